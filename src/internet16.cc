// ==========================================================================
//                 _   _             _____
//                | | | | ___  _ __ |_   _| __ __ _  ___ ___ _ __
//                | |_| |/ _ \| '_ \  | || '__/ _` |/ __/ _ \ '__|
//                |  _  | (_) | |_) | | || | | (_| | (_|  __/ |
//                |_| |_|\___/| .__/  |_||_|  \__,_|\___\___|_|
//                            |_|
//              ---  ICMP Hop Tracer (HopTracer)  ---
// ==========================================================================
//
// HopTracer - ICMP Hop Tracer
// Copyright (C) 2015-2025 by Thomas Dreibholz
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
// Contact: dreibh@simula.no

#include "internet16.h"


// ###### Internet-16 checksum according to RFC 1071, computation part ######
// The sum is accumulated in network byte order, i.e. the result of
// finishInternet16() can be written big-endian into the header.
void computeInternet16(uint32_t& sum, const uint8_t* data, const unsigned int datalen)
{
   const uint8_t*       ptr = data;
   const uint8_t* const end = &data[datalen];

   // ------ 16-bit words ---------------------------------------------------
   while(ptr + 1 < end) {
      sum += ((uint32_t)ptr[0] << 8) + ptr[1];
      ptr += 2;
   }

   // ------ Handle a final byte (padded with zero) -------------------------
   if(ptr < end) {
      sum += (uint32_t)(*ptr) << 8;
   }
}
