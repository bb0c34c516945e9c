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

#ifndef PROBEIDENTITY_H
#define PROBEIDENTITY_H

#include <stdint.h>

#include <ostream>


// ###### Identity of one probe: ICMP Echo identifier and sequence number ###
struct ProbeIdentity
{
   uint16_t RunToken;
   uint16_t SeqNumber;

   ProbeIdentity() : RunToken(0), SeqNumber(0) { }
   ProbeIdentity(const uint16_t runToken, const uint16_t seqNumber)
      : RunToken(runToken), SeqNumber(seqNumber) { }
};

inline bool operator==(const ProbeIdentity& a, const ProbeIdentity& b) {
   return (a.RunToken == b.RunToken) && (a.SeqNumber == b.SeqNumber);
}

std::ostream& operator<<(std::ostream& os, const ProbeIdentity& identity);


// ###### Sequence numbers of a run #########################################
// One counter per run, shared by all TTLs. It is never reset, so every
// probe of a run gets its own sequence number.
class SequenceCounter
{
   public:
   SequenceCounter(const uint16_t firstSeqNumber = 1);

   uint16_t next();

   inline uint16_t peek()   const { return NextSeqNumber; }
   inline unsigned int issued() const { return Issued; }

   private:
   uint16_t     NextSeqNumber;
   unsigned int Issued;
};

#endif
