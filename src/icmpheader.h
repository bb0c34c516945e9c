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

#ifndef ICMPHEADER_H
#define ICMPHEADER_H

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>

#include <algorithm>
#include <cstring>
#include <istream>

#include "internet16.h"
#include "probeidentity.h"


// ==========================================================================
// From RFC 792:
//
//        0                   1                   2                   3
//        0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |     Type      |     Code      |          Checksum             |
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |           Identifier          |        Sequence Number        |
//       +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//       |     Data ...
//       +-+-+-+-+-
//
// For Time Exceeded, the second word is unused and the data carries the
// IPv4 header of the expired packet plus the first 8 bytes of its payload.
// ==========================================================================

#define ICMP_HEADER_SIZE 8

class ICMPHeader
{
   public:
   ICMPHeader() {
      std::fill(Data, Data + sizeof(Data), 0);
   }
   ICMPHeader(const uint8_t type, const uint8_t code) {
      std::fill(Data, Data + sizeof(Data), 0);
      Data[0] = type;
      Data[1] = code;
   }
   ICMPHeader(const uint8_t* inputData, const size_t length) {
      std::fill(Data, Data + sizeof(Data), 0);
      memcpy(Data, inputData, std::min(length, sizeof(Data)));
   }

   inline uint8_t  type()       const { return Data[0];      }
   inline uint8_t  code()       const { return Data[1];      }
   inline uint16_t checksum()   const { return decode(2, 3); }
   inline uint16_t identifier() const { return decode(4, 5); }
   inline uint16_t seqNumber()  const { return decode(6, 7); }

   inline bool isEchoReply()    const { return Data[0] == ICMP_ECHOREPLY;     }
   inline bool isTimeExceeded() const { return Data[0] == ICMP_TIME_EXCEEDED; }

   // Identifier and sequence number of an Echo Request/Reply
   inline ProbeIdentity probeIdentity() const {
      return ProbeIdentity(identifier(), seqNumber());
   }

   inline void type(uint8_t type)          { Data[0] = type;         }
   inline void code(uint8_t code)          { Data[1] = code;         }
   inline void checksum(uint16_t checksum) { encode(2, 3, checksum); }
   inline void identifier(uint16_t id)     { encode(4, 5, id);       }
   inline void seqNumber(uint16_t seqNum)  { encode(6, 7, seqNum);   }

   inline void probeIdentity(const ProbeIdentity& identity) {
      encode(4, 5, identity.RunToken);
      encode(6, 7, identity.SeqNumber);
   }

   inline void computeInternet16(uint32_t& sum) const {
      ::computeInternet16(sum, Data, sizeof(Data));
   }

   // Set the checksum over header and payload, i.e. the whole ICMP message
   inline void updateChecksum(const uint8_t* payload, const size_t payloadLength) {
      uint32_t sum = 0;
      checksum(0);
      computeInternet16(sum);
      ::computeInternet16(sum, payload, payloadLength);
      checksum(finishInternet16(sum));
   }

   inline const uint8_t* data() const {
      return (const uint8_t*)&Data;
   }
   inline size_t size() const {
      return sizeof(Data);
   }

   inline friend std::istream& operator>>(std::istream& is, ICMPHeader& header) {
      return is.read(reinterpret_cast<char*>(header.Data), ICMP_HEADER_SIZE);
   }

   private:
   inline uint16_t decode(const unsigned int a, const unsigned int b) const {
      return ((uint16_t)Data[a] << 8) + Data[b];
   }

   inline void encode(const unsigned int a, const unsigned int b, const uint16_t n) {
      Data[a] = static_cast<uint8_t>(n >> 8);
      Data[b] = static_cast<uint8_t>(n & 0xff);
   }

   uint8_t Data[ICMP_HEADER_SIZE];
};

#endif
