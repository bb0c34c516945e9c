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

#ifndef IPV4HEADER_H
#define IPV4HEADER_H

#include <algorithm>
#include <cstring>
#include <istream>
#include <boost/asio/ip/address_v4.hpp>

#include "internet16.h"


// ==========================================================================
// From RFC 791:
//
//     0                   1                   2                   3
//     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |Version|  IHL  |Type of Service|          Total Length         |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |         Identification        |Flags|      Fragment Offset    |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |  Time to Live |    Protocol   |         Header Checksum       |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                       Source Address                          |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                    Destination Address                        |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                    Options                    |    Padding    |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// ==========================================================================

#define IPV4_MIN_HEADER_SIZE 20
#define IPV4_MAX_HEADER_SIZE 60

class IPv4Header
{
   public:
   IPv4Header() {
      std::fill(Data, Data + sizeof(Data), 0);
   }

   inline uint8_t  version()        const { return (Data[0] >> 4) & 0x0f; }
   inline uint16_t headerLength()   const { return (Data[0] & 0x0f) * 4;  }
   inline uint8_t  protocol()       const { return Data[9];               }

   inline boost::asio::ip::address_v4 sourceAddress() const {
      const boost::asio::ip::address_v4::bytes_type bytes =
         { { Data[12], Data[13], Data[14], Data[15] } };
      return boost::asio::ip::address_v4(bytes);
    }

   // A header length the receiver can actually use: 20 to 60 bytes.
   inline bool hasValidHeaderLength() const {
      return (version() == 4) &&
             (headerLength() >= IPV4_MIN_HEADER_SIZE) &&
             (headerLength() <= IPV4_MAX_HEADER_SIZE);
   }

   inline void version(const uint8_t version)                { Data[0] = (version << 4) | (Data[0] & 0x0f);               }
   inline void headerLength(const uint8_t headerLength)      { Data[0] = (Data[0] & 0xf0) | ((headerLength >> 2) & 0x0f); }
   inline void totalLength(const uint16_t totalLength)       { encode(2, 3, totalLength);                                 }
   inline void identification(const uint16_t identification) { encode(4, 5, identification);                              }
   inline void timeToLive(const uint8_t timeToLive)          { Data[8] = timeToLive;                                      }
   inline void protocol(const uint8_t protocol)              { Data[9] = protocol;                                        }

   inline void sourceAddress(const boost::asio::ip::address_v4& sourceAddress) {
      memcpy(&Data[12], sourceAddress.to_bytes().data(), 4);
   }
   inline void destinationAddress(const boost::asio::ip::address_v4& destinationAddress) {
      memcpy(&Data[16], destinationAddress.to_bytes().data(), 4);
   }
   inline void options(const uint8_t* options, const size_t length) {
      memcpy(&Data[IPV4_MIN_HEADER_SIZE], options,
             std::min(length, (size_t)(IPV4_MAX_HEADER_SIZE - IPV4_MIN_HEADER_SIZE)));
   }

   inline const uint8_t* data() const {
      return (const uint8_t*)&Data;
   }
   inline size_t size() const {
      return headerLength();
   }

   // ====== Strict parsing of a received datagram's header =================
   friend std::istream& operator>>(std::istream& is, IPv4Header& header) {
      is.read(reinterpret_cast<char*>(header.Data), IPV4_MIN_HEADER_SIZE);
      if(header.version() != 4) {
         is.setstate(std::ios::failbit);
      }
      std::streamsize options_length = header.headerLength() - IPV4_MIN_HEADER_SIZE;
      if(options_length < 0 || options_length > IPV4_MAX_HEADER_SIZE - IPV4_MIN_HEADER_SIZE) {
         is.setstate(std::ios::failbit);
      }
      else if(options_length > 0) {
         is.read(reinterpret_cast<char*>(header.Data) + IPV4_MIN_HEADER_SIZE, options_length);
      }
      return is;
   }

   // ====== Lenient parsing of a header quoted inside an ICMP error ========
   // The quoted header is followed by payloadLength bytes of the expired
   // packet, and "available" bytes are left in the stream. Options are
   // skipped when the declared length is usable and leaves room for that
   // payload. Otherwise, a plain 20-byte header is assumed.
   std::istream& readQuoted(std::istream&      is,
                            const std::size_t  available,
                            const std::size_t  payloadLength) {
      is.read(reinterpret_cast<char*>(Data), IPV4_MIN_HEADER_SIZE);
      if( (is) && (hasValidHeaderLength()) &&
          (headerLength() > IPV4_MIN_HEADER_SIZE) &&
          (headerLength() + payloadLength <= available) ) {
         is.read(reinterpret_cast<char*>(Data) + IPV4_MIN_HEADER_SIZE,
                 headerLength() - IPV4_MIN_HEADER_SIZE);
      }
      return is;
   }

   private:
   inline uint16_t decode(const unsigned int a, const unsigned int b) const {
      return ((uint16_t)Data[a] << 8) + Data[b];
   }

   inline void encode(const unsigned int a, const unsigned int b, const uint16_t n) {
      Data[a] = static_cast<uint8_t>(n >> 8);
      Data[b] = static_cast<uint8_t>(n & 0xff);
   }

   uint8_t Data[IPV4_MAX_HEADER_SIZE];
};

#endif
