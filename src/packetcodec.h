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

#ifndef PACKETCODEC_H
#define PACKETCODEC_H

#include "probeidentity.h"

#include <vector>

#include <boost/asio/ip/address_v4.hpp>


// Payload of an Echo Request when no packet size is given
#define MIN_PROBE_PAYLOAD_SIZE 8


enum ICMPMessageKind
{
   MK_Unrecognized = 0,
   MK_EchoReply    = 1,
   MK_TimeExceeded = 2
};


// ###### Decoded inbound ICMP message ######################################
// The echo identity is only set for Echo Reply, the embedded identity (i.e.
// the quoted original Echo Request) only for Time Exceeded.
class RawICMPMessage
{
   public:
   RawICMPMessage();
   RawICMPMessage(const ICMPMessageKind kind,
                  const ProbeIdentity&  identity);

   inline ICMPMessageKind kind() const                  { return Kind;                      }
   inline bool hasEchoIdentity() const                  { return Kind == MK_EchoReply;      }
   inline bool hasEmbeddedIdentity() const              { return Kind == MK_TimeExceeded;   }
   inline const ProbeIdentity& echoIdentity() const     { return EchoIdentity;              }
   inline const ProbeIdentity& embeddedIdentity() const { return EmbeddedIdentity;          }

   inline const boost::asio::ip::address_v4& source() const { return Source; }
   inline void setSource(const boost::asio::ip::address_v4& source) { Source = source; }

   bool matches(const ProbeIdentity& identity) const;

   private:
   ICMPMessageKind             Kind;
   ProbeIdentity               EchoIdentity;
   ProbeIdentity               EmbeddedIdentity;
   boost::asio::ip::address_v4 Source;
};

std::ostream& operator<<(std::ostream& os, const RawICMPMessage& message);


std::vector<uint8_t> encodeEchoRequest(const ProbeIdentity& identity,
                                       const unsigned int   packetSize = 0);

RawICMPMessage decodeICMPMessage(const uint8_t* data, const size_t length);
RawICMPMessage decodeIPv4Datagram(const uint8_t* data, const size_t length);

#endif
