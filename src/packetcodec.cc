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

#include "packetcodec.h"
#include "hoptracer-exception.h"
#include "icmpheader.h"
#include "ipv4header.h"

#include <algorithm>
#include <string>

#include <boost/interprocess/streams/bufferstream.hpp>


// The payload content does not matter, it only has to be there.
static const char ProbePayloadPattern[] = "HopTracer";


// ###### Constructor #######################################################
RawICMPMessage::RawICMPMessage()
   : Kind(MK_Unrecognized)
{
}


// ###### Constructor #######################################################
RawICMPMessage::RawICMPMessage(const ICMPMessageKind kind,
                               const ProbeIdentity&  identity)
   : Kind(kind)
{
   if(Kind == MK_EchoReply) {
      EchoIdentity = identity;
   }
   else if(Kind == MK_TimeExceeded) {
      EmbeddedIdentity = identity;
   }
}


// ###### Does the message belong to the given probe? #######################
bool RawICMPMessage::matches(const ProbeIdentity& identity) const
{
   switch(Kind) {
      case MK_EchoReply:
         return EchoIdentity == identity;
      case MK_TimeExceeded:
         return EmbeddedIdentity == identity;
      default:
       break;
   }
   return false;
}


// ###### Output operator ###################################################
std::ostream& operator<<(std::ostream& os, const RawICMPMessage& message)
{
   switch(message.kind()) {
      case MK_EchoReply:
         os << "EchoReply(" << message.echoIdentity() << ")";
       break;
      case MK_TimeExceeded:
         os << "TimeExceeded(" << message.embeddedIdentity() << ")";
       break;
      default:
         os << "Unrecognized";
       break;
   }
   return os;
}


// ###### Build an ICMP Echo Request ########################################
std::vector<uint8_t> encodeEchoRequest(const ProbeIdentity& identity,
                                       const unsigned int   packetSize)
{
   // ====== Compute sizes ==================================================
   // Overhead: IPv4 Header (20) + ICMP Header (8)
   const size_t payloadSize =
      std::max((ssize_t)MIN_PROBE_PAYLOAD_SIZE,
               (ssize_t)packetSize - IPV4_MIN_HEADER_SIZE - ICMP_HEADER_SIZE);
   if(IPV4_MIN_HEADER_SIZE + ICMP_HEADER_SIZE + payloadSize > IP_MAXPACKET) {
      throw PacketEncodeException("Echo Request of " + std::to_string(packetSize) +
                                  " bytes exceeds the maximum IPv4 packet size");
   }

   // ====== Prepare payload ================================================
   std::vector<uint8_t> payload(payloadSize);
   for(size_t i = 0; i < payloadSize; i++) {
      payload[i] = ProbePayloadPattern[i % (sizeof(ProbePayloadPattern) - 1)];
   }

   // ====== Prepare ICMP header ============================================
   ICMPHeader echoRequest(ICMP_ECHO, 0);
   echoRequest.probeIdentity(identity);
   echoRequest.updateChecksum(payload.data(), payload.size());

   // ====== Serialise ======================================================
   std::vector<uint8_t> message;
   message.reserve(echoRequest.size() + payload.size());
   message.insert(message.end(), echoRequest.data(), echoRequest.data() + echoRequest.size());
   message.insert(message.end(), payload.begin(), payload.end());
   return message;
}


// ###### Decode an ICMP message (starting with the ICMP header) ############
RawICMPMessage decodeICMPMessage(const uint8_t* data, const size_t length)
{
   if(length < ICMP_HEADER_SIZE) {
      throw PacketDecodeException("ICMP message of " + std::to_string(length) +
                                  " bytes is shorter than an ICMP header");
   }

   boost::interprocess::ibufferstream is(reinterpret_cast<const char*>(data), length);
   ICMPHeader icmpHeader;
   is >> icmpHeader;

   // ====== ICMP[Echo Reply] ===============================================
   if(icmpHeader.isEchoReply()) {
      return RawICMPMessage(MK_EchoReply, icmpHeader.probeIdentity());
   }

   // ====== ICMP[Time Exceeded] ============================================
   else if(icmpHeader.isTimeExceeded()) {
      // The payload quotes the expired packet: IPv4 header + first 8 bytes
      // of the original ICMP Echo Request.
      IPv4Header innerIPv4Header;
      ICMPHeader innerICMPHeader;
      innerIPv4Header.readQuoted(is, length - ICMP_HEADER_SIZE, ICMP_HEADER_SIZE);
      is >> innerICMPHeader;
      if(is) {
         return RawICMPMessage(MK_TimeExceeded, innerICMPHeader.probeIdentity());
      }
   }

   return RawICMPMessage();
}


// ###### Decode an IPv4 datagram as received from a raw ICMP socket ########
RawICMPMessage decodeIPv4Datagram(const uint8_t* data, const size_t length)
{
   // NOTE: For IPv4, the raw socket also delivers the IPv4 header!
   boost::interprocess::ibufferstream is(reinterpret_cast<const char*>(data), length);
   IPv4Header ipv4Header;
   is >> ipv4Header;
   if( (!is) || (ipv4Header.protocol() != IPPROTO_ICMP) ) {
      return RawICMPMessage();
   }

   const size_t   headerLength = ipv4Header.headerLength();
   RawICMPMessage message      = decodeICMPMessage(data + headerLength, length - headerLength);
   message.setSource(ipv4Header.sourceAddress());
   return message;
}
