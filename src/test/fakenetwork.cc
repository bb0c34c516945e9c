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

#include "fakenetwork.h"
#include "icmpheader.h"
#include "ipv4header.h"

#include <algorithm>
#include <cstring>
#include <thread>


// ###### Build ICMP Echo Reply #############################################
std::vector<uint8_t> makeEchoReply(const ProbeIdentity& identity)
{
   ICMPHeader echoReply;
   echoReply.type(ICMP_ECHOREPLY);
   echoReply.probeIdentity(identity);

   std::vector<uint8_t> message(echoReply.data(), echoReply.data() + echoReply.size());
   const char payload[] = "payload!";
   message.insert(message.end(), payload, payload + 8);
   return message;
}


// ###### Build ICMP Time Exceeded quoting an Echo Request ##################
std::vector<uint8_t> makeTimeExceeded(const std::vector<uint8_t>& quotedIPv4Header,
                                      const ProbeIdentity&        identity)
{
   ICMPHeader timeExceeded(ICMP_TIME_EXCEEDED, ICMP_EXC_TTL);
   ICMPHeader echoRequest(ICMP_ECHO, 0);
   echoRequest.checksum(0xbeef);
   echoRequest.probeIdentity(identity);

   std::vector<uint8_t> message(timeExceeded.data(), timeExceeded.data() + timeExceeded.size());
   message.insert(message.end(), quotedIPv4Header.begin(), quotedIPv4Header.end());
   message.insert(message.end(), echoRequest.data(), echoRequest.data() + echoRequest.size());
   return message;
}


// ###### Build the IPv4 header of an expired Echo Request ##################
std::vector<uint8_t> makeQuotedIPv4Header(const boost::asio::ip::address_v4& source,
                                          const boost::asio::ip::address_v4& destination,
                                          const std::vector<uint8_t>&        options)
{
   IPv4Header header;
   header.version(4);
   header.headerLength((uint8_t)(IPV4_MIN_HEADER_SIZE + options.size()));
   header.totalLength(header.headerLength() + 16);
   header.identification(0x4711);
   header.timeToLive(1);
   header.protocol(IPPROTO_ICMP);
   header.sourceAddress(source);
   header.destinationAddress(destination);
   header.options(options.data(), options.size());
   return std::vector<uint8_t>(header.data(), header.data() + header.size());
}


// ###### Build an IPv4 datagram as delivered by a raw socket ###############
std::vector<uint8_t> makeIPv4Datagram(const boost::asio::ip::address_v4& source,
                                      const boost::asio::ip::address_v4& destination,
                                      const std::vector<uint8_t>&        icmpMessage,
                                      const uint8_t                      protocol)
{
   IPv4Header header;
   header.version(4);
   header.headerLength(IPV4_MIN_HEADER_SIZE);
   header.totalLength((uint16_t)(IPV4_MIN_HEADER_SIZE + icmpMessage.size()));
   header.timeToLive(64);
   header.protocol(protocol);
   header.sourceAddress(source);
   header.destinationAddress(destination);

   std::vector<uint8_t> datagram(header.data(), header.data() + header.size());
   datagram.insert(datagram.end(), icmpMessage.begin(), icmpMessage.end());
   return datagram;
}


// ###### Constructor #######################################################
FakeNetwork::FakeNetwork(const boost::asio::ip::address_v4& local,
                         const boost::asio::ip::address_v4& destination)
   : Name("FakeNetwork"),
     Local(local),
     Destination(destination),
     AutoRespond(true),
     CurrentTTL(0)
{
}


// ###### Destructor ########################################################
FakeNetwork::~FakeNetwork()
{
}


// ###### Prepare socket ####################################################
bool FakeNetwork::prepareSocket()
{
   return true;
}


// ###### Close socket ######################################################
void FakeNetwork::closeSocket()
{
}


// ###### Set outbound TTL ##################################################
bool FakeNetwork::setTTL(const unsigned int         ttl,
                         boost::system::error_code& errorCode)
{
   errorCode  = boost::system::error_code();
   CurrentTTL = ttl;
   return true;
}


// ###### Send Echo Request into the network ################################
std::size_t FakeNetwork::sendTo(const std::vector<uint8_t>&        message,
                                const boost::asio::ip::address_v4& destination,
                                boost::system::error_code&         errorCode)
{
   if(SendError) {
      errorCode = SendError;
      return 0;
   }
   errorCode = boost::system::error_code();

   const ICMPHeader echoRequest(message.data(), message.size());
   SentProbe sentProbe;
   sentProbe.TTL      = CurrentTTL;
   sentProbe.Identity = echoRequest.probeIdentity();
   SentProbes.push_back(sentProbe);

   if( (AutoRespond) && (destination == Destination) ) {
      respondTo(sentProbe);
   }
   return message.size();
}


// ###### Generate the path's response to a probe ###########################
void FakeNetwork::respondTo(const SentProbe& sentProbe)
{
   if(SilentHops.find(sentProbe.TTL) != SilentHops.end()) {
      return;
   }
   if(sentProbe.TTL <= Routers.size()) {
      const boost::asio::ip::address_v4& router = Routers[sentProbe.TTL - 1];
      queueDatagram(makeTimeExceeded(makeQuotedIPv4Header(Local, Destination),
                                     sentProbe.Identity),
                    router);
   }
   else {
      queueDatagram(makeEchoReply(sentProbe.Identity), Destination);
   }
}


// ###### Queue ICMP message (wrapped into IPv4) ############################
void FakeNetwork::queueDatagram(const std::vector<uint8_t>&        icmpMessage,
                                const boost::asio::ip::address_v4& source)
{
   queueRawDatagram(makeIPv4Datagram(source, Local, icmpMessage), source);
}


// ###### Queue datagram as is ##############################################
void FakeNetwork::queueRawDatagram(const std::vector<uint8_t>&        data,
                                   const boost::asio::ip::address_v4& source)
{
   Datagram datagram;
   datagram.Data   = data;
   datagram.Source = source;
   Queue.push_back(datagram);
}


// ###### Receive next datagram or wait for deadline ########################
ReceiveStatus FakeNetwork::receiveFrom(uint8_t*                     buffer,
                                       const std::size_t            bufferSize,
                                       std::size_t&                 length,
                                       boost::asio::ip::address_v4& source,
                                       const ProbeClock::time_point deadline,
                                       boost::system::error_code&   errorCode)
{
   ReceiveDeadlines.push_back(deadline);
   length = 0;
   if(ReceiveError) {
      errorCode = ReceiveError;
      return RS_Error;
   }
   if(Queue.empty()) {
      std::this_thread::sleep_until(deadline);
      return RS_Timeout;
   }

   const Datagram datagram = Queue.front();
   Queue.pop_front();
   length = std::min(bufferSize, datagram.Data.size());
   memcpy(buffer, datagram.Data.data(), length);
   source = datagram.Source;
   return RS_Received;
}
