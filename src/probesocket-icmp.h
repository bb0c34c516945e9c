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

#ifndef PROBESOCKET_ICMP_H
#define PROBESOCKET_ICMP_H

#include "probesocket-base.h"

#include <boost/asio.hpp>

#ifdef __linux__
// linux/icmp.h defines the socket option ICMP_FILTER, but this include
// conflicts with netinet/ip_icmp.h. Just adding the needed definitions here:
#define ICMP_FILTER 1
struct icmp_filter {
   uint32_t data;
};
#endif


class ICMPProbeSocket : public ProbeSocketBase
{
   public:
   ICMPProbeSocket(const boost::asio::ip::address_v4& sourceAddress =
                      boost::asio::ip::address_v4::any());
   virtual ~ICMPProbeSocket();

   virtual const std::string& getName() const { return Name; }

   virtual bool prepareSocket();
   virtual void closeSocket();

   virtual bool setTTL(const unsigned int         ttl,
                       boost::system::error_code& errorCode);
   virtual std::size_t sendTo(const std::vector<uint8_t>&        message,
                              const boost::asio::ip::address_v4& destination,
                              boost::system::error_code&         errorCode);
   virtual ReceiveStatus receiveFrom(uint8_t*                     buffer,
                                     const std::size_t            bufferSize,
                                     std::size_t&                 length,
                                     boost::asio::ip::address_v4& source,
                                     const ProbeClock::time_point deadline,
                                     boost::system::error_code&   errorCode);

   private:
   const std::string                 Name;
   const boost::asio::ip::address_v4 SourceAddress;
   boost::asio::io_context           IOContext;
   boost::asio::ip::icmp::socket     ICMPSocket;
   unsigned int                      CurrentTTL;
};

#endif
