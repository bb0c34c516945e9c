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

#ifndef PROBESOCKET_BASE_H
#define PROBESOCKET_BASE_H

#include "probeoutcome.h"

#include <string>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/error_code.hpp>


enum ReceiveStatus
{
   RS_Received = 0,
   RS_Timeout  = 1,
   RS_Error    = 2
};


// ###### Socket used by the probe engine ###################################
// The outbound TTL is a socket-wide option. Therefore, a socket must only be
// used by one probe at a time.
class ProbeSocketBase
{
   public:
   ProbeSocketBase();
   virtual ~ProbeSocketBase();

   virtual const std::string& getName() const = 0;

   virtual bool prepareSocket() = 0;
   virtual void closeSocket() = 0;

   virtual bool setTTL(const unsigned int         ttl,
                       boost::system::error_code& errorCode) = 0;
   virtual std::size_t sendTo(const std::vector<uint8_t>&        message,
                              const boost::asio::ip::address_v4& destination,
                              boost::system::error_code&         errorCode) = 0;

   // Wait until a datagram arrives or the deadline is reached. On
   // RS_Received, buffer/length hold the complete IPv4 datagram.
   virtual ReceiveStatus receiveFrom(uint8_t*                     buffer,
                                     const std::size_t            bufferSize,
                                     std::size_t&                 length,
                                     boost::asio::ip::address_v4& source,
                                     const ProbeClock::time_point deadline,
                                     boost::system::error_code&   errorCode) = 0;
};

#endif
