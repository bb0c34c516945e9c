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

#ifndef TOOLS_H
#define TOOLS_H

#include <pwd.h>

#include <chrono>
#include <sstream>
#include <string>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/format.hpp>


const passwd* getUser(const char* user);
bool reducePrivileges(const passwd* pw);

bool resolveDestinationAddress(boost::asio::ip::address_v4& destination,
                               const std::string&           destinationString);
bool lookupHostName(std::string&                       hostName,
                    const boost::asio::ip::address_v4& address);

uint16_t makeRunToken();


// ###### Convert duration to string ########################################
template <typename Duration>
std::string durationToString(const Duration& duration,
                             const char*     format = "%1.3fms",
                             const double    div    = 1000000.0,
                             const char*     null   = "NULL")
{
   std::stringstream ss;
   long long         ns = std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count();
   if(ns >= 0) {
      ss << boost::format(format) % (ns / div);
   }
   else {
      ss << null;
   }
   return ss.str();
}

#endif
