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

#ifndef HOPPRINTER_H
#define HOPPRINTER_H

#include "probeoutcome.h"

#include <functional>
#include <ostream>
#include <string>


typedef std::function<bool (std::string& hostName, const boost::asio::ip::address_v4& address)> HostNameLookupType;


// ###### Prints the hops of a traceroute run ###############################
class HopPrinter
{
   public:
   HopPrinter(std::ostream&             os,
              const bool                numeric,
              const HostNameLookupType& hostNameLookup);

   void printHop(const unsigned int ttl);
   void printProbeResult(const ProbeOutcome& outcome);

   std::string makeDisplayName(const boost::asio::ip::address_v4& address) const;

   private:
   std::ostream&            OutputStream;
   const bool               Numeric;
   const HostNameLookupType HostNameLookup;
};

#endif
