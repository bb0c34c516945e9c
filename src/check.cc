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

#include <unistd.h>
#include <sys/utsname.h>
#include <time.h>

#include <chrono>
#include <iostream>

#include <boost/version.hpp>

#include "check.h"
#include "package-version.h"
#include "probesocket-icmp.h"


// ###### Check environment #################################################
void checkEnvironment(const char* programName)
{
   std::cout << programName << " " << HT_VERSION << "\n";

   // ====== System information =============================================
   utsname sysInfo;
   if(uname(&sysInfo) == 0) {
      std::cout << "System Information:\n"
                << "* System: \t" << sysInfo.sysname  << "\n"
                << "* Name:   \t" << sysInfo.nodename << "\n"
                << "* Release:\t" << sysInfo.release  << "\n"
                << "* Version:\t" << sysInfo.version  << "\n"
                << "* Machine:\t" << sysInfo.machine  << "\n";
   }

   // ====== Build environment ==============================================
   std::cout << "Build Environment:\n"
             << "* BOOST Version:  \t" << BOOST_VERSION  << "\n"
             << "* BOOST Compiler: \t" << BOOST_COMPILER << "\n"
             << "* BOOST StdLib:   \t" << BOOST_STDLIB   << "\n"
             << "* C++ Standard:   \t" << __cplusplus    << "\n";

   // ====== Clock granularity ==============================================
   timespec ts;
   clock_getres(CLOCK_MONOTONIC, &ts);
   std::cout << "Clock Granularity:\n"
             << "* std::chrono::steady_clock:        \t"
             << std::chrono::steady_clock::period::num << "/"
             << std::chrono::steady_clock::period::den << " s\t"
             << (std::chrono::steady_clock::is_steady ? "steady" : "not steady") << "\n"
             << "* clock_getres(CLOCK_MONOTONIC): s=" << ts.tv_sec << " ns=" << ts.tv_nsec << "\n";

   // ====== Raw socket ======================================================
   ICMPProbeSocket probeSocket;
   const bool      rawSocketAvailable = probeSocket.prepareSocket();
   std::cout << "Raw ICMP Socket:\n"
             << "* Effective UID:  \t" << geteuid() << "\n"
             << "* Available:      \t" << (rawSocketAvailable ? "yes" : "no (privileges required)") << "\n";
   probeSocket.closeSocket();
}
