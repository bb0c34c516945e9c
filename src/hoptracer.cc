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

#include <iostream>
#include <string>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/program_options.hpp>

#include "check.h"
#include "hopprinter.h"
#include "hoptracer-exception.h"
#include "logger.h"
#include "package-version.h"
#include "probeengine.h"
#include "probesocket-icmp.h"
#include "tools.h"
#include "traceroute.h"


// ###### Main program ######################################################
int main(int argc, char** argv)
{
   // ====== Initialize =====================================================
   unsigned int          logLevel;
   bool                  logColor;
   std::string           logFile;
   std::string           user;
   std::string           destinationString;
   unsigned int          probesPerHop;
   unsigned int          waitTime;
   unsigned int          maxTTL;
   unsigned int          packetSize;
   bool                  completeHop;
   unsigned int          identifier;
   bool                  numeric;
   TracerouteParameters  tracerouteParameters;

   boost::program_options::options_description commandLineOptions;
   commandLineOptions.add_options()
      ( "help,h",
           "Print help message" )
      ( "check",
           "Check environment" )
      ( "version",
           "Print version" )

      ( "loglevel,L",
           boost::program_options::value<unsigned int>(&logLevel)->default_value(boost::log::trivial::severity_level::info),
           "Set logging level" )
      ( "logfile,O",
           boost::program_options::value<std::string>(&logFile)->default_value(std::string()),
           "Log file" )
      ( "logcolor,Z",
           boost::program_options::value<bool>(&logColor)->default_value(true),
           "Use ANSI color escape sequences for log output" )
      ( "verbose,v",
           boost::program_options::value<unsigned int>(&logLevel)->implicit_value(boost::log::trivial::severity_level::trace),
           "Verbose logging level" )
      ( "quiet",
           boost::program_options::value<unsigned int>(&logLevel)->implicit_value(boost::log::trivial::severity_level::warning),
           "Quiet logging level" )
      ( "user,U",
           boost::program_options::value<std::string>(&user),
           "User to run as after opening the raw socket" )

      ( "queries,q",
           boost::program_options::value<unsigned int>(&probesPerHop)->default_value(3),
           "Number of probes per hop" )
      ( "wait,w",
           boost::program_options::value<unsigned int>(&waitTime)->default_value(5),
           "Time (in s) to wait for a response to a probe" )
      ( "max-ttl,m",
           boost::program_options::value<unsigned int>(&maxTTL)->default_value(64),
           "Maximum time-to-live (maximum number of hops)" )
      ( "packetsize,s",
           boost::program_options::value<unsigned int>(&packetSize)->default_value(0),
           "IPv4 packet size of a probe (0 for minimum size)" )
      ( "identifier,I",
           boost::program_options::value<unsigned int>(&identifier),
           "ICMP Echo identifier of this run (default: random)" )
      ( "numeric,n",
           boost::program_options::value<bool>(&numeric)->default_value(false)->implicit_value(true),
           "Print hop addresses numerically (skip address-to-name lookup)" )
      ( "complete-hop",
           boost::program_options::value<bool>(&completeHop)->default_value(false)->implicit_value(true),
           "Send all probes of the hop reaching the destination" )
    ;
   boost::program_options::options_description hiddenOptions;
   hiddenOptions.add_options()
      ( "destination",
           boost::program_options::value<std::string>(&destinationString),
           "Destination" )
    ;
   boost::program_options::options_description allOptions;
   allOptions.add(commandLineOptions).add(hiddenOptions);
   boost::program_options::positional_options_description positionalOptions;
   positionalOptions.add("destination", 1);

   // ====== Handle command-line arguments ==================================
   boost::program_options::variables_map vm;
   try {
      boost::program_options::store(boost::program_options::command_line_parser(argc, argv).
                                       style(
                                          boost::program_options::command_line_style::style_t::unix_style
                                       ).
                                       options(allOptions).
                                       positional(positionalOptions).
                                       run(), vm);
      boost::program_options::notify(vm);
   }
   catch(std::exception& e) {
      std::cerr << "ERROR: Bad parameter: " << e.what() << "\n";
      return 1;
   }

   if(vm.count("help")) {
       std::cerr << "Usage: " << argv[0] << " OPTIONS destination" << "\n"
                 << commandLineOptions;
       return 1;
   }
   else if(vm.count("version")) {
      std::cout << "HopTracer " << HT_VERSION << "\n";
      return 0;
   }
   else if(vm.count("check")) {
      initialiseLogger(logLevel, logColor,
                       (!logFile.empty()) ? logFile.c_str() : nullptr);
      checkEnvironment("HopTracer");
      return 0;
   }

   if(destinationString.empty()) {
      std::cerr << "Usage: " << argv[0] << " OPTIONS destination" << "\n";
      return 1;
   }
   std::string errorMessage;
   if(!makeTracerouteParameters(tracerouteParameters, probesPerHop, waitTime,
                                maxTTL, packetSize, completeHop, errorMessage)) {
      std::cerr << "ERROR: " << errorMessage << "\n";
      return 1;
   }
   if( (vm.count("identifier")) && (identifier > 0xffff) ) {
      std::cerr << "ERROR: Invalid identifier: " << identifier << "\n";
      return 1;
   }


   // ====== Initialize =====================================================
   initialiseLogger(logLevel, logColor,
                    (!logFile.empty()) ? logFile.c_str() : nullptr);
   const passwd* pw = getUser(user.c_str());
   if( (!user.empty()) && (pw == nullptr) ) {
      HT_LOG(fatal) << "Cannot find user \"" << user << "\"!";
      return 1;
   }


   // ====== Resolve destination ============================================
   boost::asio::ip::address_v4 destination;
   if(!resolveDestinationAddress(destination, destinationString)) {
      HT_LOG(fatal) << "Unable to resolve destination " << destinationString;
      return 1;
   }


   // ====== Prepare socket (before reducing privileges) ====================
   ICMPProbeSocket probeSocket;
   if(!probeSocket.prepareSocket()) {
      HT_LOG(fatal) << "Preparing raw ICMP socket failed (missing privileges?)";
      return 1;
   }


   // ====== Reduce privileges ==============================================
   if(reducePrivileges(pw) == false) {
      HT_LOG(fatal) << "Failed to reduce privileges!";
      return 1;
   }


   // ====== Run traceroute =================================================
   const uint16_t runToken = (vm.count("identifier")) ? (uint16_t)identifier : makeRunToken();
   ProbeEngine    probeEngine(probeSocket, destination, tracerouteParameters.PacketSize);
   Traceroute     traceroute(probeEngine, runToken, tracerouteParameters);
   HopPrinter     hopPrinter(std::cout, numeric, lookupHostName);
   traceroute.setHopCallback(std::bind(&HopPrinter::printHop, &hopPrinter,
                                       std::placeholders::_1));
   traceroute.setProbeResultCallback(std::bind(&HopPrinter::printProbeResult, &hopPrinter,
                                               std::placeholders::_1));
   try {
      traceroute.run();
   }
   catch(PacketEncodeException& e) {
      HT_LOG(fatal) << "Unable to build probe: " << e.what();
      probeSocket.closeSocket();
      return 1;
   }

   probeSocket.closeSocket();
   return 0;
}
