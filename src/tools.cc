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

#include "tools.h"
#include "logger.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/random/random_device.hpp>
#include <boost/random/uniform_int_distribution.hpp>


// ###### Get user by name or UID ###########################################
const passwd* getUser(const char* user)
{
   passwd* pw = nullptr;
   if((user != nullptr) && (strlen(user) > 0)) {
      pw = getpwnam(user);
      if(pw == nullptr) {
         int userID = -1;
         if( (sscanf(user, "%d", &userID) != 1) ||
             ( (pw = getpwuid(userID)) == nullptr) ) {
            HT_LOG(error) << "Provided user \"" << user << "\" is not a user name or UID!";
            return nullptr;
         }
      }
   }
   return pw;
}


// ###### Reduce privileges of process ######################################
bool reducePrivileges(const passwd* pw)
{
   // ====== Reduce permissions =============================================
   if((pw != nullptr) && (pw->pw_uid != 0)) {
      HT_LOG(info) << "Using UID " << pw->pw_uid << ", GID " << pw->pw_gid;
      if(setgid(pw->pw_gid) != 0) {
         HT_LOG(error) << "setgid(" << pw->pw_gid << ") failed: " << strerror(errno);
         return false;
      }
      if(setuid(pw->pw_uid) != 0) {
         HT_LOG(error) << "setuid(" << pw->pw_uid << ") failed: " << strerror(errno);
         return false;
      }
   }
   else if(geteuid() == 0) {
      HT_LOG(warning) << "Working as root (uid 0). This is not recommended!";
   }
   return true;
}


// ###### Resolve destination to one IPv4 address ###########################
bool resolveDestinationAddress(boost::asio::ip::address_v4& destination,
                               const std::string&           destinationString)
{
   // ====== Numeric address ================================================
   boost::system::error_code errorCode;
   destination = boost::asio::ip::make_address_v4(destinationString, errorCode);
   if(!errorCode) {
      return true;
   }

   // ====== DNS name =======================================================
   boost::asio::io_context        ioContext;
   boost::asio::ip::tcp::resolver resolver(ioContext);
   const boost::asio::ip::tcp::resolver::results_type results =
      resolver.resolve(boost::asio::ip::tcp::v4(), destinationString, "0",
                       boost::asio::ip::tcp::resolver::numeric_service, errorCode);
   if(errorCode) {
      HT_LOG(error) << "Failed to resolve a DNS name " << destinationString << ": "
                    << errorCode.message();
      return false;
   }
   for(boost::asio::ip::tcp::resolver::results_type::const_iterator iterator = results.begin();
       iterator != results.end(); iterator++) {
      const boost::asio::ip::address address = iterator->endpoint().address();
      if(address.is_v4()) {
         destination = address.to_v4();
         HT_LOG(info) << destinationString << " -> " << destination;
         return true;
      }
   }
   HT_LOG(error) << "No IPv4 address for " << destinationString;
   return false;
}


// ###### Reverse lookup of an address ######################################
bool lookupHostName(std::string&                       hostName,
                    const boost::asio::ip::address_v4& address)
{
   boost::system::error_code      errorCode;
   boost::asio::io_context        ioContext;
   boost::asio::ip::tcp::resolver resolver(ioContext);
   const boost::asio::ip::tcp::resolver::results_type results =
      resolver.resolve(boost::asio::ip::tcp::endpoint(address, 0), errorCode);
   if( (!errorCode) && (!results.empty()) ) {
      // Without a PTR record, the numeric address is returned as name.
      const std::string name = results.begin()->host_name();
      if( (!name.empty()) && (name != address.to_string()) ) {
         hostName = name;
         return true;
      }
   }
   HT_LOG(trace) << "No host name for " << address;
   return false;
}


// ###### Make random 16-bit run token (ICMP Echo identifier) ###############
uint16_t makeRunToken()
{
   boost::random::random_device                          generator;
   boost::random::uniform_int_distribution<unsigned int> distribution(0, 0xffff);
   return (uint16_t)distribution(generator);
}
