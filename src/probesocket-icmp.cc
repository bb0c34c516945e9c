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

#include "probesocket-icmp.h"
#include "logger.h"

#include <netinet/in.h>
#include <netinet/ip_icmp.h>


// ###### Constructor #######################################################
ICMPProbeSocket::ICMPProbeSocket(const boost::asio::ip::address_v4& sourceAddress)
   : Name(std::string("ICMPProbeSocket(") + sourceAddress.to_string() + std::string(")")),
     SourceAddress(sourceAddress),
     IOContext(),
     ICMPSocket(IOContext),
     CurrentTTL(0)
{
}


// ###### Destructor ########################################################
ICMPProbeSocket::~ICMPProbeSocket()
{
   closeSocket();
}


// ###### Prepare ICMP socket ###############################################
bool ICMPProbeSocket::prepareSocket()
{
   // ====== Open raw ICMP socket (requires privileges) =====================
   boost::system::error_code errorCode;
   ICMPSocket.open(boost::asio::ip::icmp::v4(), errorCode);
   if(errorCode) {
      HT_LOG(error) << getName() << ": Unable to open raw ICMP socket: "
                    << errorCode.message();
      return false;
   }

   // ====== Bind ICMP socket to given source address =======================
   ICMPSocket.bind(boost::asio::ip::icmp::endpoint(SourceAddress, 0), errorCode);
   if(errorCode) {
      HT_LOG(error) << getName() << ": Unable to bind ICMP socket to source address "
                    << SourceAddress << ": " << errorCode.message();
      ICMPSocket.close(errorCode);
      return false;
   }

   // ====== Set filter (not required, but more efficient) ==================
#if defined (ICMP_FILTER)
   icmp_filter filter;
   filter.data = ~( (1 << ICMP_ECHOREPLY) |
                    (1 << ICMP_TIME_EXCEEDED) );
   if(setsockopt(ICMPSocket.native_handle(), IPPROTO_ICMP, ICMP_FILTER,
                 &filter, sizeof(filter)) < 0) {
      HT_LOG(warning) << "Unable to set ICMP_FILTER!";
   }
#endif

   CurrentTTL = 0;
   HT_LOG(debug) << getName() << ": Socket is ready";
   return true;
}


// ###### Close socket ######################################################
void ICMPProbeSocket::closeSocket()
{
   if(ICMPSocket.is_open()) {
      boost::system::error_code errorCode;
      ICMPSocket.close(errorCode);
      if(errorCode) {
         HT_LOG(warning) << getName() << ": Closing socket failed: " << errorCode.message();
      }
   }
}


// ###### Set outbound TTL ##################################################
bool ICMPProbeSocket::setTTL(const unsigned int         ttl,
                             boost::system::error_code& errorCode)
{
   // Only need to set option again if it differs from current TTL!
   if(ttl != CurrentTTL) {
      const boost::asio::ip::unicast::hops hopsOption(ttl);
      ICMPSocket.set_option(hopsOption, errorCode);
      if(errorCode) {
         CurrentTTL = 0;
         return false;
      }
      CurrentTTL = ttl;
   }
   errorCode = boost::system::error_code();
   return true;
}


// ###### Send ICMP message #################################################
std::size_t ICMPProbeSocket::sendTo(const std::vector<uint8_t>&        message,
                                    const boost::asio::ip::address_v4& destination,
                                    boost::system::error_code&         errorCode)
{
   const boost::asio::ip::icmp::endpoint remoteEndpoint(destination, 0);
   return ICMPSocket.send_to(boost::asio::buffer(message), remoteEndpoint, 0, errorCode);
}


// ###### Receive ICMP message with deadline ################################
ReceiveStatus ICMPProbeSocket::receiveFrom(uint8_t*                     buffer,
                                           const std::size_t            bufferSize,
                                           std::size_t&                 length,
                                           boost::asio::ip::address_v4& source,
                                           const ProbeClock::time_point deadline,
                                           boost::system::error_code&   errorCode)
{
   length = 0;
   if(ProbeClock::now() >= deadline) {
      return RS_Timeout;
   }

   // ====== Start asynchronous receive =====================================
   boost::asio::ip::icmp::endpoint senderEndpoint;
   boost::system::error_code       receiveError = boost::asio::error::would_block;
   std::size_t                     received     = 0;
   ICMPSocket.async_receive_from(
      boost::asio::buffer(buffer, bufferSize), senderEndpoint,
      [&receiveError, &received](const boost::system::error_code& ec, const std::size_t bytes) {
         receiveError = ec;
         received     = bytes;
      });

   // ====== Run until completion or deadline ===============================
   IOContext.restart();
   IOContext.run_until(deadline);
   if(receiveError == boost::asio::error::would_block) {
      // Deadline reached -> cancel the receive and let its handler finish
      boost::system::error_code cancelError;
      ICMPSocket.cancel(cancelError);
      IOContext.restart();
      IOContext.run();
   }

   // ====== Evaluate result ================================================
   if(receiveError == boost::asio::error::operation_aborted) {
      return RS_Timeout;
   }
   else if(receiveError) {
      errorCode = receiveError;
      return RS_Error;
   }
   length = received;
   source = senderEndpoint.address().to_v4();
   return RS_Received;
}
