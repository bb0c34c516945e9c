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

#include "probeengine.h"
#include "assure.h"
#include "hoptracer-exception.h"
#include "logger.h"
#include "packetcodec.h"

#include <boost/asio/error.hpp>


// ###### Constructor #######################################################
ProbeEngine::ProbeEngine(ProbeSocketBase&                   probeSocket,
                         const boost::asio::ip::address_v4& destination,
                         const unsigned int                 packetSize)
   : ProbeSocket(probeSocket),
     Destination(destination),
     PacketSize(packetSize),
     DiscardedMessages(0)
{
}


// ###### Destructor ########################################################
ProbeEngine::~ProbeEngine()
{
}


// ###### Send one Echo Request with given TTL ##############################
// Throws PacketEncodeException, if the request cannot be built.
Probe ProbeEngine::sendProbe(const unsigned int ttl, const ProbeIdentity& identity)
{
   assure((ttl >= 1) && (ttl <= 255));

   const std::vector<uint8_t> echoRequest = encodeEchoRequest(identity, PacketSize);

   Probe probe;
   probe.TTL      = ttl;
   probe.Identity = identity;

   // ====== Set TTL ========================================================
   // The TTL option must be in place before the datagram is written!
   if(!ProbeSocket.setTTL(ttl, probe.SendError)) {
      HT_LOG(warning) << ProbeSocket.getName() << ": Unable to set TTL " << ttl
                      << ": " << probe.SendError.message();
      probe.SendTime = ProbeClock::now();
      return probe;
   }

   // ====== Send the request ===============================================
   probe.SendTime = ProbeClock::now();
   const std::size_t sent = ProbeSocket.sendTo(echoRequest, Destination, probe.SendError);
   if( (!probe.SendError) && (sent < echoRequest.size()) ) {
      probe.SendError = boost::asio::error::message_size;
   }
   if(probe.SendError) {
      HT_LOG(warning) << ProbeSocket.getName() << ": send_to(" << Destination
                      << ") failed: " << probe.SendError.message();
   }
   else {
      HT_LOG(trace) << "Sent Echo Request " << identity << " with TTL " << ttl
                    << " to " << Destination;
   }
   return probe;
}


// ###### Wait for the response belonging to the given probe ################
ProbeOutcome ProbeEngine::awaitResponse(const Probe&                 probe,
                                        const ProbeClock::time_point deadline)
{
   if(probe.SendError) {
      return ProbeOutcome(OT_TransportError, probe.TTL, probe.Identity,
                          boost::asio::ip::address_v4(), ProbeDuration::zero(),
                          probe.SendError);
   }

   // Foreign messages are skipped, the deadline stays the same.
   while(true) {
      std::size_t                 length = 0;
      boost::asio::ip::address_v4 responder;
      boost::system::error_code   errorCode;
      const ReceiveStatus status =
         ProbeSocket.receiveFrom(MessageBuffer, sizeof(MessageBuffer), length,
                                 responder, deadline, errorCode);

      // ====== No response or socket error =================================
      if(status == RS_Timeout) {
         HT_LOG(debug) << "No response for " << probe.Identity << " with TTL " << probe.TTL;
         return ProbeOutcome(OT_Timeout, probe.TTL, probe.Identity);
      }
      else if(status == RS_Error) {
         HT_LOG(warning) << ProbeSocket.getName() << ": receive failed: "
                         << errorCode.message();
         return ProbeOutcome(OT_TransportError, probe.TTL, probe.Identity,
                             boost::asio::ip::address_v4(), ProbeDuration::zero(),
                             errorCode);
      }
      const ProbeDuration roundTripTime = ProbeClock::now() - probe.SendTime;

      // ====== Decode and match ============================================
      RawICMPMessage message;
      try {
         message = decodeIPv4Datagram(MessageBuffer, length);
      }
      catch(PacketDecodeException& e) {
         HT_LOG(trace) << "Discarding datagram from " << responder << ": " << e.what();
         DiscardedMessages++;
         continue;
      }
      if(message.matches(probe.Identity)) {
         const OutcomeType outcomeType = (message.kind() == MK_EchoReply) ?
                                            OT_EchoReply : OT_TimeExceeded;
         const ProbeOutcome outcome(outcomeType, probe.TTL, probe.Identity,
                                    responder, roundTripTime);
         HT_LOG(debug) << outcome;
         return outcome;
      }
      HT_LOG(trace) << "Discarding " << message << " from " << responder
                    << " while waiting for " << probe.Identity;
      DiscardedMessages++;
   }
}


// ###### Send probe and wait for its outcome ###############################
ProbeOutcome ProbeEngine::runProbe(const unsigned int   ttl,
                                   const ProbeIdentity& identity,
                                   const unsigned int   expiration)
{
   const Probe probe = sendProbe(ttl, identity);
   return awaitResponse(probe, probe.SendTime + std::chrono::milliseconds(expiration));
}
