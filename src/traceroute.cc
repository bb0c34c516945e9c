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

#include "traceroute.h"
#include "assure.h"
#include "logger.h"

#include <limits.h>


// ###### Check options and convert them to traceroute parameters #########
// Returns false and sets errorMessage, if an option is out of range.
bool makeTracerouteParameters(TracerouteParameters& parameters,
                              const unsigned int    probesPerHop,
                              const unsigned int    waitTime,
                              const unsigned int    maxTTL,
                              const unsigned int    packetSize,
                              const bool            completeHop,
                              std::string&          errorMessage)
{
   if(probesPerHop < 1) {
      errorMessage = "Invalid number of probes per hop: " + std::to_string(probesPerHop);
      return false;
   }
   // The expiration is kept in ms
   if( (waitTime < 1) || (waitTime > UINT_MAX / 1000) ) {
      errorMessage = "Invalid wait time: " + std::to_string(waitTime);
      return false;
   }
   if( (maxTTL < 1) || (maxTTL > 255) ) {
      errorMessage = "Invalid maximum TTL: " + std::to_string(maxTTL);
      return false;
   }
   // Otherwise, the 16-bit sequence numbers of a run would repeat.
   if((unsigned long long)probesPerHop * maxTTL > 0xffff) {
      errorMessage = "Too many probes: " + std::to_string(probesPerHop) +
                     " x " + std::to_string(maxTTL) + " > 65535";
      return false;
   }
   if(packetSize > 0xffff) {
      errorMessage = "Invalid packet size: " + std::to_string(packetSize);
      return false;
   }

   parameters.ProbesPerHop = probesPerHop;
   parameters.Expiration   = 1000 * waitTime;
   parameters.MaxTTL       = maxTTL;
   parameters.PacketSize   = packetSize;
   parameters.CompleteHop  = completeHop;
   return true;
}


// ###### Get state name ####################################################
const char* getTracerouteStateName(const TracerouteState state)
{
   switch(state) {
      case TS_Probing:
         return "Probing";
      case TS_Reached:
         return "Reached";
      case TS_Exhausted:
         return "Exhausted";
   }
   return "Unknown";
}


// ###### Constructor #######################################################
Traceroute::Traceroute(ProbeEngine&                probeEngine,
                       const uint16_t              runToken,
                       const TracerouteParameters& parameters,
                       const uint16_t              firstSeqNumber)
   : Engine(probeEngine),
     RunToken(runToken),
     Parameters(parameters),
     SeqCounter(firstSeqNumber),
     State(TS_Probing),
     CurrentTTL(0)
{
   assure(Parameters.ProbesPerHop >= 1);
   assure(Parameters.Expiration > 0);
   assure( (Parameters.MaxTTL >= 1) && (Parameters.MaxTTL <= 255) );
}


// ###### Destructor ########################################################
Traceroute::~Traceroute()
{
}


// ###### Run the traceroute ################################################
// Throws PacketEncodeException, if a probe cannot be built.
TracerouteState Traceroute::run()
{
   HT_LOG(info) << "Tracing route to " << Engine.getDestination()
                << ": max. TTL " << Parameters.MaxTTL
                << ", " << Parameters.ProbesPerHop << " probe(s) per hop"
                << ", expiration " << Parameters.Expiration << " ms"
                << ", identifier " << RunToken;

   State = TS_Probing;
   Hops.clear();
   for(CurrentTTL = 1; CurrentTTL <= Parameters.MaxTTL; CurrentTTL++) {
      if(runHop(CurrentTTL)) {
         State = TS_Reached;
         break;
      }
   }
   if(State == TS_Probing) {
      State      = TS_Exhausted;
      CurrentTTL = Parameters.MaxTTL;
   }

   // ====== Summary ========================================================
   if(State == TS_Reached) {
      HT_LOG(info) << "Reached " << Engine.getDestination() << " with TTL " << CurrentTTL;
   }
   else {
      HT_LOG(info) << "Did not reach " << Engine.getDestination()
                   << " within " << Parameters.MaxTTL << " hops";
   }
   HT_LOG(debug) << "Run " << RunToken << " ended in state "
                 << getTracerouteStateName(State) << ": sent " << SeqCounter.issued()
                 << " probe(s), discarded " << Engine.getDiscardedMessages()
                 << " foreign message(s)";
   return State;
}


// ###### Probe one hop #####################################################
// Returns true, if the destination has responded.
bool Traceroute::runHop(const unsigned int ttl)
{
   if(HopCallback) {
      HopCallback(ttl);
   }

   HopResult hop;
   hop.TTL = ttl;
   bool reached = false;
   for(unsigned int i = 0; i < Parameters.ProbesPerHop; i++) {
      const ProbeIdentity identity(RunToken, SeqCounter.next());
      const ProbeOutcome  outcome = Engine.runProbe(ttl, identity, Parameters.Expiration);
      hop.Outcomes.push_back(outcome);
      if(ProbeResultCallback) {
         ProbeResultCallback(outcome);
      }
      if(outcome.type() == OT_EchoReply) {
         reached = true;
         if(!Parameters.CompleteHop) {
            break;
         }
      }
   }
   Hops.push_back(hop);
   return reached;
}
