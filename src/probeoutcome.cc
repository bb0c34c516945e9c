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

#include "probeoutcome.h"
#include "tools.h"


// ###### Get outcome name ##################################################
const char* getOutcomeName(const OutcomeType outcomeType)
{
   switch(outcomeType) {
      case OT_EchoReply:
         return "EchoReply";
      case OT_TimeExceeded:
         return "TimeExceeded";
      case OT_Timeout:
         return "Timeout";
      case OT_TransportError:
         return "TransportError";
   }
   return "Unknown";
}


// ###### Constructor #######################################################
ProbeOutcome::ProbeOutcome(const OutcomeType                  outcomeType,
                           const unsigned int                 ttl,
                           const ProbeIdentity&               identity,
                           const boost::asio::ip::address_v4& responder,
                           const ProbeDuration&               roundTripTime,
                           const boost::system::error_code&   errorCode)
   : Type(outcomeType),
     TTL(ttl),
     Identity(identity),
     Responder(responder),
     RoundTripTime(roundTripTime),
     ErrorCode(errorCode)
{
}


// ###### Output operator ###################################################
std::ostream& operator<<(std::ostream& os, const ProbeOutcome& outcome)
{
   os << getOutcomeName(outcome.type())
      << " TTL=" << outcome.ttl() << " " << outcome.identity();
   if(outcome.hasResponse()) {
      os << " from " << outcome.responder()
         << " RTT=" << durationToString(outcome.roundTripTime());
   }
   else if(outcome.type() == OT_TransportError) {
      os << ": " << outcome.errorCode().message();
   }
   return os;
}
