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

#ifndef PROBEOUTCOME_H
#define PROBEOUTCOME_H

#include "probeidentity.h"

#include <chrono>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/error_code.hpp>


typedef std::chrono::steady_clock           ProbeClock;
typedef std::chrono::steady_clock::duration ProbeDuration;


enum OutcomeType
{
   OT_EchoReply      = 0,   // Destination has responded
   OT_TimeExceeded   = 1,   // Router on the path has responded
   OT_Timeout        = 2,   // No response before the deadline
   OT_TransportError = 3    // Socket operation failed
};

const char* getOutcomeName(const OutcomeType outcomeType);


// ###### Result of one probe ###############################################
class ProbeOutcome
{
   public:
   ProbeOutcome(const OutcomeType                  outcomeType,
                const unsigned int                 ttl,
                const ProbeIdentity&               identity,
                const boost::asio::ip::address_v4& responder     = boost::asio::ip::address_v4(),
                const ProbeDuration&               roundTripTime = ProbeDuration::zero(),
                const boost::system::error_code&   errorCode     = boost::system::error_code());

   inline OutcomeType type()                                 const { return Type;          }
   inline unsigned int ttl()                                 const { return TTL;           }
   inline const ProbeIdentity& identity()                    const { return Identity;      }
   inline const boost::asio::ip::address_v4& responder()     const { return Responder;     }
   inline const ProbeDuration& roundTripTime()               const { return RoundTripTime; }
   inline const boost::system::error_code& errorCode()       const { return ErrorCode;     }

   // Responder and round-trip time are only meaningful for responses.
   inline bool hasResponse() const {
      return (Type == OT_EchoReply) || (Type == OT_TimeExceeded);
   }

   private:
   OutcomeType                 Type;
   unsigned int                TTL;
   ProbeIdentity               Identity;
   boost::asio::ip::address_v4 Responder;
   ProbeDuration               RoundTripTime;
   boost::system::error_code   ErrorCode;
};

std::ostream& operator<<(std::ostream& os, const ProbeOutcome& outcome);

#endif
