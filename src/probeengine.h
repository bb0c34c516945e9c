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

#ifndef PROBEENGINE_H
#define PROBEENGINE_H

#include "probeidentity.h"
#include "probeoutcome.h"
#include "probesocket-base.h"

#include <boost/asio/ip/address_v4.hpp>


// ###### One transmitted Echo Request ######################################
struct Probe
{
   unsigned int              TTL;
   ProbeIdentity             Identity;
   ProbeClock::time_point    SendTime;
   boost::system::error_code SendError;   // Set, if the request was not sent
};


class ProbeEngine
{
   public:
   ProbeEngine(ProbeSocketBase&                   probeSocket,
               const boost::asio::ip::address_v4& destination,
               const unsigned int                 packetSize = 0);
   ~ProbeEngine();

   inline const boost::asio::ip::address_v4& getDestination() const { return Destination; }
   inline unsigned int getDiscardedMessages() const { return DiscardedMessages; }

   Probe sendProbe(const unsigned int ttl, const ProbeIdentity& identity);
   ProbeOutcome awaitResponse(const Probe&                 probe,
                              const ProbeClock::time_point deadline);
   ProbeOutcome runProbe(const unsigned int   ttl,
                         const ProbeIdentity& identity,
                         const unsigned int   expiration);

   private:
   ProbeSocketBase&                  ProbeSocket;
   const boost::asio::ip::address_v4 Destination;
   const unsigned int                PacketSize;
   unsigned int                      DiscardedMessages;
   uint8_t                           MessageBuffer[65536];
};

#endif
