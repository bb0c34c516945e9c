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

#ifndef TRACEROUTE_H
#define TRACEROUTE_H

#include "probeengine.h"
#include "probeidentity.h"
#include "probeoutcome.h"

#include <functional>
#include <string>
#include <vector>


struct TracerouteParameters
{
   unsigned int ProbesPerHop;
   unsigned int Expiration;     // in ms
   unsigned int MaxTTL;
   unsigned int PacketSize;
   bool         CompleteHop;    // Finish all probes of the hop reaching the destination
};

bool makeTracerouteParameters(TracerouteParameters& parameters,
                              const unsigned int    probesPerHop,
                              const unsigned int    waitTime,     // in s
                              const unsigned int    maxTTL,
                              const unsigned int    packetSize,
                              const bool            completeHop,
                              std::string&          errorMessage);


enum TracerouteState
{
   TS_Probing   = 0,
   TS_Reached   = 1,   // Echo Reply received
   TS_Exhausted = 2    // MaxTTL probed without Echo Reply
};

const char* getTracerouteStateName(const TracerouteState state);


struct HopResult
{
   unsigned int              TTL;
   std::vector<ProbeOutcome> Outcomes;
};

typedef std::function<void (const unsigned int ttl)>      HopCallbackType;
typedef std::function<void (const ProbeOutcome& outcome)> ProbeResultCallbackType;


class Traceroute
{
   public:
   Traceroute(ProbeEngine&                probeEngine,
              const uint16_t              runToken,
              const TracerouteParameters& parameters,
              const uint16_t              firstSeqNumber = 1);
   virtual ~Traceroute();

   inline void setHopCallback(const HopCallbackType& hopCallback) {
      HopCallback = hopCallback;
   }
   inline void setProbeResultCallback(const ProbeResultCallbackType& probeResultCallback) {
      ProbeResultCallback = probeResultCallback;
   }

   TracerouteState run();

   inline TracerouteState getState()                 const { return State;      }
   inline unsigned int getCurrentTTL()               const { return CurrentTTL; }
   inline const std::vector<HopResult>& getHops()    const { return Hops;       }
   inline const SequenceCounter& getSequenceCounter() const { return SeqCounter; }

   protected:
   virtual bool runHop(const unsigned int ttl);

   ProbeEngine&               Engine;
   const uint16_t             RunToken;
   const TracerouteParameters Parameters;
   SequenceCounter            SeqCounter;
   TracerouteState            State;
   unsigned int               CurrentTTL;
   std::vector<HopResult>     Hops;
   HopCallbackType            HopCallback;
   ProbeResultCallbackType    ProbeResultCallback;
};

#endif
