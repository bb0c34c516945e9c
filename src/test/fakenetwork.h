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

#ifndef FAKENETWORK_H
#define FAKENETWORK_H

#include "probesocket-base.h"
#include "probeidentity.h"

#include <netinet/in.h>

#include <deque>
#include <set>
#include <vector>


std::vector<uint8_t> makeEchoReply(const ProbeIdentity& identity);
std::vector<uint8_t> makeTimeExceeded(const std::vector<uint8_t>& quotedIPv4Header,
                                      const ProbeIdentity&        identity);
std::vector<uint8_t> makeQuotedIPv4Header(const boost::asio::ip::address_v4& source,
                                          const boost::asio::ip::address_v4& destination,
                                          const std::vector<uint8_t>&        options =
                                             std::vector<uint8_t>());
std::vector<uint8_t> makeIPv4Datagram(const boost::asio::ip::address_v4& source,
                                      const boost::asio::ip::address_v4& destination,
                                      const std::vector<uint8_t>&        icmpMessage,
                                      const uint8_t                      protocol = IPPROTO_ICMP);


// ###### In-memory network behind a probe socket ###########################
// Router i (1-based) answers TTL i with Time Exceeded. The destination
// answers every TTL beyond the last router with Echo Reply.
class FakeNetwork : public ProbeSocketBase
{
   public:
   struct SentProbe {
      unsigned int  TTL;
      ProbeIdentity Identity;
   };
   struct Datagram {
      std::vector<uint8_t>        Data;
      boost::asio::ip::address_v4 Source;
   };

   FakeNetwork(const boost::asio::ip::address_v4& local,
               const boost::asio::ip::address_v4& destination);
   virtual ~FakeNetwork();

   virtual const std::string& getName() const { return Name; }
   virtual bool prepareSocket();
   virtual void closeSocket();
   virtual bool setTTL(const unsigned int         ttl,
                       boost::system::error_code& errorCode);
   virtual std::size_t sendTo(const std::vector<uint8_t>&        message,
                              const boost::asio::ip::address_v4& destination,
                              boost::system::error_code&         errorCode);
   virtual ReceiveStatus receiveFrom(uint8_t*                     buffer,
                                     const std::size_t            bufferSize,
                                     std::size_t&                 length,
                                     boost::asio::ip::address_v4& source,
                                     const ProbeClock::time_point deadline,
                                     boost::system::error_code&   errorCode);

   inline void addRouter(const boost::asio::ip::address_v4& router) { Routers.push_back(router); }
   inline void silenceHop(const unsigned int ttl)                  { SilentHops.insert(ttl);     }
   inline void setAutoRespond(const bool autoRespond)              { AutoRespond = autoRespond;  }
   inline void setSendError(const boost::system::error_code& e)    { SendError = e;              }
   inline void setReceiveError(const boost::system::error_code& e) { ReceiveError = e;           }
   void queueDatagram(const std::vector<uint8_t>&        icmpMessage,
                      const boost::asio::ip::address_v4& source);
   void queueRawDatagram(const std::vector<uint8_t>&        data,
                         const boost::asio::ip::address_v4& source);

   inline const std::vector<SentProbe>& getSentProbes() const                  { return SentProbes;        }
   inline const std::vector<ProbeClock::time_point>& getReceiveDeadlines() const { return ReceiveDeadlines; }

   private:
   void respondTo(const SentProbe& sentProbe);

   const std::string                        Name;
   const boost::asio::ip::address_v4        Local;
   const boost::asio::ip::address_v4        Destination;
   std::vector<boost::asio::ip::address_v4> Routers;
   std::set<unsigned int>                   SilentHops;
   bool                                     AutoRespond;
   unsigned int                             CurrentTTL;
   boost::system::error_code                SendError;
   boost::system::error_code                ReceiveError;
   std::deque<Datagram>                     Queue;
   std::vector<SentProbe>                   SentProbes;
   std::vector<ProbeClock::time_point>      ReceiveDeadlines;
};

#endif
