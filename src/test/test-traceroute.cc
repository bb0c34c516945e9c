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

#include <gtest/gtest.h>

#include "fakenetwork.h"
#include "traceroute.h"

#include <boost/asio/error.hpp>

#include <limits.h>

#include <set>
#include <string>


class TracerouteTest : public ::testing::Test
{
   protected:
   TracerouteTest()
      : Local(boost::asio::ip::make_address_v4("192.168.1.10")),
        Destination(boost::asio::ip::make_address_v4("203.0.113.7")),
        Network(Local, Destination),
        Engine(Network, Destination) {
      Parameters.ProbesPerHop = 3;
      Parameters.Expiration   = 1000;
      Parameters.MaxTTL       = 64;
      Parameters.PacketSize   = 0;
      Parameters.CompleteHop  = false;
   }

   void addRouters(const unsigned int count) {
      for(unsigned int i = 1; i <= count; i++) {
         Network.addRouter(boost::asio::ip::address_v4((10U << 24) | i));
      }
   }

   const boost::asio::ip::address_v4 Local;
   const boost::asio::ip::address_v4 Destination;
   FakeNetwork                       Network;
   ProbeEngine                       Engine;
   TracerouteParameters              Parameters;
};


TEST_F(TracerouteTest, SequenceNumbersAreUniqueWithinRun)
{
   addRouters(10);
   Parameters.MaxTTL = 5;
   Traceroute traceroute(Engine, 0xabcd, Parameters);
   EXPECT_EQ(TS_Exhausted, traceroute.run());

   const std::vector<FakeNetwork::SentProbe>& sent = Network.getSentProbes();
   ASSERT_EQ(15U, sent.size());
   std::set<uint16_t> seqNumbers;
   for(const FakeNetwork::SentProbe& sentProbe : sent) {
      EXPECT_EQ(0xabcd, sentProbe.Identity.RunToken);
      seqNumbers.insert(sentProbe.Identity.SeqNumber);
   }
   EXPECT_EQ(15U, seqNumbers.size());
   EXPECT_EQ(1U, sent.front().Identity.SeqNumber);
   EXPECT_EQ(15U, sent.back().Identity.SeqNumber);
   EXPECT_EQ(15U, traceroute.getSequenceCounter().issued());
}

TEST_F(TracerouteTest, ProbesHopsInAscendingTTLOrder)
{
   addRouters(10);
   Parameters.MaxTTL = 4;
   Traceroute traceroute(Engine, 1, Parameters);
   traceroute.run();

   const std::vector<FakeNetwork::SentProbe>& sent = Network.getSentProbes();
   ASSERT_EQ(12U, sent.size());
   for(size_t i = 0; i < sent.size(); i++) {
      EXPECT_EQ(1 + i / 3, sent[i].TTL);
   }
}

TEST_F(TracerouteTest, StopsAtFirstEchoReply)
{
   addRouters(2);
   Traceroute traceroute(Engine, 0x0101, Parameters);
   EXPECT_EQ(TS_Reached, traceroute.run());
   EXPECT_EQ(3U, traceroute.getCurrentTTL());

   const std::vector<HopResult>& hops = traceroute.getHops();
   ASSERT_EQ(3U, hops.size());
   for(unsigned int i = 0; i < 2; i++) {
      EXPECT_EQ(i + 1, hops[i].TTL);
      ASSERT_EQ(3U, hops[i].Outcomes.size());
      for(const ProbeOutcome& outcome : hops[i].Outcomes) {
         EXPECT_EQ(OT_TimeExceeded, outcome.type());
         EXPECT_EQ(boost::asio::ip::address_v4((10U << 24) | (i + 1)), outcome.responder());
      }
   }
   ASSERT_EQ(1U, hops[2].Outcomes.size());
   EXPECT_EQ(OT_EchoReply, hops[2].Outcomes[0].type());
   EXPECT_EQ(Destination, hops[2].Outcomes[0].responder());

   const std::vector<FakeNetwork::SentProbe>& sent = Network.getSentProbes();
   EXPECT_EQ(7U, sent.size());
   for(const FakeNetwork::SentProbe& sentProbe : sent) {
      EXPECT_LE(sentProbe.TTL, 3U);
   }
}

TEST_F(TracerouteTest, CompleteHopFinishesProbesOfLastHop)
{
   addRouters(2);
   Parameters.CompleteHop = true;
   Traceroute traceroute(Engine, 0x0101, Parameters);
   EXPECT_EQ(TS_Reached, traceroute.run());

   const std::vector<HopResult>& hops = traceroute.getHops();
   ASSERT_EQ(3U, hops.size());
   ASSERT_EQ(3U, hops[2].Outcomes.size());
   for(const ProbeOutcome& outcome : hops[2].Outcomes) {
      EXPECT_EQ(OT_EchoReply, outcome.type());
   }
   EXPECT_EQ(9U, Network.getSentProbes().size());
}

TEST_F(TracerouteTest, SilentHopDoesNotEndRun)
{
   addRouters(3);
   Network.silenceHop(2);
   Parameters.Expiration = 20;
   Traceroute traceroute(Engine, 0x0202, Parameters);
   EXPECT_EQ(TS_Reached, traceroute.run());

   const std::vector<HopResult>& hops = traceroute.getHops();
   ASSERT_EQ(4U, hops.size());
   ASSERT_EQ(3U, hops[1].Outcomes.size());
   for(const ProbeOutcome& outcome : hops[1].Outcomes) {
      EXPECT_EQ(OT_Timeout, outcome.type());
   }
   EXPECT_EQ(OT_TimeExceeded, hops[2].Outcomes[0].type());
   EXPECT_EQ(OT_EchoReply, hops[3].Outcomes[0].type());
}

TEST_F(TracerouteTest, ExhaustedAtMaxTTL)
{
   addRouters(10);
   Parameters.MaxTTL = 4;
   Traceroute traceroute(Engine, 0x0303, Parameters);
   EXPECT_EQ(TS_Exhausted, traceroute.run());
   EXPECT_EQ(TS_Exhausted, traceroute.getState());
   EXPECT_EQ(4U, traceroute.getCurrentTTL());
   EXPECT_EQ(4U, traceroute.getHops().size());
}

TEST_F(TracerouteTest, SendErrorsDoNotEndRun)
{
   Network.setSendError(boost::asio::error::network_unreachable);
   Parameters.MaxTTL = 2;
   Traceroute traceroute(Engine, 0x0404, Parameters);
   EXPECT_EQ(TS_Exhausted, traceroute.run());

   const std::vector<HopResult>& hops = traceroute.getHops();
   ASSERT_EQ(2U, hops.size());
   for(const HopResult& hop : hops) {
      ASSERT_EQ(3U, hop.Outcomes.size());
      for(const ProbeOutcome& outcome : hop.Outcomes) {
         EXPECT_EQ(OT_TransportError, outcome.type());
      }
   }
}

TEST_F(TracerouteTest, CallbacksFollowProbeOrder)
{
   addRouters(1);
   Parameters.ProbesPerHop = 2;
   Traceroute traceroute(Engine, 0x0505, Parameters);

   std::vector<std::string> events;
   traceroute.setHopCallback([&events](const unsigned int ttl) {
      events.push_back("hop " + std::to_string(ttl));
   });
   traceroute.setProbeResultCallback([&events](const ProbeOutcome& outcome) {
      events.push_back(getOutcomeName(outcome.type()));
   });
   EXPECT_EQ(TS_Reached, traceroute.run());

   ASSERT_EQ(5U, events.size());
   EXPECT_EQ("hop 1", events[0]);
   EXPECT_EQ(getOutcomeName(OT_TimeExceeded), events[1]);
   EXPECT_EQ(getOutcomeName(OT_TimeExceeded), events[2]);
   EXPECT_EQ("hop 2", events[3]);
   EXPECT_EQ(getOutcomeName(OT_EchoReply), events[4]);
}

TEST_F(TracerouteTest, ContinuesSequenceFromGivenStart)
{
   addRouters(1);
   Traceroute traceroute(Engine, 0x0606, Parameters, 0xfffe);
   traceroute.run();

   const std::vector<FakeNetwork::SentProbe>& sent = Network.getSentProbes();
   ASSERT_EQ(4U, sent.size());
   EXPECT_EQ(0xfffe, sent[0].Identity.SeqNumber);
   EXPECT_EQ(0xffff, sent[1].Identity.SeqNumber);
   EXPECT_EQ(0x0000, sent[2].Identity.SeqNumber);
   EXPECT_EQ(0x0001, sent[3].Identity.SeqNumber);
}


TEST(SequenceCounter, CountsUpwardsAndWraps)
{
   SequenceCounter counter(0xffff);
   EXPECT_EQ(0xffff, counter.next());
   EXPECT_EQ(0x0000, counter.next());
   EXPECT_EQ(0x0001, counter.peek());
   EXPECT_EQ(2U, counter.issued());
}


TEST(TracerouteParameters, AcceptsValidOptions)
{
   TracerouteParameters parameters;
   std::string          errorMessage;
   ASSERT_TRUE(makeTracerouteParameters(parameters, 3, 5, 64, 0, true, errorMessage));
   EXPECT_EQ(3U, parameters.ProbesPerHop);
   EXPECT_EQ(5000U, parameters.Expiration);
   EXPECT_EQ(64U, parameters.MaxTTL);
   EXPECT_EQ(0U, parameters.PacketSize);
   EXPECT_TRUE(parameters.CompleteHop);

   EXPECT_TRUE(makeTracerouteParameters(parameters, 1, UINT_MAX / 1000, 255, 65535, false, errorMessage));
   EXPECT_EQ(1000U * (UINT_MAX / 1000), parameters.Expiration);
}

TEST(TracerouteParameters, RejectsWaitTimeBeyondExpirationRange)
{
   TracerouteParameters parameters;
   std::string          errorMessage;
   EXPECT_FALSE(makeTracerouteParameters(parameters, 3, 0, 64, 0, false, errorMessage));
   EXPECT_FALSE(makeTracerouteParameters(parameters, 3, UINT_MAX / 1000 + 1, 64, 0, false, errorMessage));
   EXPECT_FALSE(makeTracerouteParameters(parameters, 3, 536870912, 64, 0, false, errorMessage));
   EXPECT_EQ("Invalid wait time: 536870912", errorMessage);
}

TEST(TracerouteParameters, RejectsOtherOutOfRangeOptions)
{
   TracerouteParameters parameters;
   std::string          errorMessage;
   EXPECT_FALSE(makeTracerouteParameters(parameters, 0, 5, 64, 0, false, errorMessage));
   EXPECT_FALSE(makeTracerouteParameters(parameters, 3, 5, 0, 0, false, errorMessage));
   EXPECT_FALSE(makeTracerouteParameters(parameters, 3, 5, 256, 0, false, errorMessage));
   EXPECT_FALSE(makeTracerouteParameters(parameters, 3, 5, 64, 65536, false, errorMessage));
   // 300 x 255 sequence numbers do not fit into 16 bits
   EXPECT_FALSE(makeTracerouteParameters(parameters, 300, 5, 255, 0, false, errorMessage));
   EXPECT_TRUE(makeTracerouteParameters(parameters, 257, 5, 255, 0, false, errorMessage));
}

TEST(TracerouteState, HasNames)
{
   EXPECT_STREQ("Probing", getTracerouteStateName(TS_Probing));
   EXPECT_STREQ("Reached", getTracerouteStateName(TS_Reached));
   EXPECT_STREQ("Exhausted", getTracerouteStateName(TS_Exhausted));
}
