/***********************************************************************************************************************
*                                                                                                                      *
* libethphy                                                                                                            *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@author Andrew D. Zonenberg
	@brief Tests for the XGMII transmitter, receiver and PHY model
 */

#include "ethphy.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>

using namespace std;

#define XGMII_PERIOD 6400000LL

/**
	@brief XGMII transmitter and receiver sharing one bus, with a monitor on the wires
 */
class XgmiiBench
{
public:
	XgmiiBench(size_t lanes)
		: clk(kernel, "xgmii_clk")
		, rst(kernel, "rst")
		, d(kernel, "xgmii_d", 8*lanes)
		, c(kernel, "xgmii_c", lanes)
		, tx(kernel, make_unique<XGMIILaneCodec>(d, c), clk, &rst)
		, rx(kernel, make_unique<XGMIILaneCodec>(d, c), clk, &rst)
		, gen(kernel, clk)
		, monitor(clk, d, c)
	{
		gen.Start(XGMII_PERIOD);
	}

	///@brief Sends everything and waits for all of it to arrive
	bool Run(const vector<EthernetFrame>& frames)
	{
		for(auto& f : frames)
			tx.SendNowait(f);
		return kernel.RunUntil([&]{ return rx.GetCount() == frames.size(); }, 10 * 1000 * 1000 * FS_PER_NS_INT);
	}

	SimulationKernel kernel;
	BusSignal clk;
	BusSignal rst;
	BusSignal d;
	BusSignal c;
	PhyTransmitter tx;
	PhyReceiver rx;
	ClockGenerator gen;
	XgmiiMonitor monitor;
};

TEST(XGMII, RoundTrip)
{
	for(size_t lanes : {1, 4, 8})
	{
		SCOPED_TRACE(lanes);
		XgmiiBench bench(lanes);
		EXPECT_EQ(bench.tx.GetCodec()->GetLaneCount(), lanes);
		EXPECT_TRUE(bench.tx.GetCodec()->IsInbandFramed());

		auto rng = MakeTestRNG();
		vector<EthernetFrame> frames;
		for(size_t n : {46, 60, 61, 62, 63, 64, 65, 66, 67, 127, 512, 1500, 9000})
			frames.push_back(EthernetFrame::FromPayload(RandomPayload(rng, n)));
		ASSERT_TRUE(bench.Run(frames));

		for(auto& f : frames)
		{
			auto r = bench.rx.RecvNowait();
			EXPECT_EQ(r, f);
			EXPECT_TRUE(r.CheckFCS());
			EXPECT_TRUE(r.m_flags.empty());

			//Start is always on lane 0 or 4
			ASSERT_TRUE(r.m_startLane.has_value());
			EXPECT_EQ(*r.m_startLane % 4, 0u);
			if(lanes < 8)
				EXPECT_EQ(*r.m_startLane, 0u);
		}
	}
}

TEST(XGMII, MinimumSizeGap)
{
	for(size_t lanes : {1, 4, 8})
	{
		SCOPED_TRACE(lanes);
		XgmiiBench bench(lanes);

		vector<EthernetFrame> frames(20, EthernetFrame::FromPayload(CountingPayload(64)));
		ASSERT_TRUE(bench.Run(frames));

		auto gaps = bench.monitor.GetGaps();
		ASSERT_EQ(gaps.size(), frames.size() - 1);
		for(auto g : gaps)
			EXPECT_EQ(g, 12);
	}
}

TEST(XGMII, DeficitIdleCount)
{
	XgmiiBench bench(8);
	ASSERT_TRUE(bench.tx.GetEnableDic());

	auto rng = MakeTestRNG();
	uniform_int_distribution<size_t> len(46, 256);
	vector<EthernetFrame> frames;
	for(int i=0; i<1000; i++)
		frames.push_back(EthernetFrame::FromPayload(RandomPayload(rng, len(rng))));
	ASSERT_TRUE(bench.Run(frames));

	auto gaps = bench.monitor.GetGaps();
	ASSERT_EQ(gaps.size(), frames.size() - 1);

	//Individual gaps shrink by up to three, the average stays at the configured value
	double avg = accumulate(gaps.begin(), gaps.end(), 0.0) / gaps.size();
	EXPECT_GE(avg, 11);
	EXPECT_LE(avg, 13);
	EXPECT_GE(*min_element(gaps.begin(), gaps.end()), 9);
}

TEST(XGMII, NoDeficitIdleCount)
{
	XgmiiBench bench(8);
	bench.tx.SetEnableDic(false);

	auto rng = MakeTestRNG();
	uniform_int_distribution<size_t> len(46, 256);
	vector<EthernetFrame> frames;
	for(int i=0; i<200; i++)
		frames.push_back(EthernetFrame::FromPayload(RandomPayload(rng, len(rng))));
	ASSERT_TRUE(bench.Run(frames));

	auto gaps = bench.monitor.GetGaps();
	ASSERT_EQ(gaps.size(), frames.size() - 1);
	EXPECT_GE(*min_element(gaps.begin(), gaps.end()), 12);
}

TEST(XGMII, ForceOffsetStart)
{
	XgmiiBench bench(8);
	bench.tx.SetForceOffsetStart(true);

	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	ASSERT_TRUE(bench.Run({frame, frame}));
	for(int i=0; i<2; i++)
	{
		auto r = bench.rx.RecvNowait();
		EXPECT_EQ(r, frame);
		ASSERT_TRUE(r.m_startLane.has_value());
		EXPECT_EQ(*r.m_startLane, 4u);
	}
}

TEST(XGMII, BadPreamble)
{
	XgmiiBench bench(8);

	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	frame.m_data[0] = 0x00;
	CompletionCounter cc(frame);
	bench.tx.SendNowait(frame);

	EXPECT_THROW(bench.kernel.RunFor(100 * FS_PER_NS_INT), PhyProtocolError);
	EXPECT_EQ(cc.m_count, 1);
	EXPECT_FALSE(cc.m_completion->GetFrame().m_endTime.has_value());
}

TEST(XGMII, ControlCharacterEndsFrame)
{
	XgmiiBench bench(4);

	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	frame.m_flags.assign(frame.size(), 0);
	frame.m_data[20] = static_cast<uint8_t>(XgmiiCtrl::ERROR);
	frame.m_flags[20] = 1;
	bench.tx.SendNowait(frame);

	auto r = bench.rx.Recv(true, 10 * 1000 * FS_PER_NS_INT);
	ASSERT_EQ(r.size(), 21u);
	EXPECT_EQ(r.m_data, vector<uint8_t>(frame.m_data.begin(), frame.m_data.begin() + 21));
	ASSERT_EQ(r.m_flags.size(), 21u);
	EXPECT_EQ(r.m_flags[20], 1);
	EXPECT_EQ(accumulate(r.m_flags.begin(), r.m_flags.end(), 0), 1);

	//The tail of the frame after the error is not a frame of its own
	EXPECT_FALSE(bench.rx.Wait(1000 * FS_PER_NS_INT));
}

TEST(XGMII, Reset)
{
	XgmiiBench bench(8);
	EXPECT_EQ(bench.d.Read(), 0x0707070707070707ULL);
	EXPECT_EQ(bench.c.Read(), 0xffULL);

	bench.tx.SendNowait(EthernetFrame::FromPayload(CountingPayload(1000)));
	bench.kernel.RunFor(100 * FS_PER_NS_INT);

	bench.rst.Write(1);
	EXPECT_EQ(bench.d.Read(), 0u);
	EXPECT_EQ(bench.c.Read(), 0u);
	bench.kernel.RunFor(100 * FS_PER_NS_INT);
	EXPECT_EQ(bench.d.Read(), 0u);
	EXPECT_EQ(bench.c.Read(), 0u);

	bench.rst.Write(0);
	EXPECT_EQ(bench.d.Read(), 0x0707070707070707ULL);
	EXPECT_EQ(bench.c.Read(), 0xffULL);

	//Neither the truncated frame nor anything else comes out
	EXPECT_FALSE(bench.rx.Wait(1000 * FS_PER_NS_INT));
	EXPECT_TRUE(bench.tx.IsIdle());
}

TEST(XGMII, LaneMismatch)
{
	SimulationKernel kernel;
	BusSignal d(kernel, "xgmii_d", 64);
	BusSignal c(kernel, "xgmii_c", 4);
	EXPECT_THROW(make_unique<XGMIILaneCodec>(d, c), PhyConfigurationError);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// PHY model

TEST(XGMIIPhy, LaneCounts)
{
	for(size_t lanes : {1, 4, 8})
	{
		SCOPED_TRACE(lanes);

		SimulationKernel kernel;
		BusSignal txd(kernel, "xgmii_txd", 8*lanes);
		BusSignal txc(kernel, "xgmii_txc", lanes);
		BusSignal txClk(kernel, "xgmii_tx_clk");
		BusSignal rxd(kernel, "xgmii_rxd", 8*lanes);
		BusSignal rxc(kernel, "xgmii_rxc", lanes);
		BusSignal rxClk(kernel, "xgmii_rx_clk");
		XGMIIPhy phy(kernel, txd, txc, txClk, rxd, rxc, rxClk);
		PhyTransmitter macTx(kernel, make_unique<XGMIILaneCodec>(txd, txc), txClk);
		PhyReceiver macRx(kernel, make_unique<XGMIILaneCodec>(rxd, rxc), rxClk);

		EXPECT_EQ(phy.GetName(), "XGMII");
		EXPECT_EQ(phy.GetLaneCount(), lanes);
		EXPECT_EQ(phy.GetSpeed(), 10000000000LL);
		EXPECT_EQ(phy.GetClockGenerator().GetPeriod(), static_cast<int64_t>(lanes * 800000));
		EXPECT_THROW(phy.SetSpeed(1000000000LL), PhyConfigurationError);

		auto a = EthernetFrame::FromPayload(CountingPayload(300));
		auto b = EthernetFrame::FromPayload(CountingPayload(46));
		macTx.SendNowait(a);
		phy.GetRx().SendNowait(b);

		auto& phyTx = phy.GetTx();
		ASSERT_TRUE(kernel.RunUntil(
			[&]{ return (phyTx.GetCount() == 1) && (macRx.GetCount() == 1); },
			100 * 1000 * FS_PER_NS_INT));
		EXPECT_EQ(phyTx.RecvNowait(), a);
		EXPECT_EQ(macRx.RecvNowait(), b);
	}
}

TEST(XGMIIPhy, BadBuses)
{
	SimulationKernel kernel;
	BusSignal txd(kernel, "xgmii_txd", 64);
	BusSignal txc(kernel, "xgmii_txc", 8);
	BusSignal txClk(kernel, "xgmii_tx_clk");
	BusSignal rxd(kernel, "xgmii_rxd", 32);
	BusSignal rxc(kernel, "xgmii_rxc", 4);
	BusSignal rxClk(kernel, "xgmii_rx_clk");
	BusSignal d16(kernel, "xgmii_d16", 16);
	BusSignal c2(kernel, "xgmii_c2", 2);

	//Different lane counts in each direction
	EXPECT_THROW(make_unique<XGMIIPhy>(kernel, txd, txc, txClk, rxd, rxc, rxClk), PhyConfigurationError);

	//Two lanes is not a real XGMII configuration
	EXPECT_THROW(make_unique<XGMIIPhy>(kernel, d16, c2, txClk, d16, c2, rxClk), PhyConfigurationError);
}
