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
	@brief Tests for PhyConfig
 */

#include "ethphy.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>
#include <fstream>

using namespace std;

///@brief Writes a YAML file into the test scratch directory and returns its path
static string WriteConfig(const string& name, const string& text)
{
	string path = testing::TempDir() + name;
	ofstream out(path);
	out << text;
	return path;
}

TEST(PhyConfig, Defaults)
{
	PhyConfig config;
	EXPECT_EQ(config.GetMode(), PhyConfig::MODE_GMII);
	EXPECT_EQ(config.GetSpeed(), 1000000000LL);
	EXPECT_EQ(config.GetLaneCount(), 8u);
	EXPECT_EQ(config.GetIfg(), 12);
	EXPECT_TRUE(config.GetEnableDic());
	EXPECT_FALSE(config.GetForceOffsetStart());
	EXPECT_TRUE(config.GetResetActiveHigh());
	EXPECT_EQ(config.GetQueueLimitBytes(), 0u);
	EXPECT_EQ(config.GetQueueLimitFrames(), 0u);
}

TEST(PhyConfig, ModeNames)
{
	EXPECT_EQ(PhyConfig::ParseMode("xgmii"), PhyConfig::MODE_XGMII);
	EXPECT_EQ(PhyConfig::ParseMode(" RGMII "), PhyConfig::MODE_RGMII);
	EXPECT_EQ(PhyConfig::ParseMode("Mii"), PhyConfig::MODE_MII);
	EXPECT_THROW(PhyConfig::ParseMode("sgmii"), PhyConfigurationError);
	EXPECT_THROW(PhyConfig::ParseMode(" \xce\xbcii "), PhyConfigurationError);
	EXPECT_EQ(PhyConfig::GetModeName(PhyConfig::MODE_RMII), "RMII");
}

TEST(PhyConfig, LoadFile)
{
	auto path = WriteConfig("ethphy_full.yml",
		"phy:\n"
		"  mode: xgmii\n"
		"  speed: 10G\n"
		"  lanes: 4\n"
		"  ifg: 8\n"
		"  enable_dic: false\n"
		"  force_offset_start: true\n"
		"  reset_active_level: low\n"
		"  queue:\n"
		"    limit_bytes: 16k\n"
		"    limit_frames: 4\n"
		"  colour: blue\n");

	PhyConfig config;
	ASSERT_TRUE(config.Load(path));
	EXPECT_EQ(config.GetFileName(), path);
	EXPECT_EQ(config.GetMode(), PhyConfig::MODE_XGMII);
	EXPECT_EQ(config.GetSpeed(), 10000000000LL);
	EXPECT_EQ(config.GetLaneCount(), 4u);
	EXPECT_EQ(config.GetIfg(), 8);
	EXPECT_FALSE(config.GetEnableDic());
	EXPECT_TRUE(config.GetForceOffsetStart());
	EXPECT_FALSE(config.GetResetActiveHigh());
	EXPECT_EQ(config.GetQueueLimitBytes(), 16384u);
	EXPECT_EQ(config.GetQueueLimitFrames(), 4u);

	//Reloading starts from the defaults again
	auto small = WriteConfig("ethphy_small.yml", "phy:\n  mode: mii\n  speed: 10M\n");
	ASSERT_TRUE(config.Load(small));
	EXPECT_EQ(config.GetMode(), PhyConfig::MODE_MII);
	EXPECT_EQ(config.GetSpeed(), 10000000LL);
	EXPECT_EQ(config.GetIfg(), 12);
	EXPECT_TRUE(config.GetEnableDic());
	EXPECT_EQ(config.GetQueueLimitFrames(), 0u);
}

TEST(PhyConfig, MissingOrEmpty)
{
	PhyConfig config;
	EXPECT_FALSE(config.Load(testing::TempDir() + "ethphy_does_not_exist.yml"));
	EXPECT_FALSE(config.Load(WriteConfig("ethphy_empty.yml", "")));
	EXPECT_FALSE(config.Load(WriteConfig("ethphy_nophy.yml", "mac:\n  mode: gmii\n")));
}

TEST(PhyConfig, BadContents)
{
	PhyConfig config;
	EXPECT_THROW(config.Load(WriteConfig("ethphy_badmode.yml", "phy:\n  mode: sgmii\n")), PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_badspeed.yml", "phy:\n  speed: fast\n")), PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_badifg.yml", "phy:\n  ifg: -1\n")), PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_badifg2.yml", "phy:\n  ifg: lots\n")), PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_badlanes.yml", "phy:\n  mode: xgmii\n  lanes: 2\n")),
		PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_badreset.yml", "phy:\n  reset_active_level: sideways\n")),
		PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_syntax.yml", "phy: [\n")), PhyConfigurationError);
}

TEST(PhyConfig, SpeedMustSuitMode)
{
	PhyConfig config;
	EXPECT_THROW(config.Load(WriteConfig("ethphy_rmii_1g.yml", "phy:\n  mode: rmii\n  speed: 1G\n")),
		PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_mii_1g.yml", "phy:\n  mode: mii\n  speed: 1G\n")),
		PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_xgmii_1g.yml", "phy:\n  mode: xgmii\n  speed: 1G\n")),
		PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_gmii_10g.yml", "phy:\n  mode: gmii\n  speed: 10G\n")),
		PhyConfigurationError);
	EXPECT_THROW(config.Load(WriteConfig("ethphy_gmii_odd.yml", "phy:\n  speed: 250M\n")),
		PhyConfigurationError);

	//Key order does not matter
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_rgmii_10m.yml", "phy:\n  speed: 10M\n  mode: rgmii\n")));
	EXPECT_EQ(config.GetSpeed(), 10000000LL);

	EXPECT_EQ(PhyConfig::GetDefaultSpeed(PhyConfig::MODE_GMII), 1000000000LL);
	EXPECT_EQ(PhyConfig::GetDefaultSpeed(PhyConfig::MODE_RGMII), 1000000000LL);
	EXPECT_EQ(PhyConfig::GetDefaultSpeed(PhyConfig::MODE_MII), 100000000LL);
	EXPECT_EQ(PhyConfig::GetDefaultSpeed(PhyConfig::MODE_RMII), 100000000LL);
	EXPECT_EQ(PhyConfig::GetDefaultSpeed(PhyConfig::MODE_XGMII), 10000000000LL);
}

TEST(PhyConfig, ApplyToTransmitter)
{
	PhyConfig config;
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_tx.yml",
		"phy:\n"
		"  ifg: 5\n"
		"  enable_dic: no\n"
		"  force_offset_start: yes\n"
		"  queue:\n"
		"    limit_frames: 3\n")));

	SimulationKernel kernel;
	BusSignal clk(kernel, "clk");
	BusSignal d(kernel, "gmii_d", 8);
	BusSignal dv(kernel, "gmii_dv");
	PhyTransmitter tx(kernel, make_unique<GMIILaneCodec>(d, nullptr, dv), clk);

	config.ApplyTo(tx);
	EXPECT_EQ(tx.GetIfg(), 5);
	EXPECT_FALSE(tx.GetEnableDic());
	EXPECT_TRUE(tx.GetForceOffsetStart());
	EXPECT_EQ(tx.GetQueue().GetLimitFrames(), 3u);
	EXPECT_EQ(tx.GetQueue().GetLimitBytes(), 0u);
}

TEST(PhyConfig, ApplyToPhy)
{
	SimulationKernel kernel;
	BusSignal txd(kernel, "xgmii_txd", 32);
	BusSignal txc(kernel, "xgmii_txc", 4);
	BusSignal txClk(kernel, "xgmii_tx_clk");
	BusSignal rxd(kernel, "xgmii_rxd", 32);
	BusSignal rxc(kernel, "xgmii_rxc", 4);
	BusSignal rxClk(kernel, "xgmii_rx_clk");
	XGMIIPhy phy(kernel, txd, txc, txClk, rxd, rxc, rxClk);

	PhyConfig config;
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_xgmii4.yml",
		"phy:\n  mode: XGMII\n  speed: 10 Gbps\n  lanes: 4\n  ifg: 16\n")));
	config.ApplyTo(phy);
	EXPECT_EQ(phy.GetRx().GetIfg(), 16);
	EXPECT_EQ(phy.GetSpeed(), 10000000000LL);

	//Lane count has to match the bus
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_xgmii8.yml", "phy:\n  mode: xgmii\n  lanes: 8\n")));
	EXPECT_THROW(config.ApplyTo(phy), PhyConfigurationError);

	//So does the interface type
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_gmii.yml", "phy:\n  mode: gmii\n")));
	EXPECT_THROW(config.ApplyTo(phy), PhyConfigurationError);

	//Speed defaults to the only one XGMII can do
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_xgmii_nospeed.yml", "phy:\n  mode: xgmii\n  lanes: 4\n")));
	EXPECT_EQ(config.GetSpeed(), 10000000000LL);
	config.ApplyTo(phy);
	EXPECT_EQ(phy.GetSpeed(), 10000000000LL);
}

TEST(PhyConfig, ApplyChangesSpeed)
{
	SimulationKernel kernel;
	BusSignal txd(kernel, "mii_txd", 4);
	BusSignal txEn(kernel, "mii_tx_en");
	BusSignal txClk(kernel, "mii_tx_clk");
	BusSignal rxd(kernel, "mii_rxd", 4);
	BusSignal rxDv(kernel, "mii_rx_dv");
	BusSignal rxClk(kernel, "mii_rx_clk");
	MIIPhy phy(kernel, txd, nullptr, txEn, txClk, rxd, nullptr, rxDv, rxClk);

	PhyConfig config;
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_mii.yml", "phy:\n  mode: mii\n  speed: 10M\n")));
	config.ApplyTo(phy);
	EXPECT_EQ(phy.GetSpeed(), 10000000LL);
	EXPECT_EQ(phy.GetClockGenerator().GetPeriod(), 400 * FS_PER_NS_INT);

	//Without a speed key the MII default of 100 Mb/s applies
	ASSERT_TRUE(config.Load(WriteConfig("ethphy_mii_nospeed.yml", "phy:\n  mode: mii\n")));
	EXPECT_EQ(config.GetSpeed(), 100000000LL);
	config.ApplyTo(phy);
	EXPECT_EQ(phy.GetSpeed(), 100000000LL);
	EXPECT_EQ(phy.GetClockGenerator().GetPeriod(), 40 * FS_PER_NS_INT);
}
