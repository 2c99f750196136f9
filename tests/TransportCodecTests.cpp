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
	@brief Tests for TransportCodec, Bijection and BaseRBlockCodec
 */

#include "ethphy.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Lane helpers

TEST(TransportCodec, LaneCount)
{
	EXPECT_EQ(TransportCodec::GetLaneCount(8), 1u);
	EXPECT_EQ(TransportCodec::GetLaneCount(32), 4u);
	EXPECT_EQ(TransportCodec::GetLaneCount(64), 8u);
	EXPECT_THROW(TransportCodec::GetLaneCount(0), PhyConfigurationError);
	EXPECT_THROW(TransportCodec::GetLaneCount(12), PhyConfigurationError);
}

TEST(TransportCodec, NibbleSplit)
{
	vector<uint8_t> nibbles;
	vector<uint8_t> flags;
	TransportCodec::SplitNibbles({0xd5, 0x3c}, {0, 1}, nibbles, flags);

	EXPECT_EQ(nibbles, vector<uint8_t>({0x5, 0xd, 0xc, 0x3}));
	EXPECT_EQ(flags, vector<uint8_t>({0, 0, 1, 1}));
}

TEST(TransportCodec, NibbleJoinResyncsOnSFD)
{
	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	vector<uint8_t> nibbles;
	vector<uint8_t> flags;
	TransportCodec::SplitNibbles(frame.m_data, frame.m_flags, nibbles, flags);

	//Lose the first nibble of the preamble, the receiver must still find the byte boundary
	nibbles.erase(nibbles.begin());
	flags.erase(flags.begin());

	vector<uint8_t> data;
	vector<uint8_t> dflags;
	TransportCodec::JoinNibbles(nibbles, flags, data, dflags);

	EthernetFrame rx(data, dflags);
	EXPECT_EQ(rx.GetPayload(), frame.GetPayload());
	EXPECT_TRUE(rx.CheckFCS());
}

TEST(TransportCodec, NibbleJoinMergesFlags)
{
	vector<uint8_t> data;
	vector<uint8_t> flags;
	TransportCodec::JoinNibbles({0x5, 0x5, 0x5, 0xd, 0x1, 0x2}, {0, 0, 0, 0, 0, 1}, data, flags);

	EXPECT_EQ(data, vector<uint8_t>({0x55, 0xd5, 0x21}));
	EXPECT_EQ(flags, vector<uint8_t>({0, 0, 1}));
}

TEST(TransportCodec, DibitSplit)
{
	vector<uint8_t> dibits;
	vector<uint8_t> flags;
	TransportCodec::SplitDibits({0xd5}, {}, dibits, flags);

	EXPECT_EQ(dibits, vector<uint8_t>({1, 1, 1, 3}));
	EXPECT_EQ(flags, vector<uint8_t>({0, 0, 0, 0}));
}

TEST(TransportCodec, DibitJoinResyncsOnSFD)
{
	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	vector<uint8_t> dibits;
	vector<uint8_t> flags;
	TransportCodec::SplitDibits(frame.m_data, frame.m_flags, dibits, flags);

	//Preamble pairs are all 01, dropping three of them shifts the byte boundary
	dibits.erase(dibits.begin(), dibits.begin() + 3);
	flags.erase(flags.begin(), flags.begin() + 3);

	vector<uint8_t> data;
	vector<uint8_t> dflags;
	TransportCodec::JoinDibits(dibits, flags, data, dflags);

	EthernetFrame rx(data, dflags);
	EXPECT_EQ(rx.GetPreambleLength(), 8u);
	EXPECT_EQ(rx.GetPayload(), frame.GetPayload());
	EXPECT_TRUE(rx.CheckFCS());
}

TEST(TransportCodec, DibitJoinKeepsSFDError)
{
	vector<uint8_t> dibits;
	vector<uint8_t> flags;
	TransportCodec::SplitDibits({0x55, 0xd5, 0x42}, {0, 1, 0}, dibits, flags);

	vector<uint8_t> data;
	vector<uint8_t> dflags;
	TransportCodec::JoinDibits(dibits, flags, data, dflags);

	EXPECT_EQ(data, vector<uint8_t>({0x55, 0xd5, 0x42}));
	EXPECT_EQ(dflags, vector<uint8_t>({0, 1, 0}));
}

TEST(TransportCodec, XgmiiIdle)
{
	uint64_t d;
	uint64_t c;

	TransportCodec::GetXgmiiIdle(8, d, c);
	EXPECT_EQ(d, 0x0707070707070707ULL);
	EXPECT_EQ(c, 0xffULL);

	TransportCodec::GetXgmiiIdle(4, d, c);
	EXPECT_EQ(d, 0x07070707ULL);
	EXPECT_EQ(c, 0xfULL);

	TransportCodec::GetXgmiiIdle(1, d, c);
	EXPECT_EQ(d, 0x07ULL);
	EXPECT_EQ(c, 0x1ULL);
}

TEST(TransportCodec, ControlMapIsBijective)
{
	auto& cmap = TransportCodec::GetControlMap();
	EXPECT_EQ(cmap.size(), 9u);

	for(auto it : cmap)
	{
		EXPECT_TRUE(cmap.HasEntry(it.second));
		EXPECT_EQ(cmap[it.second], it.first);
	}

	EXPECT_EQ(cmap[XgmiiCtrl::IDLE], BaseRCtrl::IDLE);
	EXPECT_EQ(cmap[XgmiiCtrl::ERROR], BaseRCtrl::ERROR);
	EXPECT_EQ(cmap[BaseRCtrl::RES_3], XgmiiCtrl::RES_3);

	//Carried by the block type, not by a 7-bit code
	EXPECT_FALSE(cmap.HasEntry(XgmiiCtrl::START));
	EXPECT_FALSE(cmap.HasEntry(XgmiiCtrl::TERM));
	EXPECT_FALSE(cmap.HasEntry(XgmiiCtrl::SEQ_OS));
	EXPECT_THROW(cmap[XgmiiCtrl::START], std::out_of_range);
}

TEST(TransportCodec, TermLanes)
{
	for(size_t lane=0; lane<8; lane++)
	{
		size_t found = 99;
		ASSERT_TRUE(TransportCodec::GetTermLane(TransportCodec::GetTermBlockType(lane), found));
		EXPECT_EQ(found, lane);
	}

	size_t lane = 0;
	EXPECT_FALSE(TransportCodec::GetTermLane(static_cast<uint8_t>(BaseRBlockType::START_0), lane));
	EXPECT_THROW(TransportCodec::GetTermBlockType(8), PhyConfigurationError);
	EXPECT_EQ(TransportCodec::GetTermBlockType(3), 0xb4);
}

TEST(TransportCodec, ControlCodeClassification)
{
	EXPECT_TRUE(TransportCodec::IsXgmiiControl(0x07));
	EXPECT_TRUE(TransportCodec::IsXgmiiControl(0xfb));
	EXPECT_TRUE(TransportCodec::IsXgmiiControl(0x5c));
	EXPECT_FALSE(TransportCodec::IsXgmiiControl(0x55));

	EXPECT_TRUE(TransportCodec::IsBaseRControl(0x00));
	EXPECT_TRUE(TransportCodec::IsBaseRControl(0x1e));
	EXPECT_FALSE(TransportCodec::IsBaseRControl(0x07));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// 64b/66b blocks

static uint64_t MakeWord(const vector<uint8_t>& lanes)
{
	uint64_t ret = 0;
	for(size_t i=0; i<lanes.size(); i++)
		ret |= static_cast<uint64_t>(lanes[i]) << (8*i);
	return ret;
}

static void ExpectRoundTrip(uint64_t data, uint8_t ctrl, uint8_t blockType)
{
	auto block = BaseRBlockCodec::Encode(data, ctrl);
	ASSERT_TRUE(block.IsControl());
	EXPECT_EQ(block.GetBlockType(), blockType);

	uint64_t d2;
	uint8_t c2;
	BaseRBlockCodec::Decode(block, d2, c2);
	EXPECT_EQ(d2, data);
	EXPECT_EQ(c2, ctrl);
}

TEST(BaseRBlockCodec, DataBlock)
{
	uint64_t data = 0x0123456789abcdefULL;
	auto block = BaseRBlockCodec::Encode(data, 0);
	EXPECT_EQ(block.m_header, static_cast<uint8_t>(BaseRSync::DATA));
	EXPECT_EQ(block.m_payload, data);

	uint64_t d;
	uint8_t c;
	BaseRBlockCodec::Decode(block, d, c);
	EXPECT_EQ(d, data);
	EXPECT_EQ(c, 0);
}

TEST(BaseRBlockCodec, IdleBlock)
{
	uint64_t idle;
	uint64_t ctrl;
	TransportCodec::GetXgmiiIdle(8, idle, ctrl);

	auto block = BaseRBlockCodec::Encode(idle, ctrl);
	EXPECT_EQ(block.m_header, static_cast<uint8_t>(BaseRSync::CTRL));

	//Block type 0x1e followed by eight 7-bit zero codes
	EXPECT_EQ(block.m_payload, 0x1eULL);

	ExpectRoundTrip(idle, 0xff, 0x1e);
}

TEST(BaseRBlockCodec, StartBlocks)
{
	ExpectRoundTrip(MakeWord({0xfb, 0x55, 0x55, 0x55, 0x55, 0x55, 0x55, 0x55}), 0x01, 0x78);
	ExpectRoundTrip(MakeWord({0x07, 0x07, 0x07, 0x07, 0xfb, 0x55, 0x55, 0x55}), 0x1f, 0x33);
	ExpectRoundTrip(MakeWord({0x9c, 0x00, 0x00, 0x01, 0xfb, 0x55, 0x55, 0x55}), 0x11, 0x66);
}

TEST(BaseRBlockCodec, OrderedSetBlocks)
{
	ExpectRoundTrip(MakeWord({0x07, 0x07, 0x07, 0x07, 0x9c, 0x00, 0x00, 0x01}), 0x1f, 0x2d);
	ExpectRoundTrip(MakeWord({0x9c, 0x00, 0x00, 0x01, 0x5c, 0x00, 0x00, 0x02}), 0x11, 0x55);
	ExpectRoundTrip(MakeWord({0x9c, 0x00, 0x00, 0x01, 0x07, 0x07, 0x07, 0x07}), 0xf1, 0x4b);
}

TEST(BaseRBlockCodec, TerminateBlocks)
{
	for(size_t k=0; k<8; k++)
	{
		vector<uint8_t> lanes;
		for(size_t i=0; i<8; i++)
		{
			if(i < k)
				lanes.push_back(0x10 + i);
			else if(i == k)
				lanes.push_back(0xfd);
			else
				lanes.push_back(0x07);
		}
		uint8_t ctrl = (0xff << k) & 0xff;

		SCOPED_TRACE(k);
		ExpectRoundTrip(MakeWord(lanes), ctrl, TransportCodec::GetTermBlockType(k));
	}
}

TEST(BaseRBlockCodec, ReservedAndErrorCodes)
{
	ExpectRoundTrip(MakeWord({0x07, 0xfe, 0x1c, 0x3c, 0x7c, 0xbc, 0xdc, 0xf7}), 0xff, 0x1e);
	ExpectRoundTrip(MakeWord({0x06, 0x06, 0x06, 0x06, 0x06, 0x06, 0x06, 0x06}), 0xff, 0x1e);
}

TEST(BaseRBlockCodec, InvalidWordsBecomeErrors)
{
	auto err = BaseRBlockCodec::GetErrorBlock();

	//Data in a lane flagged as control
	EXPECT_EQ(BaseRBlockCodec::Encode(MakeWord({0x07, 0x07, 0x42, 0x07, 0x07, 0x07, 0x07, 0x07}), 0xff), err);

	//START somewhere other than lane 0 or 4
	EXPECT_EQ(BaseRBlockCodec::Encode(MakeWord({0x55, 0x55, 0xfb, 0x55, 0x55, 0x55, 0x55, 0x55}), 0x04), err);

	uint64_t d;
	uint8_t c;
	BaseRBlockCodec::Decode(err, d, c);
	EXPECT_EQ(d, 0xfefefefefefefefeULL);
	EXPECT_EQ(c, 0xff);
}

TEST(BaseRBlockCodec, InvalidBlocksDecodeAsErrors)
{
	uint64_t d;
	uint8_t c;

	//Bad sync header
	BaseRBlockCodec::Decode(BaseRBlock(0x3, 0), d, c);
	EXPECT_EQ(d, 0xfefefefefefefefeULL);
	EXPECT_EQ(c, 0xff);

	//Unknown block type
	BaseRBlockCodec::Decode(BaseRBlock(static_cast<uint8_t>(BaseRSync::CTRL), 0x00), d, c);
	EXPECT_EQ(d, 0xfefefefefefefefeULL);
	EXPECT_EQ(c, 0xff);

	//Unmapped 7-bit code in lane 2 of an all-control block
	uint64_t payload = 0x1e | (0x11ULL << (8 + 2*7));
	BaseRBlockCodec::Decode(BaseRBlock(static_cast<uint8_t>(BaseRSync::CTRL), payload), d, c);
	EXPECT_EQ(c, 0xff);
	EXPECT_EQ( (d >> 16) & 0xff, 0xfeu);
	EXPECT_EQ(d & 0xffff, 0x0707u);
}
