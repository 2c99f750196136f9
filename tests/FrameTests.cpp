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
	@brief Tests for EthernetFrame, FrameCompletion and the CRC helper
 */

#include "ethphy.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

using namespace std;

TEST(CRC32, CheckValue)
{
	string s = "123456789";
	vector<uint8_t> bytes(s.begin(), s.end());
	EXPECT_EQ(CRC32(bytes), 0xcbf43926u);
	EXPECT_EQ(CRC32(&bytes[0], 0, bytes.size()-1), 0xcbf43926u);
}

TEST(CRC32, Subrange)
{
	string s = "xx123456789yy";
	vector<uint8_t> bytes(s.begin(), s.end());
	EXPECT_EQ(CRC32(&bytes[0], 2, 10), 0xcbf43926u);
}

TEST(EthernetFrame, FromPayload)
{
	auto payload = CountingPayload(64);
	auto frame = EthernetFrame::FromPayload(payload);

	ASSERT_EQ(frame.size(), 8u + 64u + 4u);
	for(size_t i=0; i<7; i++)
		EXPECT_EQ(frame.m_data[i], 0x55);
	EXPECT_EQ(frame.m_data[7], 0xd5);
	EXPECT_TRUE(frame.m_flags.empty());

	EXPECT_EQ(frame.GetPreambleLength(), 8u);
	EXPECT_EQ(frame.GetPreamble().size(), 8u);
	EXPECT_EQ(frame.GetPayload(), payload);
	EXPECT_EQ(frame.GetPayload(false).size(), 68u);
	EXPECT_TRUE(frame.CheckFCS());

	//FCS is little endian
	uint32_t crc = CRC32(payload);
	auto fcs = frame.GetFCS();
	ASSERT_EQ(fcs.size(), 4u);
	EXPECT_EQ(fcs[0], crc & 0xff);
	EXPECT_EQ(fcs[3], crc >> 24);
}

TEST(EthernetFrame, PadsShortPayload)
{
	vector<uint8_t> payload = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
	auto frame = EthernetFrame::FromPayload(payload);

	EXPECT_EQ(frame.size(), 8u + 60u + 4u);
	auto body = frame.GetPayload();
	ASSERT_EQ(body.size(), 60u);
	for(size_t i=0; i<payload.size(); i++)
		EXPECT_EQ(body[i], payload[i]);
	for(size_t i=payload.size(); i<body.size(); i++)
		EXPECT_EQ(body[i], 0);
	EXPECT_TRUE(frame.CheckFCS());

	//No padding when asked not to
	auto unpadded = EthernetFrame::FromPayload(payload, 0);
	EXPECT_EQ(unpadded.size(), 8u + 10u + 4u);
	EXPECT_TRUE(unpadded.CheckFCS());
}

TEST(EthernetFrame, CorruptionBreaksFCS)
{
	auto frame = EthernetFrame::FromPayload(CountingPayload(100));
	frame.m_data[20] ^= 0x01;
	EXPECT_FALSE(frame.CheckFCS());
}

TEST(EthernetFrame, RawPayload)
{
	auto frame = EthernetFrame::FromRawPayload({0xaa, 0xbb, 0xcc});
	EXPECT_EQ(frame.size(), 11u);
	EXPECT_EQ(frame.GetPreambleLength(), 8u);
	EXPECT_EQ(frame.GetPayload(false), vector<uint8_t>({0xaa, 0xbb, 0xcc}));

	//Too short to have an FCS
	EXPECT_TRUE(frame.GetPayload(true).empty());
	EXPECT_FALSE(frame.CheckFCS());
}

TEST(EthernetFrame, NoSFD)
{
	EthernetFrame frame({0x01, 0x02, 0x03, 0x04, 0x05, 0x06});
	EXPECT_EQ(frame.GetPreambleLength(), 0u);
	EXPECT_TRUE(frame.GetPreamble().empty());
	EXPECT_EQ(frame.GetPayload(false).size(), 6u);
	EXPECT_EQ(frame.GetPayload(true).size(), 2u);
}

TEST(EthernetFrame, NormalizeAndCompact)
{
	EthernetFrame frame({1, 2, 3, 4});
	frame.Normalize();
	EXPECT_EQ(frame.m_flags, vector<uint8_t>({0, 0, 0, 0}));
	frame.Compact();
	EXPECT_TRUE(frame.m_flags.empty());

	//Short flag vectors repeat their last entry
	EthernetFrame shortFlags({1, 2, 3, 4}, {0, 1});
	shortFlags.Normalize();
	EXPECT_EQ(shortFlags.m_flags, vector<uint8_t>({0, 1, 1, 1}));
	shortFlags.Compact();
	EXPECT_EQ(shortFlags.m_flags.size(), 4u);

	//Long ones are truncated
	EthernetFrame longFlags({1, 2}, {1, 0, 0, 0});
	longFlags.Normalize();
	EXPECT_EQ(longFlags.m_flags, vector<uint8_t>({1, 0}));
}

TEST(EthernetFrame, EqualityIgnoresFlagsAndTimes)
{
	EthernetFrame a({1, 2, 3});
	EthernetFrame b({1, 2, 3}, {0, 1, 0});
	b.m_startTime = 1234;
	EXPECT_TRUE(a == b);

	EthernetFrame c({1, 2, 4});
	EXPECT_TRUE(a != c);
}

TEST(EthernetFrame, ToString)
{
	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	frame.m_startTime = 8000000;
	auto s = frame.ToString();
	EXPECT_NE(s.find("len=72"), string::npos);
	EXPECT_NE(s.find("55 55 55 55 55 55 55 d5"), string::npos);
	EXPECT_NE(s.find("flags=none"), string::npos);
	EXPECT_NE(s.find("end=none"), string::npos);
}

TEST(FrameCompletion, FiresOnce)
{
	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	CompletionCounter counter(frame);

	EXPECT_FALSE(counter.m_completion->IsComplete());
	EXPECT_THROW(counter.m_completion->GetFrame(), PhyProtocolError);

	frame.m_endTime = 42;
	frame.HandleCompletion();
	frame.HandleCompletion();

	EXPECT_EQ(counter.m_count, 1);
	EXPECT_TRUE(counter.m_completion->IsComplete());

	auto& snapshot = counter.m_completion->GetFrame();
	EXPECT_EQ(snapshot, frame);
	ASSERT_TRUE(snapshot.m_endTime.has_value());
	EXPECT_EQ(*snapshot.m_endTime, 42);
	EXPECT_FALSE(snapshot.m_completion);
}

TEST(FrameCompletion, NoCompletionAttached)
{
	auto frame = EthernetFrame::FromPayload(CountingPayload(60));
	EXPECT_NO_THROW(frame.HandleCompletion());
}
