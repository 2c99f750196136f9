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
	@brief Shared helpers for the unit tests
 */

#include "ethphy.h"
#include "TestHelpers.h"

using namespace std;

uint32_t g_testSeed = 0;

minstd_rand MakeTestRNG()
{
	return minstd_rand(g_testSeed);
}

vector<uint8_t> RandomPayload(minstd_rand& rng, size_t len)
{
	uniform_int_distribution<int> dist(0, 255);

	vector<uint8_t> ret;
	for(size_t i=0; i<len; i++)
		ret.push_back(dist(rng));
	return ret;
}

vector<uint8_t> CountingPayload(size_t len)
{
	vector<uint8_t> ret;
	for(size_t i=0; i<len; i++)
		ret.push_back(i & 0xff);
	return ret;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// XgmiiMonitor

XgmiiMonitor::XgmiiMonitor(BusSignal& clk, BusSignal& d, BusSignal& c)
	: m_d(d)
	, m_c(c)
	, m_laneCount(c.GetWidth())
{
	m_connection = clk.signal_rising().connect(sigc::mem_fun(*this, &XgmiiMonitor::OnClock));
}

XgmiiMonitor::~XgmiiMonitor()
{
	m_connection.disconnect();
}

void XgmiiMonitor::OnClock()
{
	uint64_t d = m_d.Read();
	uint64_t c = m_c.Read();
	for(size_t i=0; i<m_laneCount; i++)
		m_lanes.push_back(PhyLaneUnit( (d >> (8*i)) & 0xff, (c >> i) & 1));
}

/**
	@brief Gets the distance from each TERM (inclusive) to the following START, in lanes
 */
vector<int> XgmiiMonitor::GetGaps() const
{
	vector<int> gaps;
	bool seenTerm = false;
	size_t last = 0;
	for(size_t i=0; i<m_lanes.size(); i++)
	{
		auto& u = m_lanes[i];
		if(!u.m_flag)
			continue;

		if(u.m_data == static_cast<uint8_t>(XgmiiCtrl::TERM))
		{
			last = i;
			seenTerm = true;
		}
		else if( (u.m_data == static_cast<uint8_t>(XgmiiCtrl::START)) && seenTerm)
			gaps.push_back(static_cast<int>(i - last));
	}
	return gaps;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// CompletionCounter

CompletionCounter::CompletionCounter(EthernetFrame& frame)
	: m_completion(make_shared<FrameCompletion>())
	, m_count(0)
{
	frame.m_completion = m_completion;
	m_completion->signal_complete().connect([this](const EthernetFrame&){ m_count ++; });
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Gap measurement

/**
	@brief Sends two minimum size frames back to back and measures the idle time between them

	@param tx			Transmitter to measure, using its current gap setting
	@param stepPeriod	Time between transmitter steps (clock period times divider)
	@param timeout		Simulation time allowed for both frames to go out

	@return Number of idle steps between the last unit of the first frame and the first unit of the second,
			or -1 if either frame did not make it out
 */
int64_t MeasureIdleSteps(PhyTransmitter& tx, int64_t stepPeriod, int64_t timeout)
{
	auto a = EthernetFrame::FromPayload(CountingPayload(60));
	auto b = EthernetFrame::FromPayload(CountingPayload(60));
	CompletionCounter ca(a);
	CompletionCounter cb(b);
	tx.SendNowait(a);
	tx.SendNowait(b);
	if(!tx.Wait(timeout))
		return -1;

	auto& fa = ca.m_completion->GetFrame();
	auto& fb = cb.m_completion->GetFrame();
	if( (ca.m_count != 1) || (cb.m_count != 1) || !fa.m_endTime || !fb.m_startTime)
		return -1;

	return (*fb.m_startTime - *fa.m_endTime) / stepPeriod - 1;
}
