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

#ifndef TestHelpers_h
#define TestHelpers_h

#include <random>

#define FS_PER_NS_INT 1000000LL

extern uint32_t g_testSeed;

std::minstd_rand MakeTestRNG();
std::vector<uint8_t> RandomPayload(std::minstd_rand& rng, size_t len);
std::vector<uint8_t> CountingPayload(size_t len);

/**
	@brief Records every word on an XGMII bus, sampled on the rising edge of its clock
 */
class XgmiiMonitor
{
public:
	XgmiiMonitor(BusSignal& clk, BusSignal& d, BusSignal& c);
	~XgmiiMonitor();

	std::vector<int> GetGaps() const;

	///@brief One entry per lane, in bus order
	std::vector<PhyLaneUnit> m_lanes;

protected:
	void OnClock();

	BusSignal& m_d;
	BusSignal& m_c;
	size_t m_laneCount;

	sigc::connection m_connection;
};

/**
	@brief Counts completion notifications for a frame
 */
class CompletionCounter
{
public:
	CompletionCounter(EthernetFrame& frame);

	std::shared_ptr<FrameCompletion> m_completion;
	int m_count;
};

int64_t MeasureIdleSteps(PhyTransmitter& tx, int64_t stepPeriod, int64_t timeout);

#endif
