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
	@brief Implementation of ClockGenerator
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

ClockGenerator::ClockGenerator(SimulationKernel& kernel)
	: m_kernel(kernel)
	, m_period(0)
	, m_generation(make_shared<uint64_t>(0))
{
}

ClockGenerator::ClockGenerator(SimulationKernel& kernel, BusSignal& clk)
	: ClockGenerator(kernel)
{
	AddOutput(clk);
}

void ClockGenerator::AddOutput(BusSignal& clk)
{
	if(clk.GetWidth() != 1)
		throw PhyConfigurationError(string("Clock ") + clk.GetName() + " must be 1 bit wide");
	m_outputs.push_back(&clk);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Waveform generation

/**
	@brief Starts (or restarts) the clock. Outputs go low now and rise half a period later.

	@param period	Clock period in femtoseconds
 */
void ClockGenerator::Start(int64_t period)
{
	if(period < 2)
		throw PhyConfigurationError(string("Invalid clock period ") + to_string(period) + " fs");

	(*m_generation) ++;
	m_period = period;

	for(auto clk : m_outputs)
		clk->Write(0);

	ScheduleEdge(period - period/2, true);
}

void ClockGenerator::Stop()
{
	(*m_generation) ++;
	m_period = 0;
}

void ClockGenerator::ScheduleEdge(int64_t delay, bool level)
{
	weak_ptr<uint64_t> token = m_generation;
	uint64_t generation = *m_generation;

	m_kernel.Schedule(delay, [this, token, generation, level]()
	{
		//Generator destroyed or restarted since this edge was scheduled
		auto current = token.lock();
		if(!current || (*current != generation) )
			return;
		OnEdge(level);
	});
}

void ClockGenerator::OnEdge(bool level)
{
	for(auto clk : m_outputs)
		clk->Write(level);

	if(level)
		ScheduleEdge(m_period/2, false);
	else
		ScheduleEdge(m_period - m_period/2, true);
}
