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
	@brief Implementation of SimulationKernel
 */

#include "ethphy.h"

using namespace std;

/**
	@brief Holds the running flag for the duration of a RunFor() / RunUntil() call
 */
class KernelRunLock
{
public:
	KernelRunLock(bool& flag)
	: m_flag(flag)
	{ m_flag = true; }

	~KernelRunLock()
	{ m_flag = false; }

protected:
	bool& m_flag;
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SimulationKernel::SimulationKernel()
	: m_time(0)
	, m_nextSequence(0)
	, m_running(false)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Event scheduling

void SimulationKernel::Schedule(int64_t delay, function<void()> callback)
{
	if(delay < 0)
		throw PhyProtocolError("Cannot schedule an event in the past");
	ScheduleAt(m_time + delay, callback);
}

void SimulationKernel::ScheduleAt(int64_t time, function<void()> callback)
{
	if(time < m_time)
		throw PhyProtocolError("Cannot schedule an event in the past");

	Event e;
	e.m_time = time;
	e.m_sequence = m_nextSequence ++;
	e.m_callback = callback;
	m_events.push(e);
}

void SimulationKernel::AddPendingUpdate(BusSignal* signal)
{
	m_pendingUpdates.push_back(signal);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Execution

void SimulationKernel::CheckNotRunning(const char* caller)
{
	if(m_running)
	{
		throw PhyProtocolError(
			string(caller) + "() cannot be called from inside a simulation callback, use the non-blocking API");
	}
}

/**
	@brief Runs every event at the earliest pending time, including all delta cycles they cause
 */
void SimulationKernel::ProcessTimeStep()
{
	m_time = m_events.top().m_time;

	while(true)
	{
		while(!m_events.empty() && (m_events.top().m_time == m_time) )
		{
			auto callback = m_events.top().m_callback;
			m_events.pop();
			callback();
		}

		if(m_pendingUpdates.empty())
			break;

		//Commit deferred writes. Edge notifications fired here may write more signals or schedule more events
		//for the current time, which then form the next delta.
		vector<BusSignal*> updates;
		updates.swap(m_pendingUpdates);
		for(auto s : updates)
			s->CommitPendingValue();
	}
}

/**
	@brief Advances simulation time by the given number of femtoseconds
 */
void SimulationKernel::RunFor(int64_t duration)
{
	CheckNotRunning("RunFor");
	KernelRunLock lock(m_running);

	int64_t end = m_time + duration;
	while(!m_events.empty() && (m_events.top().m_time <= end) )
		ProcessTimeStep();
	m_time = end;
}

/**
	@brief Runs the simulation until a condition becomes true

	@param pred		Condition, evaluated between time steps
	@param timeout	Maximum simulation time to run for, zero to run until the condition is met or nothing is left
					to simulate

	@return The final value of the condition
 */
bool SimulationKernel::RunUntil(function<bool()> pred, int64_t timeout)
{
	CheckNotRunning("RunUntil");
	KernelRunLock lock(m_running);

	int64_t end = (timeout > 0) ? m_time + timeout : INT64_MAX;
	while(!pred())
	{
		if(m_events.empty())
			return false;

		if(m_events.top().m_time > end)
		{
			m_time = end;
			return pred();
		}

		ProcessTimeStep();
	}
	return true;
}
