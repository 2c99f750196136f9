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
	@brief Declaration of SimulationKernel
 */

#ifndef SimulationKernel_h
#define SimulationKernel_h

#include <queue>

class BusSignal;

/**
	@brief Single-threaded discrete event scheduler with femtosecond resolution

	Each time step runs in delta cycles: every callback scheduled for the current time runs, then all signal
	writes made by those callbacks are committed at once, and any callbacks the commits triggered form the next
	delta. A callback sampling a signal on a clock edge therefore always sees the value from before the edge.

	The kernel is driven cooperatively by RunFor() and RunUntil(). Neither may be called from inside a callback.
 */
class SimulationKernel
{
public:
	SimulationKernel();

	///@brief Current simulation time, in femtoseconds
	int64_t GetTime() const
	{ return m_time; }

	///@brief True while a callback is executing
	bool IsRunning() const
	{ return m_running; }

	void Schedule(int64_t delay, std::function<void()> callback);
	void ScheduleAt(int64_t time, std::function<void()> callback);

	void RunFor(int64_t duration);
	bool RunUntil(std::function<bool()> pred, int64_t timeout = 0);

	void AddPendingUpdate(BusSignal* signal);

	bool HasPendingEvents() const
	{ return !m_events.empty(); }

protected:
	void ProcessTimeStep();
	void CheckNotRunning(const char* caller);

	class Event
	{
	public:
		int64_t m_time;
		uint64_t m_sequence;
		std::function<void()> m_callback;
	};

	class EventCompare
	{
	public:
		bool operator()(const Event& a, const Event& b) const
		{
			if(a.m_time != b.m_time)
				return a.m_time > b.m_time;
			return a.m_sequence > b.m_sequence;
		}
	};

	std::priority_queue<Event, std::vector<Event>, EventCompare> m_events;

	///@brief Signals with a write waiting for the end of the current delta
	std::vector<BusSignal*> m_pendingUpdates;

	int64_t m_time;
	uint64_t m_nextSequence;
	bool m_running;
};

#endif
