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
	@brief Declaration of ClockGenerator
 */

#ifndef ClockGenerator_h
#define ClockGenerator_h

/**
	@brief Free-running square wave on one or more 1-bit signals

	Restarting with a new period cancels the old waveform; edges already scheduled for it are discarded.
 */
class ClockGenerator
{
public:
	ClockGenerator(SimulationKernel& kernel);
	ClockGenerator(SimulationKernel& kernel, BusSignal& clk);

	void AddOutput(BusSignal& clk);

	void Start(int64_t period);
	void Stop();

	bool IsRunning() const
	{ return m_period != 0; }

	///@brief Period in femtoseconds, zero when stopped
	int64_t GetPeriod() const
	{ return m_period; }

protected:
	void ScheduleEdge(int64_t delay, bool level);
	void OnEdge(bool level);

	SimulationKernel& m_kernel;
	std::vector<BusSignal*> m_outputs;

	int64_t m_period;

	///@brief Bumped on every restart, scheduled edges carry the value they were created with
	std::shared_ptr<uint64_t> m_generation;
};

#endif
