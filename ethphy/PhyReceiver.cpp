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
	@brief Implementation of PhyReceiver
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

PhyReceiver::PhyReceiver(
	SimulationKernel& kernel,
	unique_ptr<LaneCodec> codec,
	BusSignal& clock,
	BusSignal* reset,
	BusSignal* enable,
	bool resetActiveHigh)
	: m_kernel(kernel)
	, m_codec(std::move(codec))
	, m_clock(&clock)
	, m_enable(enable)
	, m_frameIndex(0)
	, m_dividerCount(1)
	, m_enabled(true)
	, m_active(false)
{
	if(!m_codec)
		throw PhyConfigurationError("PhyReceiver needs a lane codec");
	if(m_clock->GetWidth() != 1)
		throw PhyConfigurationError(string("Clock ") + m_clock->GetName() + " must be 1 bit wide");
	if(m_enable && (m_enable->GetWidth() != 1) )
		throw PhyConfigurationError(string("Enable ") + m_enable->GetName() + " must be 1 bit wide");

	InitReset(reset, resetActiveHigh);
}

PhyReceiver::~PhyReceiver()
{
	Disconnect();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Queue access

/**
	@brief Runs the simulation until a frame has been received, then returns it

	@param compact	If true, a frame with no flags set comes back with an empty flag vector. If false, the flag
					vector always has one entry per byte.
	@param timeout	Maximum simulation time to wait, zero for no limit
 */
EthernetFrame PhyReceiver::Recv(bool compact, int64_t timeout)
{
	if(m_kernel.IsRunning())
		throw PhyProtocolError(GetName() + ": Recv() called from inside a simulation callback, use RecvNowait()");

	if(!Wait(timeout))
	{
		if(!m_kernel.HasPendingEvents())
			throw PhyProtocolError(GetName() + ": waiting for a frame but nothing is left to simulate");
		throw QueueEmptyError(GetName() + ": timed out waiting for a frame");
	}

	return RecvNowait(compact);
}

/**
	@brief Returns the oldest received frame

	Throws QueueEmptyError if nothing has been received.
 */
EthernetFrame PhyReceiver::RecvNowait(bool compact)
{
	if(m_queue.IsEmpty())
		throw QueueEmptyError(GetName() + ": receive queue is empty");

	EthernetFrame frame = m_queue.Pop();
	if(compact)
		frame.Compact();
	else
		frame.Normalize();
	return frame;
}

void PhyReceiver::Clear()
{
	m_queue.Clear();
}

/**
	@brief Runs the simulation until a frame is available

	@return True if a frame is available, false on timeout
 */
bool PhyReceiver::Wait(int64_t timeout)
{
	if(!m_queue.IsEmpty())
		return true;
	return m_kernel.RunUntil([this]{ return !m_queue.IsEmpty(); }, timeout);
}

/**
	@brief Switches to a different clock (e.g. GTX_CLK instead of TX_CLK at gigabit speed)
 */
void PhyReceiver::SetClock(BusSignal& clock)
{
	if(clock.GetWidth() != 1)
		throw PhyConfigurationError(string("Clock ") + clock.GetName() + " must be 1 bit wide");

	bool connected = m_risingConnection.connected();
	m_clock = &clock;
	if(connected)
		Resume();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Reset and suspension

void PhyReceiver::OnReset(bool asserted)
{
	if(asserted)
	{
		LogVerbose("%s: receiver reset asserted\n", GetName().c_str());

		Disconnect();
		if(m_frame)
			LogDebug("%s: discarding partial frame during reset\n", GetName().c_str());
		m_frame.reset();
		m_active = false;
	}
	else
	{
		LogVerbose("%s: receiver reset de-asserted\n", GetName().c_str());
		Start();
	}
}

void PhyReceiver::Start()
{
	m_frame.reset();
	m_prevUnit = PhyLaneUnit();
	m_dividerCount = 1;
	m_enabled = true;
	m_active = false;

	Resume();
}

void PhyReceiver::Disconnect()
{
	m_risingConnection.disconnect();
	m_fallingConnection.disconnect();
	m_wakeConnection.disconnect();
}

void PhyReceiver::Resume()
{
	Disconnect();

	m_risingConnection = m_clock->signal_rising().connect(sigc::mem_fun(*this, &PhyReceiver::OnClockRising));
	if(m_codec->IsDoubleDataRate())
		m_fallingConnection = m_clock->signal_falling().connect(sigc::mem_fun(*this, &PhyReceiver::OnClockFalling));
}

///@brief Restart the divider so the first sample lands a full unit time after the transmitter's first launch
void PhyReceiver::OnValidRising()
{
	m_dividerCount = 1;
	Resume();
}

void PhyReceiver::SuspendUntilValid()
{
	Disconnect();
	m_wakeConnection = m_codec->GetFrameValidSignal()->signal_rising().connect(
		sigc::mem_fun(*this, &PhyReceiver::OnValidRising));
}

void PhyReceiver::SuspendUntilEnabled()
{
	Disconnect();
	m_wakeConnection = m_enable->signal_rising().connect(sigc::mem_fun(*this, &PhyReceiver::Resume));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Clocking

void PhyReceiver::OnClockRising()
{
	OnEdge(LaneCodec::EDGE_RISING);
}

void PhyReceiver::OnClockFalling()
{
	OnEdge(LaneCodec::EDGE_FALLING);
}

void PhyReceiver::OnEdge(LaneCodec::ClockEdge edge)
{
	//Divider and enable are evaluated once per clock, on the rising edge
	if(edge == LaneCodec::EDGE_RISING)
	{
		if(m_dividerCount < m_codec->GetClockDivider())
		{
			m_dividerCount ++;
			return;
		}
		m_dividerCount = 1;

		m_enabled = !m_enable || m_enable->ReadBit();
	}

	vector<PhyLaneUnit> lanes;
	if(!m_codec->SampleLanes(edge, lanes))
		return;

	bool ddr = m_codec->IsDoubleDataRate();
	if(!m_enabled)
	{
		if(!ddr)
			SuspendUntilEnabled();
		return;
	}

	ProcessLanes(lanes);

	//Nothing going on, sleep until the transmitter asserts valid
	auto valid = m_codec->GetFrameValidSignal();
	if(!m_frame && valid && !ddr && !valid->ReadBit())
		SuspendUntilValid();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Receive logic

void PhyReceiver::ProcessLanes(const vector<PhyLaneUnit>& lanes)
{
	for(size_t i=0; i<lanes.size(); i++)
	{
		auto& unit = lanes[i];

		if(!m_frame)
		{
			if(!m_codec->IsFrameStart(unit))
				continue;

			m_frame = EthernetFrame();
			m_frame->m_startTime = m_kernel.GetTime();
			if(m_codec->IsInbandFramed())
				m_frame->m_startLane = i;
			m_prevUnit = PhyLaneUnit();
			m_active = true;

			AppendUnit(m_codec->GetStartUnit(unit));
		}

		else if(m_codec->IsFrameEnd(unit))
		{
			if(m_codec->KeepEndUnit(unit))
				AppendUnit(unit);
			FinishFrame();
		}

		else
			AppendUnit(unit);
	}
}

void PhyReceiver::AppendUnit(const PhyLaneUnit& unit)
{
	if(!m_frame->m_sfdTime && m_codec->IsSfdUnit(unit, m_prevUnit))
		m_frame->m_sfdTime = m_kernel.GetTime();

	m_frame->m_data.push_back(unit.m_data);
	m_frame->m_flags.push_back(unit.m_flag);
	m_prevUnit = unit;
}

void PhyReceiver::FinishFrame()
{
	EthernetFrame frame = std::move(*m_frame);
	m_frame.reset();
	m_active = false;
	m_frameIndex ++;

	m_codec->UpdateMode();
	m_codec->ReassembleFrame(frame);
	frame.Compact();
	frame.m_endTime = m_kernel.GetTime();

	LogDebug("%s: RX frame %zu: %s\n", GetName().c_str(), m_frameIndex, frame.ToString().c_str());

	m_queue.Push(frame);
}
