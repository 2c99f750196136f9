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
	@brief Implementation of PhyTransmitter
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

PhyTransmitter::PhyTransmitter(
	SimulationKernel& kernel,
	unique_ptr<LaneCodec> codec,
	BusSignal& clock,
	BusSignal* reset,
	BusSignal* enable,
	bool resetActiveHigh)
	: m_kernel(kernel)
	, m_codec(std::move(codec))
	, m_clock(clock)
	, m_enable(enable)
	, m_unitOffset(0)
	, m_frameIndex(0)
	, m_ifg(12)
	, m_enableDic(true)
	, m_forceOffsetStart(false)
	, m_ifgCount(0)
	, m_deficitIdleCount(0)
	, m_dividerCount(1)
	, m_active(false)
{
	if(!m_codec)
		throw PhyConfigurationError("PhyTransmitter needs a lane codec");
	if(m_clock.GetWidth() != 1)
		throw PhyConfigurationError(string("Clock ") + m_clock.GetName() + " must be 1 bit wide");
	if(m_enable && (m_enable->GetWidth() != 1) )
		throw PhyConfigurationError(string("Enable ") + m_enable->GetName() + " must be 1 bit wide");

	m_codec->InitializeOutputs();

	InitReset(reset, resetActiveHigh);
}

PhyTransmitter::~PhyTransmitter()
{
	Disconnect();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Queue access

/**
	@brief Queues a frame, running the simulation as long as the queue is over its limit

	@param frame	The frame to send. Attach a FrameCompletion beforehand to find out when it is on the wire.
	@param timeout	Maximum simulation time to wait for room in the queue, zero for no limit
 */
void PhyTransmitter::Send(const EthernetFrame& frame, int64_t timeout)
{
	if(m_kernel.IsRunning())
		throw PhyProtocolError(GetName() + ": Send() called from inside a simulation callback, use SendNowait()");
	if(frame.m_completion && frame.m_completion->IsInUse())
		throw PhyProtocolError(GetName() + ": frame completion is already in use");

	if(!m_kernel.RunUntil([this]{ return !m_queue.IsFull(); }, timeout))
	{
		if(!m_kernel.HasPendingEvents())
			throw PhyProtocolError(GetName() + ": transmit queue is full and nothing is left to simulate");
		throw QueueFullError(GetName() + ": timed out waiting for room in the transmit queue");
	}

	SendNowait(frame);
}

/**
	@brief Queues a frame without waiting

	Throws QueueFullError if the queue is over its occupancy limit, and PhyProtocolError if the frame's
	completion already belongs to an earlier transmission.
 */
void PhyTransmitter::SendNowait(const EthernetFrame& frame)
{
	if(m_queue.IsFull())
		throw QueueFullError(GetName() + ": transmit queue is full");
	if(frame.m_completion)
		frame.m_completion->Arm();

	EthernetFrame f(frame);
	f.m_startTime.reset();
	f.m_sfdTime.reset();
	f.m_endTime.reset();
	m_queue.Push(f);
}

/**
	@brief Drops every queued frame. Each one gets its completion notification with no end time.

	The frame currently on the wire is not affected.
 */
void PhyTransmitter::Clear()
{
	//Take the frames out first, completion handlers are allowed to queue new ones
	deque<EthernetFrame> frames;
	frames.swap(m_queue.GetFrames());
	m_queue.Clear();

	for(auto& f : frames)
	{
		f.m_endTime.reset();
		f.HandleCompletion();
	}
}

/**
	@brief Runs the simulation until everything queued has been transmitted

	@return True if the transmitter went idle, false on timeout
 */
bool PhyTransmitter::Wait(int64_t timeout)
{
	return m_kernel.RunUntil([this]{ return IsIdle(); }, timeout);
}

void PhyTransmitter::SetIfg(int ifg)
{
	if(ifg < 0)
		throw PhyConfigurationError(GetName() + ": inter-frame gap cannot be negative");
	m_ifg = ifg;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Reset and suspension

void PhyTransmitter::OnReset(bool asserted)
{
	if(asserted)
	{
		LogVerbose("%s: transmitter reset asserted\n", GetName().c_str());

		Disconnect();
		m_active = false;
		m_codec->DriveReset();

		if(m_currentFrame)
		{
			LogWarning("%s: flushed transmit frame %zu during reset\n", GetName().c_str(), m_frameIndex);

			EthernetFrame frame = std::move(*m_currentFrame);
			m_currentFrame.reset();
			m_units.clear();
			frame.HandleCompletion();
		}
	}
	else
	{
		LogVerbose("%s: transmitter reset de-asserted\n", GetName().c_str());
		Start();
	}
}

void PhyTransmitter::Start()
{
	m_currentFrame.reset();
	m_units.clear();
	m_unitOffset = 0;
	m_ifgCount = 0;
	m_deficitIdleCount = 0;
	m_dividerCount = 1;
	m_active = false;

	m_codec->DriveIdle();
	Resume();
}

void PhyTransmitter::Disconnect()
{
	m_risingConnection.disconnect();
	m_fallingConnection.disconnect();
	m_wakeConnection.disconnect();
}

///@brief Goes back to running on every clock edge
void PhyTransmitter::Resume()
{
	Disconnect();

	m_risingConnection = m_clock.signal_rising().connect(sigc::mem_fun(*this, &PhyTransmitter::OnClockRising));
	if(m_codec->IsDoubleDataRate())
		m_fallingConnection = m_clock.signal_falling().connect(sigc::mem_fun(*this, &PhyTransmitter::OnClockFalling));
}

void PhyTransmitter::SuspendUntilEnqueued()
{
	Disconnect();
	m_wakeConnection = m_queue.signal_enqueued().connect(sigc::mem_fun(*this, &PhyTransmitter::Resume));
}

void PhyTransmitter::SuspendUntilEnabled()
{
	Disconnect();
	m_wakeConnection = m_enable->signal_rising().connect(sigc::mem_fun(*this, &PhyTransmitter::Resume));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Clocking

void PhyTransmitter::OnClockRising()
{
	m_codec->OnTransmitEdge(LaneCodec::EDGE_RISING);

	//Clock divider
	if(m_dividerCount < m_codec->GetClockDivider())
	{
		m_dividerCount ++;
		return;
	}
	m_dividerCount = 1;

	//Clock enable. DDR interfaces keep toggling the pins so they can't go to sleep.
	if(m_enable && !m_enable->ReadBit())
	{
		if(!m_codec->IsDoubleDataRate())
			SuspendUntilEnabled();
		return;
	}

	Step();
}

void PhyTransmitter::OnClockFalling()
{
	m_codec->OnTransmitEdge(LaneCodec::EDGE_FALLING);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transmit logic

/**
	@brief Advances the transmitter by one clock
 */
void PhyTransmitter::Step()
{
	size_t lanes = m_codec->GetLaneCount();
	bool dic = m_enableDic && m_codec->IsInbandFramed();
	bool nothingToDo = false;

	//Inter-frame gap
	if( (m_ifgCount + m_deficitIdleCount > static_cast<int>(lanes) - 1) || (!dic && (m_ifgCount > 4)) )
	{
		m_ifgCount -= lanes;
		if(m_ifgCount < 0)
		{
			if(dic)
				m_deficitIdleCount = max(m_deficitIdleCount + m_ifgCount, 0);
			m_ifgCount = 0;
		}
	}

	else if(!m_currentFrame)
	{
		if(!m_queue.IsEmpty())
			StartFrame();
		else
		{
			m_ifgCount = 0;
			m_deficitIdleCount = 0;
			nothingToDo = true;
		}
	}

	if(!m_currentFrame)
	{
		m_codec->DriveIdle();
		m_active = false;
		if(nothingToDo && !m_codec->IsDoubleDataRate())
			SuspendUntilEnqueued();
		return;
	}

	vector<PhyLaneUnit> out;
	out.reserve(lanes);
	for(size_t k=0; k<lanes; k++)
	{
		if(!m_currentFrame)
		{
			out.push_back(m_codec->GetIdleUnit());
			continue;
		}

		auto& unit = m_units[m_unitOffset ++];
		if(unit.m_sfd && !m_currentFrame->m_sfdTime)
			m_currentFrame->m_sfdTime = m_kernel.GetTime();
		out.push_back(unit);

		if(m_unitOffset >= m_units.size())
			FinishFrame(k);
	}
	m_codec->DriveUnits(out);
}

/**
	@brief Takes the next frame off the queue and encodes it
 */
void PhyTransmitter::StartFrame()
{
	EthernetFrame frame = m_queue.Pop();
	m_frameIndex ++;

	frame.m_startTime = m_kernel.GetTime();
	frame.m_sfdTime.reset();
	frame.m_endTime.reset();
	frame.Normalize();

	LogDebug("%s: TX frame %zu: %s\n", GetName().c_str(), m_frameIndex, frame.ToString().c_str());

	m_codec->UpdateMode();
	try
	{
		m_codec->EncodeFrame(frame, m_units);
	}
	catch(const PhyProtocolError&)
	{
		LogError("%s: cannot transmit frame %zu\n", GetName().c_str(), m_frameIndex);
		frame.HandleCompletion();
		throw;
	}

	//XGMII: start the frame on lane 4 of an 8-lane bus if that keeps the gap closer to the configured value
	if(m_codec->IsInbandFramed())
	{
		size_t lanes = m_codec->GetLaneCount();
		bool dic = m_enableDic;

		bool offset = false;
		if(lanes > 4)
			offset = dic ? (m_ifgCount > 3 - m_deficitIdleCount) : (m_ifgCount > 0);
		if(offset || m_forceOffsetStart)
		{
			m_ifgCount -= 4;
			m_units.insert(m_units.begin(), 4, m_codec->GetIdleUnit());
		}

		if(dic)
			m_deficitIdleCount = max(m_deficitIdleCount + m_ifgCount, 0);
		m_ifgCount = 0;
	}

	m_unitOffset = 0;
	m_currentFrame = std::move(frame);
	m_active = true;
}

/**
	@brief Called right after the last unit of the current frame has been handed to the codec

	@param termLane	Lane the last unit went out on
 */
void PhyTransmitter::FinishFrame(size_t termLane)
{
	m_ifgCount = m_codec->GetGapAfterFrame(m_ifg, termLane);

	EthernetFrame frame = std::move(*m_currentFrame);
	m_currentFrame.reset();
	m_units.clear();
	m_unitOffset = 0;

	frame.m_endTime = m_kernel.GetTime();
	frame.HandleCompletion();
}
