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
	@brief Declaration of PhyReceiver
 */

#ifndef PhyReceiver_h
#define PhyReceiver_h

/**
	@brief Samples a PHY interface and reassembles the frames seen on it
 */
class PhyReceiver : public ResetDomain
{
public:
	PhyReceiver(
		SimulationKernel& kernel,
		std::unique_ptr<LaneCodec> codec,
		BusSignal& clock,
		BusSignal* reset = nullptr,
		BusSignal* enable = nullptr,
		bool resetActiveHigh = true);
	virtual ~PhyReceiver();

	//Queue access
	EthernetFrame Recv(bool compact = true, int64_t timeout = 0);
	EthernetFrame RecvNowait(bool compact = true);
	void Clear();
	bool Wait(int64_t timeout = 0);

	size_t GetCount() const
	{ return m_queue.GetCount(); }

	bool IsEmpty() const
	{ return m_queue.IsEmpty(); }

	///@brief True if no frame is being received right now
	bool IsIdle() const
	{ return !m_active; }

	void SetClock(BusSignal& clock);

	void SetMiiMode(bool mii)
	{ m_codec->SetMiiMode(mii); }

	void SetClockDivider(size_t div)
	{ m_codec->SetClockDivider(div); }

	LaneCodec* GetCodec()
	{ return m_codec.get(); }

	FrameQueue& GetQueue()
	{ return m_queue; }

protected:
	virtual void OnReset(bool asserted) override;

	void Start();
	void Disconnect();
	void Resume();
	void OnValidRising();
	void SuspendUntilValid();
	void SuspendUntilEnabled();

	void OnClockRising();
	void OnClockFalling();
	void OnEdge(LaneCodec::ClockEdge edge);

	void ProcessLanes(const std::vector<PhyLaneUnit>& lanes);
	void AppendUnit(const PhyLaneUnit& unit);
	void FinishFrame();

	std::string GetName() const
	{ return m_codec->GetBusName(); }

	SimulationKernel& m_kernel;
	std::unique_ptr<LaneCodec> m_codec;
	BusSignal* m_clock;
	BusSignal* m_enable;

	FrameQueue m_queue;

	sigc::connection m_risingConnection;
	sigc::connection m_fallingConnection;
	sigc::connection m_wakeConnection;

	///@brief Frame being received, one entry per bus unit until it is reassembled
	std::optional<EthernetFrame> m_frame;
	PhyLaneUnit m_prevUnit;
	size_t m_frameIndex;

	size_t m_dividerCount;
	bool m_enabled;
	bool m_active;
};

#endif
