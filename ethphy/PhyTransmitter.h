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
	@brief Declaration of PhyTransmitter
 */

#ifndef PhyTransmitter_h
#define PhyTransmitter_h

/**
	@brief Drives queued frames onto a PHY interface, one clock at a time

	The interface specifics come from the LaneCodec. The transmitter handles the clock divider, the optional
	clock enable, the inter-frame gap and (for XGMII) the deficit idle count, and sleeps while there is nothing
	to send.

	The inter-frame gap is configured in byte times.
 */
class PhyTransmitter : public ResetDomain
{
public:
	PhyTransmitter(
		SimulationKernel& kernel,
		std::unique_ptr<LaneCodec> codec,
		BusSignal& clock,
		BusSignal* reset = nullptr,
		BusSignal* enable = nullptr,
		bool resetActiveHigh = true);
	virtual ~PhyTransmitter();

	//Queue access
	void Send(const EthernetFrame& frame, int64_t timeout = 0);
	void SendNowait(const EthernetFrame& frame);
	void Clear();
	bool Wait(int64_t timeout = 0);

	size_t GetCount() const
	{ return m_queue.GetCount(); }

	bool IsEmpty() const
	{ return m_queue.IsEmpty(); }

	bool IsFull() const
	{ return m_queue.IsFull(); }

	///@brief True if nothing is queued and nothing is being transmitted
	bool IsIdle() const
	{ return m_queue.IsEmpty() && !m_active; }

	//Configuration
	void SetIfg(int ifg);

	int GetIfg() const
	{ return m_ifg; }

	void SetEnableDic(bool enable)
	{ m_enableDic = enable; }

	bool GetEnableDic() const
	{ return m_enableDic; }

	void SetForceOffsetStart(bool force)
	{ m_forceOffsetStart = force; }

	bool GetForceOffsetStart() const
	{ return m_forceOffsetStart; }

	void SetQueueLimits(size_t maxBytes, size_t maxFrames)
	{ m_queue.SetLimits(maxBytes, maxFrames); }

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
	void SuspendUntilEnqueued();
	void SuspendUntilEnabled();

	void OnClockRising();
	void OnClockFalling();

	void Step();
	void StartFrame();
	void FinishFrame(size_t termLane);

	std::string GetName() const
	{ return m_codec->GetBusName(); }

	SimulationKernel& m_kernel;
	std::unique_ptr<LaneCodec> m_codec;
	BusSignal& m_clock;
	BusSignal* m_enable;

	FrameQueue m_queue;

	sigc::connection m_risingConnection;
	sigc::connection m_fallingConnection;
	sigc::connection m_wakeConnection;

	///@brief Frame currently on the wire, and its encoding
	std::optional<EthernetFrame> m_currentFrame;
	std::vector<PhyLaneUnit> m_units;
	size_t m_unitOffset;
	size_t m_frameIndex;

	//Configuration
	int m_ifg;
	bool m_enableDic;
	bool m_forceOffsetStart;

	//Engine state
	int m_ifgCount;
	int m_deficitIdleCount;
	size_t m_dividerCount;
	bool m_active;
};

#endif
