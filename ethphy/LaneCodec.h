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
	@brief Declaration of LaneCodec
 */

#ifndef LaneCodec_h
#define LaneCodec_h

/**
	@brief One unit on one lane of a PHY interface: a byte, nibble or dibit plus its flag

	m_flag is the error bit for the GMII family and the control bit for XGMII. m_valid is the data valid /
	transmit enable state the unit is driven with. m_sfd marks the unit that carries the start of frame
	delimiter, so the transmitter can timestamp it.
 */
class PhyLaneUnit
{
public:
	PhyLaneUnit(uint8_t data = 0, bool flag = false, bool valid = true, bool sfd = false)
	 : m_data(data)
	 , m_flag(flag)
	 , m_valid(valid)
	 , m_sfd(sfd)
	{}

	uint8_t m_data;
	bool m_flag;
	bool m_valid;
	bool m_sfd;
};

/**
	@brief Bit-level mapping of frames onto one PHY interface

	A PhyTransmitter or PhyReceiver owns the timing (clock edges, enable, inter-frame gap, queues); the codec
	owns everything specific to the interface: which signals exist, how a frame is cut into units, what idle
	looks like, and how frame boundaries are recognized on receive.
 */
class LaneCodec
{
public:
	LaneCodec();
	virtual ~LaneCodec();

	enum ClockEdge
	{
		EDGE_RISING,
		EDGE_FALLING
	};

	virtual std::string GetName() const =0;

	///@brief Name of the data signal, used to identify the engine in log messages
	virtual std::string GetBusName() const =0;

	///@brief Number of units driven or sampled per clock
	virtual size_t GetLaneCount() const
	{ return 1; }

	///@brief Number of units each frame byte is split into in the current mode
	virtual size_t GetSplitFactor() const =0;

	///@brief True if the interface moves data on both clock edges
	virtual bool IsDoubleDataRate() const
	{ return false; }

	///@brief True if frames are delimited by control characters rather than a valid signal
	virtual bool IsInbandFramed() const
	{ return false; }

	size_t GetClockDivider() const
	{ return m_clockDivider; }

	void SetClockDivider(size_t div);

	bool GetMiiMode() const
	{ return m_miiMode; }

	virtual void SetMiiMode(bool mii);
	virtual void UpdateMode();

	//Transmit side
	virtual void InitializeOutputs() =0;
	virtual void EncodeFrame(const EthernetFrame& frame, std::vector<PhyLaneUnit>& units) =0;
	virtual PhyLaneUnit GetIdleUnit() const =0;
	virtual int GetGapAfterFrame(int ifg, size_t termLane) const;
	virtual void DriveUnits(const std::vector<PhyLaneUnit>& lanes) =0;
	virtual void DriveIdle();
	virtual void DriveReset() =0;
	virtual void OnTransmitEdge(ClockEdge edge);

	//Receive side
	virtual bool SampleLanes(ClockEdge edge, std::vector<PhyLaneUnit>& lanes) =0;
	virtual bool IsFrameStart(const PhyLaneUnit& unit) const;
	virtual bool IsFrameEnd(const PhyLaneUnit& unit) const;
	virtual PhyLaneUnit GetStartUnit(const PhyLaneUnit& unit) const;
	virtual bool KeepEndUnit(const PhyLaneUnit& unit) const;
	virtual bool IsSfdUnit(const PhyLaneUnit& unit, const PhyLaneUnit& prev) const;
	virtual void ReassembleFrame(EthernetFrame& frame);

	///@brief Signal whose rising edge ends an idle period on receive, or null if the receiver never sleeps
	virtual BusSignal* GetFrameValidSignal() const =0;

protected:
	static void CheckWidth(BusSignal* signal, size_t width);

	size_t m_clockDivider;

	bool m_miiMode;
	BusSignal* m_miiSelect;
};

#endif
