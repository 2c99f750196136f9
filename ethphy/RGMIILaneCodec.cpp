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
	@brief Implementation of RGMIILaneCodec
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

RGMIILaneCodec::RGMIILaneCodec(BusSignal& d, BusSignal& ctl, BusSignal* miiSelect)
	: m_d(d)
	, m_ctl(ctl)
	, m_txData(0)
	, m_txError(false)
	, m_txEnable(false)
	, m_rxLow(0)
	, m_rxValid(false)
{
	CheckWidth(&m_d, 4);
	CheckWidth(&m_ctl, 1);
	CheckWidth(miiSelect, 1);

	m_miiSelect = miiSelect;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

string RGMIILaneCodec::GetName() const
{
	return "RGMII";
}

string RGMIILaneCodec::GetBusName() const
{
	return m_d.GetName();
}

size_t RGMIILaneCodec::GetSplitFactor() const
{
	return m_miiMode ? 2 : 1;
}

BusSignal* RGMIILaneCodec::GetFrameValidSignal() const
{
	return &m_ctl;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transmit path

void RGMIILaneCodec::InitializeOutputs()
{
	m_txData = 0;
	m_txError = false;
	m_txEnable = false;
	m_d.SetImmediateValue(0);
	m_ctl.SetImmediateValue(0);
}

void RGMIILaneCodec::EncodeFrame(const EthernetFrame& frame, vector<PhyLaneUnit>& units)
{
	units.clear();

	if(m_miiMode)
	{
		vector<uint8_t> nibbles;
		vector<uint8_t> flags;
		TransportCodec::SplitNibbles(frame.m_data, frame.m_flags, nibbles, flags);

		for(size_t i=0; i<nibbles.size(); i++)
			units.push_back(PhyLaneUnit(nibbles[i], flags[i], true, nibbles[i] == (ETH_SFD_BYTE >> 4)));
	}
	else
	{
		for(size_t i=0; i<frame.size(); i++)
		{
			uint8_t b = frame.m_data[i];
			bool f = (i < frame.m_flags.size()) && frame.m_flags[i];
			units.push_back(PhyLaneUnit(b, f, true, b == ETH_SFD_BYTE));
		}
	}
}

PhyLaneUnit RGMIILaneCodec::GetIdleUnit() const
{
	return PhyLaneUnit(0, false, false);
}

/**
	@brief Latches the next unit. The pins are updated on the following falling and rising edges.
 */
void RGMIILaneCodec::DriveUnits(const vector<PhyLaneUnit>& lanes)
{
	m_txData = lanes[0].m_data;
	m_txError = lanes[0].m_flag;
	m_txEnable = lanes[0].m_valid;
}

void RGMIILaneCodec::DriveReset()
{
	m_txData = 0;
	m_txError = false;
	m_txEnable = false;
	m_d.Write(0);
	m_ctl.Write(0);
}

void RGMIILaneCodec::OnTransmitEdge(ClockEdge edge)
{
	//High nibble after the rising edge, leading in to the falling edge
	if(edge == EDGE_RISING)
	{
		if(!m_miiMode)
		{
			m_d.Write(m_txData >> 4);
			m_ctl.Write(m_txEnable ^ m_txError);
		}
	}

	//Low nibble after the falling edge, leading in to the rising edge
	else
	{
		m_d.Write(m_txData & 0xf);
		m_ctl.Write(m_txEnable);
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Receive path

/**
	@brief Captures one half of a unit. The unit is complete after the falling edge.
 */
bool RGMIILaneCodec::SampleLanes(ClockEdge edge, vector<PhyLaneUnit>& lanes)
{
	if(edge == EDGE_RISING)
	{
		m_rxLow = m_d.Read();
		m_rxValid = m_ctl.ReadBit();
		return false;
	}

	uint8_t hi = m_d.Read();
	bool er = m_rxValid ^ m_ctl.ReadBit();
	lanes.assign(1, PhyLaneUnit( (hi << 4) | m_rxLow, er, m_rxValid));
	return true;
}

bool RGMIILaneCodec::IsSfdUnit(const PhyLaneUnit& unit, const PhyLaneUnit& /*prev*/) const
{
	if(m_miiMode)
		return (unit.m_data & 0xf) == (ETH_SFD_BYTE >> 4);
	return unit.m_data == ETH_SFD_BYTE;
}

///@brief In MII mode both halves carry the same nibble, keep one and fold pairs into bytes
void RGMIILaneCodec::ReassembleFrame(EthernetFrame& frame)
{
	if(!m_miiMode)
		return;

	vector<uint8_t> nibbles;
	for(auto b : frame.m_data)
		nibbles.push_back(b & 0xf);

	vector<uint8_t> data;
	vector<uint8_t> flags;
	TransportCodec::JoinNibbles(nibbles, frame.m_flags, data, flags);
	frame.m_data = data;
	frame.m_flags = flags;
}
