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
	@brief Implementation of XGMIILaneCodec
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

XGMIILaneCodec::XGMIILaneCodec(BusSignal& d, BusSignal& c)
	: m_d(d)
	, m_c(c)
	, m_lanes(0)
	, m_idleData(0)
	, m_idleCtrl(0)
{
	m_lanes = TransportCodec::GetLaneCount(m_d.GetWidth());
	if(m_lanes != m_c.GetWidth())
	{
		throw PhyConfigurationError(
			string("XGMII data bus ") + m_d.GetName() + " has " + to_string(m_lanes) + " lanes but control bus " +
			m_c.GetName() + " is " + to_string(m_c.GetWidth()) + " bits wide");
	}

	TransportCodec::GetXgmiiIdle(m_lanes, m_idleData, m_idleCtrl);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

string XGMIILaneCodec::GetName() const
{
	return "XGMII";
}

string XGMIILaneCodec::GetBusName() const
{
	return m_d.GetName();
}

///@brief Control characters are always on the bus, so the receiver never goes to sleep
BusSignal* XGMIILaneCodec::GetFrameValidSignal() const
{
	return nullptr;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transmit path

void XGMIILaneCodec::InitializeOutputs()
{
	m_d.SetImmediateValue(m_idleData);
	m_c.SetImmediateValue(m_idleCtrl);
}

/**
	@brief Converts a frame to control-delimited lane units

	Throws PhyProtocolError if the frame does not begin with a preamble byte, since that byte is replaced by START.
 */
void XGMIILaneCodec::EncodeFrame(const EthernetFrame& frame, vector<PhyLaneUnit>& units)
{
	bool firstCtrl = !frame.m_flags.empty() && frame.m_flags[0];
	if(frame.m_data.empty() || (frame.m_data[0] != ETH_PREAMBLE_BYTE) || firstCtrl)
	{
		throw PhyProtocolError(
			string("XGMII frame on ") + m_d.GetName() + " does not start with a preamble byte: " + frame.ToString());
	}

	units.clear();
	units.reserve(frame.size() + 1);
	units.push_back(PhyLaneUnit(static_cast<uint8_t>(XgmiiCtrl::START), true));
	for(size_t i=1; i<frame.size(); i++)
	{
		uint8_t b = frame.m_data[i];
		bool c = (i < frame.m_flags.size()) && frame.m_flags[i];
		units.push_back(PhyLaneUnit(b, c, true, (b == ETH_SFD_BYTE) && !c));
	}
	units.push_back(PhyLaneUnit(static_cast<uint8_t>(XgmiiCtrl::TERM), true));
}

PhyLaneUnit XGMIILaneCodec::GetIdleUnit() const
{
	return PhyLaneUnit(static_cast<uint8_t>(XgmiiCtrl::IDLE), true);
}

/**
	@brief Idle countdown after TERM was driven on the given lane

	The unused lanes after TERM in the same word already count towards the gap.
 */
int XGMIILaneCodec::GetGapAfterFrame(int ifg, size_t termLane) const
{
	return max(ifg - static_cast<int>(m_lanes - termLane), 0);
}

void XGMIILaneCodec::DriveUnits(const vector<PhyLaneUnit>& lanes)
{
	uint64_t d = 0;
	uint64_t c = 0;
	for(size_t i=0; i<m_lanes && i<lanes.size(); i++)
	{
		d |= static_cast<uint64_t>(lanes[i].m_data) << (8*i);
		if(lanes[i].m_flag)
			c |= (1ULL << i);
	}
	m_d.Write(d);
	m_c.Write(c);
}

void XGMIILaneCodec::DriveIdle()
{
	m_d.Write(m_idleData);
	m_c.Write(m_idleCtrl);
}

void XGMIILaneCodec::DriveReset()
{
	m_d.Write(0);
	m_c.Write(0);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Receive path

bool XGMIILaneCodec::SampleLanes(ClockEdge edge, vector<PhyLaneUnit>& lanes)
{
	if(edge != EDGE_RISING)
		return false;

	uint64_t d = m_d.Read();
	uint64_t c = m_c.Read();

	lanes.resize(m_lanes);
	for(size_t i=0; i<m_lanes; i++)
		lanes[i] = PhyLaneUnit( (d >> (8*i)) & 0xff, (c >> i) & 1, true);
	return true;
}

bool XGMIILaneCodec::IsFrameStart(const PhyLaneUnit& unit) const
{
	return unit.m_flag && (unit.m_data == static_cast<uint8_t>(XgmiiCtrl::START));
}

bool XGMIILaneCodec::IsFrameEnd(const PhyLaneUnit& unit) const
{
	return unit.m_flag;
}

///@brief START stands in for the first preamble byte
PhyLaneUnit XGMIILaneCodec::GetStartUnit(const PhyLaneUnit& /*unit*/) const
{
	return PhyLaneUnit(ETH_PREAMBLE_BYTE, false);
}

bool XGMIILaneCodec::KeepEndUnit(const PhyLaneUnit& unit) const
{
	return unit.m_data != static_cast<uint8_t>(XgmiiCtrl::TERM);
}

bool XGMIILaneCodec::IsSfdUnit(const PhyLaneUnit& unit, const PhyLaneUnit& /*prev*/) const
{
	return !unit.m_flag && (unit.m_data == ETH_SFD_BYTE);
}

void XGMIILaneCodec::ReassembleFrame(EthernetFrame& /*frame*/)
{
}
