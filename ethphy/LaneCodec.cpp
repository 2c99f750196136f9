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
	@brief Default behavior shared by the valid-framed interfaces (GMII family)
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

LaneCodec::LaneCodec()
	: m_clockDivider(1)
	, m_miiMode(false)
	, m_miiSelect(nullptr)
{
}

LaneCodec::~LaneCodec()
{
}

/**
	@brief Throws PhyConfigurationError unless the signal exists and has the expected width
 */
void LaneCodec::CheckWidth(BusSignal* signal, size_t width)
{
	if(!signal)
		return;

	if(signal->GetWidth() != width)
	{
		throw PhyConfigurationError(
			string("Signal ") + signal->GetName() + " is " + to_string(signal->GetWidth()) +
			" bits wide, expected " + to_string(width));
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Mode control

void LaneCodec::SetClockDivider(size_t div)
{
	if(div == 0)
		throw PhyConfigurationError("Clock divider must be at least 1");
	m_clockDivider = div;
}

void LaneCodec::SetMiiMode(bool mii)
{
	m_miiMode = mii;
}

///@brief Picks up the current state of the MII select input, if there is one
void LaneCodec::UpdateMode()
{
	if(m_miiSelect)
		SetMiiMode(m_miiSelect->ReadBit());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transmit defaults

/**
	@brief Gets the idle countdown to load after the last unit of a frame

	Valid-framed interfaces count the gap in bus units, so a byte-time gap is scaled by the split factor.
 */
int LaneCodec::GetGapAfterFrame(int ifg, size_t /*termLane*/) const
{
	return max(ifg, 1) * static_cast<int>(GetSplitFactor());
}

void LaneCodec::DriveIdle()
{
	vector<PhyLaneUnit> lanes(GetLaneCount(), GetIdleUnit());
	DriveUnits(lanes);
}

void LaneCodec::OnTransmitEdge(ClockEdge /*edge*/)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Receive defaults

bool LaneCodec::IsFrameStart(const PhyLaneUnit& unit) const
{
	return unit.m_valid;
}

bool LaneCodec::IsFrameEnd(const PhyLaneUnit& unit) const
{
	return !unit.m_valid;
}

PhyLaneUnit LaneCodec::GetStartUnit(const PhyLaneUnit& unit) const
{
	return unit;
}

bool LaneCodec::KeepEndUnit(const PhyLaneUnit& /*unit*/) const
{
	return false;
}

///@brief SFD as a full byte, or its high nibble when the bus carries nibbles
bool LaneCodec::IsSfdUnit(const PhyLaneUnit& unit, const PhyLaneUnit& /*prev*/) const
{
	return (unit.m_data == ETH_SFD_BYTE) || (unit.m_data == (ETH_SFD_BYTE >> 4));
}

/**
	@brief Turns the received unit stream into frame bytes

	In nibble mode each unit carries four bits that still need to be folded into bytes.
 */
void LaneCodec::ReassembleFrame(EthernetFrame& frame)
{
	if(!m_miiMode)
		return;

	vector<uint8_t> data;
	vector<uint8_t> flags;
	TransportCodec::JoinNibbles(frame.m_data, frame.m_flags, data, flags);
	frame.m_data = data;
	frame.m_flags = flags;
}
