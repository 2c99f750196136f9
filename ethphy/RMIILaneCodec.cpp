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
	@brief Implementation of RMIILaneCodec
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

RMIILaneCodec::RMIILaneCodec(BusSignal& d, BusSignal* er, BusSignal& crsDv)
	: m_d(d)
	, m_er(er)
	, m_crsDv(crsDv)
{
	CheckWidth(&m_d, 2);
	CheckWidth(m_er, 1);
	CheckWidth(&m_crsDv, 1);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

string RMIILaneCodec::GetName() const
{
	return "RMII";
}

string RMIILaneCodec::GetBusName() const
{
	return m_d.GetName();
}

///@brief Link speed is handled with the clock divider, the unit size never changes
void RMIILaneCodec::SetMiiMode(bool /*mii*/)
{
	m_miiMode = false;
}

BusSignal* RMIILaneCodec::GetFrameValidSignal() const
{
	return &m_crsDv;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transmit path

void RMIILaneCodec::InitializeOutputs()
{
	m_d.SetImmediateValue(0);
	if(m_er)
		m_er->SetImmediateValue(0);
	m_crsDv.SetImmediateValue(0);
}

void RMIILaneCodec::EncodeFrame(const EthernetFrame& frame, vector<PhyLaneUnit>& units)
{
	vector<uint8_t> dibits;
	vector<uint8_t> flags;
	TransportCodec::SplitDibits(frame.m_data, frame.m_flags, dibits, flags);

	units.clear();
	units.reserve(dibits.size());
	for(size_t i=0; i<dibits.size(); i++)
	{
		//SFD time is the first pair of the SFD byte
		bool sfd = ( (i % 4) == 0) && (frame.m_data[i/4] == ETH_SFD_BYTE);
		units.push_back(PhyLaneUnit(dibits[i], flags[i], true, sfd));
	}
}

PhyLaneUnit RMIILaneCodec::GetIdleUnit() const
{
	return PhyLaneUnit(0, false, false);
}

void RMIILaneCodec::DriveUnits(const vector<PhyLaneUnit>& lanes)
{
	auto& u = lanes[0];
	m_d.Write(u.m_data);
	if(m_er)
		m_er->Write(u.m_flag);
	m_crsDv.Write(u.m_valid);
}

void RMIILaneCodec::DriveReset()
{
	m_d.Write(0);
	if(m_er)
		m_er->Write(0);
	m_crsDv.Write(0);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Receive path

bool RMIILaneCodec::SampleLanes(ClockEdge edge, vector<PhyLaneUnit>& lanes)
{
	if(edge != EDGE_RISING)
		return false;

	bool er = m_er ? m_er->ReadBit() : false;
	lanes.assign(1, PhyLaneUnit(m_d.Read(), er, m_crsDv.ReadBit()));
	return true;
}

///@brief 0xd5 goes out as 01 01 01 11, so the SFD is the first 11 following a 01
bool RMIILaneCodec::IsSfdUnit(const PhyLaneUnit& unit, const PhyLaneUnit& prev) const
{
	return (unit.m_data == 3) && (prev.m_data == 1);
}

void RMIILaneCodec::ReassembleFrame(EthernetFrame& frame)
{
	vector<uint8_t> data;
	vector<uint8_t> flags;
	TransportCodec::JoinDibits(frame.m_data, frame.m_flags, data, flags);
	frame.m_data = data;
	frame.m_flags = flags;
}
