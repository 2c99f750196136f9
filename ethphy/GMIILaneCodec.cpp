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
	@brief Implementation of GMIILaneCodec
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

GMIILaneCodec::GMIILaneCodec(BusSignal& data, BusSignal* er, BusSignal& dv, BusSignal* miiSelect)
	: GMIILaneCodec(data, er, dv, miiSelect, 8)
{
}

GMIILaneCodec::GMIILaneCodec(BusSignal& data, BusSignal* er, BusSignal& dv, BusSignal* miiSelect, size_t width)
	: m_data(data)
	, m_er(er)
	, m_dv(dv)
{
	CheckWidth(&m_data, width);
	CheckWidth(m_er, 1);
	CheckWidth(&m_dv, 1);
	CheckWidth(miiSelect, 1);

	m_miiSelect = miiSelect;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

string GMIILaneCodec::GetName() const
{
	return "GMII";
}

string GMIILaneCodec::GetBusName() const
{
	return m_data.GetName();
}

size_t GMIILaneCodec::GetSplitFactor() const
{
	return m_miiMode ? 2 : 1;
}

BusSignal* GMIILaneCodec::GetFrameValidSignal() const
{
	return &m_dv;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transmit path

void GMIILaneCodec::InitializeOutputs()
{
	m_data.SetImmediateValue(0);
	if(m_er)
		m_er->SetImmediateValue(0);
	m_dv.SetImmediateValue(0);
}

void GMIILaneCodec::EncodeFrame(const EthernetFrame& frame, vector<PhyLaneUnit>& units)
{
	units.clear();

	if(m_miiMode)
	{
		vector<uint8_t> nibbles;
		vector<uint8_t> flags;
		TransportCodec::SplitNibbles(frame.m_data, frame.m_flags, nibbles, flags);

		units.reserve(nibbles.size());
		for(size_t i=0; i<nibbles.size(); i++)
			units.push_back(PhyLaneUnit(nibbles[i], flags[i], true, nibbles[i] == (ETH_SFD_BYTE >> 4)));
	}

	else
	{
		units.reserve(frame.size());
		for(size_t i=0; i<frame.size(); i++)
		{
			uint8_t b = frame.m_data[i];
			bool f = (i < frame.m_flags.size()) && frame.m_flags[i];
			units.push_back(PhyLaneUnit(b, f, true, b == ETH_SFD_BYTE));
		}
	}
}

PhyLaneUnit GMIILaneCodec::GetIdleUnit() const
{
	return PhyLaneUnit(0, false, false);
}

void GMIILaneCodec::DriveUnits(const vector<PhyLaneUnit>& lanes)
{
	auto& u = lanes[0];
	m_data.Write(u.m_data);
	if(m_er)
		m_er->Write(u.m_flag);
	m_dv.Write(u.m_valid);
}

void GMIILaneCodec::DriveReset()
{
	m_data.Write(0);
	if(m_er)
		m_er->Write(0);
	m_dv.Write(0);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Receive path

bool GMIILaneCodec::SampleLanes(ClockEdge edge, vector<PhyLaneUnit>& lanes)
{
	if(edge != EDGE_RISING)
		return false;

	bool er = m_er ? m_er->ReadBit() : false;
	lanes.assign(1, PhyLaneUnit(m_data.Read(), er, m_dv.ReadBit()));
	return true;
}
