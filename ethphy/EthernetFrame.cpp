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
	@brief Implementation of EthernetFrame
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

EthernetFrame::EthernetFrame()
{
}

EthernetFrame::EthernetFrame(const vector<uint8_t>& data, const vector<uint8_t>& flags)
	: m_data(data)
	, m_flags(flags)
{
}

/**
	@brief Creates a frame from a MAC payload (destination address onwards, without FCS)

	The payload is zero padded to minLength, then the FCS and the preamble/SFD are added.
 */
EthernetFrame EthernetFrame::FromPayload(const vector<uint8_t>& payload, size_t minLength)
{
	vector<uint8_t> body = payload;
	if(body.size() < minLength)
		body.resize(minLength, 0);

	//FCS goes out least significant byte first
	uint32_t crc = CRC32(body);
	for(int i=0; i<4; i++)
		body.push_back( (crc >> (8*i)) & 0xff );

	return FromRawPayload(body);
}

/**
	@brief Creates a frame by putting the standard preamble and SFD in front of the given bytes
 */
EthernetFrame EthernetFrame::FromRawPayload(const vector<uint8_t>& payload)
{
	vector<uint8_t> data(ETH_PREAMBLE_LENGTH, ETH_PREAMBLE_BYTE);
	data.push_back(ETH_SFD_BYTE);
	data.insert(data.end(), payload.begin(), payload.end());
	return EthernetFrame(data);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Accessors

/**
	@brief Gets the number of bytes up to and including the first SFD, or zero if there is no SFD
 */
size_t EthernetFrame::GetPreambleLength() const
{
	for(size_t i=0; i<m_data.size(); i++)
	{
		if(m_data[i] == ETH_SFD_BYTE)
			return i+1;
	}
	return 0;
}

vector<uint8_t> EthernetFrame::GetPreamble() const
{
	return vector<uint8_t>(m_data.begin(), m_data.begin() + GetPreambleLength());
}

vector<uint8_t> EthernetFrame::GetPayload(bool stripFCS) const
{
	size_t start = GetPreambleLength();
	size_t end = m_data.size();
	if(stripFCS)
	{
		if(end < start + ETH_FCS_LENGTH)
			return vector<uint8_t>();
		end -= ETH_FCS_LENGTH;
	}
	return vector<uint8_t>(m_data.begin() + start, m_data.begin() + end);
}

vector<uint8_t> EthernetFrame::GetFCS() const
{
	if(m_data.size() < ETH_FCS_LENGTH)
		return vector<uint8_t>();
	return vector<uint8_t>(m_data.end() - ETH_FCS_LENGTH, m_data.end());
}

/**
	@brief Checks the trailing FCS against the CRC-32 of the payload
 */
bool EthernetFrame::CheckFCS() const
{
	auto fcs = GetFCS();
	if(fcs.size() != ETH_FCS_LENGTH)
		return false;

	uint32_t expected = CRC32(GetPayload(true));
	uint32_t actual = fcs[0] | (fcs[1] << 8) | (fcs[2] << 16) | (static_cast<uint32_t>(fcs[3]) << 24);
	return expected == actual;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Flag handling

/**
	@brief Makes the flag vector exactly as long as the data

	A missing flag vector becomes all zeroes. A short one is extended by repeating its last element, a long one
	is truncated.
 */
void EthernetFrame::Normalize()
{
	size_t n = m_data.size();
	if(m_flags.empty())
		m_flags.assign(n, 0);
	else
		m_flags.resize(n, m_flags.back());
}

///@brief Drops the flag vector if every flag is clear
void EthernetFrame::Compact()
{
	for(auto f : m_flags)
	{
		if(f)
			return;
	}
	m_flags.clear();
}

///@brief Fires the completion notification, if anyone asked for one
void EthernetFrame::HandleCompletion()
{
	if(m_completion)
		m_completion->Fire(*this);
}

string EthernetFrame::ToString() const
{
	auto stamp = [](const optional<int64_t>& t) -> string
	{
		if(!t)
			return "none";
		return Unit(Unit::UNIT_FS).PrettyPrint(*t);
	};

	string ret = "EthernetFrame(data=" + HexDump(m_data);
	ret += ", len=" + to_string(m_data.size());
	if(m_flags.empty())
		ret += ", flags=none";
	else
		ret += ", flags=" + HexDump(m_flags);
	ret += ", start=" + stamp(m_startTime);
	ret += ", sfd=" + stamp(m_sfdTime);
	ret += ", end=" + stamp(m_endTime);
	if(m_startLane)
		ret += ", lane=" + to_string(*m_startLane);
	ret += ")";
	return ret;
}
