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
	@brief Implementation of TransportCodec
 */

#include "ethphy.h"

using namespace std;

/**
	@brief Gets the number of byte lanes on a data bus of the given width

	Throws PhyConfigurationError if the width is not a whole number of bytes.
 */
size_t TransportCodec::GetLaneCount(size_t dataWidth)
{
	if( (dataWidth == 0) || (dataWidth % 8) != 0)
		throw PhyConfigurationError(string("Data bus width ") + to_string(dataWidth) + " is not a multiple of 8");
	return dataWidth / 8;
}

/**
	@brief Splits each byte into two nibbles, low nibble first. Flags are replicated onto both halves.
 */
void TransportCodec::SplitNibbles(
	const vector<uint8_t>& data,
	const vector<uint8_t>& flags,
	vector<uint8_t>& nibbles,
	vector<uint8_t>& nibbleFlags)
{
	nibbles.clear();
	nibbleFlags.clear();
	nibbles.reserve(data.size() * 2);
	nibbleFlags.reserve(data.size() * 2);

	for(size_t i=0; i<data.size(); i++)
	{
		uint8_t f = (i < flags.size()) ? flags[i] : 0;
		nibbles.push_back(data[i] & 0xf);
		nibbles.push_back(data[i] >> 4);
		nibbleFlags.push_back(f);
		nibbleFlags.push_back(f);
	}
}

/**
	@brief Folds a nibble stream back into bytes, resynchronizing on the SFD

	Each output flag is the OR of the flags of the nibbles that make up the byte.
 */
void TransportCodec::JoinNibbles(
	const vector<uint8_t>& nibbles,
	const vector<uint8_t>& nibbleFlags,
	vector<uint8_t>& data,
	vector<uint8_t>& flags)
{
	data.clear();
	flags.clear();

	bool odd = true;
	bool sync = false;
	uint8_t b = 0;
	uint8_t be = 0;
	for(size_t i=0; i<nibbles.size(); i++)
	{
		odd = !odd;
		b = ((nibbles[i] & 0xf) << 4) | (b >> 4);
		if(i < nibbleFlags.size())
			be |= nibbleFlags[i];

		//First SFD seen at nibble granularity: the byte boundary is here no matter what came before
		if(!sync && (b == ETH_SFD_BYTE) )
		{
			odd = true;
			sync = true;
		}

		if(odd)
		{
			data.push_back(b);
			flags.push_back(be);
			be = 0;
		}
	}
}

/**
	@brief Splits each byte into four 2-bit units, least significant pair first
 */
void TransportCodec::SplitDibits(
	const vector<uint8_t>& data,
	const vector<uint8_t>& flags,
	vector<uint8_t>& dibits,
	vector<uint8_t>& dibitFlags)
{
	dibits.clear();
	dibitFlags.clear();
	dibits.reserve(data.size() * 4);
	dibitFlags.reserve(data.size() * 4);

	for(size_t i=0; i<data.size(); i++)
	{
		uint8_t f = (i < flags.size()) ? flags[i] : 0;
		for(int j=0; j<4; j++)
		{
			dibits.push_back( (data[i] >> (2*j)) & 3);
			dibitFlags.push_back(f);
		}
	}
}

/**
	@brief Folds a 2-bit unit stream back into bytes, resynchronizing on the SFD
 */
void TransportCodec::JoinDibits(
	const vector<uint8_t>& dibits,
	const vector<uint8_t>& dibitFlags,
	vector<uint8_t>& data,
	vector<uint8_t>& flags)
{
	data.clear();
	flags.clear();

	size_t position = 0;
	bool sync = false;
	uint8_t b = 0;
	uint8_t be = 0;
	for(size_t i=0; i<dibits.size(); i++)
	{
		b = ((dibits[i] & 3) << 6) | (b >> 2);
		if(i < dibitFlags.size())
			be |= dibitFlags[i];
		position ++;

		//First SFD seen at 2-bit granularity: the byte boundary is here no matter what came before
		if(!sync && (b == ETH_SFD_BYTE) )
		{
			sync = true;
			position = 4;
		}

		if(position == 4)
		{
			data.push_back(b);
			flags.push_back(be);
			position = 0;
			be = 0;
		}
	}
}

/**
	@brief Gets the XGMII idle pattern for a bus with the given number of lanes

	@param lanes	Number of byte lanes (1 to 8)
	@param data		IDLE in every lane
	@param ctrl		Every control bit set
 */
void TransportCodec::GetXgmiiIdle(size_t lanes, uint64_t& data, uint64_t& ctrl)
{
	data = 0;
	ctrl = 0;
	for(size_t i=0; i<lanes; i++)
	{
		data |= static_cast<uint64_t>(XgmiiCtrl::IDLE) << (8*i);
		ctrl |= (1ULL << i);
	}
}

/**
	@brief Gets the XGMII <-> BASE-R control character mapping

	START, TERM and the ordered set characters have no 7-bit code, they are carried by the block type.
 */
const Bijection<XgmiiCtrl, BaseRCtrl>& TransportCodec::GetControlMap()
{
	static const Bijection<XgmiiCtrl, BaseRCtrl> map =
	{
		{XgmiiCtrl::IDLE,	BaseRCtrl::IDLE},
		{XgmiiCtrl::LPI,	BaseRCtrl::LPI},
		{XgmiiCtrl::ERROR,	BaseRCtrl::ERROR},
		{XgmiiCtrl::RES_0,	BaseRCtrl::RES_0},
		{XgmiiCtrl::RES_1,	BaseRCtrl::RES_1},
		{XgmiiCtrl::RES_2,	BaseRCtrl::RES_2},
		{XgmiiCtrl::RES_3,	BaseRCtrl::RES_3},
		{XgmiiCtrl::RES_4,	BaseRCtrl::RES_4},
		{XgmiiCtrl::RES_5,	BaseRCtrl::RES_5}
	};
	return map;
}

/**
	@brief Looks up the lane that carries TERM for a terminate block type

	@return False if the block type is not one of TERM_0 to TERM_7
 */
bool TransportCodec::GetTermLane(uint8_t blockType, size_t& lane)
{
	static const map<uint8_t, size_t> lanes =
	{
		{static_cast<uint8_t>(BaseRBlockType::TERM_0), 0},
		{static_cast<uint8_t>(BaseRBlockType::TERM_1), 1},
		{static_cast<uint8_t>(BaseRBlockType::TERM_2), 2},
		{static_cast<uint8_t>(BaseRBlockType::TERM_3), 3},
		{static_cast<uint8_t>(BaseRBlockType::TERM_4), 4},
		{static_cast<uint8_t>(BaseRBlockType::TERM_5), 5},
		{static_cast<uint8_t>(BaseRBlockType::TERM_6), 6},
		{static_cast<uint8_t>(BaseRBlockType::TERM_7), 7}
	};

	auto it = lanes.find(blockType);
	if(it == lanes.end())
		return false;
	lane = it->second;
	return true;
}

uint8_t TransportCodec::GetTermBlockType(size_t lane)
{
	static const uint8_t types[8] =
	{
		static_cast<uint8_t>(BaseRBlockType::TERM_0),
		static_cast<uint8_t>(BaseRBlockType::TERM_1),
		static_cast<uint8_t>(BaseRBlockType::TERM_2),
		static_cast<uint8_t>(BaseRBlockType::TERM_3),
		static_cast<uint8_t>(BaseRBlockType::TERM_4),
		static_cast<uint8_t>(BaseRBlockType::TERM_5),
		static_cast<uint8_t>(BaseRBlockType::TERM_6),
		static_cast<uint8_t>(BaseRBlockType::TERM_7)
	};
	if(lane >= 8)
		throw PhyConfigurationError(string("No terminate block for lane ") + to_string(lane));
	return types[lane];
}

///@brief True if the byte is a defined XGMII control character
bool TransportCodec::IsXgmiiControl(uint8_t code)
{
	switch(static_cast<XgmiiCtrl>(code))
	{
		case XgmiiCtrl::IDLE:
		case XgmiiCtrl::LPI:
		case XgmiiCtrl::START:
		case XgmiiCtrl::TERM:
		case XgmiiCtrl::ERROR:
		case XgmiiCtrl::SEQ_OS:
		case XgmiiCtrl::RES_0:
		case XgmiiCtrl::RES_1:
		case XgmiiCtrl::RES_2:
		case XgmiiCtrl::RES_3:
		case XgmiiCtrl::RES_4:
		case XgmiiCtrl::RES_5:
		case XgmiiCtrl::SIG_OS:
			return true;

		default:
			return false;
	}
}

///@brief True if the 7-bit value is a defined BASE-R control code
bool TransportCodec::IsBaseRControl(uint8_t code)
{
	return GetControlMap().HasEntry(static_cast<BaseRCtrl>(code));
}
