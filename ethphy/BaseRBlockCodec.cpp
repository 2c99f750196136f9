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
	@brief Implementation of BaseRBlockCodec
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Bit packing helpers

static void PutBits(uint64_t& payload, size_t& pos, uint64_t value, size_t nbits)
{
	payload |= (value & ((1ULL << nbits) - 1)) << pos;
	pos += nbits;
}

static uint8_t GetBits(uint64_t payload, size_t& pos, size_t nbits)
{
	uint8_t ret = (payload >> pos) & ((1ULL << nbits) - 1);
	pos += nbits;
	return ret;
}

static uint8_t GetLane(uint64_t data, size_t lane)
{
	return (data >> (8*lane)) & 0xff;
}

static void SetLane(uint64_t& data, uint8_t& ctrl, size_t lane, uint8_t value, bool control)
{
	data &= ~(0xffULL << (8*lane));
	data |= static_cast<uint64_t>(value) << (8*lane);
	if(control)
		ctrl |= (1 << lane);
	else
		ctrl &= ~(1 << lane);
}

static uint8_t DecodeControlCode(uint8_t code)
{
	auto& cmap = TransportCodec::GetControlMap();
	auto c = static_cast<BaseRCtrl>(code);
	if(!cmap.HasEntry(c))
		return static_cast<uint8_t>(XgmiiCtrl::ERROR);
	return static_cast<uint8_t>(cmap[c]);
}

static uint8_t DecodeOrderedSet(uint8_t o)
{
	if(o == static_cast<uint8_t>(BaseRO::SEQ_OS))
		return static_cast<uint8_t>(XgmiiCtrl::SEQ_OS);
	else if(o == static_cast<uint8_t>(BaseRO::SIG_OS))
		return static_cast<uint8_t>(XgmiiCtrl::SIG_OS);
	return static_cast<uint8_t>(XgmiiCtrl::ERROR);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Encoding

///@brief A control block with ERROR in all eight positions
BaseRBlock BaseRBlockCodec::GetErrorBlock()
{
	uint64_t payload = 0;
	size_t pos = 0;
	PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::CTRL), 8);
	for(int i=0; i<8; i++)
		PutBits(payload, pos, static_cast<uint8_t>(BaseRCtrl::ERROR), 7);
	return BaseRBlock(static_cast<uint8_t>(BaseRSync::CTRL), payload);
}

/**
	@brief Packs lanes first...last as 7-bit control codes

	@return False if any of the lanes holds a character with no 7-bit code
 */
bool BaseRBlockCodec::EncodeControlLanes(uint64_t data, size_t first, size_t last, uint64_t& payload, size_t& bitpos)
{
	auto& cmap = TransportCodec::GetControlMap();
	for(size_t i=first; i<=last; i++)
	{
		auto c = static_cast<XgmiiCtrl>(GetLane(data, i));
		if(!cmap.HasEntry(c))
			return false;
		PutBits(payload, bitpos, static_cast<uint8_t>(cmap[c]), 7);
	}
	return true;
}

bool BaseRBlockCodec::EncodeOrderedSet(uint8_t code, uint8_t& o)
{
	if(code == static_cast<uint8_t>(XgmiiCtrl::SEQ_OS))
		o = static_cast<uint8_t>(BaseRO::SEQ_OS);
	else if(code == static_cast<uint8_t>(XgmiiCtrl::SIG_OS))
		o = static_cast<uint8_t>(BaseRO::SIG_OS);
	else
		return false;
	return true;
}

/**
	@brief Encodes one 8-lane XGMII word

	@param data		Lane i in bits 8i+7:8i
	@param ctrl		Lane i control flag in bit i
 */
BaseRBlock BaseRBlockCodec::Encode(uint64_t data, uint8_t ctrl)
{
	const uint8_t hdr = static_cast<uint8_t>(BaseRSync::CTRL);
	const uint8_t start = static_cast<uint8_t>(XgmiiCtrl::START);
	const uint8_t term = static_cast<uint8_t>(XgmiiCtrl::TERM);

	//Eight data bytes
	if(ctrl == 0)
		return BaseRBlock(static_cast<uint8_t>(BaseRSync::DATA), data);

	uint64_t payload = 0;
	size_t pos = 0;
	uint8_t l0 = GetLane(data, 0);
	uint8_t l4 = GetLane(data, 4);
	uint8_t o0 = 0;
	uint8_t o4 = 0;

	if(ctrl == 0xff)
	{
		//T0 C1 C2 C3 C4 C5 C6 C7
		if(l0 == term)
		{
			PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::TERM_0), 8);
			PutBits(payload, pos, 0, 7);
			if(EncodeControlLanes(data, 1, 7, payload, pos))
				return BaseRBlock(hdr, payload);
			return GetErrorBlock();
		}

		//C0 C1 C2 C3 C4 C5 C6 C7
		PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::CTRL), 8);
		if(EncodeControlLanes(data, 0, 7, payload, pos))
			return BaseRBlock(hdr, payload);
		return GetErrorBlock();
	}

	//S0 D1 D2 D3 D4 D5 D6 D7
	if( (ctrl == 0x01) && (l0 == start) )
	{
		PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::START_0), 8);
		for(size_t i=1; i<8; i++)
			PutBits(payload, pos, GetLane(data, i), 8);
		return BaseRBlock(hdr, payload);
	}

	if(ctrl == 0x1f)
	{
		//C0 C1 C2 C3 S4 D5 D6 D7
		if(l4 == start)
		{
			PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::START_4), 8);
			if(!EncodeControlLanes(data, 0, 3, payload, pos))
				return GetErrorBlock();
			PutBits(payload, pos, 0, 4);
		}

		//C0 C1 C2 C3 O4 D5 D6 D7
		else if(EncodeOrderedSet(l4, o4))
		{
			PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::OS_4), 8);
			if(!EncodeControlLanes(data, 0, 3, payload, pos))
				return GetErrorBlock();
			PutBits(payload, pos, o4, 4);
		}

		else
			return GetErrorBlock();

		for(size_t i=5; i<8; i++)
			PutBits(payload, pos, GetLane(data, i), 8);
		return BaseRBlock(hdr, payload);
	}

	if( (ctrl == 0x11) && EncodeOrderedSet(l0, o0) )
	{
		//O0 D1 D2 D3 S4 D5 D6 D7
		if(l4 == start)
		{
			PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::OS_START), 8);
			for(size_t i=1; i<4; i++)
				PutBits(payload, pos, GetLane(data, i), 8);
			PutBits(payload, pos, o0, 4);
			PutBits(payload, pos, 0, 4);
		}

		//O0 D1 D2 D3 O4 D5 D6 D7
		else if(EncodeOrderedSet(l4, o4))
		{
			PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::OS_04), 8);
			for(size_t i=1; i<4; i++)
				PutBits(payload, pos, GetLane(data, i), 8);
			PutBits(payload, pos, o0, 4);
			PutBits(payload, pos, o4, 4);
		}

		else
			return GetErrorBlock();

		for(size_t i=5; i<8; i++)
			PutBits(payload, pos, GetLane(data, i), 8);
		return BaseRBlock(hdr, payload);
	}

	//O0 D1 D2 D3 C4 C5 C6 C7
	if( (ctrl == 0xf1) && EncodeOrderedSet(l0, o0) )
	{
		PutBits(payload, pos, static_cast<uint8_t>(BaseRBlockType::OS_0), 8);
		for(size_t i=1; i<4; i++)
			PutBits(payload, pos, GetLane(data, i), 8);
		PutBits(payload, pos, o0, 4);
		if(EncodeControlLanes(data, 4, 7, payload, pos))
			return BaseRBlock(hdr, payload);
		return GetErrorBlock();
	}

	//Terminate in lanes 1 to 7: data up to the TERM, control after it
	for(size_t k=1; k<8; k++)
	{
		if( (ctrl != ((0xff << k) & 0xff)) || (GetLane(data, k) != term) )
			continue;

		PutBits(payload, pos, TransportCodec::GetTermBlockType(k), 8);
		for(size_t i=0; i<k; i++)
			PutBits(payload, pos, GetLane(data, i), 8);
		PutBits(payload, pos, 0, 7-k);
		if(EncodeControlLanes(data, k+1, 7, payload, pos))
			return BaseRBlock(hdr, payload);
		return GetErrorBlock();
	}

	return GetErrorBlock();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Decoding

void BaseRBlockCodec::ErrorWord(uint64_t& data, uint8_t& ctrl)
{
	data = 0;
	ctrl = 0;
	for(size_t i=0; i<8; i++)
		SetLane(data, ctrl, i, static_cast<uint8_t>(XgmiiCtrl::ERROR), true);
}

/**
	@brief Decodes one block back to an 8-lane XGMII word
 */
void BaseRBlockCodec::Decode(const BaseRBlock& block, uint64_t& data, uint8_t& ctrl)
{
	const uint8_t start = static_cast<uint8_t>(XgmiiCtrl::START);
	const uint8_t term = static_cast<uint8_t>(XgmiiCtrl::TERM);

	if(block.m_header == static_cast<uint8_t>(BaseRSync::DATA))
	{
		data = block.m_payload;
		ctrl = 0;
		return;
	}

	//Bad sync header
	if(!block.IsControl())
	{
		ErrorWord(data, ctrl);
		return;
	}

	data = 0;
	ctrl = 0;
	uint64_t p = block.m_payload;
	size_t pos = 8;
	size_t termLane = 0;
	switch(static_cast<BaseRBlockType>(block.GetBlockType()))
	{
		case BaseRBlockType::CTRL:
			for(size_t i=0; i<8; i++)
				SetLane(data, ctrl, i, DecodeControlCode(GetBits(p, pos, 7)), true);
			break;

		case BaseRBlockType::OS_4:
			for(size_t i=0; i<4; i++)
				SetLane(data, ctrl, i, DecodeControlCode(GetBits(p, pos, 7)), true);
			SetLane(data, ctrl, 4, DecodeOrderedSet(GetBits(p, pos, 4)), true);
			for(size_t i=5; i<8; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			break;

		case BaseRBlockType::START_4:
			for(size_t i=0; i<4; i++)
				SetLane(data, ctrl, i, DecodeControlCode(GetBits(p, pos, 7)), true);
			pos += 4;
			SetLane(data, ctrl, 4, start, true);
			for(size_t i=5; i<8; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			break;

		case BaseRBlockType::OS_START:
			for(size_t i=1; i<4; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			SetLane(data, ctrl, 0, DecodeOrderedSet(GetBits(p, pos, 4)), true);
			pos += 4;
			SetLane(data, ctrl, 4, start, true);
			for(size_t i=5; i<8; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			break;

		case BaseRBlockType::OS_04:
			for(size_t i=1; i<4; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			SetLane(data, ctrl, 0, DecodeOrderedSet(GetBits(p, pos, 4)), true);
			SetLane(data, ctrl, 4, DecodeOrderedSet(GetBits(p, pos, 4)), true);
			for(size_t i=5; i<8; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			break;

		case BaseRBlockType::START_0:
			SetLane(data, ctrl, 0, start, true);
			for(size_t i=1; i<8; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			break;

		case BaseRBlockType::OS_0:
			for(size_t i=1; i<4; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			SetLane(data, ctrl, 0, DecodeOrderedSet(GetBits(p, pos, 4)), true);
			for(size_t i=4; i<8; i++)
				SetLane(data, ctrl, i, DecodeControlCode(GetBits(p, pos, 7)), true);
			break;

		default:
			if(!TransportCodec::GetTermLane(block.GetBlockType(), termLane))
			{
				ErrorWord(data, ctrl);
				return;
			}

			for(size_t i=0; i<termLane; i++)
				SetLane(data, ctrl, i, GetBits(p, pos, 8), false);
			pos += 7 - termLane;
			SetLane(data, ctrl, termLane, term, true);
			for(size_t i=termLane+1; i<8; i++)
				SetLane(data, ctrl, i, DecodeControlCode(GetBits(p, pos, 7)), true);
			break;
	}
}
