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
	@brief Declaration of BaseRBlockCodec
 */

#ifndef BaseRBlockCodec_h
#define BaseRBlockCodec_h

/**
	@brief One 66-bit 10GBASE-R block: 2-bit sync header plus 64-bit payload

	Payload bits are in transmission order, LSB first. For control blocks the block type occupies bits 7:0.
 */
class BaseRBlock
{
public:
	BaseRBlock()
	 : m_header(0)
	 , m_payload(0)
	{}

	BaseRBlock(uint8_t h, uint64_t p)
	 : m_header(h)
	 , m_payload(p)
	{}

	uint8_t m_header;
	uint64_t m_payload;

	bool IsControl() const
	{ return m_header == static_cast<uint8_t>(BaseRSync::CTRL); }

	uint8_t GetBlockType() const
	{ return m_payload & 0xff; }

	bool operator== (const BaseRBlock& b) const
	{
		return (m_header == b.m_header) && (m_payload == b.m_payload);
	}
};

/**
	@brief Converts 8-lane XGMII words to 64b/66b blocks (IEEE 802.3 clause 49 figure 49-7) and back

	Lane i of an XGMII word is bits 8i+7:8i of the data word and bit i of the control word.
	Words that have no legal block encoding are sent as a control block full of ERROR codes, and blocks that
	cannot be decoded come back as eight ERROR control characters.
 */
class BaseRBlockCodec
{
public:
	static BaseRBlock Encode(uint64_t data, uint8_t ctrl);
	static void Decode(const BaseRBlock& block, uint64_t& data, uint8_t& ctrl);

	static BaseRBlock GetErrorBlock();

protected:
	static bool EncodeControlLanes(uint64_t data, size_t first, size_t last, uint64_t& payload, size_t& bitpos);
	static bool EncodeOrderedSet(uint8_t code, uint8_t& o);
	static void ErrorWord(uint64_t& data, uint8_t& ctrl);
};

#endif
