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
	@brief Declaration of TransportCodec
 */

#ifndef TransportCodec_h
#define TransportCodec_h

/**
	@brief Stateless helpers for splitting bytes into bus units and back

	Sub-byte units are always emitted least significant part first. The join helpers realign on the first
	occurrence of the SFD at sub-byte granularity, so a receiver that started sampling on the wrong half of a
	byte still recovers the frame from the SFD onwards.
 */
class TransportCodec
{
public:

	static size_t GetLaneCount(size_t dataWidth);

	static void SplitNibbles(
		const std::vector<uint8_t>& data,
		const std::vector<uint8_t>& flags,
		std::vector<uint8_t>& nibbles,
		std::vector<uint8_t>& nibbleFlags);

	static void JoinNibbles(
		const std::vector<uint8_t>& nibbles,
		const std::vector<uint8_t>& nibbleFlags,
		std::vector<uint8_t>& data,
		std::vector<uint8_t>& flags);

	static void SplitDibits(
		const std::vector<uint8_t>& data,
		const std::vector<uint8_t>& flags,
		std::vector<uint8_t>& dibits,
		std::vector<uint8_t>& dibitFlags);

	static void JoinDibits(
		const std::vector<uint8_t>& dibits,
		const std::vector<uint8_t>& dibitFlags,
		std::vector<uint8_t>& data,
		std::vector<uint8_t>& flags);

	static void GetXgmiiIdle(size_t lanes, uint64_t& data, uint64_t& ctrl);

	static const Bijection<XgmiiCtrl, BaseRCtrl>& GetControlMap();

	static bool GetTermLane(uint8_t blockType, size_t& lane);
	static uint8_t GetTermBlockType(size_t lane);

	static bool IsXgmiiControl(uint8_t code);
	static bool IsBaseRControl(uint8_t code);
};

#endif
