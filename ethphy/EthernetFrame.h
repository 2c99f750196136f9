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
	@brief Declaration of EthernetFrame
 */

#ifndef EthernetFrame_h
#define EthernetFrame_h

/**
	@brief A single Ethernet frame as seen at the PHY interface: preamble, SFD, payload and FCS

	m_flags runs parallel to m_data and holds the per-byte error bit (GMII family) or control bit (XGMII).
	An empty flag vector means every flag is clear.

	Timestamps are in femtoseconds of simulation time and are only filled in by the engine handling the frame.
 */
class EthernetFrame
{
public:
	EthernetFrame();
	EthernetFrame(const std::vector<uint8_t>& data, const std::vector<uint8_t>& flags = std::vector<uint8_t>());

	static EthernetFrame FromPayload(const std::vector<uint8_t>& payload, size_t minLength = ETH_MIN_FRAME_LENGTH);
	static EthernetFrame FromRawPayload(const std::vector<uint8_t>& payload);

	size_t GetPreambleLength() const;
	std::vector<uint8_t> GetPreamble() const;
	std::vector<uint8_t> GetPayload(bool stripFCS = true) const;
	std::vector<uint8_t> GetFCS() const;
	bool CheckFCS() const;

	void Normalize();
	void Compact();

	void HandleCompletion();

	std::string ToString() const;

	size_t size() const
	{ return m_data.size(); }

	bool operator==(const EthernetFrame& rhs) const
	{ return m_data == rhs.m_data; }

	bool operator!=(const EthernetFrame& rhs) const
	{ return m_data != rhs.m_data; }

	std::vector<uint8_t> m_data;
	std::vector<uint8_t> m_flags;

	std::optional<int64_t> m_startTime;
	std::optional<int64_t> m_sfdTime;
	std::optional<int64_t> m_endTime;

	///@brief Lane on which START was seen (XGMII receive only)
	std::optional<size_t> m_startLane;

	///@brief Transmit notification. Copies share it, and it is good for one transmission only.
	std::shared_ptr<FrameCompletion> m_completion;
};

#endif
