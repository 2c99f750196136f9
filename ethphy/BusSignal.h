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
	@brief Declaration of BusSignal
 */

#ifndef BusSignal_h
#define BusSignal_h

/**
	@brief A named wire or bus of 1 to 64 bits

	Write() is a non-blocking assignment: while the kernel is running, the new value becomes visible at the end
	of the current delta cycle. Outside of the kernel it takes effect immediately.
 */
class BusSignal
{
public:
	BusSignal(SimulationKernel& kernel, const std::string& name, size_t width = 1, uint64_t initial = 0);

	const std::string& GetName() const
	{ return m_name; }

	size_t GetWidth() const
	{ return m_width; }

	uint64_t Read() const
	{ return m_value; }

	bool ReadBit() const
	{ return (m_value & 1) != 0; }

	void Write(uint64_t value);
	void SetImmediateValue(uint64_t value);

	void CommitPendingValue();

	sigc::signal<void()> signal_changed()
	{ return m_changedSignal; }

	sigc::signal<void()> signal_rising()
	{ return m_risingSignal; }

	sigc::signal<void()> signal_falling()
	{ return m_fallingSignal; }

protected:
	void Update(uint64_t value);

	SimulationKernel& m_kernel;
	std::string m_name;
	size_t m_width;
	uint64_t m_mask;

	uint64_t m_value;
	uint64_t m_pendingValue;
	bool m_pending;

	sigc::signal<void()> m_changedSignal;
	sigc::signal<void()> m_risingSignal;
	sigc::signal<void()> m_fallingSignal;
};

#endif
