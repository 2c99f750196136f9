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
	@brief Implementation of BusSignal
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

BusSignal::BusSignal(SimulationKernel& kernel, const string& name, size_t width, uint64_t initial)
	: m_kernel(kernel)
	, m_name(name)
	, m_width(width)
	, m_value(0)
	, m_pendingValue(0)
	, m_pending(false)
{
	if( (width == 0) || (width > 64) )
		throw PhyConfigurationError(string("Signal ") + name + " has unsupported width " + to_string(width));

	if(width == 64)
		m_mask = ~0ULL;
	else
		m_mask = (1ULL << width) - 1;

	m_value = initial & m_mask;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Value updates

void BusSignal::Write(uint64_t value)
{
	if(!m_kernel.IsRunning())
	{
		SetImmediateValue(value);
		return;
	}

	m_pendingValue = value & m_mask;
	if(!m_pending)
	{
		m_pending = true;
		m_kernel.AddPendingUpdate(this);
	}
}

void BusSignal::SetImmediateValue(uint64_t value)
{
	m_pending = false;
	Update(value & m_mask);
}

///@brief Makes the last Write() of this delta cycle visible
void BusSignal::CommitPendingValue()
{
	if(!m_pending)
		return;
	m_pending = false;
	Update(m_pendingValue);
}

void BusSignal::Update(uint64_t value)
{
	if(value == m_value)
		return;

	bool wasHigh = (m_value & 1) != 0;
	bool isHigh = (value & 1) != 0;
	m_value = value;

	m_changedSignal.emit();

	//Edges are only meaningful on single bit signals
	if(m_width == 1)
	{
		if(!wasHigh && isHigh)
			m_risingSignal.emit();
		else if(wasHigh && !isHigh)
			m_fallingSignal.emit();
	}
}
