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

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

ResetDomain::ResetDomain()
	: m_resetSignal(nullptr)
	, m_resetActiveHigh(true)
	, m_localReset(false)
	, m_externalReset(false)
	, m_resetState(true)
{
}

ResetDomain::~ResetDomain()
{
	m_resetConnection.disconnect();
}

/**
	@brief Hooks up the external reset and brings the domain out of reset if nothing holds it there

	Must be called at the end of the most derived constructor, since it calls OnReset().
 */
void ResetDomain::InitReset(BusSignal* reset, bool activeHigh)
{
	m_resetSignal = reset;
	m_resetActiveHigh = activeHigh;

	if(m_resetSignal)
	{
		m_resetConnection = m_resetSignal->signal_changed().connect(
			sigc::mem_fun(*this, &ResetDomain::OnResetSignalChanged));
		m_externalReset = (m_resetSignal->ReadBit() == m_resetActiveHigh);
	}

	bool state = m_localReset || m_externalReset;
	m_resetState = state;
	OnReset(state);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Reset control

void ResetDomain::AssertReset()
{
	m_localReset = true;
	UpdateReset();
}

void ResetDomain::DeassertReset()
{
	m_localReset = false;
	UpdateReset();
}

void ResetDomain::OnResetSignalChanged()
{
	m_externalReset = (m_resetSignal->ReadBit() == m_resetActiveHigh);
	UpdateReset();
}

void ResetDomain::UpdateReset()
{
	bool state = m_localReset || m_externalReset;
	if(state == m_resetState)
		return;

	m_resetState = state;
	OnReset(state);
}
