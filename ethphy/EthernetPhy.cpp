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
	@brief Implementation of EthernetPhy
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

EthernetPhy::EthernetPhy(SimulationKernel& kernel)
	: m_kernel(kernel)
	, m_clock(kernel)
	, m_speed(0)
{
}

EthernetPhy::~EthernetPhy()
{
	m_clock.Stop();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Speed control

/**
	@brief Changes the link speed

	Restarts the clocks at the new period, switches both engines to the matching data path width and pulses a
	reset on both of them. Anything in flight is dropped.

	@param speed	Link speed in bits per second
 */
void EthernetPhy::SetSpeed(int64_t speed)
{
	if(!IsSpeedSupported(speed))
	{
		throw PhyConfigurationError(
			GetName() + " PHY does not support a link speed of " + Unit(Unit::UNIT_BITRATE).PrettyPrint(speed));
	}

	m_speed = speed;
	ApplySpeed(speed);

	LogVerbose("%s PHY: link speed set to %s, clock period %s\n",
		GetName().c_str(),
		Unit(Unit::UNIT_BITRATE).PrettyPrint(speed).c_str(),
		Unit(Unit::UNIT_FS).PrettyPrint(m_clock.GetPeriod()).c_str());

	m_tx->AssertReset();
	m_rx->AssertReset();
	m_tx->DeassertReset();
	m_rx->DeassertReset();
}
