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
	@brief Implementation of XGMIIPhy
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

XGMIIPhy::XGMIIPhy(
	SimulationKernel& kernel,
	BusSignal& txd,
	BusSignal& txc,
	BusSignal& txClk,
	BusSignal& rxd,
	BusSignal& rxc,
	BusSignal& rxClk,
	BusSignal* reset,
	bool resetActiveHigh,
	int64_t speed)
	: EthernetPhy(kernel)
	, m_lanes(0)
{
	m_clock.AddOutput(txClk);
	m_clock.AddOutput(rxClk);
	txClk.SetImmediateValue(0);
	rxClk.SetImmediateValue(0);

	auto txCodec = make_unique<XGMIILaneCodec>(txd, txc);
	auto rxCodec = make_unique<XGMIILaneCodec>(rxd, rxc);
	m_lanes = rxCodec->GetLaneCount();
	if(txCodec->GetLaneCount() != m_lanes)
	{
		throw PhyConfigurationError(
			string("XGMII PHY: ") + txd.GetName() + " and " + rxd.GetName() + " have different lane counts");
	}
	if( (m_lanes != 1) && (m_lanes != 4) && (m_lanes != 8) )
		throw PhyConfigurationError(string("XGMII PHY: unsupported lane count ") + to_string(m_lanes));

	m_tx = make_unique<PhyReceiver>(kernel, std::move(txCodec), txClk, reset, nullptr, resetActiveHigh);
	m_rx = make_unique<PhyTransmitter>(kernel, std::move(rxCodec), rxClk, reset, nullptr, resetActiveHigh);

	SetSpeed(speed);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Speed control

string XGMIIPhy::GetName() const
{
	return "XGMII";
}

bool XGMIIPhy::IsSpeedSupported(int64_t speed) const
{
	return speed == 10000000000LL;
}

void XGMIIPhy::ApplySpeed(int64_t speed)
{
	//8 lanes: 6.4 ns, 4 lanes: 3.2 ns, 1 lane: 0.8 ns
	m_clock.Start(static_cast<int64_t>(m_lanes * 8 * FS_PER_SECOND / speed));
}
