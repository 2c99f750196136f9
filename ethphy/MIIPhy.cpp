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
	@brief Implementation of MIIPhy
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

MIIPhy::MIIPhy(
	SimulationKernel& kernel,
	BusSignal& txd,
	BusSignal* txEr,
	BusSignal& txEn,
	BusSignal& txClk,
	BusSignal& rxd,
	BusSignal* rxEr,
	BusSignal& rxDv,
	BusSignal& rxClk,
	BusSignal* reset,
	bool resetActiveHigh,
	int64_t speed)
	: EthernetPhy(kernel)
{
	m_clock.AddOutput(txClk);
	m_clock.AddOutput(rxClk);
	txClk.SetImmediateValue(0);
	rxClk.SetImmediateValue(0);

	m_tx = make_unique<PhyReceiver>(
		kernel, make_unique<MIILaneCodec>(txd, txEr, txEn), txClk, reset, nullptr, resetActiveHigh);
	m_rx = make_unique<PhyTransmitter>(
		kernel, make_unique<MIILaneCodec>(rxd, rxEr, rxDv), rxClk, reset, nullptr, resetActiveHigh);

	SetSpeed(speed);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Speed control

string MIIPhy::GetName() const
{
	return "MII";
}

bool MIIPhy::IsSpeedSupported(int64_t speed) const
{
	return (speed == 10000000LL) || (speed == 100000000LL);
}

void MIIPhy::ApplySpeed(int64_t speed)
{
	m_clock.Start(static_cast<int64_t>(4 * FS_PER_SECOND / speed));
}
