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
	@brief Declaration of GMIIPhy
 */

#ifndef GMIIPhy_h
#define GMIIPhy_h

/**
	@brief GMII PHY model, 10/100/1000 Mb/s

	Generates TX_CLK and RX_CLK. At gigabit speed the MAC transmits on its own GTX_CLK, at 10/100 the port
	runs in MII mode off TX_CLK.
 */
class GMIIPhy : public EthernetPhy
{
public:
	GMIIPhy(
		SimulationKernel& kernel,
		BusSignal& txd,
		BusSignal* txEr,
		BusSignal& txEn,
		BusSignal& txClk,
		BusSignal& gtxClk,
		BusSignal& rxd,
		BusSignal* rxEr,
		BusSignal& rxDv,
		BusSignal& rxClk,
		BusSignal* reset = nullptr,
		bool resetActiveHigh = true,
		int64_t speed = 1000000000LL);

	virtual std::string GetName() const override;
	virtual bool IsSpeedSupported(int64_t speed) const override;

protected:
	virtual void ApplySpeed(int64_t speed) override;

	BusSignal& m_txClk;
	BusSignal& m_gtxClk;
	BusSignal& m_rxClk;
};

#endif
