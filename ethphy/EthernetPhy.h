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
	@brief Declaration of EthernetPhy
 */

#ifndef EthernetPhy_h
#define EthernetPhy_h

/**
	@brief Base class for a PHY model sitting on the far side of a MAC's PHY interface

	A PHY owns two engines. The TX side is a PhyReceiver that captures whatever the MAC transmits, the RX side
	is a PhyTransmitter that drives frames into the MAC. The PHY also generates the interface clocks, whose
	period follows the link speed.
 */
class EthernetPhy
{
public:
	EthernetPhy(SimulationKernel& kernel);
	virtual ~EthernetPhy();

	virtual std::string GetName() const =0;

	void SetSpeed(int64_t speed);

	///@brief Link speed in bits per second
	int64_t GetSpeed() const
	{ return m_speed; }

	virtual bool IsSpeedSupported(int64_t speed) const =0;

	///@brief Engine capturing frames sent by the MAC
	PhyReceiver& GetTx()
	{ return *m_tx; }

	///@brief Engine sending frames to the MAC
	PhyTransmitter& GetRx()
	{ return *m_rx; }

	ClockGenerator& GetClockGenerator()
	{ return m_clock; }

protected:
	///@brief Reconfigures clocks and engines for a speed that has already been validated
	virtual void ApplySpeed(int64_t speed) =0;

	SimulationKernel& m_kernel;

	std::unique_ptr<PhyReceiver> m_tx;
	std::unique_ptr<PhyTransmitter> m_rx;

	ClockGenerator m_clock;

	int64_t m_speed;
};

#endif
