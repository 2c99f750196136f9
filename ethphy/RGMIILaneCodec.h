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
	@brief Declaration of RGMIILaneCodec
 */

#ifndef RGMIILaneCodec_h
#define RGMIILaneCodec_h

/**
	@brief RGMII: 4-bit double data rate bus plus a combined control line

	Bits 3:0 and the enable are valid at the rising edge, bits 7:4 and enable XOR error at the falling edge.
	In MII mode the transmitter only updates the bus on the falling edge, so each clock carries one nibble and
	the error bit cannot be represented.
 */
class RGMIILaneCodec : public LaneCodec
{
public:
	RGMIILaneCodec(BusSignal& d, BusSignal& ctl, BusSignal* miiSelect = nullptr);

	virtual std::string GetName() const override;
	virtual std::string GetBusName() const override;
	virtual size_t GetSplitFactor() const override;

	virtual bool IsDoubleDataRate() const override
	{ return true; }

	virtual void InitializeOutputs() override;
	virtual void EncodeFrame(const EthernetFrame& frame, std::vector<PhyLaneUnit>& units) override;
	virtual PhyLaneUnit GetIdleUnit() const override;
	virtual void DriveUnits(const std::vector<PhyLaneUnit>& lanes) override;
	virtual void DriveReset() override;
	virtual void OnTransmitEdge(ClockEdge edge) override;

	virtual bool SampleLanes(ClockEdge edge, std::vector<PhyLaneUnit>& lanes) override;
	virtual bool IsSfdUnit(const PhyLaneUnit& unit, const PhyLaneUnit& prev) const override;
	virtual void ReassembleFrame(EthernetFrame& frame) override;
	virtual BusSignal* GetFrameValidSignal() const override;

protected:
	BusSignal& m_d;
	BusSignal& m_ctl;

	//Unit currently being transmitted
	uint8_t m_txData;
	bool m_txError;
	bool m_txEnable;

	//Rising edge half of the unit being received
	uint8_t m_rxLow;
	bool m_rxValid;
};

#endif
