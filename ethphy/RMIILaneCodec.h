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
	@brief Declaration of RMIILaneCodec
 */

#ifndef RMIILaneCodec_h
#define RMIILaneCodec_h

/**
	@brief RMII: 2-bit data on a 50 MHz reference clock, least significant pair first

	At 10 Mb/s each 2-bit unit is held for ten reference clocks, which the engines implement with the clock
	divider.
 */
class RMIILaneCodec : public LaneCodec
{
public:
	RMIILaneCodec(BusSignal& d, BusSignal* er, BusSignal& crsDv);

	virtual std::string GetName() const override;
	virtual std::string GetBusName() const override;

	virtual size_t GetSplitFactor() const override
	{ return 4; }

	virtual void SetMiiMode(bool mii) override;

	virtual void InitializeOutputs() override;
	virtual void EncodeFrame(const EthernetFrame& frame, std::vector<PhyLaneUnit>& units) override;
	virtual PhyLaneUnit GetIdleUnit() const override;
	virtual void DriveUnits(const std::vector<PhyLaneUnit>& lanes) override;
	virtual void DriveReset() override;

	virtual bool SampleLanes(ClockEdge edge, std::vector<PhyLaneUnit>& lanes) override;
	virtual bool IsSfdUnit(const PhyLaneUnit& unit, const PhyLaneUnit& prev) const override;
	virtual void ReassembleFrame(EthernetFrame& frame) override;
	virtual BusSignal* GetFrameValidSignal() const override;

protected:
	BusSignal& m_d;
	BusSignal* m_er;
	BusSignal& m_crsDv;
};

#endif
