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
	@brief Declaration of PhyConfig
 */

#ifndef PhyConfig_h
#define PhyConfig_h

/**
	@brief Link and engine settings loaded from a YAML file

	Everything lives under a top level "phy" key. Keys that are not present keep their defaults.
 */
class PhyConfig
{
public:
	PhyConfig();

	enum PhyMode
	{
		MODE_GMII,
		MODE_MII,
		MODE_RGMII,
		MODE_RMII,
		MODE_XGMII
	};

	bool Load(const std::string& path);
	bool Load(const YAML::Node& node);

	void ApplyTo(PhyTransmitter& tx) const;
	void ApplyTo(EthernetPhy& phy) const;

	static PhyMode ParseMode(const std::string& str);
	static std::string GetModeName(PhyMode mode);
	static int64_t GetDefaultSpeed(PhyMode mode);
	static bool IsSpeedValid(PhyMode mode, int64_t speed);

	PhyMode GetMode() const
	{ return m_mode; }

	///@brief Link speed in bits per second
	int64_t GetSpeed() const
	{ return m_speed; }

	size_t GetLaneCount() const
	{ return m_lanes; }

	int GetIfg() const
	{ return m_ifg; }

	bool GetEnableDic() const
	{ return m_enableDic; }

	bool GetForceOffsetStart() const
	{ return m_forceOffsetStart; }

	///@brief Reset polarity, to be passed to the engine or PHY constructor
	bool GetResetActiveHigh() const
	{ return m_resetActiveHigh; }

	size_t GetQueueLimitBytes() const
	{ return m_limitBytes; }

	size_t GetQueueLimitFrames() const
	{ return m_limitFrames; }

	const std::string& GetFileName() const
	{ return m_fname; }

protected:
	void Clear();
	void LoadQueue(const YAML::Node& node);

	std::string m_fname;

	PhyMode m_mode;
	int64_t m_speed;
	size_t m_lanes;
	int m_ifg;
	bool m_enableDic;
	bool m_forceOffsetStart;
	bool m_resetActiveHigh;
	size_t m_limitBytes;
	size_t m_limitFrames;
};

#endif
