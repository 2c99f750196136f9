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
	@brief Implementation of PhyConfig
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

PhyConfig::PhyConfig()
{
	Clear();
}

void PhyConfig::Clear()
{
	m_fname = "";
	m_mode = MODE_GMII;
	m_speed = GetDefaultSpeed(m_mode);
	m_lanes = 8;
	m_ifg = 12;
	m_enableDic = true;
	m_forceOffsetStart = false;
	m_resetActiveHigh = true;
	m_limitBytes = 0;
	m_limitFrames = 0;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Mode names

PhyConfig::PhyMode PhyConfig::ParseMode(const string& str)
{
	auto s = strtolower(Trim(str));
	if(s == "gmii")
		return MODE_GMII;
	else if(s == "mii")
		return MODE_MII;
	else if(s == "rgmii")
		return MODE_RGMII;
	else if(s == "rmii")
		return MODE_RMII;
	else if(s == "xgmii")
		return MODE_XGMII;

	throw PhyConfigurationError(string("Unrecognized PHY mode \"") + str + "\"");
}

string PhyConfig::GetModeName(PhyMode mode)
{
	switch(mode)
	{
		case MODE_GMII:
			return "GMII";

		case MODE_MII:
			return "MII";

		case MODE_RGMII:
			return "RGMII";

		case MODE_RMII:
			return "RMII";

		case MODE_XGMII:
			return "XGMII";

		default:
			return "unknown";
	}
}

///@brief Link speed a PHY of the given type comes up at when the config does not name one
int64_t PhyConfig::GetDefaultSpeed(PhyMode mode)
{
	switch(mode)
	{
		case MODE_MII:
		case MODE_RMII:
			return 100000000LL;

		case MODE_XGMII:
			return 10000000000LL;

		case MODE_GMII:
		case MODE_RGMII:
		default:
			return 1000000000LL;
	}
}

bool PhyConfig::IsSpeedValid(PhyMode mode, int64_t speed)
{
	switch(mode)
	{
		case MODE_GMII:
		case MODE_RGMII:
			return (speed == 10000000LL) || (speed == 100000000LL) || (speed == 1000000000LL);

		case MODE_MII:
		case MODE_RMII:
			return (speed == 10000000LL) || (speed == 100000000LL);

		case MODE_XGMII:
			return speed == 10000000000LL;

		default:
			return false;
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Loading

/**
	@brief Loads settings from a YAML file

	@return False if the file could not be opened. Malformed contents throw PhyConfigurationError.
 */
bool PhyConfig::Load(const string& path)
{
	Clear();

	try
	{
		m_fname = path;
		auto docs = YAML::LoadAllFromFile(path);
		if(docs.empty())
		{
			LogWarning("Config file %s is empty\n", path.c_str());
			return false;
		}
		if(!Load(docs[0]))
			return false;
	}
	catch(const YAML::BadFile&)
	{
		LogWarning("Could not open config file %s\n", path.c_str());
		return false;
	}
	catch(const YAML::Exception& ex)
	{
		throw PhyConfigurationError(string("Malformed config file ") + path + ": " + ex.what());
	}

	LogVerbose("Loaded %s PHY config from %s\n", GetModeName(m_mode).c_str(), path.c_str());
	return true;
}

bool PhyConfig::Load(const YAML::Node& node)
{
	auto phy = node["phy"];
	if(!phy)
	{
		LogError("Config has no \"phy\" section\n");
		return false;
	}

	bool haveSpeed = false;
	for(auto it : phy)
	{
		auto name = it.first.as<string>();

		if(name == "mode")
			m_mode = ParseMode(it.second.as<string>());
		else if(name == "speed")
		{
			m_speed = Unit(Unit::UNIT_BITRATE).ParseStringInt64(it.second.as<string>());
			haveSpeed = true;
		}
		else if(name == "lanes")
			m_lanes = it.second.as<size_t>();
		else if(name == "ifg")
			m_ifg = it.second.as<int>();
		else if(name == "enable_dic")
			m_enableDic = it.second.as<bool>();
		else if(name == "force_offset_start")
			m_forceOffsetStart = it.second.as<bool>();
		else if(name == "reset_active_level")
		{
			auto level = strtolower(it.second.as<string>());
			if( (level == "high") || (level == "1") || (level == "true") )
				m_resetActiveHigh = true;
			else if( (level == "low") || (level == "0") || (level == "false") )
				m_resetActiveHigh = false;
			else
				throw PhyConfigurationError(string("Unrecognized reset_active_level \"") + level + "\"");
		}
		else if(name == "queue")
			LoadQueue(it.second);
		else
			LogWarning("Ignoring unrecognized config key \"%s\"\n", name.c_str());
	}

	if(!haveSpeed)
		m_speed = GetDefaultSpeed(m_mode);
	else if(!IsSpeedValid(m_mode, m_speed))
	{
		throw PhyConfigurationError(
			GetModeName(m_mode) + " cannot run at " + Unit(Unit::UNIT_BITRATE).PrettyPrint(m_speed));
	}

	if(m_ifg < 0)
		throw PhyConfigurationError("Inter-frame gap cannot be negative");
	if( (m_mode == MODE_XGMII) && (m_lanes != 1) && (m_lanes != 4) && (m_lanes != 8) )
		throw PhyConfigurationError(string("Unsupported XGMII lane count ") + to_string(m_lanes));

	return true;
}

void PhyConfig::LoadQueue(const YAML::Node& node)
{
	for(auto it : node)
	{
		auto name = it.first.as<string>();
		if(name == "limit_bytes")
			m_limitBytes = Unit(Unit::UNIT_BYTES).ParseStringInt64(it.second.as<string>());
		else if(name == "limit_frames")
			m_limitFrames = it.second.as<size_t>();
		else
			LogWarning("Ignoring unrecognized queue key \"%s\"\n", name.c_str());
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Applying settings

///@brief Pushes gap, deficit idle and queue settings into a transmitter
void PhyConfig::ApplyTo(PhyTransmitter& tx) const
{
	tx.SetIfg(m_ifg);
	tx.SetEnableDic(m_enableDic);
	tx.SetForceOffsetStart(m_forceOffsetStart);
	tx.SetQueueLimits(m_limitBytes, m_limitFrames);
}

/**
	@brief Configures a PHY model. The mode (and lane count for XGMII) must match the PHY.
 */
void PhyConfig::ApplyTo(EthernetPhy& phy) const
{
	if(phy.GetName() != GetModeName(m_mode))
	{
		throw PhyConfigurationError(
			string("Config is for a ") + GetModeName(m_mode) + " PHY, cannot apply it to a " + phy.GetName() + " PHY");
	}

	auto xgmii = dynamic_cast<XGMIIPhy*>(&phy);
	if(xgmii && (xgmii->GetLaneCount() != m_lanes) )
	{
		throw PhyConfigurationError(
			string("Config is for ") + to_string(m_lanes) + " XGMII lanes, PHY has " +
			to_string(xgmii->GetLaneCount()));
	}

	if(phy.GetSpeed() != m_speed)
		phy.SetSpeed(m_speed);

	ApplyTo(phy.GetRx());
}
