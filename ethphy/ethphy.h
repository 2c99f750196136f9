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
	@brief Main library include file
 */

#ifndef ethphy_h
#define ethphy_h

#include <deque>
#include <vector>
#include <string>
#include <map>
#include <stdint.h>
#include <memory>
#include <functional>
#include <optional>
#include <stdexcept>
#include <climits>
#include <algorithm>
#include <cstdio>

#include <sigc++/sigc++.h>

#include <yaml-cpp/yaml.h>

#include <log/log.h>

#define ETHPHY_VERSION_STRING "0.1.0"

#define FS_PER_PICOSECOND 1e3
#define FS_PER_NANOSECOND 1e6
#define FS_PER_MICROSECOND 1e9
#define FS_PER_SECOND 1e15
#define SECONDS_PER_FS 1e-15

#include "EthPhyException.h"
#include "Unit.h"
#include "Bijection.h"

#include "EthernetConstants.h"
#include "TransportCodec.h"
#include "BaseRBlockCodec.h"

#include "FrameCompletion.h"
#include "EthernetFrame.h"
#include "FrameQueue.h"

#include "SimulationKernel.h"
#include "BusSignal.h"
#include "ClockGenerator.h"
#include "ResetDomain.h"

#include "LaneCodec.h"
#include "GMIILaneCodec.h"
#include "MIILaneCodec.h"
#include "RGMIILaneCodec.h"
#include "RMIILaneCodec.h"
#include "XGMIILaneCodec.h"

#include "PhyTransmitter.h"
#include "PhyReceiver.h"

#include "EthernetPhy.h"
#include "GMIIPhy.h"
#include "MIIPhy.h"
#include "RGMIIPhy.h"
#include "RMIIPhy.h"
#include "XGMIIPhy.h"

#include "PhyConfig.h"

//Checksum helpers
uint32_t CRC32(const uint8_t* bytes, size_t start, size_t end);
uint32_t CRC32(const std::vector<uint8_t>& bytes);

std::string to_string_hex(uint64_t n, bool zeropad = false, int len = 0);
std::string HexDump(const std::vector<uint8_t>& bytes, size_t maxlen = 32);
std::string strtolower(const std::string& s);
std::string Trim(const std::string& str);

const char* EthPhyGetVersion();

#endif
