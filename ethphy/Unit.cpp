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
	@brief Implementation of Unit
 */

#include "ethphy.h"

#include <cmath>
#include <cctype>
#include <cstring>

using namespace std;

/**
	@brief One rung of a prefix ladder. Values of at least m_scale are printed divided by it.
 */
struct UnitPrefix
{
	double m_scale;
	const char* m_prefix;
};

static const UnitPrefix g_decimalPrefixes[] =
{
	{ 1e12, "T" },
	{ 1e9,  "G" },
	{ 1e6,  "M" },
	{ 1e3,  "k" },
	{ 1,    ""  }
};

//Frame and queue sizes count in powers of two
static const UnitPrefix g_binaryPrefixes[] =
{
	{ 1024.0 * 1024, "M" },
	{ 1024,          "k" },
	{ 1,             ""  }
};

//Times are stored in femtoseconds, so the ladder is shifted down by 1e15
static const UnitPrefix g_timePrefixes[] =
{
	{ 1e15, ""  },
	{ 1e12, "m" },
	{ 1e9,  "μ" },
	{ 1e6,  "n" },
	{ 1e3,  "p" },
	{ 1,    "f" }
};

/**
	@brief Prefixes accepted when parsing config values, with their decimal and binary multipliers
 */
struct UnitParsePrefix
{
	const char* m_text;
	double m_decimal;
	double m_binary;
};

static const UnitParsePrefix g_parsePrefixes[] =
{
	{ "T", 1e12,  1024.0 * 1024 * 1024 * 1024 },
	{ "G", 1e9,   1024.0 * 1024 * 1024 },
	{ "M", 1e6,   1024.0 * 1024 },
	{ "k", 1e3,   1024.0 },
	{ "K", 1e3,   1024.0 },
	{ "m", 1e-3,  1e-3 },
	{ "u", 1e-6,  1e-6 },
	{ "μ", 1e-6,  1e-6 },
	{ "n", 1e-9,  1e-9 },
	{ "p", 1e-12, 1e-12 },
	{ "f", 1e-15, 1e-15 }
};

/**
	@brief Converts this unit to a string
 */
string Unit::ToString() const
{
	switch(m_type)
	{
		case UNIT_FS:
			return "fs";

		case UNIT_HZ:
			return "Hz";

		case UNIT_BITRATE:
			return "b/s";

		case UNIT_BYTES:
			return "B";

		case UNIT_COUNTS:
			return "unitless";

		default:
			return "unknown";
	}
}

/**
	@brief Picks the prefix for a value and builds the label printed after it

	@param value	Value in base units (femtoseconds for times)
	@param divisor	Set to the number the value has to be divided by before printing

	@return Prefix and unit symbol, e.g. "Gbps", "ns" or "kB". Empty for dimensionless values below 1000.
 */
string Unit::GetScaledLabel(double value, double& divisor) const
{
	const UnitPrefix* ladder = g_decimalPrefixes;
	size_t rungs = sizeof(g_decimalPrefixes) / sizeof(g_decimalPrefixes[0]);
	string symbol;

	switch(m_type)
	{
		case UNIT_FS:
			ladder = g_timePrefixes;
			rungs = sizeof(g_timePrefixes) / sizeof(g_timePrefixes[0]);
			symbol = "s";
			break;

		case UNIT_HZ:
			symbol = "Hz";
			break;

		case UNIT_BITRATE:
			symbol = "bps";
			break;

		case UNIT_BYTES:
			ladder = g_binaryPrefixes;
			rungs = sizeof(g_binaryPrefixes) / sizeof(g_binaryPrefixes[0]);
			symbol = "B";
			break;

		default:
			break;
	}

	//Fall through to the smallest rung for anything below it, including zero
	double mag = fabs(value);
	size_t i = 0;
	while( (i+1 < rungs) && (mag < ladder[i].m_scale) )
		i ++;

	divisor = ladder[i].m_scale;
	return string(ladder[i].m_prefix) + symbol;
}

/**
	@brief Prints a value with SI prefixes, using as few decimal places as the value needs (up to 4)
 */
string Unit::PrettyPrint(double value) const
{
	double divisor;
	string label = GetScaledLabel(value, divisor);
	double scaled = value / divisor;

	int decimals = 4;
	for(int d : {0, 1, 2})
	{
		double shifted = scaled * pow(10, d);
		if(fabs(round(shifted) - shifted) < 0.001)
		{
			decimals = d;
			break;
		}
	}

	char tmp[128];
	snprintf(tmp, sizeof(tmp), "%.*f%s%s", decimals, scaled, label.empty() ? "" : " ", label.c_str());
	return tmp;
}

/**
	@brief Parses a string with an optional SI prefix ("10 Gbps", "6.4 ns", "16 kB") into a value

	Throws PhyConfigurationError if the string does not begin with a number.
 */
double Unit::ParseString(const string& str) const
{
	double ret = 0;
	if(1 != sscanf(str.c_str(), "%20lf", &ret))
		throw PhyConfigurationError(string("Could not parse \"") + str + "\" as " + ToString());

	//The first character after the number and any spaces may be a prefix
	size_t i = 0;
	while(i < str.size())
	{
		unsigned char c = str[i];
		if(isspace(c) || isdigit(c) || (c == '.') || (c == '-') || (c == '+') )
			i ++;
		else
			break;
	}

	for(auto& p : g_parsePrefixes)
	{
		if(str.compare(i, strlen(p.m_text), p.m_text) == 0)
		{
			ret *= (m_type == UNIT_BYTES) ? p.m_binary : p.m_decimal;
			break;
		}
	}

	if(m_type == UNIT_FS)
		ret *= FS_PER_SECOND;

	return ret;
}

/**
	@brief Parses a string into an integer value, rounding to the nearest unit
 */
int64_t Unit::ParseStringInt64(const string& str) const
{
	return llround(ParseString(str));
}
