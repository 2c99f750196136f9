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
	@brief Code tables shared by the MII family and the XGMII / 10GBASE-R codecs
 */

#ifndef EthernetConstants_h
#define EthernetConstants_h

#define ETH_PREAMBLE_BYTE		0x55
#define ETH_SFD_BYTE			0xd5
#define ETH_PREAMBLE_LENGTH		7
#define ETH_FCS_LENGTH			4
#define ETH_MIN_FRAME_LENGTH	60

/**
	@brief XGMII control characters (IEEE 802.3 clause 46)
 */
enum class XgmiiCtrl : uint8_t
{
	IDLE	= 0x07,
	LPI		= 0x06,
	START	= 0xfb,
	TERM	= 0xfd,
	ERROR	= 0xfe,
	SEQ_OS	= 0x9c,
	RES_0	= 0x1c,
	RES_1	= 0x3c,
	RES_2	= 0x7c,
	RES_3	= 0xbc,
	RES_4	= 0xdc,
	RES_5	= 0xf7,
	SIG_OS	= 0x5c
};

/**
	@brief 7-bit control codes carried in 10GBASE-R control blocks (IEEE 802.3 clause 49)
 */
enum class BaseRCtrl : uint8_t
{
	IDLE	= 0x00,
	LPI		= 0x06,
	ERROR	= 0x1e,
	RES_0	= 0x2d,
	RES_1	= 0x33,
	RES_2	= 0x4b,
	RES_3	= 0x55,
	RES_4	= 0x66,
	RES_5	= 0x78
};

///@brief 4-bit O codes identifying the kind of ordered set in a BASE-R block
enum class BaseRO : uint8_t
{
	SEQ_OS	= 0x0,
	SIG_OS	= 0xf
};

///@brief 2-bit sync header
enum class BaseRSync : uint8_t
{
	DATA	= 0x2,
	CTRL	= 0x1
};

///@brief Block type field of a BASE-R control block
enum class BaseRBlockType : uint8_t
{
	CTRL		= 0x1e,		//C0 C1 C2 C3 C4 C5 C6 C7
	OS_4		= 0x2d,		//C0 C1 C2 C3 O4 D5 D6 D7
	START_4		= 0x33,		//C0 C1 C2 C3 S4 D5 D6 D7
	OS_START	= 0x66,		//O0 D1 D2 D3 S4 D5 D6 D7
	OS_04		= 0x55,		//O0 D1 D2 D3 O4 D5 D6 D7
	START_0		= 0x78,		//S0 D1 D2 D3 D4 D5 D6 D7
	OS_0		= 0x4b,		//O0 D1 D2 D3 C4 C5 C6 C7
	TERM_0		= 0x87,		//T0 C1 C2 C3 C4 C5 C6 C7
	TERM_1		= 0x99,		//D0 T1 C2 C3 C4 C5 C6 C7
	TERM_2		= 0xaa,		//D0 D1 T2 C3 C4 C5 C6 C7
	TERM_3		= 0xb4,		//D0 D1 D2 T3 C4 C5 C6 C7
	TERM_4		= 0xcc,		//D0 D1 D2 D3 T4 C5 C6 C7
	TERM_5		= 0xd2,		//D0 D1 D2 D3 D4 T5 C6 C7
	TERM_6		= 0xe1,		//D0 D1 D2 D3 D4 D5 T6 C7
	TERM_7		= 0xff		//D0 D1 D2 D3 D4 D5 D6 T7
};

#endif
