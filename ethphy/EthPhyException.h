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
	@brief Exception types thrown by the PHY models
 */

#ifndef EthPhyException_h
#define EthPhyException_h

/**
	@brief Base class for all fatal errors raised by the PHY models
 */
class EthPhyException : public std::runtime_error
{
public:
	EthPhyException(const std::string& what)
	: std::runtime_error(what)
	{}
};

/**
	@brief A bus, speed or configuration file that the model cannot work with
 */
class PhyConfigurationError : public EthPhyException
{
public:
	PhyConfigurationError(const std::string& what)
	: EthPhyException(what)
	{}
};

/**
	@brief A frame or call sequence that violates the interface protocol
 */
class PhyProtocolError : public EthPhyException
{
public:
	PhyProtocolError(const std::string& what)
	: EthPhyException(what)
	{}
};

/**
	@brief Non-blocking send into a queue that is over its occupancy limit
 */
class QueueFullError : public std::runtime_error
{
public:
	QueueFullError(const std::string& what)
	: std::runtime_error(what)
	{}
};

/**
	@brief Non-blocking receive from an empty queue
 */
class QueueEmptyError : public std::runtime_error
{
public:
	QueueEmptyError(const std::string& what)
	: std::runtime_error(what)
	{}
};

#endif
