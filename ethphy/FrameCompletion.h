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
	@brief Declaration of FrameCompletion
 */

#ifndef FrameCompletion_h
#define FrameCompletion_h

class EthernetFrame;

/**
	@brief One-shot notification that a transmitted frame has left the transmitter

	Shared between the caller that submitted the frame and the copy sitting in the transmit queue. Fires
	exactly once: when the last unit is driven, when a reset flushes the frame mid-transmission, or when the
	queue is cleared. The frame snapshot carries the timestamps the engine recorded (the end time is unset if
	the frame never finished).

	A completion covers a single transmission. The transmitter arms it when the frame is queued and refuses a
	frame whose completion is already armed or has fired, so sending the same frame again needs a fresh
	FrameCompletion attached to it.
 */
class FrameCompletion
{
public:
	FrameCompletion();
	~FrameCompletion();

	void Arm();
	bool Fire(const EthernetFrame& frame);

	///@brief True once the completion has been handed to a transmitter, whether or not it has fired yet
	bool IsInUse() const
	{ return m_armed || m_complete; }

	bool IsComplete() const
	{ return m_complete; }

	const EthernetFrame& GetFrame() const;

	sigc::signal<void(const EthernetFrame&)> signal_complete()
	{ return m_completeSignal; }

protected:
	bool m_armed;
	bool m_complete;
	std::unique_ptr<EthernetFrame> m_frame;

	sigc::signal<void(const EthernetFrame&)> m_completeSignal;
};

#endif
