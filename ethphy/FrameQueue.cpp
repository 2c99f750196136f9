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
	@brief Implementation of FrameQueue
 */

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

FrameQueue::FrameQueue()
	: m_occupancyBytes(0)
	, m_occupancyFrames(0)
	, m_limitBytes(0)
	, m_limitFrames(0)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Queue operations

void FrameQueue::Push(const EthernetFrame& frame)
{
	m_frames.push_back(frame);
	m_occupancyBytes += frame.size();
	m_occupancyFrames ++;

	m_enqueuedSignal.emit();
}

/**
	@brief Removes the oldest frame

	Throws QueueEmptyError if there is nothing to remove.
 */
EthernetFrame FrameQueue::Pop()
{
	if(m_frames.empty())
		throw QueueEmptyError("Frame queue is empty");

	EthernetFrame frame = std::move(m_frames.front());
	m_frames.pop_front();
	m_occupancyBytes -= frame.size();
	m_occupancyFrames --;

	m_dequeuedSignal.emit();
	return frame;
}

/**
	@brief Drops every queued frame without notifying anyone

	Callers that own completion notifications fire them before calling this.
 */
void FrameQueue::Clear()
{
	m_frames.clear();
	m_occupancyBytes = 0;
	m_occupancyFrames = 0;

	m_dequeuedSignal.emit();
}

bool FrameQueue::IsFull() const
{
	if( (m_limitBytes != 0) && (m_occupancyBytes > m_limitBytes) )
		return true;
	if( (m_limitFrames != 0) && (m_occupancyFrames > m_limitFrames) )
		return true;
	return false;
}
