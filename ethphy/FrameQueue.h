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
	@brief Declaration of FrameQueue
 */

#ifndef FrameQueue_h
#define FrameQueue_h

/**
	@brief FIFO of frames with occupancy accounting and optional limits

	A limit of zero means unlimited. The queue reports full once occupancy is strictly over a nonzero limit,
	so a single frame larger than the byte limit can always be queued into an empty queue.
 */
class FrameQueue
{
public:
	FrameQueue();

	void Push(const EthernetFrame& frame);
	EthernetFrame Pop();
	void Clear();

	bool IsEmpty() const
	{ return m_frames.empty(); }

	bool IsFull() const;

	size_t GetCount() const
	{ return m_frames.size(); }

	size_t GetOccupancyBytes() const
	{ return m_occupancyBytes; }

	size_t GetOccupancyFrames() const
	{ return m_occupancyFrames; }

	void SetLimits(size_t maxBytes, size_t maxFrames)
	{
		m_limitBytes = maxBytes;
		m_limitFrames = maxFrames;
	}

	size_t GetLimitBytes() const
	{ return m_limitBytes; }

	size_t GetLimitFrames() const
	{ return m_limitFrames; }

	std::deque<EthernetFrame>& GetFrames()
	{ return m_frames; }

	sigc::signal<void()> signal_enqueued()
	{ return m_enqueuedSignal; }

	sigc::signal<void()> signal_dequeued()
	{ return m_dequeuedSignal; }

protected:
	std::deque<EthernetFrame> m_frames;

	size_t m_occupancyBytes;
	size_t m_occupancyFrames;

	size_t m_limitBytes;
	size_t m_limitFrames;

	sigc::signal<void()> m_enqueuedSignal;
	sigc::signal<void()> m_dequeuedSignal;
};

#endif
