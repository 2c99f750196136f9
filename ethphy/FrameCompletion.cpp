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

#include "ethphy.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

FrameCompletion::FrameCompletion()
	: m_armed(false)
	, m_complete(false)
{
}

FrameCompletion::~FrameCompletion()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Notification

/**
	@brief Claims the completion for one transmission

	Throws PhyProtocolError if it already belongs to a queued frame or has fired.
 */
void FrameCompletion::Arm()
{
	if(m_complete)
		throw PhyProtocolError("Frame completion has already fired, attach a new one to send the frame again");
	if(m_armed)
		throw PhyProtocolError("Frame completion is already attached to a queued frame");
	m_armed = true;
}

/**
	@brief Marks the frame as finished and notifies observers

	@return False if the completion had already fired, in which case nothing happens
 */
bool FrameCompletion::Fire(const EthernetFrame& frame)
{
	if(m_complete)
		return false;

	m_complete = true;
	m_frame = make_unique<EthernetFrame>(frame);
	m_frame->m_completion = nullptr;

	m_completeSignal.emit(*m_frame);
	return true;
}

/**
	@brief Gets the snapshot of the frame taken when the completion fired

	Throws PhyProtocolError if the frame has not completed yet.
 */
const EthernetFrame& FrameCompletion::GetFrame() const
{
	if(!m_complete)
		throw PhyProtocolError("Frame has not completed yet");
	return *m_frame;
}
