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
	@brief Declaration of Bijection
 */
#ifndef Bijection_h
#define Bijection_h

/**
	@brief A strict one-to-one mapping from objects of type T1 to type T2 (which must be different types).

	Used for the control character translation between the XGMII and BASE-R code spaces. Lookups of a
	missing key do not create entries, use HasEntry() first.
 */
template<class T1, class T2>
class Bijection
{
public:

	typedef std::map<T1, T2> forwardType;
	typedef std::map<T2, T1> reverseType;

	Bijection()
	{}

	Bijection(std::initializer_list< std::pair<T1, T2> > entries)
	{
		for(auto& e : entries)
			emplace(e.first, e.second);
	}

	typename forwardType::const_iterator begin() const
	{ return m_forwardMap.begin(); }

	typename forwardType::const_iterator end() const
	{ return m_forwardMap.end(); }

	/**
		@brief Adds a new entry to the bijection.

		Neither a nor b is allowed to be in the map when this function is called.
	 */
	void emplace(T1 a, T2 b)
	{
		m_forwardMap[a] = b;
		m_reverseMap[b] = a;
	}

	///@brief Looks up an object in the reverse direction
	const T1& operator[](T2 key) const
	{ return m_reverseMap.at(key); }

	///@brief Looks up an object in the forward direction
	const T2& operator[](T1 key) const
	{ return m_forwardMap.at(key); }

	bool HasEntry(T1 key) const
	{ return m_forwardMap.find(key) != m_forwardMap.end(); }

	bool HasEntry(T2 key) const
	{ return m_reverseMap.find(key) != m_reverseMap.end(); }

	size_t size() const
	{ return m_forwardMap.size(); }

protected:
	forwardType m_forwardMap;
	reverseType m_reverseMap;
};

#endif
