/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Half open range of token positions in a document
/// \file "span.hpp"
#ifndef _CLINICAL_ANALYZER_SPAN_HPP_INCLUDED
#define _CLINICAL_ANALYZER_SPAN_HPP_INCLUDED
#include <cstddef>

namespace clinical {
namespace analyzer {

/// \brief Half open range [start,end) of token positions in a document
class Span
{
public:
	Span()
		:m_start(0),m_end(0){}
	Span( std::size_t start_, std::size_t end_)
		:m_start(start_),m_end(end_){}
	Span( const Span& o)
		:m_start(o.m_start),m_end(o.m_end){}

	/// \brief Ordinal position of the first token
	std::size_t start() const		{return m_start;}
	/// \brief Ordinal position of the token after the last token
	std::size_t end() const			{return m_end;}
	/// \brief Number of tokens covered
	std::size_t size() const		{return m_end > m_start ? (m_end - m_start) : 0;}
	bool empty() const			{return m_end <= m_start;}

	/// \brief Test if this span shares at least one token with another span
	bool overlaps( const Span& o) const
	{
		return m_start < o.m_end && o.m_start < m_end;
	}
	/// \brief Test if another span lies completely inside this span
	bool contains( const Span& o) const
	{
		return m_start <= o.m_start && o.m_end <= m_end;
	}
	/// \brief Number of tokens between this span and another, 0 if they touch or overlap
	std::size_t distance( const Span& o) const
	{
		if (o.m_start >= m_end) return o.m_start - m_end;
		if (m_start >= o.m_end) return m_start - o.m_end;
		return 0;
	}

	bool operator==( const Span& o) const	{return m_start == o.m_start && m_end == o.m_end;}
	bool operator!=( const Span& o) const	{return m_start != o.m_start || m_end != o.m_end;}
	bool operator<( const Span& o) const
	{
		return m_start == o.m_start ? m_end < o.m_end : m_start < o.m_start;
	}

private:
	std::size_t m_start;
	std::size_t m_end;
};

}}//namespace
#endif

