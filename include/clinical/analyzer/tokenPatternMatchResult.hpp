/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structure describing a result of the token pattern matcher
/// \file "tokenPatternMatchResult.hpp"
#ifndef _CLINICAL_ANALYZER_TOKEN_PATTERN_MATCH_RESULT_HPP_INCLUDED
#define _CLINICAL_ANALYZER_TOKEN_PATTERN_MATCH_RESULT_HPP_INCLUDED
#include "clinical/analyzer/span.hpp"
#include <cstddef>

namespace clinical {
namespace analyzer {

/// \brief Structure describing a result of the token pattern matcher
class TokenPatternMatchResult
{
public:
	/// \brief Constructor
	TokenPatternMatchResult( unsigned int id_, std::size_t ordpos_, std::size_t ordend_, std::size_t origpos_, std::size_t origend_)
		:m_id(id_),m_ordpos(ordpos_),m_ordend(ordend_),m_origpos(origpos_),m_origend(origend_){}
	/// \brief Copy constructor
	TokenPatternMatchResult( const TokenPatternMatchResult& o)
		:m_id(o.m_id),m_ordpos(o.m_ordpos),m_ordend(o.m_ordend),m_origpos(o.m_origpos),m_origend(o.m_origend){}

	/// \brief Identifier of the pattern matched as passed to the definition
	unsigned int id() const				{return m_id;}
	/// \brief Ordinal position of the first token of the match
	std::size_t ordpos() const			{return m_ordpos;}
	/// \brief Ordinal position after the last token of the match
	std::size_t ordend() const			{return m_ordend;}
	/// \brief Start byte offset of the match in the source
	std::size_t origpos() const			{return m_origpos;}
	/// \brief End byte offset of the match in the source
	std::size_t origend() const			{return m_origend;}
	/// \brief Token range of the match
	Span span() const				{return Span( m_ordpos, m_ordend);}

private:
	unsigned int m_id;
	std::size_t m_ordpos;
	std::size_t m_ordend;
	std::size_t m_origpos;
	std::size_t m_origend;
};

}}//namespace
#endif

