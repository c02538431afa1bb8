/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structure describing a token of a document fed to the matchers
/// \file "token.hpp"
#ifndef _CLINICAL_ANALYZER_TOKEN_HPP_INCLUDED
#define _CLINICAL_ANALYZER_TOKEN_HPP_INCLUDED
#include <string>
#include <cstddef>

namespace clinical {
namespace analyzer {

/// \brief Token attribute selected for matching
enum TokenAttribute
{
	LiteralText,		///< text of the token as it appears in the source
	NormalizedText		///< normalized form of the token (lowercased, diacritics mapped)
};

/// \brief Get the name of a token attribute
static inline const char* tokenAttributeName( TokenAttribute attr)
{
	return attr == LiteralText ? "TEXT" : "NORM";
}

/// \brief Structure describing a token of a document fed to the matchers
class Token
{
public:
	/// \brief Default constructor
	Token()
		:m_literal(),m_normalized(),m_ordpos(0),m_origpos(0),m_origsize(0){}
	/// \brief Constructor
	/// \param[in] literal_ text of the token as it appears in the source
	/// \param[in] normalized_ normalized form of the token
	/// \param[in] ordpos_ ordinal position (sequence index) of the token in the document
	/// \param[in] origpos_ byte offset of the token in the source
	/// \param[in] origsize_ byte size of the token in the source
	Token( const std::string& literal_, const std::string& normalized_, std::size_t ordpos_, std::size_t origpos_, std::size_t origsize_)
		:m_literal(literal_),m_normalized(normalized_),m_ordpos(ordpos_),m_origpos(origpos_),m_origsize(origsize_){}
	/// \brief Copy constructor
	Token( const Token& o)
		:m_literal(o.m_literal),m_normalized(o.m_normalized),m_ordpos(o.m_ordpos),m_origpos(o.m_origpos),m_origsize(o.m_origsize){}

	/// \brief Text of the token as it appears in the source
	const std::string& literal() const		{return m_literal;}
	/// \brief Normalized form of the token
	const std::string& normalized() const		{return m_normalized;}
	/// \brief Value of the token attribute selected
	const std::string& attribute( TokenAttribute attr) const
	{
		return attr == LiteralText ? m_literal : m_normalized;
	}
	/// \brief Ordinal position of the token in the document
	std::size_t ordpos() const			{return m_ordpos;}
	/// \brief Start byte offset of the token in the source
	std::size_t origpos() const			{return m_origpos;}
	/// \brief Byte size of the token in the source
	std::size_t origsize() const			{return m_origsize;}
	/// \brief End byte offset of the token in the source
	std::size_t origend() const			{return m_origpos + m_origsize;}

private:
	std::string m_literal;
	std::string m_normalized;
	std::size_t m_ordpos;
	std::size_t m_origpos;
	std::size_t m_origsize;
};

}}//namespace
#endif

