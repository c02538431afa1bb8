/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structured token pattern as ordered list of per token attribute constraints
/// \file "tokenPattern.hpp"
#ifndef _CLINICAL_ANALYZER_TOKEN_PATTERN_HPP_INCLUDED
#define _CLINICAL_ANALYZER_TOKEN_PATTERN_HPP_INCLUDED
#include "clinical/analyzer/token.hpp"
#include <string>
#include <vector>

namespace clinical {
namespace analyzer {

/// \brief Constraint on the attribute of one token (resp. a repetition of tokens) in a structured pattern
class TokenConstraint
{
public:
	/// \brief Type of the constraint
	enum Type
	{
		MatchAny,	///< any token matches
		MatchEqual,	///< attribute equals the single value
		MatchIn,	///< attribute equals one of the values
		MatchNotIn,	///< attribute equals none of the values
		MatchRegex,	///< regular expression (single value) matches somewhere in the attribute
		MatchFuzzy	///< attribute within a bounded edit distance to the single value
	};
	/// \brief Number of tokens matched by the constraint
	enum Quantifier
	{
		One,		///< exactly one matching token
		Optional,	///< zero or one matching token ('?')
		ZeroOrMore,	///< zero or more matching tokens ('*')
		OneOrMore,	///< one or more matching tokens ('+')
		Negation	///< exactly one token that does not match ('!')
	};

	/// \brief Default constructor, a constraint matching any token
	TokenConstraint()
		:m_type(MatchAny),m_attribute(LiteralText),m_values(),m_maxEditDistance(0),m_quantifier(One){}
	/// \brief Constructor
	TokenConstraint( Type type_, TokenAttribute attribute_, const std::vector<std::string>& values_, Quantifier quantifier_=One, unsigned int maxEditDistance_=0)
		:m_type(type_),m_attribute(attribute_),m_values(values_),m_maxEditDistance(maxEditDistance_),m_quantifier(quantifier_){}
	/// \brief Constructor for constraints with a single value
	TokenConstraint( Type type_, TokenAttribute attribute_, const std::string& value_, Quantifier quantifier_=One, unsigned int maxEditDistance_=0)
		:m_type(type_),m_attribute(attribute_),m_values(1,value_),m_maxEditDistance(maxEditDistance_),m_quantifier(quantifier_){}
	TokenConstraint( const TokenConstraint& o)
		:m_type(o.m_type),m_attribute(o.m_attribute),m_values(o.m_values),m_maxEditDistance(o.m_maxEditDistance),m_quantifier(o.m_quantifier){}

	/// \brief Constraint matching any token with a quantifier
	static TokenConstraint any( Quantifier quantifier_)
	{
		return TokenConstraint( MatchAny, LiteralText, std::vector<std::string>(), quantifier_);
	}

	Type type() const					{return m_type;}
	TokenAttribute attribute() const			{return m_attribute;}
	const std::vector<std::string>& values() const		{return m_values;}
	/// \brief Maximum edit distance for MatchFuzzy, 0 for a default depending on the value length
	unsigned int maxEditDistance() const			{return m_maxEditDistance;}
	Quantifier quantifier() const				{return m_quantifier;}

	void setQuantifier( Quantifier quantifier_)		{m_quantifier = quantifier_;}

private:
	Type m_type;
	TokenAttribute m_attribute;
	std::vector<std::string> m_values;
	unsigned int m_maxEditDistance;
	Quantifier m_quantifier;
};

/// \brief Structured token pattern as ordered list of per token attribute constraints
typedef std::vector<TokenConstraint> TokenPattern;

}}//namespace
#endif

