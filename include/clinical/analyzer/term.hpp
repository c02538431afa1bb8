/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Matching specification of a concept: a phrase or a structured pattern with per term overrides
/// \file "term.hpp"
#ifndef _CLINICAL_ANALYZER_TERM_HPP_INCLUDED
#define _CLINICAL_ANALYZER_TERM_HPP_INCLUDED
#include "clinical/analyzer/token.hpp"
#include "clinical/analyzer/tokenPattern.hpp"
#include <string>

namespace clinical {
namespace analyzer {

/// \brief Matching specification: a phrase string or a structured pattern, with overrides of the matcher defaults
/// \remark Overrides not set explicitely take the value defined for the matcher
/// \remark Structured patterns are matched literally, the attribute, proximity and fuzzy overrides do not apply to them
class Term
{
public:
	/// \brief Flags marking the overrides set
	enum OverrideFlag
	{
		AttributeDefined=0x1,
		ProximityDefined=0x2,
		FuzzyDefined=0x4,
		FuzzyMinLengthDefined=0x8,
		PseudoDefined=0x10
	};

	Term()
		:m_phrase(),m_pattern(),m_structured(false),m_attribute(LiteralText),m_proximity(0),m_fuzzy(0),m_fuzzyMinLength(0),m_pseudo(false),m_defined(0){}
	/// \brief Constructor of a phrase term
	explicit Term( const std::string& phrase_)
		:m_phrase(phrase_),m_pattern(),m_structured(false),m_attribute(LiteralText),m_proximity(0),m_fuzzy(0),m_fuzzyMinLength(0),m_pseudo(false),m_defined(0){}
	/// \brief Constructor of a structured pattern term
	explicit Term( const TokenPattern& pattern_)
		:m_phrase(),m_pattern(pattern_),m_structured(true),m_attribute(LiteralText),m_proximity(0),m_fuzzy(0),m_fuzzyMinLength(0),m_pseudo(false),m_defined(0){}
	Term( const Term& o)
		:m_phrase(o.m_phrase),m_pattern(o.m_pattern),m_structured(o.m_structured),m_attribute(o.m_attribute),m_proximity(o.m_proximity),m_fuzzy(o.m_fuzzy),m_fuzzyMinLength(o.m_fuzzyMinLength),m_pseudo(o.m_pseudo),m_defined(o.m_defined){}

	Term& setAttribute( TokenAttribute attribute_)		{m_attribute = attribute_; m_defined |= AttributeDefined; return *this;}
	Term& setProximity( unsigned int proximity_)		{m_proximity = proximity_; m_defined |= ProximityDefined; return *this;}
	Term& setFuzzy( unsigned int fuzzy_)			{m_fuzzy = fuzzy_; m_defined |= FuzzyDefined; return *this;}
	Term& setFuzzyMinLength( unsigned int fuzzyMinLength_)	{m_fuzzyMinLength = fuzzyMinLength_; m_defined |= FuzzyMinLengthDefined; return *this;}
	Term& setPseudo( bool pseudo_)				{m_pseudo = pseudo_; m_defined |= PseudoDefined; return *this;}

	bool isStructured() const				{return m_structured;}
	const std::string& phrase() const			{return m_phrase;}
	const TokenPattern& pattern() const			{return m_pattern;}

	bool isDefined( OverrideFlag flag) const		{return (m_defined & flag) != 0;}

	/// \brief Token attribute to match on, or the default passed if not overridden
	TokenAttribute attribute( TokenAttribute default_) const	{return isDefined( AttributeDefined) ? m_attribute : default_;}
	/// \brief Maximum number of arbitrary tokens skipped between words, or the default passed if not overridden
	unsigned int proximity( unsigned int default_) const		{return isDefined( ProximityDefined) ? m_proximity : default_;}
	/// \brief Maximum edit distance per word, or the default passed if not overridden
	unsigned int fuzzy( unsigned int default_) const		{return isDefined( FuzzyDefined) ? m_fuzzy : default_;}
	/// \brief Minimum length in characters of a word for fuzzy matching, or the default passed if not overridden
	unsigned int fuzzyMinLength( unsigned int default_) const	{return isDefined( FuzzyMinLengthDefined) ? m_fuzzyMinLength : default_;}
	/// \brief True, if matches of this term exclude matches of the concept, or the default passed if not overridden
	bool pseudo( bool default_) const				{return isDefined( PseudoDefined) ? m_pseudo : default_;}

private:
	std::string m_phrase;
	TokenPattern m_pattern;
	bool m_structured;
	TokenAttribute m_attribute;
	unsigned int m_proximity;
	unsigned int m_fuzzy;
	unsigned int m_fuzzyMinLength;
	bool m_pseudo;
	int m_defined;
};

}}//namespace
#endif

