/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Trigger rule of the context algorithm
/// \file "contextRule.hpp"
#ifndef _CLINICAL_ANALYZER_CONTEXT_RULE_HPP_INCLUDED
#define _CLINICAL_ANALYZER_CONTEXT_RULE_HPP_INCLUDED
#include "clinical/analyzer/term.hpp"
#include <string>
#include <vector>

namespace clinical {
namespace analyzer {

/// \brief Trigger rule of the context algorithm: trigger patterns assigning a qualifier class value to entities in their scope
class ContextRule
{
public:
	/// \brief Direction of the scope of the trigger relative to the trigger match
	enum Direction
	{
		Preceding,	///< the trigger precedes the entities in its scope
		Following,	///< the trigger follows the entities in its scope
		Bidirectional,	///< the scope extends in both directions
		Pseudo,		///< suppresses overlapping triggers of the same qualifier value
		Termination	///< bounds the scope of other triggers of the same qualifier class
	};

	static const char* directionName( Direction dir)
	{
		static const char* ar[] = {"preceding","following","bidirectional","pseudo","termination"};
		return ar[ dir];
	}

	ContextRule()
		:m_className(),m_value(),m_direction(Preceding),m_maxScope(0),m_patterns(){}
	/// \brief Constructor
	/// \param[in] className_ name of the qualifier class
	/// \param[in] value_ qualifier value assigned (resp. value the pseudo or termination rule refers to)
	/// \param[in] direction_ direction of the scope
	/// \param[in] maxScope_ maximum number of tokens the scope extends over, 0 for the sentence boundaries only
	ContextRule( const std::string& className_, const std::string& value_, Direction direction_, unsigned int maxScope_=0)
		:m_className(className_),m_value(value_),m_direction(direction_),m_maxScope(maxScope_),m_patterns(){}
	ContextRule( const ContextRule& o)
		:m_className(o.m_className),m_value(o.m_value),m_direction(o.m_direction),m_maxScope(o.m_maxScope),m_patterns(o.m_patterns){}

	/// \brief Add a trigger phrase
	ContextRule& addPattern( const std::string& phrase)		{m_patterns.push_back( Term( phrase)); return *this;}
	/// \brief Add a structured trigger pattern
	ContextRule& addPattern( const TokenPattern& pattern)		{m_patterns.push_back( Term( pattern)); return *this;}

	const std::string& className() const			{return m_className;}
	const std::string& value() const			{return m_value;}
	Direction direction() const				{return m_direction;}
	unsigned int maxScope() const				{return m_maxScope;}
	const std::vector<Term>& patterns() const		{return m_patterns;}

	/// \brief Qualifier referenced as string "<class>.<value>"
	std::string qualifierName() const			{return m_className + "." + m_value;}

private:
	std::string m_className;
	std::string m_value;
	Direction m_direction;
	unsigned int m_maxScope;
	std::vector<Term> m_patterns;
};

}}//namespace
#endif

