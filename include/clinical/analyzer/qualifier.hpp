/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Assignment of a qualifier class value to an entity
/// \file "qualifier.hpp"
#ifndef _CLINICAL_ANALYZER_QUALIFIER_HPP_INCLUDED
#define _CLINICAL_ANALYZER_QUALIFIER_HPP_INCLUDED
#include <string>

namespace clinical {
namespace analyzer {

/// \brief Assignment of a qualifier class value to an entity
class Qualifier
{
public:
	Qualifier()
		:m_className(),m_value(),m_isDefault(false),m_priority(0),m_prob(0.0),m_hasProb(false){}
	/// \brief Constructor
	/// \param[in] className_ name of the qualifier class (e.g. "Presence")
	/// \param[in] value_ value assigned (e.g. "Absent")
	/// \param[in] isDefault_ true if the value is the default value of the class
	/// \param[in] priority_ priority of the value in its class (0 = highest)
	Qualifier( const std::string& className_, const std::string& value_, bool isDefault_, int priority_)
		:m_className(className_),m_value(value_),m_isDefault(isDefault_),m_priority(priority_),m_prob(0.0),m_hasProb(false){}
	Qualifier( const Qualifier& o)
		:m_className(o.m_className),m_value(o.m_value),m_isDefault(o.m_isDefault),m_priority(o.m_priority),m_prob(o.m_prob),m_hasProb(o.m_hasProb){}

	const std::string& className() const		{return m_className;}
	const std::string& value() const		{return m_value;}
	bool isDefault() const				{return m_isDefault;}
	int priority() const				{return m_priority;}

	/// \brief Probability attached by non rule based detectors
	double prob() const				{return m_prob;}
	/// \brief True, if a probability is attached
	bool hasProb() const				{return m_hasProb;}
	void setProb( double prob_)			{m_prob = prob_; m_hasProb = true;}

	/// \brief String representation "<class>.<value>"
	std::string tostring() const			{return m_className + "." + m_value;}

	/// \brief Equality is defined by class and value only
	bool operator==( const Qualifier& o) const	{return m_className == o.m_className && m_value == o.m_value;}
	bool operator!=( const Qualifier& o) const	{return !operator==( o);}

private:
	std::string m_className;
	std::string m_value;
	bool m_isDefault;
	int m_priority;
	double m_prob;
	bool m_hasProb;
};

}}//namespace
#endif

