/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Definition of a categorical qualifier dimension (e.g. Presence)
/// \file "qualifierClass.hpp"
#ifndef _CLINICAL_ANALYZER_QUALIFIER_CLASS_HPP_INCLUDED
#define _CLINICAL_ANALYZER_QUALIFIER_CLASS_HPP_INCLUDED
#include "clinical/analyzer/qualifier.hpp"
#include <string>
#include <vector>
#include <map>

namespace clinical {
namespace analyzer {

/// \brief Definition of a categorical qualifier dimension with mutually exclusive values
/// \note Validation (unique values, default and priorities consistent) is done by the rule store when the class is defined
class QualifierClass
{
public:
	QualifierClass()
		:m_name(),m_values(),m_defaultValue(),m_priorities(){}
	/// \brief Constructor
	/// \param[in] name_ name of the class
	/// \param[in] values_ enumeration of the values in declaration order
	/// \param[in] defaultValue_ default value or empty for the first value declared
	QualifierClass( const std::string& name_, const std::vector<std::string>& values_, const std::string& defaultValue_=std::string())
		:m_name(name_),m_values(values_),m_defaultValue(defaultValue_),m_priorities(){}
	QualifierClass( const QualifierClass& o)
		:m_name(o.m_name),m_values(o.m_values),m_defaultValue(o.m_defaultValue),m_priorities(o.m_priorities){}

	/// \brief Define the priority of a value explicitely (lower is higher priority, 0 = highest)
	void definePriority( const std::string& value, int priority)
	{
		m_priorities[ value] = priority;
	}

	const std::string& name() const				{return m_name;}
	const std::vector<std::string>& values() const		{return m_values;}
	const std::map<std::string,int>& priorities() const	{return m_priorities;}

	/// \brief Default value, the first value if not defined explicitely
	const std::string& defaultValue() const
	{
		static const std::string empty;
		if (!m_defaultValue.empty()) return m_defaultValue;
		return m_values.empty() ? empty : m_values[0];
	}

	bool hasValue( const std::string& value) const
	{
		std::vector<std::string>::const_iterator vi = m_values.begin(), ve = m_values.end();
		for (; vi != ve && *vi != value; ++vi){}
		return vi != ve;
	}

	/// \brief Priority of a value, explicitely defined or its index in the declaration, -1 if unknown
	int priority( const std::string& value) const
	{
		std::map<std::string,int>::const_iterator pi = m_priorities.find( value);
		if (pi != m_priorities.end()) return pi->second;
		std::vector<std::string>::const_iterator vi = m_values.begin(), ve = m_values.end();
		for (int vidx=0; vi != ve; ++vi,++vidx)
		{
			if (*vi == value) return vidx;
		}
		return -1;
	}

	/// \brief Create a qualifier for a value of this class
	/// \remark The value is not checked, use hasValue before
	Qualifier qualifier( const std::string& value) const
	{
		return Qualifier( m_name, value, value == defaultValue(), priority( value));
	}

	/// \brief Create the default qualifier of this class
	Qualifier defaultQualifier() const
	{
		return qualifier( defaultValue());
	}

private:
	std::string m_name;
	std::vector<std::string> m_values;
	std::string m_defaultValue;
	std::map<std::string,int> m_priorities;
};

}}//namespace
#endif

