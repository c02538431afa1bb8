/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the store of qualifier classes and context rules
/// \file "contextRuleStore.cpp"
#include "contextRuleStore.hpp"
#include "termPatterns.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "clinical/tokenPatternMatchInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include <set>

using namespace clinical;

void ContextRuleStore::checkNotCompiled() const
{
	if (m_compiled)
	{
		throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("context rule store modified after compile"));
	}
}

void ContextRuleStore::defineAttribute( analyzer::TokenAttribute attribute)
{
	try
	{
		checkNotCompiled();
		m_attribute = attribute;
	}
	CATCH_ERROR_MAP( _TXT("failed to define attribute of context rules: %s"), *m_errorhnd);
}

void ContextRuleStore::defineQualifierClass( const analyzer::QualifierClass& qualifierClass)
{
	try
	{
		checkNotCompiled();
		const std::string& name = qualifierClass.name();
		if (name.empty())
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("empty qualifier class name"));
		}
		if (m_classmap.find( name) != m_classmap.end())
		{
			throw configuration_error( strus::ErrorCodeDuplicateDefinition, _TXT("duplicate definition of qualifier class '%s'"), name.c_str());
		}
		if (qualifierClass.values().empty())
		{
			throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("qualifier class '%s' without values"), name.c_str());
		}
		std::set<std::string> valueset;
		std::vector<std::string>::const_iterator vi = qualifierClass.values().begin(), ve = qualifierClass.values().end();
		for (; vi != ve; ++vi)
		{
			if (vi->empty())
			{
				throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("empty value in qualifier class '%s'"), name.c_str());
			}
			if (!valueset.insert( *vi).second)
			{
				throw configuration_error( strus::ErrorCodeDuplicateDefinition, _TXT("duplicate value '%s' in qualifier class '%s'"), vi->c_str(), name.c_str());
			}
		}
		if (!qualifierClass.hasValue( qualifierClass.defaultValue()))
		{
			throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("default value '%s' is not a value of qualifier class '%s'"), qualifierClass.defaultValue().c_str(), name.c_str());
		}
		const std::map<std::string,int>& priorities = qualifierClass.priorities();
		if (!priorities.empty())
		{
			std::map<std::string,int>::const_iterator pi = priorities.begin(), pe = priorities.end();
			for (; pi != pe; ++pi)
			{
				if (!qualifierClass.hasValue( pi->first))
				{
					throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("priority defined for unknown value '%s' of qualifier class '%s'"), pi->first.c_str(), name.c_str());
				}
			}
			for (vi = qualifierClass.values().begin(); vi != ve; ++vi)
			{
				if (priorities.find( *vi) == priorities.end())
				{
					throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("no priority defined for value '%s' of qualifier class '%s'"), vi->c_str(), name.c_str());
				}
			}
		}
		m_classmap[ name] = m_classes.size();
		m_classes.push_back( qualifierClass);
	}
	CATCH_ERROR_MAP( _TXT("failed to define qualifier class: %s"), *m_errorhnd);
}

void ContextRuleStore::defineRule( const analyzer::ContextRule& rule)
{
	try
	{
		checkNotCompiled();
		if (rule.patterns().empty())
		{
			throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("context rule for '%s' without patterns"), rule.qualifierName().c_str());
		}
		m_rules.push_back( rule);
	}
	CATCH_ERROR_MAP( _TXT("failed to define context rule: %s"), *m_errorhnd);
}

bool ContextRuleStore::compile()
{
	try
	{
		checkNotCompiled();
		if (m_errorhnd->hasError())
		{
			throw runtime_error( _TXT("error in context rule definitions"));
		}
		std::vector<analyzer::ContextRule>::const_iterator ri = m_rules.begin(), re = m_rules.end();
		for (unsigned int ridx=1; ri != re; ++ri,++ridx)
		{
			std::map<std::string,std::size_t>::const_iterator ci = m_classmap.find( ri->className());
			if (ci == m_classmap.end())
			{
				throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("context rule %u references undefined qualifier class '%s'"), ridx, ri->className().c_str());
			}
			if (!m_classes[ ci->second].hasValue( ri->value()))
			{
				throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("context rule %u references undefined qualifier '%s'"), ridx, ri->qualifierName().c_str());
			}
		}
		m_patterns.reset( m_tpm->createInstance());
		if (!m_patterns.get())
		{
			throw runtime_error( _TXT("failed to create token pattern match instance"));
		}
		TermDefaults defaults;
		defaults.attribute = m_attribute;
		for (ri = m_rules.begin(); ri != re; ++ri)
		{
			unsigned int ridx = (ri - m_rules.begin()) + 1;
			std::vector<analyzer::Term>::const_iterator pi = ri->patterns().begin(), pe = ri->patterns().end();
			for (; pi != pe; ++pi)
			{
				defineTermPattern( m_patterns.get(), m_tokenizer, ridx, *pi, defaults, m_errorhnd);
			}
		}
		if (!m_patterns->compile())
		{
			throw runtime_error( _TXT("failed to compile trigger patterns"));
		}
		m_compiled = true;
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to compile context rules: %s"), *m_errorhnd, false);
}

