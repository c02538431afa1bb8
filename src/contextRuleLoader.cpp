/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loading of qualifier classes and context rules from JSON
/// \file "contextRuleLoader.cpp"
#include "contextRuleLoader.hpp"
#include "jsonDefinitions.hpp"
#include "internationalization.hpp"
#include "clinical/contextRuleStoreInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/base/stdint.h"
#include <limits>

using namespace clinical;
using json = nlohmann::json;

static std::string getString( const json& obj, const char* key, const char* context)
{
	json::const_iterator vi = obj.find( key);
	if (vi == obj.end() || !vi->is_string())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("string expected as '%s' of %s"), key, context);
	}
	return vi->get<std::string>();
}

static analyzer::QualifierClass parseQualifierClass( const json& def)
{
	if (!def.is_object())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("object expected as qualifier class definition"));
	}
	std::string name = getString( def, "name", "qualifier class");
	json::const_iterator values = def.find( "values");
	if (values == def.end() || !values->is_array())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("list expected as 'values' of qualifier class '%s'"), name.c_str());
	}
	std::vector<std::string> valuelist;
	json::const_iterator vi = values->begin(), ve = values->end();
	for (; vi != ve; ++vi)
	{
		if (!vi->is_string())
		{
			throw configuration_error( strus::ErrorCodeSyntax, _TXT("string expected as value of qualifier class '%s'"), name.c_str());
		}
		valuelist.push_back( vi->get<std::string>());
	}
	std::string defaultValue;
	json::const_iterator dflt = def.find( "default");
	if (dflt != def.end() && !dflt->is_null())
	{
		defaultValue = getString( def, "default", "qualifier class");
	}
	analyzer::QualifierClass rt( name, valuelist, defaultValue);

	json::const_iterator priorities = def.find( "priorities");
	if (priorities != def.end() && !priorities->is_null())
	{
		if (!priorities->is_object())
		{
			throw configuration_error( strus::ErrorCodeSyntax, _TXT("object expected as 'priorities' of qualifier class '%s'"), name.c_str());
		}
		json::const_iterator pi = priorities->begin(), pe = priorities->end();
		for (; pi != pe; ++pi)
		{
			if (!pi->is_number_integer())
			{
				throw configuration_error( strus::ErrorCodeSyntax, _TXT("integer expected as priority of '%s' in qualifier class '%s'"), pi.key().c_str(), name.c_str());
			}
			rt.definePriority( pi.key(), pi->get<int>());
		}
	}
	return rt;
}

static analyzer::ContextRule::Direction parseDirection( const std::string& name)
{
	static const analyzer::ContextRule::Direction ar[] = {
		analyzer::ContextRule::Preceding,
		analyzer::ContextRule::Following,
		analyzer::ContextRule::Bidirectional,
		analyzer::ContextRule::Pseudo,
		analyzer::ContextRule::Termination};
	for (std::size_t di=0; di < sizeof(ar)/sizeof(ar[0]); ++di)
	{
		if (name == analyzer::ContextRule::directionName( ar[ di])) return ar[ di];
	}
	throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown direction '%s' in context rule"), name.c_str());
}

static analyzer::ContextRule parseContextRule( const json& def)
{
	if (!def.is_object())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("object expected as context rule definition"));
	}
	std::string qualifier = getString( def, "qualifier", "context rule");
	std::string::size_type dotpos = qualifier.find( '.');
	if (dotpos == std::string::npos || dotpos == 0 || dotpos+1 == qualifier.size())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("qualifier '%s' of context rule not in the form <class>.<value>"), qualifier.c_str());
	}
	analyzer::ContextRule::Direction direction = parseDirection( getString( def, "direction", "context rule"));

	unsigned int maxScope = 0;
	json::const_iterator scope = def.find( "max_scope");
	if (scope != def.end() && !scope->is_null())
	{
		if (!scope->is_number_unsigned() || scope->get<uint64_t>() < 1
			|| scope->get<uint64_t>() > std::numeric_limits<unsigned int>::max())
		{
			throw configuration_error( strus::ErrorCodeValueOutOfRange, _TXT("max_scope of context rule for '%s' must be an integer between 1 and %u"), qualifier.c_str(), std::numeric_limits<unsigned int>::max());
		}
		maxScope = (unsigned int)scope->get<uint64_t>();
	}
	analyzer::ContextRule rt( qualifier.substr( 0, dotpos), qualifier.substr( dotpos+1), direction, maxScope);

	json::const_iterator patterns = def.find( "patterns");
	if (patterns == def.end() || !patterns->is_array())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("list expected as 'patterns' of context rule for '%s'"), qualifier.c_str());
	}
	if (patterns->empty())
	{
		throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("context rule for '%s' without patterns"), qualifier.c_str());
	}
	json::const_iterator pi = patterns->begin(), pe = patterns->end();
	for (; pi != pe; ++pi)
	{
		if (pi->is_string())
		{
			rt.addPattern( pi->get<std::string>());
		}
		else
		{
			rt.addPattern( parseTokenPattern( *pi));
		}
	}
	return rt;
}

void clinical::loadContextRuleDefinitions( ContextRuleStoreInterface* rulestore, const std::string& source, strus::ErrorBufferInterface* errorhnd)
{
	json doc = parseJsonDocument( source);
	if (!doc.is_object())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("object with 'qualifiers' and 'rules' expected as context rule definitions"));
	}
	json::const_iterator qualifiers = doc.find( "qualifiers");
	json::const_iterator rules = doc.find( "rules");
	if (qualifiers == doc.end() || !qualifiers->is_array())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("list expected as 'qualifiers' of context rule definitions"));
	}
	if (rules == doc.end() || !rules->is_array())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("list expected as 'rules' of context rule definitions"));
	}
	json::const_iterator qi = qualifiers->begin(), qe = qualifiers->end();
	for (; qi != qe; ++qi)
	{
		rulestore->defineQualifierClass( parseQualifierClass( *qi));
		if (errorhnd->hasError())
		{
			throw runtime_error( _TXT("failed to define qualifier class %u: %s"), (unsigned int)(qi - qualifiers->begin()) + 1, errorhnd->fetchError());
		}
	}
	json::const_iterator ri = rules->begin(), re = rules->end();
	for (; ri != re; ++ri)
	{
		unsigned int ridx = (ri - rules->begin()) + 1;
		try
		{
			rulestore->defineRule( parseContextRule( *ri));
		}
		catch (const config_error& err)
		{
			throw configuration_error( err.errorcode(), _TXT("in context rule %u: %s"), ridx, err.what());
		}
		if (errorhnd->hasError())
		{
			throw runtime_error( _TXT("failed to define context rule %u: %s"), ridx, errorhnd->fetchError());
		}
	}
}

