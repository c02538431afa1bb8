/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Regular expressions on token values matched with one hyperscan database
/// \file "tokenRegexMatch.cpp"
#include "tokenRegexMatch.hpp"
#include "hyperscanErrorCode.hpp"
#include "internationalization.hpp"
#include <algorithm>
#include <cstring>
#include <new>

using namespace clinical;

TokenRegexTable::~TokenRegexTable()
{
	if (m_database) hs_free_database( m_database);
}

unsigned int TokenRegexTable::define( const std::string& expression)
{
	std::map<std::string,unsigned int>::const_iterator ei = m_idmap.find( expression);
	if (ei != m_idmap.end()) return ei->second;
	unsigned int rt = m_expressions.size();
	m_expressions.push_back( expression);
	m_idmap[ expression] = rt;
	return rt;
}

void TokenRegexTable::compile()
{
	if (m_database)
	{
		hs_free_database( m_database);
		m_database = 0;
	}
	if (m_expressions.empty()) return;

	std::vector<const char*> patternar;
	std::vector<unsigned int> flagar;
	std::vector<unsigned int> idar;
	std::vector<std::string>::const_iterator ei = m_expressions.begin(), ee = m_expressions.end();
	for (unsigned int eidx=0; ei != ee; ++ei,++eidx)
	{
		patternar.push_back( ei->c_str());
		flagar.push_back( HS_FLAG_UTF8 | HS_FLAG_SINGLEMATCH | HS_FLAG_ALLOWEMPTY);
		idar.push_back( eidx);
	}
	hs_platform_info_t platform;
	std::memset( &platform, 0, sizeof(platform));
	platform.cpu_features = HS_TUNE_FAMILY_GENERIC;
	hs_compile_error_t* compile_err = 0;

	hs_error_t err =
		hs_compile_multi(
			&patternar[0], &flagar[0], &idar[0], patternar.size(), HS_MODE_BLOCK, &platform,
			&m_database, &compile_err);
	if (err != HS_SUCCESS)
	{
		std::string message;
		std::string expression;
		if (compile_err)
		{
			message = compile_err->message;
			if (compile_err->expression >= 0 && (std::size_t)compile_err->expression < m_expressions.size())
			{
				expression = m_expressions[ compile_err->expression];
			}
			hs_free_compile_error( compile_err);
		}
		m_database = 0;
		if (expression.empty())
		{
			throw configuration_error( hyperscanErrorCode( err), _TXT("failed to build regular expression database (hyperscan error %s): %s"), hyperscanErrorName( err), message.c_str());
		}
		else
		{
			throw configuration_error( hyperscanErrorCode( err), _TXT("failed to compile regular expression \"%s\": %s"), expression.c_str(), message.c_str());
		}
	}
}

TokenRegexScanner::TokenRegexScanner( const TokenRegexTable* table_)
	:m_table(table_),m_scratch(0),m_result(0)
{
	if (m_table->database())
	{
		hs_error_t err = hs_alloc_scratch( m_table->database(), &m_scratch);
		if (err != HS_SUCCESS)
		{
			throw std::bad_alloc();
		}
	}
}

TokenRegexScanner::~TokenRegexScanner()
{
	if (m_scratch) hs_free_scratch( m_scratch);
}

int TokenRegexScanner::matchEventHandler( unsigned int id, unsigned long long, unsigned long long, unsigned int, void* context)
{
	TokenRegexScanner* THIS = static_cast<TokenRegexScanner*>( context);
	try
	{
		THIS->m_result->push_back( id);
		return 0;
	}
	catch (const std::bad_alloc&)
	{
		return -1;
	}
}

void TokenRegexScanner::match( std::vector<unsigned int>& result, const std::string& value)
{
	result.clear();
	if (!m_scratch) return;
	m_result = &result;
	hs_error_t err = hs_scan( m_table->database(), value.c_str(), value.size(), 0/*reserved*/, m_scratch, matchEventHandler, this);
	m_result = 0;
	if (err != HS_SUCCESS)
	{
		throw configuration_error( hyperscanErrorCode( err), _TXT("error matching regular expressions (hyperscan error %s) on '%s'"), hyperscanErrorName( err), value.c_str());
	}
	std::sort( result.begin(), result.end());
}

