/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Regular expressions on token values matched with one hyperscan database
/// \file "tokenRegexMatch.hpp"
#ifndef _CLINICAL_TOKEN_REGEX_MATCH_HPP_INCLUDED
#define _CLINICAL_TOKEN_REGEX_MATCH_HPP_INCLUDED
#include "hs.h"
#include <string>
#include <vector>
#include <map>

namespace clinical {

/// \brief Table of all regular expressions used in token constraints, compiled into one hyperscan database
class TokenRegexTable
{
public:
	TokenRegexTable()
		:m_expressions(),m_idmap(),m_database(0){}
	~TokenRegexTable();

	/// \brief Define an expression
	/// \return the index of the expression, identical expressions share the index
	unsigned int define( const std::string& expression);

	/// \brief Build the database, throws on syntax errors
	void compile();

	std::size_t size() const				{return m_expressions.size();}
	const std::string& expression( unsigned int idx) const	{return m_expressions[ idx];}
	const hs_database_t* database() const			{return m_database;}

private:
	TokenRegexTable( const TokenRegexTable&){}	///... non copyable
	void operator=( const TokenRegexTable&){}	///... non copyable

private:
	std::vector<std::string> m_expressions;
	std::map<std::string,unsigned int> m_idmap;
	hs_database_t* m_database;
};

/// \brief Matcher of the expressions of a token regex table, one per thread
class TokenRegexScanner
{
public:
	explicit TokenRegexScanner( const TokenRegexTable* table_);
	~TokenRegexScanner();

	/// \brief Get the sorted indices of all expressions matching somewhere in a value
	void match( std::vector<unsigned int>& result, const std::string& value);

private:
	static int matchEventHandler( unsigned int id, unsigned long long from, unsigned long long to, unsigned int flags, void* context);

private:
	TokenRegexScanner( const TokenRegexScanner&){}	///... non copyable
	void operator=( const TokenRegexScanner&){}	///... non copyable

private:
	const TokenRegexTable* m_table;
	hs_scratch_t* m_scratch;
	std::vector<unsigned int>* m_result;
};

}//namespace
#endif

