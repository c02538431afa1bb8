/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Lexems of the tabular (CSV) definition format and of option values
/// \file "lexems.hpp"
#ifndef _CLINICAL_LOADER_LEXEMS_HPP_INCLUDED
#define _CLINICAL_LOADER_LEXEMS_HPP_INCLUDED
#include <string>
#include <vector>

namespace clinical {
namespace parser {

static inline bool isDigit( char ch)
{
	return (ch <= '9' && ch >= '0');
}
static inline bool isSpace( char ch)
{
	return ch == ' ' || ch == '\t';
}
static inline bool isEoln( char ch)
{
	return ch == '\n' || ch == '\r';
}
static inline bool isComma( char ch)
{
	return (ch == ',');
}
static inline bool isStringQuote( char ch)
{
	return ch == '"';
}
static inline void skipSpaces( char const*& src)
{
	while (isSpace( *src)) ++src;
}
static inline void skipEoln( char const*& src, unsigned int& line)
{
	if (*src == '\r') ++src;
	if (*src == '\n')
	{
		++src;
		++line;
	}
}

/// \brief Case insensitive comparison of an identifier with an ASCII keyword
bool isEqual( const std::string& id, const char* idstr);
/// \brief Strip leading and trailing spaces
std::string trim( const std::string& value);
/// \brief Test if the rest of a line contains only spaces
bool isEmptyLine( const char* src);
/// \brief Parse one row of comma separated values, fields may be quoted with '"', a quote inside a quoted field is doubled
std::vector<std::string> parse_CSV_ROW( char const*& src, unsigned int& line);
/// \brief Parse a non negative integer value
unsigned int parse_UNSIGNED( const std::string& value);
/// \brief Parse a boolean value, one of "true", "false", "yes", "no", "1", "0"
bool parse_BOOLEAN( const std::string& value);

}}//namespace
#endif
