/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "lexems.hpp"
#include "internationalization.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <limits>

using namespace clinical;
using namespace clinical::parser;

bool parser::isEqual( const std::string& id, const char* idstr)
{
	char const* si = id.c_str();
	char const* di = idstr;
	for (; *si && *di && ((*si|32) == (*di|32)); ++si,++di){}
	return !*si && !*di;
}

std::string parser::trim( const std::string& value)
{
	std::string::const_iterator si = value.begin(), se = value.end();
	for (; si != se && (isSpace( *si) || isEoln( *si)); ++si){}
	for (; se != si && (isSpace( *(se-1)) || isEoln( *(se-1))); --se){}
	return std::string( si, se);
}

bool parser::isEmptyLine( const char* src)
{
	char const* cc = src;
	skipSpaces( cc);
	return !*cc || isEoln( *cc);
}

static std::string parse_QUOTED_FIELD( char const*& src, unsigned int& line)
{
	std::string rt;
	unsigned int startline = line;
	++src;
	for (;;)
	{
		if (!*src) throw runtime_error(_TXT("unterminated quoted field starting on line %u"), startline);
		if (isStringQuote( *src))
		{
			if (isStringQuote( src[1]))
			{
				rt.push_back( '"');
				src += 2;
				continue;
			}
			++src;
			break;
		}
		if (*src == '\n') ++line;
		rt.push_back( *src++);
	}
	skipSpaces( src);
	if (*src && !isComma( *src) && !isEoln( *src))
	{
		throw runtime_error(_TXT("unexpected character '%c' after quoted field on line %u"), *src, line);
	}
	return rt;
}

std::vector<std::string> parser::parse_CSV_ROW( char const*& src, unsigned int& line)
{
	std::vector<std::string> rt;
	for (;;)
	{
		skipSpaces( src);
		if (isStringQuote( *src))
		{
			rt.push_back( parse_QUOTED_FIELD( src, line));
		}
		else
		{
			std::string field;
			while (*src && !isComma( *src) && !isEoln( *src)) field.push_back( *src++);
			rt.push_back( trim( field));
		}
		if (isComma( *src))
		{
			++src;
			continue;
		}
		skipEoln( src, line);
		break;
	}
	return rt;
}

unsigned int parser::parse_UNSIGNED( const std::string& value)
{
	unsigned int rt = 0;
	std::string::const_iterator vi = value.begin(), ve = value.end();
	if (vi == ve) throw runtime_error(_TXT("unsigned integer expected"));
	for (; vi != ve; ++vi)
	{
		if (!isDigit( *vi)) throw runtime_error(_TXT("unsigned integer expected instead of '%s'"), value.c_str());
		unsigned int digit = *vi - '0';
		if (rt > (std::numeric_limits<unsigned int>::max() - digit) / 10)
		{
			throw runtime_error(_TXT("integer number out of range: '%s'"), value.c_str());
		}
		rt = rt * 10 + digit;
	}
	return rt;
}

bool parser::parse_BOOLEAN( const std::string& value)
{
	if (isEqual( value, "true") || isEqual( value, "yes") || value == "1") return true;
	if (isEqual( value, "false") || isEqual( value, "no") || value == "0") return false;
	throw runtime_error(_TXT("boolean value expected instead of '%s'"), value.c_str());
}
