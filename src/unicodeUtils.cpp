/*
 * Copyright (c) 2017 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Helpers for UTF-8 decoding and character classification based on textwolf
#include "unicodeUtils.hpp"
#include "textwolf/charset.hpp"
#include "textwolf/sourceiterator.hpp"
#include "textwolf/textscanner.hpp"

using namespace clinical;

typedef textwolf::TextScanner<textwolf::SrcIterator,textwolf::charset::UTF8> Utf8TextScanner;

CodePointString clinical::decodeUtf8( const std::string& src)
{
	CodePointString rt;
	textwolf::charset::UTF8 utf8;
	textwolf::SrcIterator srcitr( src.c_str(), src.size(), 0);
	Utf8TextScanner itr( utf8, srcitr);
	textwolf::UChar ch;

	rt.reserve( src.size());
	while ((ch = *itr) != 0)
	{
		rt.push_back( ch);
		++itr;
	}
	return rt;
}

std::vector<DecodedChar> clinical::decodeUtf8Positions( const std::string& src)
{
	std::vector<DecodedChar> rt;
	textwolf::charset::UTF8 utf8;
	textwolf::SrcIterator srcitr( src.c_str(), src.size(), 0);
	Utf8TextScanner itr( utf8, srcitr);
	textwolf::UChar ch;

	std::size_t pos = 0;
	while ((ch = *itr) != 0)
	{
		++itr;
		std::size_t nextpos = itr.getPosition();
		rt.push_back( DecodedChar( ch, pos, nextpos - pos));
		pos = nextpos;
	}
	return rt;
}

void clinical::appendUtf8( std::string& dest, CodePoint chr)
{
	textwolf::charset::UTF8 utf8;
	utf8.print( chr, dest);
}

std::size_t clinical::utf8Length( const std::string& src)
{
	std::size_t rt = 0;
	std::string::const_iterator si = src.begin(), se = src.end();
	for (; si != se; ++si)
	{
		// count all bytes that are not UTF-8 continuation bytes
		if (((unsigned char)*si & 0xC0) != 0x80) ++rt;
	}
	return rt;
}

CodePoint clinical::lowercaseChar( CodePoint chr)
{
	if (chr < 128)
	{
		return (chr >= 'A' && chr <= 'Z') ? (chr + 32) : chr;
	}
	else if (chr >= 0xC0 && chr <= 0xDE)
	{
		return (chr == 0xD7) ? chr : (chr + 32);
	}
	else if (chr >= 0x100 && chr <= 0x17F)
	{
		if ((chr >= 0x100 && chr <= 0x137) || (chr >= 0x14A && chr <= 0x177))
		{
			return (chr & 1) ? chr : (chr + 1);
		}
		else if ((chr >= 0x139 && chr <= 0x148) || (chr >= 0x179 && chr <= 0x17E))
		{
			return (chr & 1) ? (chr + 1) : chr;
		}
		else if (chr == 0x178)
		{
			return 0xFF;
		}
		return chr;
	}
	else if (chr >= 0x391 && chr <= 0x3A9 && chr != 0x3A2)
	{
		return chr + 32;
	}
	else if (chr >= 0x410 && chr <= 0x42F)
	{
		return chr + 32;
	}
	else if (chr >= 0x400 && chr <= 0x40F)
	{
		return chr + 80;
	}
	return chr;
}

// Base letters of Latin-1 0xC0..0xFF and Latin Extended-A 0x100..0x17F, '*' for characters without canonical decomposition
static const char* g_latin1_base = "AAAAAA*CEEEEIIII*NOOOOO**UUUUY**aaaaaa*ceeeeiiii*nooooo**uuuuy*y";
static const char* g_latinExtA_base = "AaAaAaCcCcCcCcDd**EeEeEeEeEeGgGgGgGgHh**IiIiIiIiI***JjKk*LlLlLl****NnNnNn***OoOoOo**RrRrRrSsSsSsSsTtTt**UuUuUuUuUuUuWwYyYZzZzZz*";

CodePoint clinical::stripDiacritic( CodePoint chr)
{
	char base = '*';
	if (chr >= 0xC0 && chr <= 0xFF)
	{
		base = g_latin1_base[ chr - 0xC0];
	}
	else if (chr >= 0x100 && chr <= 0x17F)
	{
		base = g_latinExtA_base[ chr - 0x100];
	}
	return base == '*' ? chr : (CodePoint)(unsigned char)base;
}

bool clinical::isSpaceChar( CodePoint chr)
{
	return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\f' || chr == '\v'
		|| chr == 0xA0 || chr == 0x2028 || chr == 0x2029 || (chr >= 0x2000 && chr <= 0x200A) || chr == 0x3000;
}

bool clinical::isWordChar( CodePoint chr)
{
	if (chr < 128)
	{
		return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || (chr >= '0' && chr <= '9');
	}
	if (chr == 0xD7 || chr == 0xF7) return false;
	if (chr >= 0xC0 && chr <= 0x24F) return true;	// Latin-1 letters and Latin Extended-A/B
	if (chr >= 0x370 && chr <= 0x3FF) return true;	// Greek
	if (chr >= 0x400 && chr <= 0x4FF) return true;	// Cyrillic
	if (chr == 0xAA || chr == 0xB5 || chr == 0xBA) return true;
	if (chr >= 0x1E00 && chr <= 0x1EFF) return true;	// Latin Extended Additional
	if (chr >= 0x2000 && chr <= 0x2BFF) return false;	// punctuation, symbols, arrows
	return chr > 0x2BFF && !isSpaceChar( chr);
}

