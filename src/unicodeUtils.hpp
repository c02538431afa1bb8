/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Helpers for UTF-8 decoding and character classification based on textwolf
/// \file "unicodeUtils.hpp"
#ifndef _CLINICAL_UNICODE_UTILS_HPP_INCLUDED
#define _CLINICAL_UNICODE_UTILS_HPP_INCLUDED
#include <string>
#include <vector>
#include <cstddef>

namespace clinical {

/// \brief Unicode code point
typedef unsigned int CodePoint;
/// \brief String of unicode code points
typedef std::vector<CodePoint> CodePointString;

/// \brief Character decoded from a UTF-8 source with its byte position
struct DecodedChar
{
	CodePoint chr;
	std::size_t pos;
	std::size_t size;

	DecodedChar( CodePoint chr_, std::size_t pos_, std::size_t size_)
		:chr(chr_),pos(pos_),size(size_){}
	DecodedChar( const DecodedChar& o)
		:chr(o.chr),pos(o.pos),size(o.size){}
};

/// \brief Decode a UTF-8 string into code points
CodePointString decodeUtf8( const std::string& src);

/// \brief Decode a UTF-8 string into code points with their byte positions
std::vector<DecodedChar> decodeUtf8Positions( const std::string& src);

/// \brief Encode a code point as UTF-8 and append it to a string
void appendUtf8( std::string& dest, CodePoint chr);

/// \brief Number of characters of a UTF-8 string
std::size_t utf8Length( const std::string& src);

/// \brief Map a code point to lowercase (ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic)
CodePoint lowercaseChar( CodePoint chr);

/// \brief Map a Latin letter with diacritics to its base letter, returns the argument if there is no such mapping
CodePoint stripDiacritic( CodePoint chr);

/// \brief Test if a code point is a letter or a digit
bool isWordChar( CodePoint chr);

/// \brief Test if a code point is white space
bool isSpaceChar( CodePoint chr);

}//namespace
#endif

