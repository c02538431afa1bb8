/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Standard tokenizer splitting text into words and punctuation
/// \file "tokenizer.cpp"
#include "tokenizer.hpp"
#include "unicodeUtils.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"

using namespace clinical;

static std::string normalizeChars( const std::string& word)
{
	std::string rt;
	CodePointString chars = decodeUtf8( word);
	CodePointString::const_iterator ci = chars.begin(), ce = chars.end();
	for (; ci != ce; ++ci)
	{
		appendUtf8( rt, lowercaseChar( stripDiacritic( *ci)));
	}
	return rt;
}

static bool isDigitChar( CodePoint chr)
{
	return chr >= '0' && chr <= '9';
}

std::vector<analyzer::Token> Tokenizer::tokenize( const std::string& text) const
{
	try
	{
		std::vector<analyzer::Token> rt;
		std::vector<DecodedChar> chars = decodeUtf8Positions( text);
		std::size_t ci = 0, ce = chars.size();
		while (ci < ce)
		{
			if (isSpaceChar( chars[ ci].chr))
			{
				++ci;
				continue;
			}
			std::size_t start = ci;
			if (isWordChar( chars[ ci].chr))
			{
				for (++ci; ci < ce; ++ci)
				{
					if (isWordChar( chars[ ci].chr)) continue;
					if ((chars[ ci].chr == '.' || chars[ ci].chr == ',')
						&& ci+1 < ce && isDigitChar( chars[ ci-1].chr) && isDigitChar( chars[ ci+1].chr))
					{
						continue;
					}
					break;
				}
			}
			else
			{
				++ci;
			}
			std::size_t origpos = chars[ start].pos;
			std::size_t origend = chars[ ci-1].pos + chars[ ci-1].size;
			std::string literal( text.c_str() + origpos, origend - origpos);
			rt.push_back( analyzer::Token( literal, normalizeChars( literal), rt.size(), origpos, origend - origpos));
		}
		return rt;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to tokenize text: %s"), *m_errorhnd, std::vector<analyzer::Token>());
}

std::string Tokenizer::normalize( const std::string& word) const
{
	try
	{
		return normalizeChars( word);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to normalize word: %s"), *m_errorhnd, std::string());
}

