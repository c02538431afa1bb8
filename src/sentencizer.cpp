/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Standard sentencizer splitting the tokens of a document into sentences
/// \file "sentencizer.cpp"
#include "sentencizer.hpp"
#include "unicodeUtils.hpp"

using namespace clinical;

static bool isSentenceEnd( const analyzer::Token& token)
{
	const std::string& lit = token.literal();
	return lit == "." || lit == "!" || lit == "?";
}

static bool isSentenceStart( const analyzer::Token& token)
{
	const std::string& lit = token.literal();
	if (lit.empty()) return false;
	if (lit == "-" || lit == "*" || lit == "(" || lit[0] == '[') return true;
	CodePointString chars = decodeUtf8( lit);
	return !chars.empty() && isWordChar( chars[0]);
}

static bool hasLineBreak( const std::string& source, std::size_t start, std::size_t end)
{
	if (end > source.size() || start >= end) return false;
	return source.find( '\n', start) < end;
}

std::vector<analyzer::Span> clinical::splitSentences( const analyzer::Document& doc)
{
	std::vector<analyzer::Span> rt;
	const std::vector<analyzer::Token>& tokens = doc.tokens();
	std::size_t start = 0;
	bool endPending = false;
	std::size_t ti = 0, te = tokens.size();
	for (; ti < te; ++ti)
	{
		if (endPending && isSentenceStart( tokens[ ti]))
		{
			rt.push_back( analyzer::Span( start, ti));
			start = ti;
			endPending = false;
		}
		if (isSentenceEnd( tokens[ ti]))
		{
			endPending = true;
		}
		else if (ti+1 < te && hasLineBreak( doc.source(), tokens[ ti].origend(), tokens[ ti+1].origpos()))
		{
			endPending = true;
		}
	}
	if (start < te)
	{
		rt.push_back( analyzer::Span( start, te));
	}
	return rt;
}

