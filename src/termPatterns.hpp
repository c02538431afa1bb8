/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Translation of terms into patterns of the token pattern matcher
/// \file "termPatterns.hpp"
#ifndef _CLINICAL_TERM_PATTERNS_HPP_INCLUDED
#define _CLINICAL_TERM_PATTERNS_HPP_INCLUDED
#include "clinical/analyzer/term.hpp"
#include "clinical/analyzer/token.hpp"
#include <vector>
#include <string>

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchInstanceInterface;
/// \brief Forward declaration
class TokenizerInterface;

/// \brief Defaults of the term options not overridden by the term
struct TermDefaults
{
	analyzer::TokenAttribute attribute;
	unsigned int proximity;
	unsigned int fuzzy;
	unsigned int fuzzyMinLength;
	bool pseudo;

	TermDefaults()
		:attribute(analyzer::LiteralText),proximity(0),fuzzy(0),fuzzyMinLength(0),pseudo(false){}
};

/// \brief Split a phrase into the words compared with the token attribute selected
/// \note Throws on error
std::vector<std::string> splitPhraseWords(
		const TokenizerInterface* tokenizer,
		const std::string& phrase,
		analyzer::TokenAttribute attribute,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Define the pattern of a term in a token pattern matcher instance
/// \note Throws on error
void defineTermPattern(
		TokenPatternMatchInstanceInterface* patterns,
		const TokenizerInterface* tokenizer,
		unsigned int id,
		const analyzer::Term& term,
		const TermDefaults& defaults,
		strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

