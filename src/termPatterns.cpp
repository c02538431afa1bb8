/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Translation of terms into patterns of the token pattern matcher
/// \file "termPatterns.cpp"
#include "termPatterns.hpp"
#include "internationalization.hpp"
#include "clinical/tokenizerInterface.hpp"
#include "clinical/tokenPatternMatchInstanceInterface.hpp"
#include "strus/errorBufferInterface.hpp"

using namespace clinical;

std::vector<std::string> clinical::splitPhraseWords(
		const TokenizerInterface* tokenizer,
		const std::string& phrase,
		analyzer::TokenAttribute attribute,
		strus::ErrorBufferInterface* errorhnd)
{
	std::vector<std::string> rt;
	std::vector<analyzer::Token> tokens = tokenizer->tokenize( phrase);
	if (errorhnd->hasError())
	{
		throw runtime_error( _TXT("failed to tokenize phrase '%s': %s"), phrase.c_str(), errorhnd->fetchError());
	}
	std::vector<analyzer::Token>::const_iterator ti = tokens.begin(), te = tokens.end();
	for (; ti != te; ++ti)
	{
		rt.push_back( ti->attribute( attribute));
	}
	return rt;
}

void clinical::defineTermPattern(
		TokenPatternMatchInstanceInterface* patterns,
		const TokenizerInterface* tokenizer,
		unsigned int id,
		const analyzer::Term& term,
		const TermDefaults& defaults,
		strus::ErrorBufferInterface* errorhnd)
{
	if (term.isStructured())
	{
		if (term.pattern().empty())
		{
			throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("empty structured pattern"));
		}
		patterns->definePattern( id, term.pattern());
	}
	else
	{
		analyzer::TokenAttribute attribute = term.attribute( defaults.attribute);
		std::vector<std::string> words = splitPhraseWords( tokenizer, term.phrase(), attribute, errorhnd);
		if (words.empty())
		{
			throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("phrase '%s' without words"), term.phrase().c_str());
		}
		patterns->definePhrase(
				id, words, attribute,
				term.proximity( defaults.proximity),
				term.fuzzy( defaults.fuzzy),
				term.fuzzyMinLength( defaults.fuzzyMinLength));
	}
	if (errorhnd->hasError())
	{
		throw runtime_error( _TXT("failed to define pattern %u: %s"), id, errorhnd->fetchError());
	}
}

