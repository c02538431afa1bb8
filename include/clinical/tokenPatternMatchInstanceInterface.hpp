/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for building the set of token patterns to detect in a tokenized document
/// \file "tokenPatternMatchInstanceInterface.hpp"
#ifndef _CLINICAL_TOKEN_PATTERN_MATCH_INSTANCE_INTERFACE_HPP_INCLUDED
#define _CLINICAL_TOKEN_PATTERN_MATCH_INSTANCE_INTERFACE_HPP_INCLUDED
#include "clinical/analyzer/token.hpp"
#include "clinical/analyzer/tokenPattern.hpp"
#include <string>
#include <vector>

namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchContextInterface;

/// \brief Interface for building the set of token patterns to detect in a tokenized document
/// \note The instance is read only after compile and can be shared by contexts of different threads
class TokenPatternMatchInstanceInterface
{
public:
	/// \brief Destructor
	virtual ~TokenPatternMatchInstanceInterface(){}

	/// \brief Define an option of the matcher
	/// \param[in] name name of the option (case insensitive), one of "maxProximity", "maxFuzzy"
	/// \param[in] value value of the option
	virtual void defineOption( const std::string& name, double value)=0;

	/// \brief Define a phrase pattern
	/// \param[in] id identifier of the pattern in the results (non zero, may be shared by several patterns)
	/// \param[in] words words of the phrase as produced by the tokenizer for the attribute selected
	/// \param[in] attribute attribute of the document tokens compared with the words
	/// \param[in] proximity maximum number of arbitrary tokens skipped between two consecutive words
	/// \param[in] fuzzy maximum edit distance (Levenshtein without transpositions) of a word to the matching token, 0 for exact matches
	/// \param[in] fuzzyMinLength minimum length in characters of a word for allowing fuzzy matches
	virtual void definePhrase(
			unsigned int id,
			const std::vector<std::string>& words,
			analyzer::TokenAttribute attribute,
			unsigned int proximity,
			unsigned int fuzzy,
			unsigned int fuzzyMinLength)=0;

	/// \brief Define a structured pattern
	/// \param[in] id identifier of the pattern in the results (non zero, may be shared by several patterns)
	/// \param[in] pattern list of per token constraints
	virtual void definePattern( unsigned int id, const analyzer::TokenPattern& pattern)=0;

	/// \brief Compile all patterns defined
	/// \return true on success, false on error (error reported to the error buffer)
	virtual bool compile()=0;

	/// \brief Create the context to process a document with the pattern matcher
	/// \return the pattern matcher context (with ownership) or NULL in case of an error
	virtual TokenPatternMatchContextInterface* createContext() const=0;
};

} //namespace
#endif

