/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for splitting a text into tokens with literal and normalized form
/// \file "tokenizerInterface.hpp"
#ifndef _CLINICAL_TOKENIZER_INTERFACE_HPP_INCLUDED
#define _CLINICAL_TOKENIZER_INTERFACE_HPP_INCLUDED
#include "clinical/analyzer/token.hpp"
#include <vector>
#include <string>

namespace clinical {

/// \brief Interface for splitting a text into tokens with literal and normalized form
/// \note Used for documents and for splitting term and trigger phrases into words
class TokenizerInterface
{
public:
	/// \brief Destructor
	virtual ~TokenizerInterface(){}

	/// \brief Split a text into tokens
	/// \param[in] text UTF-8 text to split
	/// \return the tokens with ordinal positions counting from 0 and byte offsets in text
	virtual std::vector<analyzer::Token> tokenize( const std::string& text) const=0;

	/// \brief Map a word to its normalized form
	virtual std::string normalize( const std::string& word) const=0;
};

} //namespace
#endif

