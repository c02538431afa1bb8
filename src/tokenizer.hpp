/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Standard tokenizer splitting text into words and punctuation
/// \file "tokenizer.hpp"
#ifndef _CLINICAL_TOKENIZER_HPP_INCLUDED
#define _CLINICAL_TOKENIZER_HPP_INCLUDED
#include "clinical/tokenizerInterface.hpp"

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Standard tokenizer splitting text into words and punctuation
/// \remark Words are runs of letters and digits, a dot or a comma between two digits is part of the word (e.g. "38,5")
class Tokenizer
	:public TokenizerInterface
{
public:
	explicit Tokenizer( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_){}
	virtual ~Tokenizer(){}

	virtual std::vector<analyzer::Token> tokenize( const std::string& text) const;

	virtual std::string normalize( const std::string& word) const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
};

}//namespace
#endif

