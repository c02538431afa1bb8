/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the clinical token pattern matching library with regular expressions based on hyperscan
/// \file pattern.hpp
#ifndef _CLINICAL_PATTERN_LIB_HPP_INCLUDED
#define _CLINICAL_PATTERN_LIB_HPP_INCLUDED

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

/// \brief clinical toplevel namespace
namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchInterface;
/// \brief Forward declaration
class TokenizerInterface;

/// \brief Create the interface for matching phrases, fuzzy phrases and structured patterns on token sequences
TokenPatternMatchInterface* createTokenPatternMatch_std(
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the standard tokenizer splitting text into words and punctuation with normalization (lowercase, diacritics mapped)
TokenizerInterface* createTokenizer_std(
		strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

