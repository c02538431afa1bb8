/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Standard sentencizer splitting the tokens of a document into sentences
/// \file "sentencizer.hpp"
#ifndef _CLINICAL_SENTENCIZER_HPP_INCLUDED
#define _CLINICAL_SENTENCIZER_HPP_INCLUDED
#include "clinical/analyzer/document.hpp"
#include <vector>

namespace clinical {

/// \brief Split the tokens of a document into sentences
/// \remark A sentence ends after one of the tokens ".", "!", "?" or at a line break between two tokens,
///	the next sentence starts at the next token that starts with a letter, a digit or '[', or is one of "-", "*", "("
/// \return the sentences partitioning the token sequence
std::vector<analyzer::Span> splitSentences( const analyzer::Document& doc);

}//namespace
#endif

