/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for detecting token patterns in a sequence of tokens
/// \file "tokenPatternMatchContextInterface.hpp"
#ifndef _CLINICAL_TOKEN_PATTERN_MATCH_CONTEXT_INTERFACE_HPP_INCLUDED
#define _CLINICAL_TOKEN_PATTERN_MATCH_CONTEXT_INTERFACE_HPP_INCLUDED
#include "clinical/analyzer/token.hpp"
#include "clinical/analyzer/tokenPatternMatchResult.hpp"
#include <vector>

namespace clinical {

/// \brief Interface for detecting token patterns in a sequence of tokens (e.g. a sentence)
/// \note A context is used by one thread only
class TokenPatternMatchContextInterface
{
public:
	/// \brief Destructor
	virtual ~TokenPatternMatchContextInterface(){}

	/// \brief Feed the next token of the sequence
	/// \param[in] token token with an ordinal position greater than the one of the previous token fed
	/// \remark The tokens fed are treated as contiguous sequence
	virtual void putInput( const analyzer::Token& token)=0;

	/// \brief Get all matches of the patterns in the sequence fed
	/// \return the list of matches, all distinct spans per pattern, overlapping matches included
	virtual std::vector<analyzer::TokenPatternMatchResult> fetchResults() const=0;

	/// \brief Reset the context for processing another sequence
	virtual void reset()=0;
};

} //namespace
#endif

