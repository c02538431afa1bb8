/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the matcher of phrases, fuzzy phrases and structured patterns on token sequences
/// \file "tokenPatternMatch.hpp"
#ifndef _CLINICAL_TOKEN_PATTERN_MATCH_IMPLEMENTATION_HPP_INCLUDED
#define _CLINICAL_TOKEN_PATTERN_MATCH_IMPLEMENTATION_HPP_INCLUDED
#include "clinical/tokenPatternMatchInterface.hpp"

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical
{
/// \brief Forward declaration
class TokenPatternMatchInstanceInterface;

/// \brief Implementation of the matcher of phrases, fuzzy phrases and structured patterns on token sequences
class TokenPatternMatch
	:public TokenPatternMatchInterface
{
public:
	explicit TokenPatternMatch( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_){}
	virtual ~TokenPatternMatch(){}

	virtual std::vector<std::string> getCompileOptionNames() const;

	virtual TokenPatternMatchInstanceInterface* createInstance() const;

	virtual const char* getDescription() const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
};

} //namespace
#endif

