/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the matcher of concept dictionary entities
/// \file "entityMatcher.hpp"
#ifndef _CLINICAL_ENTITY_MATCHER_HPP_INCLUDED
#define _CLINICAL_ENTITY_MATCHER_HPP_INCLUDED
#include "clinical/entityMatcherInterface.hpp"

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchInterface;
/// \brief Forward declaration
class TokenizerInterface;

/// \brief Implementation of the matcher of concept dictionary entities
class EntityMatcher
	:public EntityMatcherInterface
{
public:
	EntityMatcher( const TokenPatternMatchInterface* tpm_, const TokenizerInterface* tokenizer_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_tpm(tpm_),m_tokenizer(tokenizer_){}
	virtual ~EntityMatcher(){}

	virtual std::vector<std::string> getCompileOptionNames() const;

	virtual EntityMatcherInstanceInterface* createInstance() const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const TokenPatternMatchInterface* m_tpm;
	const TokenizerInterface* m_tokenizer;
};

}//namespace
#endif

