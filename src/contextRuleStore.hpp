/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the store of qualifier classes and context rules
/// \file "contextRuleStore.hpp"
#ifndef _CLINICAL_CONTEXT_RULE_STORE_HPP_INCLUDED
#define _CLINICAL_CONTEXT_RULE_STORE_HPP_INCLUDED
#include "clinical/contextRuleStoreInterface.hpp"
#include "clinical/tokenPatternMatchInstanceInterface.hpp"
#include "strus/reference.hpp"
#include <map>

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchInterface;
/// \brief Forward declaration
class TokenizerInterface;

/// \brief Implementation of the store of qualifier classes and context rules
class ContextRuleStore
	:public ContextRuleStoreInterface
{
public:
	ContextRuleStore( const TokenPatternMatchInterface* tpm_, const TokenizerInterface* tokenizer_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_tpm(tpm_),m_tokenizer(tokenizer_)
		,m_attribute(analyzer::LiteralText),m_classes(),m_classmap(),m_rules(),m_patterns(),m_compiled(false){}
	virtual ~ContextRuleStore(){}

	virtual void defineAttribute( analyzer::TokenAttribute attribute);

	virtual void defineQualifierClass( const analyzer::QualifierClass& qualifierClass);

	virtual void defineRule( const analyzer::ContextRule& rule);

	virtual bool compile();

	virtual bool isCompiled() const
	{
		return m_compiled;
	}

	virtual const std::vector<analyzer::QualifierClass>& qualifierClasses() const
	{
		return m_classes;
	}

	virtual const std::vector<analyzer::ContextRule>& rules() const
	{
		return m_rules;
	}

	virtual const TokenPatternMatchInstanceInterface* triggerPatterns() const
	{
		return m_compiled ? m_patterns.get() : 0;
	}

private:
	void checkNotCompiled() const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const TokenPatternMatchInterface* m_tpm;
	const TokenizerInterface* m_tokenizer;
	analyzer::TokenAttribute m_attribute;
	std::vector<analyzer::QualifierClass> m_classes;
	std::map<std::string,std::size_t> m_classmap;
	std::vector<analyzer::ContextRule> m_rules;
	strus::Reference<TokenPatternMatchInstanceInterface> m_patterns;
	bool m_compiled;
};

}//namespace
#endif

