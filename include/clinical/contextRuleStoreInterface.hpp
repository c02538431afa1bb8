/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for the store of qualifier classes and context rules used by the context algorithm
/// \file "contextRuleStoreInterface.hpp"
#ifndef _CLINICAL_CONTEXT_RULE_STORE_INTERFACE_HPP_INCLUDED
#define _CLINICAL_CONTEXT_RULE_STORE_INTERFACE_HPP_INCLUDED
#include "clinical/analyzer/qualifierClass.hpp"
#include "clinical/analyzer/contextRule.hpp"
#include "clinical/analyzer/token.hpp"
#include <vector>
#include <string>

namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchInstanceInterface;

/// \brief Interface for the store of qualifier classes and context rules used by the context algorithm
/// \note The store is read only after compile and can be shared by several threads
class ContextRuleStoreInterface
{
public:
	/// \brief Destructor
	virtual ~ContextRuleStoreInterface(){}

	/// \brief Define the token attribute matched by trigger phrases (default LiteralText)
	virtual void defineAttribute( analyzer::TokenAttribute attribute)=0;

	/// \brief Define a qualifier class
	/// \remark Rejects duplicate classes, duplicate or empty values, a default not among the values and incomplete priorities
	virtual void defineQualifierClass( const analyzer::QualifierClass& qualifierClass)=0;

	/// \brief Define a context rule
	/// \remark The qualifier class and value referenced are checked in compile, so rules may be defined before their class
	virtual void defineRule( const analyzer::ContextRule& rule)=0;

	/// \brief Validate all rules and compile their patterns
	/// \return true on success, false on error (error reported to the error buffer)
	virtual bool compile()=0;

	/// \brief True, if the store has been compiled successfully
	virtual bool isCompiled() const=0;

	/// \brief Get the qualifier classes in the order of their definition
	virtual const std::vector<analyzer::QualifierClass>& qualifierClasses() const=0;

	/// \brief Get the rules in the order of their definition
	virtual const std::vector<analyzer::ContextRule>& rules() const=0;

	/// \brief Get the compiled trigger patterns, the identifier of a pattern result is the index of its rule plus one
	/// \return the pattern matcher instance or NULL if not compiled
	virtual const TokenPatternMatchInstanceInterface* triggerPatterns() const=0;
};

} //namespace
#endif

