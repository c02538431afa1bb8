/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loading of qualifier classes and context rules from JSON
/// \file "contextRuleLoader.hpp"
#ifndef _CLINICAL_CONTEXT_RULE_LOADER_HPP_INCLUDED
#define _CLINICAL_CONTEXT_RULE_LOADER_HPP_INCLUDED
#include <string>

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Forward declaration
class ContextRuleStoreInterface;

/// \brief Define the qualifier classes and rules of a JSON rule document {"qualifiers":[...],"rules":[...]} in a rule store
/// \note Throws on error
void loadContextRuleDefinitions( ContextRuleStoreInterface* rulestore, const std::string& source, strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

