/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Parsing of terms and structured token patterns from JSON definitions
/// \file "jsonDefinitions.hpp"
#ifndef _CLINICAL_JSON_DEFINITIONS_HPP_INCLUDED
#define _CLINICAL_JSON_DEFINITIONS_HPP_INCLUDED
#include "clinical/analyzer/token.hpp"
#include "clinical/analyzer/tokenPattern.hpp"
#include "clinical/analyzer/term.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace clinical {

/// \brief Get the token attribute from its name ("TEXT", "ORTH", "NORM" or "LOWER", case insensitive)
/// \note Throws a configuration error for unknown names
analyzer::TokenAttribute parseTokenAttribute( const std::string& name);

/// \brief Parse a structured pattern, a list of per token constraint objects, e.g. [{"NORM":{"IN":["geen","niet"]}},{"OP":"?"}]
analyzer::TokenPattern parseTokenPattern( const nlohmann::json& pattern);

/// \brief Parse a term, either a phrase string, a term object with overrides or a structured pattern
analyzer::Term parseTerm( const nlohmann::json& term);

/// \brief Parse a JSON document reporting syntax errors as configuration errors
nlohmann::json parseJsonDocument( const std::string& source);

}//namespace
#endif

