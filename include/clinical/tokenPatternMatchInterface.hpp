/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for creating matchers of token patterns (phrases, fuzzy phrases, structured patterns)
/// \file "tokenPatternMatchInterface.hpp"
#ifndef _CLINICAL_TOKEN_PATTERN_MATCH_INTERFACE_HPP_INCLUDED
#define _CLINICAL_TOKEN_PATTERN_MATCH_INTERFACE_HPP_INCLUDED
#include <vector>
#include <string>

namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchInstanceInterface;

/// \brief Interface for creating matchers of token patterns
class TokenPatternMatchInterface
{
public:
	/// \brief Destructor
	virtual ~TokenPatternMatchInterface(){}

	/// \brief Get the list of option names you can pass to TokenPatternMatchInstanceInterface::defineOption
	virtual std::vector<std::string> getCompileOptionNames() const=0;

	/// \brief Create an instance to build the pattern set for matching
	/// \return the instance (with ownership) or NULL in case of an error reported to the error buffer
	virtual TokenPatternMatchInstanceInterface* createInstance() const=0;

	/// \brief Get a one line description of this matcher
	virtual const char* getDescription() const=0;
};

} //namespace
#endif

