/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for creating matchers of concept dictionary entities
/// \file "entityMatcherInterface.hpp"
#ifndef _CLINICAL_ENTITY_MATCHER_INTERFACE_HPP_INCLUDED
#define _CLINICAL_ENTITY_MATCHER_INTERFACE_HPP_INCLUDED
#include <vector>
#include <string>

namespace clinical {

/// \brief Forward declaration
class EntityMatcherInstanceInterface;

/// \brief Interface for creating matchers of concept dictionary entities
class EntityMatcherInterface
{
public:
	/// \brief Destructor
	virtual ~EntityMatcherInterface(){}

	/// \brief Get the list of option names you can pass to EntityMatcherInstanceInterface::defineOption
	virtual std::vector<std::string> getCompileOptionNames() const=0;

	/// \brief Create an instance to define the concept dictionary
	/// \return the instance (with ownership) or NULL in case of an error reported to the error buffer
	virtual EntityMatcherInstanceInterface* createInstance() const=0;
};

} //namespace
#endif

