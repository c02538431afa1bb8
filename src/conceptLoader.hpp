/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loading of concept dictionaries in JSON or tabular (CSV) form
/// \file "conceptLoader.hpp"
#ifndef _CLINICAL_CONCEPT_LOADER_HPP_INCLUDED
#define _CLINICAL_CONCEPT_LOADER_HPP_INCLUDED
#include <string>

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Forward declaration
class EntityMatcherInstanceInterface;

/// \brief Add the terms of a JSON concept dictionary {"<concept>":[<term>,...],...} to a matcher
/// \note Throws on error
void loadConceptDefinitionsJson( EntityMatcherInstanceInterface* matcher, const std::string& source, strus::ErrorBufferInterface* errorhnd);

/// \brief Add the terms of a CSV concept table with the columns concept, phrase, attr, proximity, fuzzy, fuzzy_min_len, pseudo to a matcher
/// \note Throws on error
void loadConceptDefinitionsCsv( EntityMatcherInstanceInterface* matcher, const std::string& source, strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

