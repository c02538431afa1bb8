/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for defining a concept dictionary and matching its entities in documents
/// \file "entityMatcherInstanceInterface.hpp"
#ifndef _CLINICAL_ENTITY_MATCHER_INSTANCE_INTERFACE_HPP_INCLUDED
#define _CLINICAL_ENTITY_MATCHER_INSTANCE_INTERFACE_HPP_INCLUDED
#include "clinical/analyzer/term.hpp"
#include "clinical/analyzer/entity.hpp"
#include "clinical/analyzer/document.hpp"
#include <vector>
#include <string>

namespace clinical {

/// \brief Interface for defining a concept dictionary and matching its entities in documents
/// \note The instance is read only after compile and can be used by several threads
class EntityMatcherInstanceInterface
{
public:
	/// \brief Destructor
	virtual ~EntityMatcherInstanceInterface(){}

	/// \brief Define an option of the matcher
	/// \param[in] name name of the option (case insensitive):
	///	"proximity", "fuzzy", "fuzzyMinLength", "pseudo" (defaults for terms not overriding them),
	///	"resolveOverlap" (1 = resolve overlapping entities of different concepts, default 0),
	///	"pseudoOverlap" (1 = pseudo matches exclude any overlapping match of the concept, 0 = only coinciding matches, default 1)
	/// \param[in] value value of the option
	virtual void defineOption( const std::string& name, double value)=0;

	/// \brief Define the token attribute matched by terms not overriding it (default LiteralText)
	virtual void defineAttribute( analyzer::TokenAttribute attribute)=0;

	/// \brief Add a term to a concept
	/// \param[in] concept concept identifier, terms of the same concept accumulate
	/// \param[in] term term to add
	virtual void addTerm( const std::string& concept, const analyzer::Term& term)=0;

	/// \brief Add a list of terms to a concept
	virtual void addTerms( const std::string& concept, const std::vector<analyzer::Term>& terms)=0;

	/// \brief Build the patterns of all terms added
	/// \return true on success, false on error (error reported to the error buffer)
	virtual bool compile()=0;

	/// \brief Find all entities in a document
	/// \param[in] doc tokenized document, matching is restricted to its sentences if defined
	/// \return the entities sorted by position, an empty list also in case of an error
	virtual std::vector<analyzer::Entity> match( const analyzer::Document& doc) const=0;
};

} //namespace
#endif

