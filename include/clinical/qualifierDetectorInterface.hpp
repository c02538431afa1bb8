/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for detectors assigning qualifiers to the entities of a document
/// \file "qualifierDetectorInterface.hpp"
#ifndef _CLINICAL_QUALIFIER_DETECTOR_INTERFACE_HPP_INCLUDED
#define _CLINICAL_QUALIFIER_DETECTOR_INTERFACE_HPP_INCLUDED
#include "clinical/analyzer/qualifierClass.hpp"
#include "clinical/analyzer/document.hpp"
#include <vector>

namespace clinical {

/// \brief Interface for detectors assigning qualifiers to the entities of a document
/// \note Detectors of different types are interchangeable and can be applied one after the other on the same entities
class QualifierDetectorInterface
{
public:
	/// \brief Destructor
	virtual ~QualifierDetectorInterface(){}

	/// \brief Get the qualifier classes this detector assigns
	virtual std::vector<analyzer::QualifierClass> qualifierClasses() const=0;

	/// \brief Assign exactly one qualifier of every class of this detector to every entity of a document
	/// \param[in,out] doc document with tokens, sentences and entities
	/// \return true on success, false on error (document not modified, error reported to the error buffer)
	virtual bool detect( analyzer::Document& doc) const=0;
};

} //namespace
#endif

