/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for a stage of the document processing pipeline
/// \file "pipelineStageInterface.hpp"
#ifndef _CLINICAL_PIPELINE_STAGE_INTERFACE_HPP_INCLUDED
#define _CLINICAL_PIPELINE_STAGE_INTERFACE_HPP_INCLUDED
#include "clinical/analyzer/document.hpp"

namespace clinical {

/// \brief Interface for a stage of the document processing pipeline
class PipelineStageInterface
{
public:
	/// \brief Destructor
	virtual ~PipelineStageInterface(){}

	/// \brief Name of the stage for diagnostics
	virtual const char* name() const=0;

	/// \brief Annotate a document
	/// \return true on success, false on error reported to the error buffer
	virtual bool process( analyzer::Document& doc) const=0;
};

} //namespace
#endif

