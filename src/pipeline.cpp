/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Ordered list of pipeline stages applied to documents
/// \file "pipeline.cpp"
#include "clinical/pipeline.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "strus/base/dll_tags.hpp"

#define CLINICAL_DBGTRACE_COMPONENT_NAME "pipeline"

using namespace clinical;

DLL_PUBLIC Pipeline::Pipeline( strus::ErrorBufferInterface* errorhnd)
	:m_errorhnd(errorhnd),m_stages(),m_valid(true){}

DLL_PUBLIC Pipeline::~Pipeline(){}

DLL_PUBLIC Pipeline& Pipeline::addStage( PipelineStageInterface* stage)
{
	bool success = false;
	try
	{
		if (!stage)
		{
			throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("undefined stage"));
		}
		m_stages.push_back( strus::Reference<PipelineStageInterface>( stage));
		success = true;
	}
	CATCH_ERROR_MAP( _TXT("failed to add stage to pipeline: %s"), *m_errorhnd);
	if (!success) m_valid = false;
	return *this;
}

DLL_PUBLIC bool Pipeline::process( analyzer::Document& doc) const
{
	try
	{
		if (!m_valid)
		{
			throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("pipeline built with failed stages"));
		}
		strus::Reference<strus::DebugTraceContextInterface> debugtrace;
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) debugtrace.reset( dbgi->createTraceContext( CLINICAL_DBGTRACE_COMPONENT_NAME));

		analyzer::Document result( doc);
		std::vector<strus::Reference<PipelineStageInterface> >::const_iterator si = m_stages.begin(), se = m_stages.end();
		for (; si != se; ++si)
		{
			if (debugtrace.get()) debugtrace->event( "stage", "%s", (*si)->name());
			if (!(*si)->process( result) || m_errorhnd->hasError())
			{
				if (!m_errorhnd->hasError())
				{
					throw runtime_error( _TXT("stage '%s' failed without error message"), (*si)->name());
				}
				m_errorhnd->explain( _TXT("error processing document in pipeline: %s"));
				return false;
			}
		}
		doc.swap( result);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error processing document in pipeline: %s"), *m_errorhnd, false);
}

