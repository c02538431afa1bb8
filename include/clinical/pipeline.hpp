/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Ordered list of pipeline stages applied to documents
/// \file "pipeline.hpp"
#ifndef _CLINICAL_PIPELINE_HPP_INCLUDED
#define _CLINICAL_PIPELINE_HPP_INCLUDED
#include "clinical/pipelineStageInterface.hpp"
#include "clinical/analyzer/document.hpp"
#include "strus/reference.hpp"
#include <vector>

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Ordered list of pipeline stages applied to documents
/// \note The pipeline is read only after building and can be used by several threads
class Pipeline
{
public:
	/// \brief Constructor
	/// \param[in] errorhnd error buffer interface
	explicit Pipeline( strus::ErrorBufferInterface* errorhnd);
	~Pipeline();

	/// \brief Append a stage
	/// \param[in] stage stage (with ownership) to append, NULL is accepted as result of a failed stage constructor and marks the pipeline as invalid
	/// \return *this
	Pipeline& addStage( PipelineStageInterface* stage);

	/// \brief Number of stages defined
	std::size_t size() const			{return m_stages.size();}

	/// \brief Run all stages in their order on a document
	/// \param[in,out] doc document processed, only modified if all stages succeeded
	/// \return true on success, false on error reported to the error buffer
	bool process( analyzer::Document& doc) const;

private:
	Pipeline( const Pipeline&){}		///... non copyable
	void operator=( const Pipeline&){}	///... non copyable

private:
	strus::ErrorBufferInterface* m_errorhnd;
	std::vector<strus::Reference<PipelineStageInterface> > m_stages;
	bool m_valid;
};

} //namespace
#endif

