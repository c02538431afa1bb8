/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the clinical information extraction library
/// \file ie.hpp
#ifndef _CLINICAL_IE_LIB_HPP_INCLUDED
#define _CLINICAL_IE_LIB_HPP_INCLUDED
#include "clinical/analyzer/document.hpp"
#include <string>

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

/// \brief clinical toplevel namespace
namespace clinical {

/// \brief Forward declaration
class TokenPatternMatchInterface;
/// \brief Forward declaration
class TokenizerInterface;
/// \brief Forward declaration
class EntityMatcherInterface;
/// \brief Forward declaration
class EntityMatcherInstanceInterface;
/// \brief Forward declaration
class ContextRuleStoreInterface;
/// \brief Forward declaration
class QualifierDetectorInterface;
/// \brief Forward declaration
class PipelineStageInterface;

/// \brief Create the matcher of concept dictionary entities
/// \param[in] tokenpatternmatch token pattern matcher used (reference, not owned)
/// \param[in] tokenizer tokenizer for splitting term phrases into words (reference, not owned)
/// \param[in] errorhnd error buffer interface
EntityMatcherInterface* createEntityMatcher_std(
		const TokenPatternMatchInterface* tokenpatternmatch,
		const TokenizerInterface* tokenizer,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create an empty context rule store
/// \param[in] tokenpatternmatch token pattern matcher used (reference, not owned)
/// \param[in] tokenizer tokenizer for splitting trigger phrases into words (reference, not owned)
/// \param[in] errorhnd error buffer interface
ContextRuleStoreInterface* createContextRuleStore_std(
		const TokenPatternMatchInterface* tokenpatternmatch,
		const TokenizerInterface* tokenizer,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the context algorithm qualifier detector
/// \param[in] rulestore compiled rule store (reference, not owned)
/// \param[in] errorhnd error buffer interface
QualifierDetectorInterface* createContextAlgorithm_std(
		const ContextRuleStoreInterface* rulestore,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Load qualifier classes and rules from a JSON document
/// \param[in,out] rulestore rule store to define the classes and rules in (not compiled by this function)
/// \param[in] source JSON source
/// \return true on success, false on error reported to the error buffer
bool loadContextRules(
		ContextRuleStoreInterface* rulestore,
		const std::string& source,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Load qualifier classes and rules from a JSON file
bool loadContextRulesFile(
		ContextRuleStoreInterface* rulestore,
		const std::string& filename,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Load concept terms from a JSON document (map of concept to list of phrases, term objects or structured patterns)
bool loadConceptsJson(
		EntityMatcherInstanceInterface* matcher,
		const std::string& source,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Load concept terms from a CSV document with a header row naming the columns
bool loadConceptsCsv(
		EntityMatcherInstanceInterface* matcher,
		const std::string& source,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Load concept terms from a file, the format (JSON or CSV) is selected by the file extension
bool loadConceptsFile(
		EntityMatcherInstanceInterface* matcher,
		const std::string& filename,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the pipeline stage tokenizing the source of a document
PipelineStageInterface* createTokenizerStage(
		const TokenizerInterface* tokenizer,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the pipeline stage splitting the tokens of a document into sentences
PipelineStageInterface* createSentencizerStage_std(
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the pipeline stage attaching the entities found by a matcher to the document
PipelineStageInterface* createEntityMatcherStage(
		const EntityMatcherInstanceInterface* matcher,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Create the pipeline stage assigning the qualifiers of a detector to the entities of the document
PipelineStageInterface* createQualifierDetectorStage(
		const QualifierDetectorInterface* detector,
		strus::ErrorBufferInterface* errorhnd);

/// \brief Render the entities of a document with their qualifiers as JSON
/// \return the JSON string or an empty string in case of an error reported to the error buffer
std::string documentEntitiesToJson(
		const analyzer::Document& doc,
		strus::ErrorBufferInterface* errorhnd);

}//namespace
#endif

