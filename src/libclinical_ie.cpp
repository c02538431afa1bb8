/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the clinical information extraction library
/// \file libclinical_ie.cpp
#include "clinical/lib/ie.hpp"
#include "clinical/contextRuleStoreInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/base/fileio.hpp"
#include "strus/base/dll_tags.hpp"
#include "entityMatcher.hpp"
#include "contextRuleStore.hpp"
#include "contextAlgorithm.hpp"
#include "contextRuleLoader.hpp"
#include "conceptLoader.hpp"
#include "pipelineStages.hpp"
#include "documentSerializer.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"
#include <cstring>

using namespace clinical;
static bool g_intl_initialized = false;

static void initLibrary()
{
	if (!g_intl_initialized)
	{
		clinical::initMessageTextDomain();
		g_intl_initialized = true;
	}
}

static std::string readDefinitionFile( const std::string& filename)
{
	std::string rt;
	unsigned int ec = strus::readFile( filename, rt);
	if (ec)
	{
		throw configuration_error( strus::ErrorCodeIOError, _TXT("error (%u) reading file %s: %s"), ec, filename.c_str(), ::strerror(ec));
	}
	return rt;
}

static bool hasFileExtension( const std::string& filename, const char* ext)
{
	std::size_t extlen = std::strlen( ext);
	if (filename.size() < extlen) return false;
	const char* fi = filename.c_str() + filename.size() - extlen;
	for (; *fi && *ext && ((*fi|32) == (*ext|32)); ++fi,++ext){}
	return !*fi && !*ext;
}

DLL_PUBLIC EntityMatcherInterface* clinical::createEntityMatcher_std(
		const TokenPatternMatchInterface* tokenpatternmatch,
		const TokenizerInterface* tokenizer,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!tokenpatternmatch || !tokenizer)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("undefined token pattern matcher or tokenizer"));
		}
		return new EntityMatcher( tokenpatternmatch, tokenizer, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating entity matcher: %s"), *errorhnd, 0);
}

DLL_PUBLIC ContextRuleStoreInterface* clinical::createContextRuleStore_std(
		const TokenPatternMatchInterface* tokenpatternmatch,
		const TokenizerInterface* tokenizer,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!tokenpatternmatch || !tokenizer)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("undefined token pattern matcher or tokenizer"));
		}
		return new ContextRuleStore( tokenpatternmatch, tokenizer, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating context rule store: %s"), *errorhnd, 0);
}

DLL_PUBLIC QualifierDetectorInterface* clinical::createContextAlgorithm_std(
		const ContextRuleStoreInterface* rulestore,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!rulestore)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("undefined context rule store"));
		}
		if (!rulestore->isCompiled())
		{
			throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("context rule store not compiled"));
		}
		return new ContextAlgorithm( rulestore, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating context algorithm: %s"), *errorhnd, 0);
}

DLL_PUBLIC bool clinical::loadContextRules(
		ContextRuleStoreInterface* rulestore,
		const std::string& source,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		loadContextRuleDefinitions( rulestore, source, errorhnd);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error loading context rules: %s"), *errorhnd, false);
}

DLL_PUBLIC bool clinical::loadContextRulesFile(
		ContextRuleStoreInterface* rulestore,
		const std::string& filename,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		loadContextRuleDefinitions( rulestore, readDefinitionFile( filename), errorhnd);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error loading context rules from file: %s"), *errorhnd, false);
}

DLL_PUBLIC bool clinical::loadConceptsJson(
		EntityMatcherInstanceInterface* matcher,
		const std::string& source,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		loadConceptDefinitionsJson( matcher, source, errorhnd);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error loading concepts: %s"), *errorhnd, false);
}

DLL_PUBLIC bool clinical::loadConceptsCsv(
		EntityMatcherInstanceInterface* matcher,
		const std::string& source,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		loadConceptDefinitionsCsv( matcher, source, errorhnd);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error loading concept table: %s"), *errorhnd, false);
}

DLL_PUBLIC bool clinical::loadConceptsFile(
		EntityMatcherInstanceInterface* matcher,
		const std::string& filename,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (hasFileExtension( filename, ".json"))
		{
			loadConceptDefinitionsJson( matcher, readDefinitionFile( filename), errorhnd);
		}
		else if (hasFileExtension( filename, ".csv"))
		{
			loadConceptDefinitionsCsv( matcher, readDefinitionFile( filename), errorhnd);
		}
		else
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("unknown format of concept file '%s', expected extension .json or .csv"), filename.c_str());
		}
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error loading concepts from file: %s"), *errorhnd, false);
}

DLL_PUBLIC PipelineStageInterface* clinical::createTokenizerStage(
		const TokenizerInterface* tokenizer,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!tokenizer)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("undefined tokenizer"));
		}
		return new TokenizerStage( tokenizer, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating tokenizer stage: %s"), *errorhnd, 0);
}

DLL_PUBLIC PipelineStageInterface* clinical::createSentencizerStage_std(
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		return new SentencizerStage( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating sentencizer stage: %s"), *errorhnd, 0);
}

DLL_PUBLIC PipelineStageInterface* clinical::createEntityMatcherStage(
		const EntityMatcherInstanceInterface* matcher,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!matcher)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("undefined entity matcher"));
		}
		return new EntityMatcherStage( matcher, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating entity matcher stage: %s"), *errorhnd, 0);
}

DLL_PUBLIC PipelineStageInterface* clinical::createQualifierDetectorStage(
		const QualifierDetectorInterface* detector,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		initLibrary();
		if (!detector)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("undefined qualifier detector"));
		}
		return new QualifierDetectorStage( detector, errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating qualifier detector stage: %s"), *errorhnd, 0);
}

DLL_PUBLIC std::string clinical::documentEntitiesToJson(
		const analyzer::Document& doc,
		strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		return serializeDocumentEntities( doc);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error serializing document entities: %s"), *errorhnd, std::string());
}

