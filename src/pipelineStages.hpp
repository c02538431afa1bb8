/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Standard pipeline stages wrapping the tokenizer, the sentencizer, the entity matcher and qualifier detectors
/// \file "pipelineStages.hpp"
#ifndef _CLINICAL_PIPELINE_STAGES_HPP_INCLUDED
#define _CLINICAL_PIPELINE_STAGES_HPP_INCLUDED
#include "clinical/pipelineStageInterface.hpp"

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Forward declaration
class TokenizerInterface;
/// \brief Forward declaration
class EntityMatcherInstanceInterface;
/// \brief Forward declaration
class QualifierDetectorInterface;

/// \brief Stage replacing the tokens of a document by the tokens of its source
class TokenizerStage
	:public PipelineStageInterface
{
public:
	TokenizerStage( const TokenizerInterface* tokenizer_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_tokenizer(tokenizer_){}
	virtual ~TokenizerStage(){}

	virtual const char* name() const	{return "tokenizer";}
	virtual bool process( analyzer::Document& doc) const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const TokenizerInterface* m_tokenizer;
};

/// \brief Stage replacing the sentences of a document by the ones of the standard sentencizer
class SentencizerStage
	:public PipelineStageInterface
{
public:
	explicit SentencizerStage( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_){}
	virtual ~SentencizerStage(){}

	virtual const char* name() const	{return "sentencizer";}
	virtual bool process( analyzer::Document& doc) const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
};

/// \brief Stage replacing the entities of a document by the ones found by an entity matcher
class EntityMatcherStage
	:public PipelineStageInterface
{
public:
	EntityMatcherStage( const EntityMatcherInstanceInterface* matcher_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_matcher(matcher_){}
	virtual ~EntityMatcherStage(){}

	virtual const char* name() const	{return "entity matcher";}
	virtual bool process( analyzer::Document& doc) const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const EntityMatcherInstanceInterface* m_matcher;
};

/// \brief Stage assigning the qualifiers of a detector to the entities of a document
class QualifierDetectorStage
	:public PipelineStageInterface
{
public:
	QualifierDetectorStage( const QualifierDetectorInterface* detector_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_detector(detector_){}
	virtual ~QualifierDetectorStage(){}

	virtual const char* name() const	{return "qualifier detector";}
	virtual bool process( analyzer::Document& doc) const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const QualifierDetectorInterface* m_detector;
};

}//namespace
#endif

