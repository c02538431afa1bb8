/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Standard pipeline stages wrapping the tokenizer, the sentencizer, the entity matcher and qualifier detectors
/// \file "pipelineStages.cpp"
#include "pipelineStages.hpp"
#include "sentencizer.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "clinical/tokenizerInterface.hpp"
#include "clinical/entityMatcherInstanceInterface.hpp"
#include "clinical/qualifierDetectorInterface.hpp"
#include "strus/errorBufferInterface.hpp"

using namespace clinical;

bool TokenizerStage::process( analyzer::Document& doc) const
{
	try
	{
		std::vector<analyzer::Token> tokens = m_tokenizer->tokenize( doc.source());
		if (m_errorhnd->hasError()) return false;
		doc.setTokens( tokens);
		doc.setSentences( std::vector<analyzer::Span>());
		doc.setEntities( std::vector<analyzer::Entity>());
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error in tokenizer stage: %s"), *m_errorhnd, false);
}

bool SentencizerStage::process( analyzer::Document& doc) const
{
	try
	{
		doc.setSentences( splitSentences( doc));
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error in sentencizer stage: %s"), *m_errorhnd, false);
}

bool EntityMatcherStage::process( analyzer::Document& doc) const
{
	try
	{
		std::vector<analyzer::Entity> entities = m_matcher->match( doc);
		if (m_errorhnd->hasError()) return false;
		doc.setEntities( entities);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error in entity matcher stage: %s"), *m_errorhnd, false);
}

bool QualifierDetectorStage::process( analyzer::Document& doc) const
{
	return m_detector->detect( doc);
}

