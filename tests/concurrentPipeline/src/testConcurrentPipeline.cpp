/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "clinical/lib/pattern.hpp"
#include "clinical/lib/ie.hpp"
#include "clinical/tokenPatternMatchInterface.hpp"
#include "clinical/tokenizerInterface.hpp"
#include "clinical/entityMatcherInterface.hpp"
#include "clinical/entityMatcherInstanceInterface.hpp"
#include "clinical/contextRuleStoreInterface.hpp"
#include "clinical/qualifierDetectorInterface.hpp"
#include "clinical/pipelineStageInterface.hpp"
#include "clinical/pipeline.hpp"
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/reference.hpp"
#include "testUtils.hpp"
#include <boost/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/bind.hpp>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#define NOF_THREADS 8
#define NOF_ITERATIONS 50

strus::ErrorBufferInterface* g_errorBuffer = 0;

using namespace clinical;

static const char* g_documents[] =
{
	"Patient heeft geen koorts. Moeder had diabetes.",
	"Verdenking op pneumonie, niet uitgesloten. Geen hoest.",
	"Koorts in de voorgeschiedenis, vroeger diabetes melitus.",
	"Risico op diabetes. Geen koorts maar wel hoest klachten.",
	"Prematuur ademhalingspatroon zonder koorts.",
	"Vader met dm type 2, patient zelf febriss en hoesten.",
	0
};

class Globals
{
public:
	Globals( const Pipeline* pipeline_, const std::vector<std::string>& expected_)
		:pipeline(pipeline_),expected(expected_),nofDocs(0){}

	const Pipeline* pipeline;
	std::vector<std::string> expected;
	unsigned int nofDocs;
	std::vector<std::string> errors;

public:
	void reportError( const std::string& msg)
	{
		boost::mutex::scoped_lock lock( mutex);
		errors.push_back( msg);
	}
	void accumulate( unsigned int nofDocs_)
	{
		boost::mutex::scoped_lock lock( mutex);
		nofDocs += nofDocs_;
	}

private:
	boost::mutex mutex;
};

class Task
{
public:
	Task( Globals* globals_, unsigned int offset_)
		:m_globals(globals_),m_offset(offset_){}
	Task( const Task& o)
		:m_globals(o.m_globals),m_offset(o.m_offset){}
	~Task(){}

	void run()
	{
		unsigned int nofDocs = 0;
		std::size_t nofTexts = m_globals->expected.size();
		for (unsigned int ii=0; ii<NOF_ITERATIONS; ++ii)
		{
			std::size_t didx = (m_offset + ii) % nofTexts;
			analyzer::Document doc( g_documents[ didx]);
			if (!m_globals->pipeline->process( doc))
			{
				m_globals->reportError( g_errorBuffer->hasError() ? g_errorBuffer->fetchError() : "pipeline failed");
				return;
			}
			std::string output = documentEntitiesToJson( doc, g_errorBuffer);
			if (output != m_globals->expected[ didx])
			{
				m_globals->reportError( std::string("result differs for '") + g_documents[ didx] + "': " + output);
				return;
			}
			++nofDocs;
		}
		m_globals->accumulate( nofDocs);
	}

private:
	Globals* m_globals;
	unsigned int m_offset;
};

int main( int argc, const char** argv)
{
	try
	{
		g_errorBuffer = strus::createErrorBuffer_standard( 0, NOF_THREADS+1);
		if (!g_errorBuffer)
		{
			std::cerr << "construction of error buffer failed" << std::endl;
			return -1;
		}
		else if (argc > 2)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		std::string datadir = argc > 1 ? argv[1] : "./data";

		strus::Reference<TokenizerInterface> tokenizer( createTokenizer_std( g_errorBuffer));
		strus::Reference<TokenPatternMatchInterface> tpm( createTokenPatternMatch_std( g_errorBuffer));
		if (!tokenizer.get() || !tpm.get()) throw std::runtime_error( "failed to create token pattern matcher");

		strus::Reference<EntityMatcherInterface> matcher( createEntityMatcher_std( tpm.get(), tokenizer.get(), g_errorBuffer));
		if (!matcher.get()) throw std::runtime_error( "failed to create entity matcher");
		strus::Reference<EntityMatcherInstanceInterface> concepts( matcher->createInstance());
		if (!concepts.get()
			|| !loadConceptsFile( concepts.get(), utils::joinFilePath( datadir, "concepts.csv"), g_errorBuffer)
			|| !concepts->compile())
		{
			throw std::runtime_error( "failed to load concepts");
		}
		strus::Reference<ContextRuleStoreInterface> rules( createContextRuleStore_std( tpm.get(), tokenizer.get(), g_errorBuffer));
		if (!rules.get()) throw std::runtime_error( "failed to create context rule store");
		rules->defineAttribute( analyzer::NormalizedText);
		if (!loadContextRulesFile( rules.get(), utils::joinFilePath( datadir, "context_rules.json"), g_errorBuffer)
			|| !rules->compile())
		{
			throw std::runtime_error( "failed to load context rules");
		}
		strus::Reference<QualifierDetectorInterface> detector( createContextAlgorithm_std( rules.get(), g_errorBuffer));
		if (!detector.get()) throw std::runtime_error( "failed to create context algorithm");

		Pipeline pipeline( g_errorBuffer);
		pipeline.addStage( createTokenizerStage( tokenizer.get(), g_errorBuffer))
			.addStage( createSentencizerStage_std( g_errorBuffer))
			.addStage( createEntityMatcherStage( concepts.get(), g_errorBuffer))
			.addStage( createQualifierDetectorStage( detector.get(), g_errorBuffer));
		if (g_errorBuffer->hasError()) throw std::runtime_error( "failed to build pipeline");

		// Results of a sequential run are the reference for the threads
		std::vector<std::string> expected;
		for (std::size_t di=0; g_documents[di]; ++di)
		{
			analyzer::Document doc( g_documents[di]);
			if (!pipeline.process( doc)) throw std::runtime_error( "failed to process document");
			expected.push_back( documentEntitiesToJson( doc, g_errorBuffer));
			utils::checkCondition( !doc.entities().empty(), "no entities found in '%s'", g_documents[di]);
		}

		Globals globals( &pipeline, expected);
		std::vector<Task> taskar;
		for (unsigned int ti=0; ti<NOF_THREADS; ++ti)
		{
			taskar.push_back( Task( &globals, ti));
		}
		std::cerr << "starting " << NOF_THREADS << " threads processing documents ..." << std::endl;
		{
			boost::thread_group tgroup;
			for (unsigned int ti=0; ti<NOF_THREADS; ++ti)
			{
				tgroup.create_thread( boost::bind( &Task::run, &taskar[ti]));
			}
			tgroup.join_all();
		}
		if (!globals.errors.empty())
		{
			std::vector<std::string>::const_iterator ei = globals.errors.begin(), ee = globals.errors.end();
			for (; ei != ee; ++ei)
			{
				std::cerr << "ERROR in thread: " << *ei << std::endl;
			}
			throw std::runtime_error( "errors in threads");
		}
		utils::checkCondition( globals.nofDocs == NOF_THREADS * NOF_ITERATIONS, "only %u documents processed", globals.nofDocs);
		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error( "error in concurrent pipeline");
		}
		std::cerr << "processed " << globals.nofDocs << " documents" << std::endl;
		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		if (g_errorBuffer->hasError())
		{
			std::cerr << "error in concurrent pipeline test: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error in concurrent pipeline test: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory in concurrent pipeline test" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}
