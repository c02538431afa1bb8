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
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/reference.hpp"
#include "strus/base/local_ptr.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <cstring>
#include <string>
#include <vector>

#undef CLINICAL_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

using namespace clinical;

static strus::Reference<TokenizerInterface> g_tokenizer;
static strus::Reference<TokenPatternMatchInterface> g_tokenPatternMatch;
static strus::Reference<EntityMatcherInterface> g_entityMatcher;

static const char* g_text =
	"Patient heeft koorts en hoest. Bekend met diabetes melitus.\n"
	"Geen prematuur ademhalingspatroon, wel febriss.";

struct ExpectedEntity
{
	const char* concept;
	std::size_t start;
	std::size_t end;
	const char* text;
};

static const ExpectedEntity g_expected[] =
{
	{"koorts", 2, 3, "koorts"},
	{"hoesten", 4, 5, "hoest"},
	{"diabetes", 8, 9, "diabetes"},
	{"diabetes", 8, 10, "diabetes melitus"},
	{"koorts", 16, 17, "febriss"},
	{0,0,0,0}
};

static EntityMatcherInstanceInterface* loadMatcher( const std::string& filename)
{
	strus::local_ptr<EntityMatcherInstanceInterface> rt( g_entityMatcher->createInstance());
	if (!rt.get()) throw std::runtime_error( "failed to create entity matcher instance");
	if (!loadConceptsFile( rt.get(), filename, g_errorBuffer))
	{
		throw std::runtime_error( std::string( "failed to load concepts from ") + filename);
	}
	if (!rt->compile())
	{
		throw std::runtime_error( std::string( "failed to compile concepts from ") + filename);
	}
	return rt.release();
}

static void checkEntities( const EntityMatcherInstanceInterface* matcher, const char* source)
{
	analyzer::Document doc = utils::createDocument( g_tokenizer.get(), g_text, true, g_errorBuffer);
	doc.setEntities( matcher->match( doc));
	if (g_errorBuffer->hasError()) throw std::runtime_error( "error matching entities");
#ifdef CLINICAL_LOWLEVEL_DEBUG
	utils::printEntities( std::cout, doc);
#endif
	std::size_t ei = 0;
	for (; g_expected[ei].concept; ++ei)
	{
		utils::checkCondition( ei < doc.entities().size(), "entity %u missing with concepts from %s", (unsigned int)ei, source);
		const analyzer::Entity& entity = doc.entities()[ ei];
		utils::checkCondition(
			entity.concept() == g_expected[ei].concept && entity.start() == g_expected[ei].start
			&& entity.end() == g_expected[ei].end && entity.text() == g_expected[ei].text,
			"unexpected entity %s with concepts from %s", utils::entityToString( entity).c_str(), source);
	}
	utils::checkCondition( ei == doc.entities().size(), "%u entities more than expected with concepts from %s", (unsigned int)(doc.entities().size() - ei), source);
}

static void expectLoadError( const char* source, bool csv, const char* expectedMessagePart)
{
	strus::Reference<EntityMatcherInstanceInterface> matcher( g_entityMatcher->createInstance());
	bool success = csv
		? loadConceptsCsv( matcher.get(), source, g_errorBuffer)
		: loadConceptsJson( matcher.get(), source, g_errorBuffer);
	utils::checkCondition( !success && g_errorBuffer->hasError(), "invalid concept definitions not rejected: %s", source);
	const char* msg = g_errorBuffer->fetchError();
	utils::checkCondition( msg && std::strstr( msg, expectedMessagePart) != 0, "error message '%s' does not contain '%s'", msg ? msg : "", expectedMessagePart);
}

int main( int argc, const char** argv)
{
	try
	{
		g_errorBuffer = strus::createErrorBuffer_standard( 0, 1);
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

		g_tokenizer.reset( createTokenizer_std( g_errorBuffer));
		g_tokenPatternMatch.reset( createTokenPatternMatch_std( g_errorBuffer));
		if (!g_tokenizer.get() || !g_tokenPatternMatch.get()) throw std::runtime_error( "failed to create token pattern matcher");
		g_entityMatcher.reset( createEntityMatcher_std( g_tokenPatternMatch.get(), g_tokenizer.get(), g_errorBuffer));
		if (!g_entityMatcher.get()) throw std::runtime_error( "failed to create entity matcher");

		strus::Reference<EntityMatcherInstanceInterface> jsonMatcher( loadMatcher( utils::joinFilePath( datadir, "concepts.json")));
		checkEntities( jsonMatcher.get(), "JSON");
		strus::Reference<EntityMatcherInstanceInterface> csvMatcher( loadMatcher( utils::joinFilePath( datadir, "concepts.csv")));
		checkEntities( csvMatcher.get(), "CSV");

		expectLoadError( "{\"koorts\": [\"koorts\",}", false, "syntax");
		expectLoadError( "{\"koorts\": \"koorts\"}", false, "list of terms expected");
		expectLoadError( "{\"koorts\": [{\"phrase\": \"koorts\", \"fuzy\": 1}]}", false, "fuzy");
		expectLoadError( "{\"koorts\": [{\"phrase\": \"koorts\", \"attr\": \"LEMMA\"}]}", false, "LEMMA");
		expectLoadError( "{\"koorts\": [[{\"NORM\": {\"LIKE\": \"koorts\"}}]]}", false, "LIKE");
		expectLoadError( "concept,phrase,fuzzy\nkoorts,koorts,\nkoorts,febris,x\n", true, "line 3");
		expectLoadError( "concept,comment\nkoorts,koorts\n", true, "'phrase'");
		expectLoadError( "concept,phrase,phrase\nkoorts,koorts,koorts\n", true, "duplicate column");
		expectLoadError( "concept,phrase,pseudo\nprematuriteit,prematuur,perhaps\n", true, "perhaps");
		expectLoadError( "concept,phrase,fuzy\nkoorts,febris,1\n", true, "perhaps 'fuzzy'");
		expectLoadError( "concept,phrase,synonym\nkoorts,febris,koorts\n", true, "unknown column 'synonym'");
		expectLoadError( "concept,phrase,proximity\nkoorts,koorts,5000000000\n", true, "out of range");
		expectLoadError( "concept,phrase,fuzzy\nkoorts,koorts,4294967296\n", true, "out of range");
		expectLoadError( "{\"koorts\": [{\"phrase\": \"koorts\", \"proximity\": 5000000000}]}", false, "'proximity' out of range");
		expectLoadError( "{\"koorts\": [{\"phrase\": \"koorts\", \"fuzzy\": -1}]}", false, "non negative integer");

		strus::Reference<EntityMatcherInstanceInterface> matcher( g_entityMatcher->createInstance());
		utils::checkCondition( !loadConceptsFile( matcher.get(), utils::joinFilePath( datadir, "concepts.txt"), g_errorBuffer), "unknown concept file format not rejected");
		g_errorBuffer->fetchError();
		utils::checkCondition( !loadConceptsFile( matcher.get(), utils::joinFilePath( datadir, "nonexistent.json"), g_errorBuffer), "missing concept file not reported");
		g_errorBuffer->fetchError();

		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error( "error loading concepts");
		}
		g_entityMatcher.reset();
		g_tokenPatternMatch.reset();
		g_tokenizer.reset();
		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		if (g_errorBuffer->hasError())
		{
			std::cerr << "error in concept loader test: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error in concept loader test: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory in concept loader test" << std::endl;
	}
	g_entityMatcher.reset();
	g_tokenPatternMatch.reset();
	g_tokenizer.reset();
	delete g_errorBuffer;
	return -1;
}
