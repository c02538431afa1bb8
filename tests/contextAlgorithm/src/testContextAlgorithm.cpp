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
#include "clinical/contextRuleStoreInterface.hpp"
#include "clinical/qualifierDetectorInterface.hpp"
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/reference.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#undef CLINICAL_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

using namespace clinical;

static strus::Reference<TokenizerInterface> g_tokenizer;
static strus::Reference<TokenPatternMatchInterface> g_tokenPatternMatch;

/// \brief Entity to attach to a test document, identified by its token span
struct EntityDef
{
	const char* concept;
	std::size_t start;
	std::size_t end;
};

/// \brief Detection test: a text with entities and the expected qualifiers of each entity as string "Class.Value Class.Value ..."
struct DetectionTest
{
	const char* text;
	EntityDef entities[10];
	const char* expected[10];
};

static std::vector<std::string> valueList( const char* v1, const char* v2)
{
	std::vector<std::string> rt;
	rt.push_back( v1);
	rt.push_back( v2);
	return rt;
}

static analyzer::Document createDocument( const char* text, const EntityDef* entities, bool withSentences=true)
{
	analyzer::Document rt = utils::createDocument( g_tokenizer.get(), text, withSentences, g_errorBuffer);
	std::vector<analyzer::Entity> entitylist;
	for (std::size_t ei=0; entities[ei].concept; ++ei)
	{
		analyzer::Span span( entities[ei].start, entities[ei].end);
		entitylist.push_back( analyzer::Entity( entities[ei].concept, span, rt.spanText( span)));
	}
	rt.setEntities( entitylist);
	return rt;
}

static std::string qualifierString( const analyzer::Entity& entity)
{
	std::ostringstream out;
	analyzer::Entity::QualifierMap::const_iterator qi = entity.qualifiers().begin(), qe = entity.qualifiers().end();
	for (int qidx=0; qi != qe; ++qi,++qidx)
	{
		if (qidx) out << " ";
		out << qi->second.tostring();
	}
	return out.str();
}

static void runDetection( const QualifierDetectorInterface* detector, analyzer::Document& doc)
{
	if (!detector->detect( doc))
	{
		throw std::runtime_error( std::string( "qualifier detection failed for '") + doc.source() + "'");
	}
#ifdef CLINICAL_LOWLEVEL_DEBUG
	std::cout << doc.source() << std::endl;
	utils::printEntities( std::cout, doc);
#endif
}

static void runTests( const QualifierDetectorInterface* detector, const DetectionTest* tests)
{
	for (std::size_t ti=0; tests[ti].text; ++ti)
	{
		analyzer::Document doc = createDocument( tests[ti].text, tests[ti].entities);
		runDetection( detector, doc);
		std::vector<analyzer::Entity>::const_iterator ei = doc.entities().begin(), ee = doc.entities().end();
		for (std::size_t eidx=0; ei != ee; ++ei,++eidx)
		{
			std::string result = qualifierString( *ei);
			utils::checkCondition( result == tests[ti].expected[ eidx],
				"qualifiers of '%s' in '%s' are '%s', expected '%s'", ei->text().c_str(), tests[ti].text, result.c_str(), tests[ti].expected[ eidx]);
		}
	}
}

static ContextRuleStoreInterface* createStore()
{
	ContextRuleStoreInterface* rt = createContextRuleStore_std( g_tokenPatternMatch.get(), g_tokenizer.get(), g_errorBuffer);
	if (!rt) throw std::runtime_error( "failed to create context rule store");
	rt->defineAttribute( analyzer::NormalizedText);
	return rt;
}

static QualifierDetectorInterface* createDetector( ContextRuleStoreInterface* store)
{
	if (!store->compile()) throw std::runtime_error( "failed to compile context rules");
	QualifierDetectorInterface* rt = createContextAlgorithm_std( store, g_errorBuffer);
	if (!rt) throw std::runtime_error( "failed to create context algorithm");
	return rt;
}

static analyzer::Document createTwoTokenDocument( std::size_t firstOrdpos, std::size_t firstOrigpos, std::size_t secondOrigpos)
{
	analyzer::Document rt;
	rt.addToken( analyzer::Token( "geen", "geen", firstOrdpos, firstOrigpos, 4));
	rt.addToken( analyzer::Token( "hoesten", "hoesten", firstOrdpos+1, secondOrigpos, 7));
	std::vector<analyzer::Entity> entities;
	entities.push_back( analyzer::Entity( "hoesten", analyzer::Span( 1, 2), "hoesten"));
	rt.setEntities( entities);
	return rt;
}

static void expectTokenContractViolation( const QualifierDetectorInterface* detector, analyzer::Document doc, const char* expectedMessagePart)
{
	utils::checkCondition( !detector->detect( doc) && g_errorBuffer->hasError(), "invalid token sequence not rejected (expected '%s')", expectedMessagePart);
	std::string errmsg = g_errorBuffer->fetchError();
	utils::checkCondition( errmsg.find( expectedMessagePart) != std::string::npos, "unexpected error '%s', expected '%s'", errmsg.c_str(), expectedMessagePart);
	utils::checkCondition( doc.entities()[0].qualifiers().empty(), "document modified by rejected detection");
}

static void testTokenSequenceContract( const QualifierDetectorInterface* detector)
{
	analyzer::Document doc = createTwoTokenDocument( 0, 0, 5);
	runDetection( detector, doc);
	utils::checkCondition( utils::qualifierValue( doc.entities()[0], "Negation") == "Negated", "negation not detected in valid token sequence");

	// Ordinal positions counted from 1
	expectTokenContractViolation( detector, createTwoTokenDocument( 1, 0, 5), "ordinal position");
	// Source offsets in descending order
	expectTokenContractViolation( detector, createTwoTokenDocument( 0, 10, 0), "source offset");
}

static const DetectionTest g_basicTests[] =
{
	{"geen hoesten",
		{{"hoesten",1,2},{0}},
		{"Negation.Negated Presence.Present Temporality.Current"}},
	{"hoesten in de voorgeschiedenis",
		{{"hoesten",0,1},{0}},
		{"Negation.Affirmed Presence.Present Temporality.Historical"}},
	{0,{{0}},{0}}
};

static void testBasicRules()
{
	strus::Reference<ContextRuleStoreInterface> store( createStore());
	store->defineQualifierClass( analyzer::QualifierClass( "Negation", valueList( "Affirmed", "Negated"), "Affirmed"));
	store->defineQualifierClass( analyzer::QualifierClass( "Temporality", valueList( "Current", "Historical"), "Current"));
	store->defineQualifierClass( analyzer::QualifierClass( "Presence", valueList( "Present", "Absent"), "Present"));
	store->defineRule( analyzer::ContextRule( "Negation", "Negated", analyzer::ContextRule::Preceding, 5).addPattern( "geen"));
	store->defineRule( analyzer::ContextRule( "Temporality", "Historical", analyzer::ContextRule::Following).addPattern( "in de voorgeschiedenis"));
	strus::Reference<QualifierDetectorInterface> detector( createDetector( store.get()));
	runTests( detector.get(), g_basicTests);

	// Defaults are flagged as such
	analyzer::Document doc = createDocument( g_basicTests[0].text, g_basicTests[0].entities);
	runDetection( detector.get(), doc);
	const analyzer::Entity& entity = doc.entities()[0];
	utils::checkCondition( !entity.qualifier( "Negation")->isDefault() && entity.qualifier( "Temporality")->isDefault(), "default flags of qualifiers not as expected");

	testTokenSequenceContract( detector.get());
}

static const DetectionTest g_ruleFileTests[] =
{
	// higher priority wins
	{"Mogelijk geen koorts",
		{{"koorts",2,3},{0}},
		{"Experiencer.Patient Presence.Absent Temporality.Current"}},
	{"Mogelijk koorts",
		{{"koorts",1,2},{0}},
		{"Experiencer.Patient Presence.Uncertain Temporality.Current"}},
	// pseudo trigger suppresses the negation triggers it overlaps
	{"Verdenking op pneumonie, niet uitgesloten.",
		{{"pneumonie",2,3},{0}},
		{"Experiencer.Patient Presence.Uncertain Temporality.Current"}},
	// termination trigger ends the scope
	{"Geen koorts maar wel hoesten",
		{{"koorts",1,2},{"hoesten",4,5},{0}},
		{"Experiencer.Patient Presence.Absent Temporality.Current",
		 "Experiencer.Patient Presence.Present Temporality.Current"}},
	// maximum scope of 5 tokens after the trigger
	{"Geen koorts of hoofdpijn of buikpijn of hoesten",
		{{"koorts",1,2},{"hoofdpijn",3,4},{"buikpijn",5,6},{"hoesten",7,8},{0}},
		{"Experiencer.Patient Presence.Absent Temporality.Current",
		 "Experiencer.Patient Presence.Absent Temporality.Current",
		 "Experiencer.Patient Presence.Absent Temporality.Current",
		 "Experiencer.Patient Presence.Present Temporality.Current"}},
	// following trigger with a maximum scope of 3 tokens
	{"koorts, hoofdpijn en buikpijn uitgesloten",
		{{"koorts",0,1},{"hoofdpijn",2,3},{"buikpijn",4,5},{0}},
		{"Experiencer.Patient Presence.Present Temporality.Current",
		 "Experiencer.Patient Presence.Absent Temporality.Current",
		 "Experiencer.Patient Presence.Absent Temporality.Current"}},
	// scope does not cross the sentence boundary
	{"Geen koorts. Hoesten sinds gisteren.",
		{{"koorts",1,2},{"hoesten",3,4},{0}},
		{"Experiencer.Patient Presence.Absent Temporality.Current",
		 "Experiencer.Patient Presence.Present Temporality.Current"}},
	{"Moeder had diabetes, patient heeft astma.",
		{{"diabetes",2,3},{"astma",6,7},{0}},
		{"Experiencer.Family Presence.Present Temporality.Current",
		 "Experiencer.Patient Presence.Present Temporality.Current"}},
	// entity inside a trigger of its class is not qualified by it
	{"koorts in de voorgeschiedenis",
		{{"koorts",0,1},{"voorgeschiedenis",3,4},{0}},
		{"Experiencer.Patient Presence.Present Temporality.Historical",
		 "Experiencer.Patient Presence.Present Temporality.Current"}},
	{"Patient heeft risico op diabetes",
		{{"diabetes",4,5},{0}},
		{"Experiencer.Patient Presence.Present Temporality.Future"}},
	// structured trigger patterns
	{"Waarschijnlik pneumonie",
		{{"pneumonie",1,2},{0}},
		{"Experiencer.Patient Presence.Uncertain Temporality.Current"}},
	{"Patient ontkent pijn op de borst",
		{{"pijn",2,3},{0}},
		{"Experiencer.Patient Presence.Absent Temporality.Current"}},
	{"Vroeger geen astma, vader had astma",
		{{"astma",2,3},{"astma",6,7},{0}},
		{"Experiencer.Patient Presence.Absent Temporality.Historical",
		 "Experiencer.Family Presence.Absent Temporality.Current"}},
	{0,{{0}},{0}}
};

static void testRuleFile( const std::string& datadir)
{
	strus::Reference<ContextRuleStoreInterface> store( createStore());
	if (!loadContextRulesFile( store.get(), utils::joinFilePath( datadir, "context_rules.json"), g_errorBuffer))
	{
		throw std::runtime_error( "failed to load context rules");
	}
	strus::Reference<QualifierDetectorInterface> detector( createDetector( store.get()));
	runTests( detector.get(), g_ruleFileTests);

	// Repeated detection gives the same result
	for (std::size_t ti=0; g_ruleFileTests[ti].text; ++ti)
	{
		analyzer::Document doc = createDocument( g_ruleFileTests[ti].text, g_ruleFileTests[ti].entities);
		runDetection( detector.get(), doc);
		std::vector<analyzer::Entity> first = doc.entities();
		runDetection( detector.get(), doc);
		std::vector<analyzer::Entity>::const_iterator ai = first.begin(), ae = first.end();
		std::vector<analyzer::Entity>::const_iterator bi = doc.entities().begin();
		for (; ai != ae; ++ai,++bi)
		{
			utils::checkCondition( ai->qualifiers().size() == 3, "not every qualifier class assigned to '%s'", ai->text().c_str());
			utils::checkCondition( qualifierString( *ai) == qualifierString( *bi), "repeated detection differs for '%s'", g_ruleFileTests[ti].text);
		}
	}

	// A document without sentences is treated as one sentence
	EntityDef entities[] = {{"koorts",1,2},{"hoesten",3,4},{0}};
	analyzer::Document doc = createDocument( "Geen koorts. Hoesten sinds gisteren.", entities, false);
	runDetection( detector.get(), doc);
	utils::checkCondition( utils::qualifierValue( doc.entities()[1], "Presence") == "Absent", "document without sentences not processed as one sentence");

	// An entity crossing a sentence boundary is rejected and the document stays unchanged
	EntityDef crossing[] = {{"koorts",1,2},{"koorts_hoesten",1,4},{0}};
	analyzer::Document bad = createDocument( "Geen koorts. Hoesten sinds gisteren.", crossing);
	utils::checkCondition( !detector->detect( bad) && g_errorBuffer->hasError(), "entity crossing a sentence boundary not rejected");
	g_errorBuffer->fetchError();
	utils::checkCondition( bad.entities()[0].qualifiers().empty(), "document modified by a failed detection");
}

static void testScopeBoundaries()
{
	strus::Reference<ContextRuleStoreInterface> store( createStore());
	store->defineQualifierClass( analyzer::QualifierClass( "Presence", valueList( "Present", "Absent"), "Present"));
	store->defineQualifierClass( analyzer::QualifierClass( "Experiencer", valueList( "Patient", "Family"), "Patient"));
	store->defineRule( analyzer::ContextRule( "Presence", "Absent", analyzer::ContextRule::Following).addPattern( "uitgesloten"));
	store->defineRule( analyzer::ContextRule( "Presence", "Absent", analyzer::ContextRule::Termination).addPattern( "maar"));
	store->defineRule( analyzer::ContextRule( "Experiencer", "Family", analyzer::ContextRule::Bidirectional, 3).addPattern( "familie"));
	store->defineRule( analyzer::ContextRule( "Experiencer", "Family", analyzer::ContextRule::Termination).addPattern( "zelf"));
	strus::Reference<QualifierDetectorInterface> detector( createDetector( store.get()));

	static const DetectionTest tests[] =
	{
		// termination cuts the backward scope of a following trigger
		{"hoesten maar koorts uitgesloten",
			{{"hoesten",0,1},{"koorts",2,3},{0}},
			{"Experiencer.Patient Presence.Present",
			 "Experiencer.Patient Presence.Absent"}},
		// maximum scope of 3 tokens on both sides of a bidirectional trigger
		{"astma hoesten koorts jeuk familie pijn griep buikpijn hoofdpijn",
			{{"astma",0,1},{"hoesten",1,2},{"koorts",2,3},{"jeuk",3,4},{"pijn",5,6},{"griep",6,7},{"buikpijn",7,8},{"hoofdpijn",8,9},{0}},
			{"Experiencer.Patient Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Patient Presence.Present"}},
		// termination cuts both scopes of a bidirectional trigger
		{"astma zelf hoesten familie koorts zelf pijn",
			{{"astma",0,1},{"hoesten",2,3},{"koorts",4,5},{"pijn",6,7},{0}},
			{"Experiencer.Patient Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Family Presence.Present",
			 "Experiencer.Patient Presence.Present"}},
		{0,{{0}},{0}}
	};
	runTests( detector.get(), tests);
}

static void testTieBreak()
{
	analyzer::QualifierClass experiencer( "Experiencer", valueList( "Patient", "Family"), "Patient");
	experiencer.definePriority( "Patient", 0);
	experiencer.definePriority( "Family", 0);
	strus::Reference<ContextRuleStoreInterface> store( createStore());
	store->defineQualifierClass( experiencer);
	store->defineRule( analyzer::ContextRule( "Experiencer", "Family", analyzer::ContextRule::Preceding).addPattern( "vader"));
	store->defineRule( analyzer::ContextRule( "Experiencer", "Patient", analyzer::ContextRule::Bidirectional).addPattern( "zelf"));
	strus::Reference<QualifierDetectorInterface> detector( createDetector( store.get()));

	static const DetectionTest tests[] =
	{
		// closer trigger wins on equal priority
		{"vader en zelf griep", {{"griep",3,4},{0}}, {"Experiencer.Patient"}},
		{"zelf en vader griep", {{"griep",3,4},{0}}, {"Experiencer.Family"}},
		// equal distance, earlier trigger in scan order wins
		{"vader griep zelf", {{"griep",1,2},{0}}, {"Experiencer.Family"}},
		{0,{{0}},{0}}
	};
	runTests( detector.get(), tests);
}

static void testComposition()
{
	strus::Reference<ContextRuleStoreInterface> negationStore( createStore());
	negationStore->defineQualifierClass( analyzer::QualifierClass( "Negation", valueList( "Affirmed", "Negated"), "Affirmed"));
	negationStore->defineRule( analyzer::ContextRule( "Negation", "Negated", analyzer::ContextRule::Preceding, 5).addPattern( "geen"));
	strus::Reference<QualifierDetectorInterface> negation( createDetector( negationStore.get()));

	strus::Reference<ContextRuleStoreInterface> emptyStore( createStore());
	emptyStore->defineQualifierClass( analyzer::QualifierClass( "Temporality", valueList( "Current", "Historical"), "Current"));
	strus::Reference<QualifierDetectorInterface> temporality( createDetector( emptyStore.get()));

	EntityDef entities[] = {{"koorts",1,2},{0}};
	analyzer::Document doc = createDocument( "Geen koorts", entities);
	runDetection( negation.get(), doc);
	runDetection( temporality.get(), doc);
	utils::checkCondition( qualifierString( doc.entities()[0]) == "Negation.Negated Temporality.Current", "qualifiers of detectors do not compose: %s", qualifierString( doc.entities()[0]).c_str());
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

		testBasicRules();
		testRuleFile( datadir);
		testScopeBoundaries();
		testTieBreak();
		testComposition();

		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error( "error detecting qualifiers");
		}
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
			std::cerr << "error in context algorithm test: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error in context algorithm test: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory in context algorithm test" << std::endl;
	}
	g_tokenPatternMatch.reset();
	g_tokenizer.reset();
	delete g_errorBuffer;
	return -1;
}
