/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "clinical/lib/pattern.hpp"
#include "clinical/tokenPatternMatchInterface.hpp"
#include "clinical/tokenPatternMatchInstanceInterface.hpp"
#include "clinical/tokenPatternMatchContextInterface.hpp"
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/reference.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <cstdio>
#include <set>
#include <string>
#include <vector>

#undef CLINICAL_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

using namespace clinical;

struct PhraseDef
{
	unsigned int id;
	const char* words[8];
	analyzer::TokenAttribute attribute;
	unsigned int proximity;
	unsigned int fuzzy;
	unsigned int fuzzyMinLength;
	unsigned int results[8][2];	///< expected [ordpos,ordend) pairs, terminated by {0,0}
};

static const char* g_document[] = {"Patient","heeft","geen","hoge","koorts","en","geen","hoest",".",0};

static const PhraseDef g_phrases[] =
{
	{1, {"geen","koorts",0}, analyzer::LiteralText, 0,0,0, {{0,0}}},
	{2, {"geen","koorts",0}, analyzer::LiteralText, 1,0,0, {{2,5},{0,0}}},
	{3, {"hoest",0}, analyzer::LiteralText, 0,0,0, {{7,8},{0,0}}},
	{4, {"patient",0}, analyzer::NormalizedText, 0,0,0, {{0,1},{0,0}}},
	{5, {"Patient","heeft",0}, analyzer::LiteralText, 0,0,0, {{0,2},{0,0}}},
	{6, {"geen",0}, analyzer::LiteralText, 0,0,0, {{2,3},{6,7},{0,0}}},
	{7, {"koorts",".",0}, analyzer::LiteralText, 4,0,0, {{4,9},{0,0}}},
	{8, {"hoesten",0}, analyzer::LiteralText, 0,2,0, {{7,8},{0,0}}},
	{9, {"hoesy",0}, analyzer::LiteralText, 0,1,6, {{0,0}}},
	{10, {"hoesy",0}, analyzer::LiteralText, 0,1,0, {{7,8},{0,0}}},
	{11, {"patient",0}, analyzer::LiteralText, 0,0,0, {{0,0}}},
	{0, {0}, analyzer::LiteralText, 0,0,0, {{0,0}}}
};

static void definePhrases( TokenPatternMatchInstanceInterface* ptinst, const PhraseDef* phrases)
{
	std::size_t pi = 0;
	for (; phrases[pi].id; ++pi)
	{
		std::vector<std::string> words;
		for (std::size_t wi=0; phrases[pi].words[wi]; ++wi)
		{
			words.push_back( phrases[pi].words[wi]);
		}
		ptinst->definePhrase( phrases[pi].id, words, phrases[pi].attribute, phrases[pi].proximity, phrases[pi].fuzzy, phrases[pi].fuzzyMinLength);
	}
	if (!ptinst->compile())
	{
		throw std::runtime_error( "failed to compile phrase patterns");
	}
}

static std::vector<analyzer::TokenPatternMatchResult>
	processDocument( const TokenPatternMatchInstanceInterface* ptinst, const analyzer::Document& doc)
{
	strus::Reference<TokenPatternMatchContextInterface> mt( ptinst->createContext());
	if (!mt.get()) throw std::runtime_error( "failed to create token pattern match context");
	std::vector<analyzer::Token>::const_iterator ti = doc.tokens().begin(), te = doc.tokens().end();
	for (; ti != te; ++ti)
	{
		mt->putInput( *ti);
		if (g_errorBuffer->hasError()) throw std::runtime_error( "error feeding tokens");
	}
	std::vector<analyzer::TokenPatternMatchResult> rt = mt->fetchResults();
	if (g_errorBuffer->hasError()) throw std::runtime_error( "error fetching results");
#ifdef CLINICAL_LOWLEVEL_DEBUG
	utils::printResults( std::cout, rt);
#endif
	return rt;
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
		else if (argc > 1)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		strus::Reference<TokenPatternMatchInterface> pt( createTokenPatternMatch_std( g_errorBuffer));
		if (!pt.get()) throw std::runtime_error( "failed to create token pattern matcher");
		strus::Reference<TokenPatternMatchInstanceInterface> ptinst( pt->createInstance());
		if (!ptinst.get()) throw std::runtime_error( "failed to create token pattern matcher instance");
		definePhrases( ptinst.get(), g_phrases);

		analyzer::Document doc = utils::createDocument( g_document);
		std::vector<analyzer::TokenPatternMatchResult> results = processDocument( ptinst.get(), doc);

		// Verify results:
		typedef std::pair<unsigned int,std::pair<std::size_t,std::size_t> > Match;
		std::set<Match> matches;
		std::vector<analyzer::TokenPatternMatchResult>::const_iterator ri = results.begin(), re = results.end();
		for (; ri != re; ++ri)
		{
			matches.insert( Match( ri->id(), std::pair<std::size_t,std::size_t>( ri->ordpos(), ri->ordend())));
		}
		std::size_t pi = 0;
		for (; g_phrases[pi].id; ++pi)
		{
			std::size_t ei = 0;
			for (; g_phrases[pi].results[ei][1]; ++ei)
			{
				Match expected( g_phrases[pi].id, std::pair<std::size_t,std::size_t>( g_phrases[pi].results[ei][0], g_phrases[pi].results[ei][1]));
				std::set<Match>::iterator mi = matches.find( expected);
				if (mi == matches.end())
				{
					char msgbuf[ 256];
					::snprintf( msgbuf, sizeof(msgbuf), "expected match of phrase %u at [%u,%u) not found",
							g_phrases[pi].id, g_phrases[pi].results[ei][0], g_phrases[pi].results[ei][1]);
					throw std::runtime_error( msgbuf);
				}
				matches.erase( mi);
			}
		}
		if (!matches.empty())
		{
			std::set<Match>::const_iterator mi = matches.begin(), me = matches.end();
			for (; mi != me; ++mi)
			{
				std::cerr << "unexpected match of phrase " << mi->first << " at [" << mi->second.first << "," << mi->second.second << ")" << std::endl;
			}
			throw std::runtime_error( "more matches found than expected");
		}

		// Tokens must be fed in ascending order:
		strus::Reference<TokenPatternMatchContextInterface> mt( ptinst->createContext());
		mt->putInput( doc.tokens()[1]);
		mt->putInput( doc.tokens()[0]);
		if (!g_errorBuffer->hasError())
		{
			throw std::runtime_error( "tokens in descending order not rejected");
		}
		g_errorBuffer->fetchError();

		// Source offsets of tokens must be ascending:
		mt->reset();
		mt->putInput( doc.tokens()[1]);
		mt->putInput( analyzer::Token( "hoge", "hoge", doc.tokens()[1].ordpos()+1, doc.tokens()[0].origpos(), 4));
		if (!g_errorBuffer->hasError())
		{
			throw std::runtime_error( "tokens with descending source offsets not rejected");
		}
		g_errorBuffer->fetchError();

		// A phrase needs at least one word:
		strus::Reference<TokenPatternMatchInstanceInterface> ptinst3( pt->createInstance());
		ptinst3->definePhrase( 1, std::vector<std::string>(), analyzer::LiteralText, 0, 0, 0);
		if (!g_errorBuffer->hasError())
		{
			throw std::runtime_error( "phrase without words not rejected");
		}
		g_errorBuffer->fetchError();

		// Proximity above the configured maximum is rejected:
		strus::Reference<TokenPatternMatchInstanceInterface> ptinst2( pt->createInstance());
		ptinst2->defineOption( "maxProximity", 2);
		std::vector<std::string> words;
		words.push_back( "geen");
		words.push_back( "koorts");
		ptinst2->definePhrase( 1, words, analyzer::LiteralText, 3, 0, 0);
		if (!g_errorBuffer->hasError())
		{
			throw std::runtime_error( "proximity above maximum not rejected");
		}
		g_errorBuffer->fetchError();

		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error( "error matching phrases");
		}
		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		if (g_errorBuffer->hasError())
		{
			std::cerr << "error processing pattern matching: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error processing pattern matching: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory processing pattern matching" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}
