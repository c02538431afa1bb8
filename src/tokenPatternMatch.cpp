/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the matcher of phrases, fuzzy phrases and structured patterns on token sequences
/// \file "tokenPatternMatch.cpp"
#include "tokenPatternMatch.hpp"
#include "tokenRegexMatch.hpp"
#include "editDistance.hpp"
#include "unicodeUtils.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "clinical/tokenPatternMatchInstanceInterface.hpp"
#include "clinical/tokenPatternMatchContextInterface.hpp"
#include "clinical/analyzer/tokenPatternMatchResult.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "strus/base/symbolTable.hpp"
#include "strus/base/string_conv.hpp"
#include <boost/unordered_map.hpp>
#include <boost/dynamic_bitset.hpp>
#include <vector>
#include <set>
#include <limits>
#include <algorithm>
#include <cmath>

#define CLINICAL_DBGTRACE_COMPONENT_NAME "pattern"
#define DEBUG_EVENT1( NAME, FMT, X1)                            if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1);
#define DEBUG_EVENT2( NAME, FMT, X1, X2)                        if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2);
#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)                    if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3);
#define DEBUG_EVENT4( NAME, FMT, X1, X2, X3, X4)                if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3, X4);

using namespace clinical;

/// \brief One position of a compiled pattern
struct PatternNode
{
	enum Type {Any, Equal, In, NotIn, Regex, Fuzzy};

	Type type;
	analyzer::TokenAttribute attribute;
	analyzer::TokenConstraint::Quantifier quantifier;
	std::vector<uint32_t> symbols;		///< sorted symbol identifiers for Equal, In and NotIn
	unsigned int regexidx;			///< index of the expression in the regex table for Regex
	CodePointString chars;			///< characters of the word for Fuzzy
	unsigned int maxdist;			///< maximum edit distance for Fuzzy

	explicit PatternNode( Type type_=Any, analyzer::TokenAttribute attribute_=analyzer::LiteralText, analyzer::TokenConstraint::Quantifier quantifier_=analyzer::TokenConstraint::One)
		:type(type_),attribute(attribute_),quantifier(quantifier_),symbols(),regexidx(0),chars(),maxdist(0){}
	PatternNode( const PatternNode& o)
		:type(o.type),attribute(o.attribute),quantifier(o.quantifier),symbols(o.symbols),regexidx(o.regexidx),chars(o.chars),maxdist(o.maxdist){}

	bool skippable() const
	{
		return quantifier == analyzer::TokenConstraint::Optional || quantifier == analyzer::TokenConstraint::ZeroOrMore;
	}
	bool repeatable() const
	{
		return quantifier == analyzer::TokenConstraint::ZeroOrMore || quantifier == analyzer::TokenConstraint::OneOrMore;
	}
};

struct PatternProgram
{
	unsigned int id;
	std::vector<PatternNode> nodes;

	explicit PatternProgram( unsigned int id_)
		:id(id_),nodes(){}
	PatternProgram( const PatternProgram& o)
		:id(o.id),nodes(o.nodes){}
};

struct TokenPatternMatchData
{
	typedef boost::unordered_map<uint32_t,std::vector<std::size_t> > KeyEventMap;

	strus::SymbolTable symbolTable;
	TokenRegexTable regexTable;
	std::vector<PatternProgram> programs;
	KeyEventMap keyEventMap[2];			///< symbol of the first node per attribute -> programs starting with it
	std::vector<std::size_t> scanAlways;		///< programs without a key symbol, tried at every position
	bool hasFuzzy;
	bool compiled;
	unsigned int maxProximity;
	unsigned int maxFuzzy;

	TokenPatternMatchData()
		:symbolTable(),regexTable(),programs(),scanAlways(),hasFuzzy(false),compiled(false),maxProximity(16),maxFuzzy(4){}

private:
	TokenPatternMatchData( const TokenPatternMatchData&){}	///... non copyable
	void operator=( const TokenPatternMatchData&){}		///... non copyable
};

/// \brief Token fed to the context with the data needed for evaluating the nodes
struct TokenRecord
{
	std::size_t ordpos;
	std::size_t origpos;
	std::size_t origend;
	uint32_t symbol[2];
	std::vector<unsigned int> regexmatches[2];
	CodePointString chars[2];

	TokenRecord()
		:ordpos(0),origpos(0),origend(0)
	{
		symbol[0] = 0;
		symbol[1] = 0;
	}
};

static bool nodeMatches( const PatternNode& node, const TokenRecord& token)
{
	bool rt = false;
	int attr = (int)node.attribute;
	switch (node.type)
	{
		case PatternNode::Any:
			rt = true;
			break;
		case PatternNode::Equal:
		case PatternNode::In:
			rt = token.symbol[ attr] && std::binary_search( node.symbols.begin(), node.symbols.end(), token.symbol[ attr]);
			break;
		case PatternNode::NotIn:
			rt = !token.symbol[ attr] || !std::binary_search( node.symbols.begin(), node.symbols.end(), token.symbol[ attr]);
			break;
		case PatternNode::Regex:
			rt = std::binary_search( token.regexmatches[ attr].begin(), token.regexmatches[ attr].end(), node.regexidx);
			break;
		case PatternNode::Fuzzy:
			rt = withinEditDistance( node.chars, token.chars[ attr], node.maxdist);
			break;
	}
	return node.quantifier == analyzer::TokenConstraint::Negation ? !rt : rt;
}

/// \brief Add the states reachable without consuming a token
static void closeStates( boost::dynamic_bitset<>& states, const std::vector<PatternNode>& nodes)
{
	std::size_t ni = 0, ne = nodes.size();
	for (; ni != ne; ++ni)
	{
		if (states.test( ni) && nodes[ ni].skippable())
		{
			states.set( ni+1);
		}
	}
}

struct MatchKey
{
	std::size_t ordpos;
	std::size_t ordend;
	unsigned int id;

	MatchKey( std::size_t ordpos_, std::size_t ordend_, unsigned int id_)
		:ordpos(ordpos_),ordend(ordend_),id(id_){}
	MatchKey( const MatchKey& o)
		:ordpos(o.ordpos),ordend(o.ordend),id(o.id){}

	bool operator<( const MatchKey& o) const
	{
		if (ordpos != o.ordpos) return ordpos < o.ordpos;
		if (ordend != o.ordend) return ordend < o.ordend;
		return id < o.id;
	}
};

class TokenPatternMatchContext
	:public TokenPatternMatchContextInterface
{
public:
	TokenPatternMatchContext( const TokenPatternMatchData* data_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_)
		,m_debugtrace(0)
		,m_data(data_)
		,m_regexScanner(0)
		,m_tokens()
	{
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) m_debugtrace = dbgi->createTraceContext( CLINICAL_DBGTRACE_COMPONENT_NAME);
		if (m_data->regexTable.size())
		{
			m_regexScanner = new TokenRegexScanner( &m_data->regexTable);
		}
	}

	virtual ~TokenPatternMatchContext()
	{
		if (m_debugtrace) delete m_debugtrace;
		if (m_regexScanner) delete m_regexScanner;
	}

	virtual void putInput( const analyzer::Token& token)
	{
		try
		{
			DEBUG_EVENT2( "input", "ordpos=%u value='%s'", (unsigned int)token.ordpos(), token.literal().c_str())
			if (!m_tokens.empty() && m_tokens.back().ordpos >= token.ordpos())
			{
				throw logic_error( _TXT("tokens not fed in ascending order (%u >= %u)"), (unsigned int)m_tokens.back().ordpos, (unsigned int)token.ordpos());
			}
			if (!m_tokens.empty() && m_tokens.back().origend > token.origpos())
			{
				throw logic_error( _TXT("source offset %u of token overlaps or precedes the previous token ending at %u"), (unsigned int)token.origpos(), (unsigned int)m_tokens.back().origend);
			}
			m_tokens.push_back( TokenRecord());
			TokenRecord& rec = m_tokens.back();
			rec.ordpos = token.ordpos();
			rec.origpos = token.origpos();
			rec.origend = token.origend();
			rec.symbol[ analyzer::LiteralText] = m_data->symbolTable.get( token.literal());
			rec.symbol[ analyzer::NormalizedText] = m_data->symbolTable.get( token.normalized());
			if (m_regexScanner)
			{
				m_regexScanner->match( rec.regexmatches[ analyzer::LiteralText], token.literal());
				if (token.normalized() == token.literal())
				{
					rec.regexmatches[ analyzer::NormalizedText] = rec.regexmatches[ analyzer::LiteralText];
				}
				else
				{
					m_regexScanner->match( rec.regexmatches[ analyzer::NormalizedText], token.normalized());
				}
			}
			if (m_data->hasFuzzy)
			{
				rec.chars[ analyzer::LiteralText] = decodeUtf8( token.literal());
				rec.chars[ analyzer::NormalizedText] = decodeUtf8( token.normalized());
			}
		}
		CATCH_ERROR_MAP( _TXT("failed to feed input to token pattern matcher: %s"), *m_errorhnd);
	}

	virtual std::vector<analyzer::TokenPatternMatchResult> fetchResults() const
	{
		try
		{
			std::set<MatchKey> matches;
			std::size_t ti = 0, te = m_tokens.size();
			for (; ti != te; ++ti)
			{
				const TokenRecord& token = m_tokens[ ti];
				int ai = 0;
				for (; ai < 2; ++ai)
				{
					if (!token.symbol[ ai]) continue;
					TokenPatternMatchData::KeyEventMap::const_iterator
						ki = m_data->keyEventMap[ ai].find( token.symbol[ ai]);
					if (ki != m_data->keyEventMap[ ai].end())
					{
						runPrograms( matches, ki->second, ti);
					}
				}
				runPrograms( matches, m_data->scanAlways, ti);
			}
			std::vector<analyzer::TokenPatternMatchResult> rt;
			rt.reserve( matches.size());
			std::set<MatchKey>::const_iterator mi = matches.begin(), me = matches.end();
			for (; mi != me; ++mi)
			{
				const TokenRecord& first = m_tokens[ mi->ordpos];
				const TokenRecord& last = m_tokens[ mi->ordend-1];
				DEBUG_EVENT3( "result", "id=%u ordpos=%u ordend=%u", mi->id, (unsigned int)first.ordpos, (unsigned int)last.ordpos+1)
				rt.push_back( analyzer::TokenPatternMatchResult( mi->id, first.ordpos, last.ordpos+1, first.origpos, last.origend));
			}
			return rt;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to fetch token pattern match results: %s"), *m_errorhnd, std::vector<analyzer::TokenPatternMatchResult>());
	}

	virtual void reset()
	{
		m_tokens.clear();
	}

private:
	void runPrograms( std::set<MatchKey>& matches, const std::vector<std::size_t>& programs, std::size_t start) const
	{
		std::vector<std::size_t>::const_iterator pi = programs.begin(), pe = programs.end();
		for (; pi != pe; ++pi)
		{
			runProgram( matches, m_data->programs[ *pi], start);
		}
	}

	/// \brief Simulate all alternatives of a program in parallel from a start index, recording every non empty match (indices into m_tokens)
	void runProgram( std::set<MatchKey>& matches, const PatternProgram& program, std::size_t start) const
	{
		const std::vector<PatternNode>& nodes = program.nodes;
		std::size_t accept = nodes.size();
		boost::dynamic_bitset<> states( accept+1);
		boost::dynamic_bitset<> next( accept+1);
		states.set( 0);
		closeStates( states, nodes);

		std::size_t ti = start, te = m_tokens.size();
		for (; ti != te && states.any(); ++ti)
		{
			const TokenRecord& token = m_tokens[ ti];
			next.reset();
			std::size_t ni = 0;
			for (; ni != accept; ++ni)
			{
				if (!states.test( ni)) continue;
				const PatternNode& node = nodes[ ni];
				if (nodeMatches( node, token))
				{
					if (node.repeatable()) next.set( ni);
					next.set( ni+1);
				}
			}
			closeStates( next, nodes);
			if (next.test( accept))
			{
				matches.insert( MatchKey( start, ti+1, program.id));
				next.reset( accept);
			}
			states.swap( next);
		}
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	const TokenPatternMatchData* m_data;
	TokenRegexScanner* m_regexScanner;
	std::vector<TokenRecord> m_tokens;
};


/// \brief Interface for building the set of token patterns
class TokenPatternMatchInstance
	:public TokenPatternMatchInstanceInterface
{
public:
	explicit TokenPatternMatchInstance( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_debugtrace(0),m_data()
	{
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) m_debugtrace = dbgi->createTraceContext( CLINICAL_DBGTRACE_COMPONENT_NAME);
	}

	virtual ~TokenPatternMatchInstance()
	{
		if (m_debugtrace) delete m_debugtrace;
	}

	virtual void defineOption( const std::string& name, double value)
	{
		try
		{
			if (value < 0.0)
			{
				throw configuration_error( strus::ErrorCodeValueOutOfRange, _TXT("negative value for token pattern match option '%s'"), name.c_str());
			}
			if (strus::caseInsensitiveEquals( name, "maxProximity"))
			{
				m_data.maxProximity = (unsigned int)(value + std::numeric_limits<double>::epsilon());
			}
			else if (strus::caseInsensitiveEquals( name, "maxFuzzy"))
			{
				m_data.maxFuzzy = (unsigned int)(value + std::numeric_limits<double>::epsilon());
			}
			else
			{
				throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown token pattern match option: '%s'"), name.c_str());
			}
		}
		CATCH_ERROR_MAP( _TXT("failed to define token pattern match option: %s"), *m_errorhnd);
	}

	virtual void definePhrase(
			unsigned int id,
			const std::vector<std::string>& words,
			analyzer::TokenAttribute attribute,
			unsigned int proximity,
			unsigned int fuzzy,
			unsigned int fuzzyMinLength)
	{
		try
		{
			checkDefinition( id);
			if (words.empty())
			{
				throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("phrase pattern %u without words"), id);
			}
			if (proximity > m_data.maxProximity)
			{
				throw configuration_error( strus::ErrorCodeValueOutOfRange, _TXT("proximity %u of phrase pattern %u exceeds the maximum %u"), proximity, id, m_data.maxProximity);
			}
			if (fuzzy > m_data.maxFuzzy)
			{
				throw configuration_error( strus::ErrorCodeValueOutOfRange, _TXT("fuzzy edit distance %u of phrase pattern %u exceeds the maximum %u"), fuzzy, id, m_data.maxFuzzy);
			}
			PatternProgram program( id);
			std::vector<std::string>::const_iterator wi = words.begin(), we = words.end();
			for (int widx=0; wi != we; ++wi,++widx)
			{
				if (wi->empty())
				{
					throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("empty word in phrase pattern %u"), id);
				}
				if (widx)
				{
					program.nodes.insert( program.nodes.end(), proximity, PatternNode( PatternNode::Any, attribute, analyzer::TokenConstraint::Optional));
				}
				if (fuzzy > 0 && utf8Length( *wi) >= fuzzyMinLength)
				{
					PatternNode node( PatternNode::Fuzzy, attribute);
					node.chars = decodeUtf8( *wi);
					node.maxdist = fuzzy;
					program.nodes.push_back( node);
					m_data.hasFuzzy = true;
				}
				else
				{
					PatternNode node( PatternNode::Equal, attribute);
					node.symbols.push_back( getOrCreateSymbol( *wi));
					program.nodes.push_back( node);
				}
			}
			m_data.programs.push_back( program);
			DEBUG_EVENT4( "phrase", "id=%u words=%u proximity=%u fuzzy=%u", id, (unsigned int)words.size(), proximity, fuzzy)
		}
		CATCH_ERROR_MAP( _TXT("failed to define phrase pattern: %s"), *m_errorhnd);
	}

	virtual void definePattern( unsigned int id, const analyzer::TokenPattern& pattern)
	{
		try
		{
			checkDefinition( id);
			if (pattern.empty())
			{
				throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("structured pattern %u without token constraints"), id);
			}
			PatternProgram program( id);
			analyzer::TokenPattern::const_iterator ci = pattern.begin(), ce = pattern.end();
			for (; ci != ce; ++ci)
			{
				program.nodes.push_back( createNode( id, *ci));
			}
			m_data.programs.push_back( program);
			DEBUG_EVENT2( "pattern", "id=%u size=%u", id, (unsigned int)pattern.size())
		}
		CATCH_ERROR_MAP( _TXT("failed to define structured pattern: %s"), *m_errorhnd);
	}

	virtual bool compile()
	{
		try
		{
			if (m_data.compiled)
			{
				throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("token patterns already compiled"));
			}
			m_data.regexTable.compile();

			std::vector<PatternProgram>::const_iterator pi = m_data.programs.begin(), pe = m_data.programs.end();
			for (std::size_t pidx=0; pi != pe; ++pi,++pidx)
			{
				const PatternNode& first = pi->nodes[0];
				if (first.quantifier != analyzer::TokenConstraint::One
					|| (first.type != PatternNode::Equal && first.type != PatternNode::In))
				{
					m_data.scanAlways.push_back( pidx);
					continue;
				}
				std::vector<uint32_t>::const_iterator si = first.symbols.begin(), se = first.symbols.end();
				for (; si != se; ++si)
				{
					m_data.keyEventMap[ first.attribute][ *si].push_back( pidx);
				}
			}
			m_data.compiled = true;
			DEBUG_EVENT3( "compile", "programs=%u scanAlways=%u regex=%u", (unsigned int)m_data.programs.size(), (unsigned int)m_data.scanAlways.size(), (unsigned int)m_data.regexTable.size())
			return true;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to compile token patterns: %s"), *m_errorhnd, false);
	}

	virtual TokenPatternMatchContextInterface* createContext() const
	{
		try
		{
			if (!m_data.compiled)
			{
				throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("token patterns not compiled"));
			}
			return new TokenPatternMatchContext( &m_data, m_errorhnd);
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to create token pattern match context: %s"), *m_errorhnd, 0);
	}

private:
	void checkDefinition( unsigned int id) const
	{
		if (m_data.compiled)
		{
			throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("pattern %u defined after compile"), id);
		}
		if (!id)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("pattern identifier 0 is not allowed"));
		}
	}

	uint32_t getOrCreateSymbol( const std::string& value)
	{
		uint32_t rt = m_data.symbolTable.getOrCreate( value);
		if (!rt) throw std::bad_alloc();
		return rt;
	}

	static const std::string& singleValue( unsigned int id, const analyzer::TokenConstraint& constraint)
	{
		if (constraint.values().size() != 1)
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("expected exactly one value in token constraint of pattern %u"), id);
		}
		return constraint.values()[0];
	}

	PatternNode createNode( unsigned int id, const analyzer::TokenConstraint& constraint)
	{
		PatternNode rt( PatternNode::Any, constraint.attribute(), constraint.quantifier());
		switch (constraint.type())
		{
			case analyzer::TokenConstraint::MatchAny:
				break;
			case analyzer::TokenConstraint::MatchEqual:
				rt.type = PatternNode::Equal;
				rt.symbols.push_back( getOrCreateSymbol( singleValue( id, constraint)));
				break;
			case analyzer::TokenConstraint::MatchIn:
			case analyzer::TokenConstraint::MatchNotIn:
			{
				rt.type = constraint.type() == analyzer::TokenConstraint::MatchIn ? PatternNode::In : PatternNode::NotIn;
				std::vector<std::string>::const_iterator vi = constraint.values().begin(), ve = constraint.values().end();
				for (; vi != ve; ++vi)
				{
					rt.symbols.push_back( getOrCreateSymbol( *vi));
				}
				std::sort( rt.symbols.begin(), rt.symbols.end());
				rt.symbols.erase( std::unique( rt.symbols.begin(), rt.symbols.end()), rt.symbols.end());
				break;
			}
			case analyzer::TokenConstraint::MatchRegex:
				rt.type = PatternNode::Regex;
				rt.regexidx = m_data.regexTable.define( singleValue( id, constraint));
				break;
			case analyzer::TokenConstraint::MatchFuzzy:
			{
				const std::string& word = singleValue( id, constraint);
				rt.type = PatternNode::Fuzzy;
				rt.chars = decodeUtf8( word);
				if (constraint.maxEditDistance())
				{
					if (constraint.maxEditDistance() > m_data.maxFuzzy)
					{
						throw configuration_error( strus::ErrorCodeValueOutOfRange, _TXT("fuzzy edit distance %u in pattern %u exceeds the maximum %u"), constraint.maxEditDistance(), id, m_data.maxFuzzy);
					}
					rt.maxdist = constraint.maxEditDistance();
				}
				else
				{
					unsigned int dist = (unsigned int)std::floor( 0.3 * (double)rt.chars.size() + 0.5);
					rt.maxdist = std::min( std::max( 2U, dist), m_data.maxFuzzy);
				}
				m_data.hasFuzzy = true;
				break;
			}
		}
		return rt;
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	TokenPatternMatchData m_data;
};


std::vector<std::string> TokenPatternMatch::getCompileOptionNames() const
{
	std::vector<std::string> rt;
	static const char* ar[] = {"maxProximity","maxFuzzy",0};
	for (std::size_t ai=0; ar[ai]; ++ai)
	{
		rt.push_back( ar[ ai]);
	}
	return rt;
}

TokenPatternMatchInstanceInterface* TokenPatternMatch::createInstance() const
{
	try
	{
		return new TokenPatternMatchInstance( m_errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to create token pattern match instance: %s"), *m_errorhnd, 0);
}

const char* TokenPatternMatch::getDescription() const
{
	return _TXT( "matcher of phrases, fuzzy phrases and structured patterns on token sequences");
}

