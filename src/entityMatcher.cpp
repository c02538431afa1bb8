/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of the matcher of concept dictionary entities
/// \file "entityMatcher.cpp"
#include "entityMatcher.hpp"
#include "termPatterns.hpp"
#include "unicodeUtils.hpp"
#include "documentChecks.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "clinical/entityMatcherInstanceInterface.hpp"
#include "clinical/tokenPatternMatchInterface.hpp"
#include "clinical/tokenPatternMatchInstanceInterface.hpp"
#include "clinical/tokenPatternMatchContextInterface.hpp"
#include "clinical/tokenizerInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "strus/reference.hpp"
#include "strus/base/string_conv.hpp"
#include <map>
#include <set>
#include <limits>
#include <algorithm>

#define CLINICAL_DBGTRACE_COMPONENT_NAME "entity"
#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)                    if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3);
#define DEBUG_EVENT4( NAME, FMT, X1, X2, X3, X4)                if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3, X4);

using namespace clinical;

/// \brief Term added to a concept, the index of a term plus one is the identifier of its pattern
struct ConceptTerm
{
	std::size_t conceptidx;
	analyzer::Term term;

	ConceptTerm( std::size_t conceptidx_, const analyzer::Term& term_)
		:conceptidx(conceptidx_),term(term_){}
	ConceptTerm( const ConceptTerm& o)
		:conceptidx(o.conceptidx),term(o.term){}
};

struct EntityMatcherData
{
	std::vector<std::string> concepts;
	std::map<std::string,std::size_t> conceptmap;
	std::vector<ConceptTerm> terms;
	std::vector<bool> pseudoflags;			///< per term, evaluated at compile time
	TermDefaults defaults;
	bool resolveOverlap;
	bool pseudoOverlap;
	strus::Reference<TokenPatternMatchInstanceInterface> patterns;

	EntityMatcherData()
		:concepts(),conceptmap(),terms(),pseudoflags(),defaults(),resolveOverlap(false),pseudoOverlap(true),patterns(){}

private:
	EntityMatcherData( const EntityMatcherData&){}	///... non copyable
	void operator=( const EntityMatcherData&){}	///... non copyable
};

/// \brief Match candidate before filtering
struct EntityCandidate
{
	std::size_t conceptidx;
	analyzer::Span span;
	std::string text;
	std::size_t textlen;

	EntityCandidate( std::size_t conceptidx_, const analyzer::Span& span_, const std::string& text_)
		:conceptidx(conceptidx_),span(span_),text(text_),textlen(utf8Length(text_)){}
	EntityCandidate( const EntityCandidate& o)
		:conceptidx(o.conceptidx),span(o.span),text(o.text),textlen(o.textlen){}
};

/// \brief Order of preference for overlap resolution: longest text first, then earliest start, then first registered concept
static bool preferCandidate( const EntityCandidate& aa, const EntityCandidate& bb)
{
	if (aa.textlen != bb.textlen) return aa.textlen > bb.textlen;
	if (aa.span.start() != bb.span.start()) return aa.span.start() < bb.span.start();
	if (aa.conceptidx != bb.conceptidx) return aa.conceptidx < bb.conceptidx;
	return aa.span.end() < bb.span.end();
}

static bool candidatePositionOrder( const EntityCandidate& aa, const EntityCandidate& bb)
{
	if (aa.span != bb.span) return aa.span < bb.span;
	return aa.conceptidx < bb.conceptidx;
}

/// \brief Matching of one document
class EntityMatchContext
{
public:
	EntityMatchContext( const EntityMatcherData* data_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_debugtrace(0),m_data(data_),m_patternContext()
	{
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) m_debugtrace = dbgi->createTraceContext( CLINICAL_DBGTRACE_COMPONENT_NAME);
		m_patternContext.reset( m_data->patterns->createContext());
		if (!m_patternContext.get())
		{
			if (m_debugtrace) delete m_debugtrace;
			throw runtime_error( _TXT("failed to create pattern match context"));
		}
	}
	~EntityMatchContext()
	{
		if (m_debugtrace) delete m_debugtrace;
	}

	std::vector<analyzer::Entity> run( const analyzer::Document& doc)
	{
		checkDocumentTokens( doc);
		std::vector<EntityCandidate> candidates;
		if (doc.sentences().empty())
		{
			matchSentence( candidates, doc, analyzer::Span( 0, doc.tokens().size()));
		}
		else
		{
			std::vector<analyzer::Span>::const_iterator si = doc.sentences().begin(), se = doc.sentences().end();
			for (; si != se; ++si)
			{
				matchSentence( candidates, doc, *si);
			}
		}
		if (m_data->resolveOverlap)
		{
			candidates = resolveOverlaps( candidates);
		}
		std::sort( candidates.begin(), candidates.end(), candidatePositionOrder);

		std::vector<analyzer::Entity> rt;
		std::vector<EntityCandidate>::const_iterator ci = candidates.begin(), ce = candidates.end();
		for (; ci != ce; ++ci)
		{
			const std::string& concept = m_data->concepts[ ci->conceptidx];
			DEBUG_EVENT4( "entity", "concept=%s start=%u end=%u text='%s'", concept.c_str(), (unsigned int)ci->span.start(), (unsigned int)ci->span.end(), ci->text.c_str())
			rt.push_back( analyzer::Entity( concept, ci->span, ci->text));
		}
		return rt;
	}

private:
	typedef std::pair<std::size_t,analyzer::Span> ConceptSpan;

	void matchSentence( std::vector<EntityCandidate>& candidates, const analyzer::Document& doc, const analyzer::Span& sentence)
	{
		if (sentence.end() > doc.tokens().size())
		{
			throw logic_error( _TXT("sentence [%u,%u) out of token range"), (unsigned int)sentence.start(), (unsigned int)sentence.end());
		}
		m_patternContext->reset();
		std::size_t ti = sentence.start(), te = sentence.end();
		for (; ti < te; ++ti)
		{
			m_patternContext->putInput( doc.tokens()[ ti]);
		}
		std::vector<analyzer::TokenPatternMatchResult> results = m_patternContext->fetchResults();
		if (m_errorhnd->hasError())
		{
			throw runtime_error( _TXT("failed to match term patterns"));
		}
		std::vector<ConceptSpan> positives;
		std::vector<ConceptSpan> pseudos;
		std::vector<analyzer::TokenPatternMatchResult>::const_iterator ri = results.begin(), re = results.end();
		for (; ri != re; ++ri)
		{
			std::size_t termidx = ri->id() - 1;
			ConceptSpan cs( m_data->terms[ termidx].conceptidx, ri->span());
			if (m_data->pseudoflags[ termidx])
			{
				pseudos.push_back( cs);
			}
			else
			{
				positives.push_back( cs);
			}
		}
		// Results are ordered by span and term, so the first term of duplicate spans of a concept is kept
		std::set<ConceptSpan> visited;
		std::vector<ConceptSpan>::const_iterator pi = positives.begin(), pe = positives.end();
		for (; pi != pe; ++pi)
		{
			if (!visited.insert( *pi).second) continue;
			if (excludedByPseudo( *pi, pseudos))
			{
				DEBUG_EVENT3( "pseudo", "concept=%s start=%u end=%u", m_data->concepts[ pi->first].c_str(), (unsigned int)pi->second.start(), (unsigned int)pi->second.end())
				continue;
			}
			candidates.push_back( EntityCandidate( pi->first, pi->second, doc.spanText( pi->second)));
		}
	}

	bool excludedByPseudo( const ConceptSpan& positive, const std::vector<ConceptSpan>& pseudos) const
	{
		std::vector<ConceptSpan>::const_iterator si = pseudos.begin(), se = pseudos.end();
		for (; si != se; ++si)
		{
			if (si->first != positive.first) continue;
			if (m_data->pseudoOverlap ? si->second.overlaps( positive.second) : si->second == positive.second)
			{
				return true;
			}
		}
		return false;
	}

	std::vector<EntityCandidate> resolveOverlaps( std::vector<EntityCandidate>& candidates)
	{
		std::vector<EntityCandidate> rt;
		std::sort( candidates.begin(), candidates.end(), preferCandidate);
		std::vector<EntityCandidate>::const_iterator ci = candidates.begin(), ce = candidates.end();
		for (; ci != ce; ++ci)
		{
			std::vector<EntityCandidate>::const_iterator ai = rt.begin(), ae = rt.end();
			for (; ai != ae && !ai->span.overlaps( ci->span); ++ai){}
			if (ai == ae)
			{
				rt.push_back( *ci);
			}
			else
			{
				DEBUG_EVENT4( "overlap", "drop concept=%s start=%u end=%u for concept=%s", m_data->concepts[ ci->conceptidx].c_str(), (unsigned int)ci->span.start(), (unsigned int)ci->span.end(), m_data->concepts[ ai->conceptidx].c_str())
			}
		}
		return rt;
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	const EntityMatcherData* m_data;
	strus::Reference<TokenPatternMatchContextInterface> m_patternContext;
};


class EntityMatcherInstance
	:public EntityMatcherInstanceInterface
{
public:
	EntityMatcherInstance( const TokenPatternMatchInterface* tpm_, const TokenizerInterface* tokenizer_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_tpm(tpm_),m_tokenizer(tokenizer_),m_data(),m_compiled(false){}

	virtual ~EntityMatcherInstance(){}

	virtual void defineOption( const std::string& name, double value)
	{
		try
		{
			checkNotCompiled();
			if (value < 0.0)
			{
				throw configuration_error( strus::ErrorCodeValueOutOfRange, _TXT("negative value for entity matcher option '%s'"), name.c_str());
			}
			unsigned int uvalue = (unsigned int)(value + std::numeric_limits<double>::epsilon());
			if (strus::caseInsensitiveEquals( name, "proximity"))
			{
				m_data.defaults.proximity = uvalue;
			}
			else if (strus::caseInsensitiveEquals( name, "fuzzy"))
			{
				m_data.defaults.fuzzy = uvalue;
			}
			else if (strus::caseInsensitiveEquals( name, "fuzzyMinLength"))
			{
				m_data.defaults.fuzzyMinLength = uvalue;
			}
			else if (strus::caseInsensitiveEquals( name, "pseudo"))
			{
				m_data.defaults.pseudo = (uvalue != 0);
			}
			else if (strus::caseInsensitiveEquals( name, "resolveOverlap"))
			{
				m_data.resolveOverlap = (uvalue != 0);
			}
			else if (strus::caseInsensitiveEquals( name, "pseudoOverlap"))
			{
				m_data.pseudoOverlap = (uvalue != 0);
			}
			else
			{
				throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown entity matcher option: '%s'"), name.c_str());
			}
		}
		CATCH_ERROR_MAP( _TXT("failed to define entity matcher option: %s"), *m_errorhnd);
	}

	virtual void defineAttribute( analyzer::TokenAttribute attribute)
	{
		try
		{
			checkNotCompiled();
			m_data.defaults.attribute = attribute;
		}
		CATCH_ERROR_MAP( _TXT("failed to define entity matcher attribute: %s"), *m_errorhnd);
	}

	virtual void addTerm( const std::string& concept, const analyzer::Term& term)
	{
		try
		{
			checkNotCompiled();
			m_data.terms.push_back( ConceptTerm( conceptIndex( concept), term));
		}
		CATCH_ERROR_MAP( _TXT("failed to add term to entity matcher: %s"), *m_errorhnd);
	}

	virtual void addTerms( const std::string& concept, const std::vector<analyzer::Term>& terms)
	{
		try
		{
			checkNotCompiled();
			if (terms.empty())
			{
				throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("empty list of terms for concept '%s'"), concept.c_str());
			}
			std::size_t conceptidx = conceptIndex( concept);
			std::vector<analyzer::Term>::const_iterator ti = terms.begin(), te = terms.end();
			for (; ti != te; ++ti)
			{
				m_data.terms.push_back( ConceptTerm( conceptidx, *ti));
			}
		}
		CATCH_ERROR_MAP( _TXT("failed to add terms to entity matcher: %s"), *m_errorhnd);
	}

	virtual bool compile()
	{
		try
		{
			checkNotCompiled();
			if (m_errorhnd->hasError())
			{
				throw runtime_error( _TXT("error in entity matcher definition"));
			}
			if (m_data.terms.empty())
			{
				throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("no concept terms defined"));
			}
			m_data.patterns.reset( m_tpm->createInstance());
			if (!m_data.patterns.get())
			{
				throw runtime_error( _TXT("failed to create token pattern match instance"));
			}
			m_data.pseudoflags.clear();
			std::vector<ConceptTerm>::const_iterator ti = m_data.terms.begin(), te = m_data.terms.end();
			for (unsigned int tidx=0; ti != te; ++ti,++tidx)
			{
				defineTermPattern( m_data.patterns.get(), m_tokenizer, tidx+1, ti->term, m_data.defaults, m_errorhnd);
				m_data.pseudoflags.push_back( ti->term.pseudo( m_data.defaults.pseudo));
			}
			if (!m_data.patterns->compile())
			{
				throw runtime_error( _TXT("failed to compile term patterns"));
			}
			m_compiled = true;
			return true;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to compile entity matcher: %s"), *m_errorhnd, false);
	}

	virtual std::vector<analyzer::Entity> match( const analyzer::Document& doc) const
	{
		try
		{
			if (!m_compiled)
			{
				throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("entity matcher not compiled"));
			}
			EntityMatchContext ctx( &m_data, m_errorhnd);
			return ctx.run( doc);
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to match entities: %s"), *m_errorhnd, std::vector<analyzer::Entity>());
	}

private:
	void checkNotCompiled() const
	{
		if (m_compiled)
		{
			throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("entity matcher definition after compile"));
		}
	}

	std::size_t conceptIndex( const std::string& concept)
	{
		if (concept.empty())
		{
			throw configuration_error( strus::ErrorCodeInvalidArgument, _TXT("empty concept identifier"));
		}
		std::map<std::string,std::size_t>::const_iterator ci = m_data.conceptmap.find( concept);
		if (ci != m_data.conceptmap.end()) return ci->second;
		std::size_t rt = m_data.concepts.size();
		m_data.concepts.push_back( concept);
		m_data.conceptmap[ concept] = rt;
		return rt;
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const TokenPatternMatchInterface* m_tpm;
	const TokenizerInterface* m_tokenizer;
	EntityMatcherData m_data;
	bool m_compiled;
};


std::vector<std::string> EntityMatcher::getCompileOptionNames() const
{
	std::vector<std::string> rt;
	static const char* ar[] = {"proximity","fuzzy","fuzzyMinLength","pseudo","resolveOverlap","pseudoOverlap",0};
	for (std::size_t ai=0; ar[ai]; ++ai)
	{
		rt.push_back( ar[ ai]);
	}
	return rt;
}

EntityMatcherInstanceInterface* EntityMatcher::createInstance() const
{
	try
	{
		return new EntityMatcherInstance( m_tpm, m_tokenizer, m_errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to create entity matcher instance: %s"), *m_errorhnd, 0);
}

