/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Rule based qualifier detector propagating trigger qualifiers to the entities in their scope
/// \file "contextAlgorithm.cpp"
#include "contextAlgorithm.hpp"
#include "errorUtils.hpp"
#include "documentChecks.hpp"
#include "internationalization.hpp"
#include "clinical/contextRuleStoreInterface.hpp"
#include "clinical/tokenPatternMatchInstanceInterface.hpp"
#include "clinical/tokenPatternMatchContextInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "strus/reference.hpp"
#include <map>
#include <algorithm>

#define CLINICAL_DBGTRACE_COMPONENT_NAME "context"
#define DEBUG_OPEN( NAME)                                       if (m_debugtrace) m_debugtrace->open( NAME);
#define DEBUG_CLOSE()                                           if (m_debugtrace) m_debugtrace->close();
#define DEBUG_EVENT4( NAME, FMT, X1, X2, X3, X4)                if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3, X4);
#define DEBUG_EVENT5( NAME, FMT, X1, X2, X3, X4, X5)            if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3, X4, X5);

using namespace clinical;

/// \brief Match of a trigger pattern in a sentence with its resolved scope
struct TriggerMatch
{
	const analyzer::ContextRule* rule;
	std::size_t ruleidx;
	std::size_t classidx;
	analyzer::Span span;
	analyzer::Span backwardScope;	///< part of the scope before the trigger, empty if none
	analyzer::Span forwardScope;	///< part of the scope after the trigger, empty if none
	int priority;
	std::size_t seqno;		///< position in the scan order (start, end, rule)

	TriggerMatch( const analyzer::ContextRule* rule_, std::size_t ruleidx_, std::size_t classidx_, const analyzer::Span& span_, int priority_, std::size_t seqno_)
		:rule(rule_),ruleidx(ruleidx_),classidx(classidx_),span(span_),backwardScope(),forwardScope(),priority(priority_),seqno(seqno_){}
	TriggerMatch( const TriggerMatch& o)
		:rule(o.rule),ruleidx(o.ruleidx),classidx(o.classidx),span(o.span),backwardScope(o.backwardScope),forwardScope(o.forwardScope),priority(o.priority),seqno(o.seqno){}

	bool assigning() const
	{
		return rule->direction() == analyzer::ContextRule::Preceding
			|| rule->direction() == analyzer::ContextRule::Following
			|| rule->direction() == analyzer::ContextRule::Bidirectional;
	}

	/// \brief Test if an entity outside the trigger lies in the scope
	bool claims( const analyzer::Span& entity) const
	{
		if (entity.start() >= span.end())
		{
			return !forwardScope.empty() && entity.start() < forwardScope.end();
		}
		else if (entity.end() <= span.start())
		{
			return !backwardScope.empty() && entity.end() > backwardScope.start();
		}
		return false;
	}
};

/// \brief Qualifier detection on one document
class ContextDetection
{
public:
	ContextDetection( const ContextRuleStoreInterface* rulestore_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_debugtrace(0),m_rulestore(rulestore_),m_classmap(),m_patternContext()
	{
		const TokenPatternMatchInstanceInterface* patterns = m_rulestore->triggerPatterns();
		if (!patterns)
		{
			throw configuration_error( strus::ErrorCodeOperationOrder, _TXT("context rule store not compiled"));
		}
		m_patternContext.reset( patterns->createContext());
		if (!m_patternContext.get())
		{
			throw runtime_error( _TXT("failed to create pattern match context for trigger patterns"));
		}
		const std::vector<analyzer::QualifierClass>& classes = m_rulestore->qualifierClasses();
		std::vector<analyzer::QualifierClass>::const_iterator ci = classes.begin(), ce = classes.end();
		for (std::size_t cidx=0; ci != ce; ++ci,++cidx)
		{
			m_classmap[ ci->name()] = cidx;
		}
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi) m_debugtrace = dbgi->createTraceContext( CLINICAL_DBGTRACE_COMPONENT_NAME);
	}

	~ContextDetection()
	{
		if (m_debugtrace) delete m_debugtrace;
	}

	/// \brief Compute the qualifier of every class for every entity, the result is a matrix [entity][class]
	void run( std::vector<std::vector<analyzer::Qualifier> >& result, const analyzer::Document& doc)
	{
		checkDocumentTokens( doc);
		const std::vector<analyzer::QualifierClass>& classes = m_rulestore->qualifierClasses();
		const std::vector<analyzer::Entity>& entities = doc.entities();

		std::vector<analyzer::Span> sentences = doc.sentences();
		if (sentences.empty())
		{
			sentences.push_back( analyzer::Span( 0, doc.tokens().size()));
		}
		// Every entity starts with the defaults of all classes
		std::vector<analyzer::Qualifier> defaults;
		std::vector<analyzer::QualifierClass>::const_iterator ci = classes.begin(), ce = classes.end();
		for (; ci != ce; ++ci)
		{
			defaults.push_back( ci->defaultQualifier());
		}
		result.assign( entities.size(), defaults);

		std::vector<std::vector<std::size_t> > sentenceEntities( sentences.size());
		std::vector<analyzer::Entity>::const_iterator ei = entities.begin(), ee = entities.end();
		for (std::size_t eidx=0; ei != ee; ++ei,++eidx)
		{
			if (ei->span().empty() || ei->end() > doc.tokens().size())
			{
				throw logic_error( _TXT("entity '%s' [%u,%u) outside of the document tokens"), ei->text().c_str(), (unsigned int)ei->start(), (unsigned int)ei->end());
			}
			std::vector<analyzer::Span>::const_iterator si = sentences.begin(), se = sentences.end();
			for (std::size_t sidx=0; si != se; ++si,++sidx)
			{
				if (si->contains( ei->span()))
				{
					sentenceEntities[ sidx].push_back( eidx);
					break;
				}
				else if (si->overlaps( ei->span()))
				{
					throw logic_error( _TXT("entity '%s' [%u,%u) crosses the boundary of the sentence [%u,%u)"), ei->text().c_str(), (unsigned int)ei->start(), (unsigned int)ei->end(), (unsigned int)si->start(), (unsigned int)si->end());
				}
			}
		}
		std::vector<analyzer::Span>::const_iterator si = sentences.begin(), se = sentences.end();
		for (std::size_t sidx=0; si != se; ++si,++sidx)
		{
			if (sentenceEntities[ sidx].empty()) continue;
			DEBUG_OPEN( "sentence")
			processSentence( result, doc, *si, sentenceEntities[ sidx]);
			DEBUG_CLOSE()
		}
	}

private:
	std::vector<TriggerMatch> matchTriggers( const analyzer::Document& doc, const analyzer::Span& sentence)
	{
		std::vector<TriggerMatch> rt;
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
			throw runtime_error( _TXT("failed to match trigger patterns"));
		}
		const std::vector<analyzer::ContextRule>& rules = m_rulestore->rules();
		const std::vector<analyzer::QualifierClass>& classes = m_rulestore->qualifierClasses();
		std::vector<analyzer::TokenPatternMatchResult>::const_iterator ri = results.begin(), re = results.end();
		for (std::size_t seqno=0; ri != re; ++ri,++seqno)
		{
			std::size_t ruleidx = ri->id() - 1;
			const analyzer::ContextRule& rule = rules[ ruleidx];
			std::map<std::string,std::size_t>::const_iterator mi = m_classmap.find( rule.className());
			if (mi == m_classmap.end())
			{
				throw logic_error( _TXT("trigger of undefined qualifier class '%s'"), rule.className().c_str());
			}
			int priority = classes[ mi->second].priority( rule.value());
			DEBUG_EVENT5( "trigger", "%s %s [%u,%u) rule %u", rule.directionName( rule.direction()), rule.qualifierName().c_str(), (unsigned int)ri->ordpos(), (unsigned int)ri->ordend(), (unsigned int)ruleidx+1)
			rt.push_back( TriggerMatch( &rule, ruleidx, mi->second, ri->span(), priority, seqno));
		}
		return rt;
	}

	/// \brief Remove assigning triggers overlapping a pseudo trigger of the same qualifier
	std::vector<TriggerMatch> filterPseudoTriggers( const std::vector<TriggerMatch>& triggers)
	{
		std::vector<TriggerMatch> rt;
		std::vector<TriggerMatch>::const_iterator ti = triggers.begin(), te = triggers.end();
		for (; ti != te; ++ti)
		{
			if (!ti->assigning()) continue;
			std::vector<TriggerMatch>::const_iterator pi = triggers.begin(), pe = triggers.end();
			for (; pi != pe; ++pi)
			{
				if (pi->rule->direction() == analyzer::ContextRule::Pseudo
					&& pi->classidx == ti->classidx
					&& pi->rule->value() == ti->rule->value()
					&& pi->span.overlaps( ti->span)) break;
			}
			if (pi == pe)
			{
				rt.push_back( *ti);
			}
			else
			{
				DEBUG_EVENT4( "pseudo", "%s [%u,%u) suppressed by rule %u", ti->rule->qualifierName().c_str(), (unsigned int)ti->span.start(), (unsigned int)ti->span.end(), (unsigned int)pi->ruleidx+1)
			}
		}
		return rt;
	}

	/// \brief Compute the scope of an assigning trigger bounded by the sentence, the maximum scope and the termination triggers of its class
	void resolveScope( TriggerMatch& trigger, const analyzer::Span& sentence, const std::vector<TriggerMatch>& triggers)
	{
		std::size_t maxScope = trigger.rule->maxScope() ? trigger.rule->maxScope() : sentence.size();
		analyzer::ContextRule::Direction direction = trigger.rule->direction();
		if (direction == analyzer::ContextRule::Preceding || direction == analyzer::ContextRule::Bidirectional)
		{
			std::size_t end = std::min( trigger.span.end() + maxScope, sentence.end());
			std::vector<TriggerMatch>::const_iterator ti = triggers.begin(), te = triggers.end();
			for (; ti != te; ++ti)
			{
				if (ti->rule->direction() == analyzer::ContextRule::Termination && ti->classidx == trigger.classidx
					&& ti->span.start() >= trigger.span.end() && ti->span.start() < end)
				{
					end = ti->span.start();
				}
			}
			trigger.forwardScope = analyzer::Span( trigger.span.end(), end);
		}
		if (direction == analyzer::ContextRule::Following || direction == analyzer::ContextRule::Bidirectional)
		{
			std::size_t start = (trigger.span.start() >= sentence.start() + maxScope) ? (trigger.span.start() - maxScope) : sentence.start();
			std::vector<TriggerMatch>::const_iterator ti = triggers.begin(), te = triggers.end();
			for (; ti != te; ++ti)
			{
				if (ti->rule->direction() == analyzer::ContextRule::Termination && ti->classidx == trigger.classidx
					&& ti->span.end() <= trigger.span.start() && ti->span.end() > start)
				{
					start = ti->span.end();
				}
			}
			trigger.backwardScope = analyzer::Span( start, trigger.span.start());
		}
		DEBUG_EVENT5( "scope", "%s [%u,%u) backward [%u,%u)", trigger.rule->qualifierName().c_str(), (unsigned int)trigger.span.start(), (unsigned int)trigger.span.end(), (unsigned int)trigger.backwardScope.start(), (unsigned int)trigger.backwardScope.end())
		DEBUG_EVENT5( "scope", "%s [%u,%u) forward [%u,%u)", trigger.rule->qualifierName().c_str(), (unsigned int)trigger.span.start(), (unsigned int)trigger.span.end(), (unsigned int)trigger.forwardScope.start(), (unsigned int)trigger.forwardScope.end())
	}

	/// \brief Test if a trigger is preferred to another claiming the same entity: higher priority (lower number), then closer, then earlier in scan order
	static bool preferTrigger( const TriggerMatch& aa, const TriggerMatch& bb, const analyzer::Span& entity)
	{
		if (aa.priority != bb.priority) return aa.priority < bb.priority;
		std::size_t adist = aa.span.distance( entity);
		std::size_t bdist = bb.span.distance( entity);
		if (adist != bdist) return adist < bdist;
		return aa.seqno < bb.seqno;
	}

	void processSentence(
			std::vector<std::vector<analyzer::Qualifier> >& result,
			const analyzer::Document& doc,
			const analyzer::Span& sentence,
			const std::vector<std::size_t>& entityIndices)
	{
		std::vector<TriggerMatch> triggers = matchTriggers( doc, sentence);
		std::vector<TriggerMatch> assigning = filterPseudoTriggers( triggers);
		std::vector<TriggerMatch>::iterator ai = assigning.begin(), ae = assigning.end();
		for (; ai != ae; ++ai)
		{
			resolveScope( *ai, sentence, triggers);
		}
		const std::vector<analyzer::QualifierClass>& classes = m_rulestore->qualifierClasses();
		std::vector<std::size_t>::const_iterator ei = entityIndices.begin(), ee = entityIndices.end();
		for (; ei != ee; ++ei)
		{
			const analyzer::Entity& entity = doc.entities()[ *ei];
			std::size_t cidx = 0, cend = classes.size();
			for (; cidx != cend; ++cidx)
			{
				const TriggerMatch* selected = 0;
				bool containedInTrigger = false;
				std::vector<TriggerMatch>::const_iterator ti = assigning.begin(), te = assigning.end();
				for (; ti != te; ++ti)
				{
					if (ti->classidx != cidx) continue;
					if (ti->span.contains( entity.span()))
					{
						containedInTrigger = true;
						break;
					}
					if (ti->claims( entity.span()) && (!selected || preferTrigger( *ti, *selected, entity.span())))
					{
						selected = &*ti;
					}
				}
				if (containedInTrigger || !selected) continue;

				result[ *ei][ cidx] = classes[ cidx].qualifier( selected->rule->value());
				DEBUG_EVENT5( "assign", "%s to '%s' [%u,%u) by rule %u", selected->rule->qualifierName().c_str(), entity.text().c_str(), (unsigned int)entity.start(), (unsigned int)entity.end(), (unsigned int)selected->ruleidx+1)
			}
		}
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	const ContextRuleStoreInterface* m_rulestore;
	std::map<std::string,std::size_t> m_classmap;
	strus::Reference<TokenPatternMatchContextInterface> m_patternContext;
};


std::vector<analyzer::QualifierClass> ContextAlgorithm::qualifierClasses() const
{
	try
	{
		return m_rulestore->qualifierClasses();
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to get qualifier classes of context algorithm: %s"), *m_errorhnd, std::vector<analyzer::QualifierClass>());
}

bool ContextAlgorithm::detect( analyzer::Document& doc) const
{
	try
	{
		std::vector<std::vector<analyzer::Qualifier> > assignments;
		{
			ContextDetection detection( m_rulestore, m_errorhnd);
			detection.run( assignments, doc);
		}
		std::vector<analyzer::Entity>& entities = doc.entities();
		std::vector<analyzer::Entity>::iterator ei = entities.begin(), ee = entities.end();
		for (std::size_t eidx=0; ei != ee; ++ei,++eidx)
		{
			std::vector<analyzer::Qualifier>::const_iterator qi = assignments[ eidx].begin(), qe = assignments[ eidx].end();
			for (; qi != qe; ++qi)
			{
				ei->setQualifier( *qi);
			}
		}
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to detect qualifiers with context algorithm: %s"), *m_errorhnd, false);
}

