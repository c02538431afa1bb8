/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Document with its tokens and the annotations attached during a pipeline run
/// \file "document.hpp"
#ifndef _CLINICAL_ANALYZER_DOCUMENT_HPP_INCLUDED
#define _CLINICAL_ANALYZER_DOCUMENT_HPP_INCLUDED
#include "clinical/analyzer/token.hpp"
#include "clinical/analyzer/span.hpp"
#include "clinical/analyzer/entity.hpp"
#include <string>
#include <vector>

namespace clinical {
namespace analyzer {

/// \brief Document with its tokens and the annotations (sentences, entities, qualifiers) attached during a pipeline run
class Document
{
public:
	Document()
		:m_source(),m_tokens(),m_sentences(),m_entities(){}
	/// \brief Constructor
	/// \param[in] source_ raw text of the document
	explicit Document( const std::string& source_)
		:m_source(source_),m_tokens(),m_sentences(),m_entities(){}
	Document( const Document& o)
		:m_source(o.m_source),m_tokens(o.m_tokens),m_sentences(o.m_sentences),m_entities(o.m_entities){}

	void swap( Document& o)
	{
		m_source.swap( o.m_source);
		m_tokens.swap( o.m_tokens);
		m_sentences.swap( o.m_sentences);
		m_entities.swap( o.m_entities);
	}

	const std::string& source() const			{return m_source;}
	const std::vector<Token>& tokens() const		{return m_tokens;}
	const std::vector<Span>& sentences() const		{return m_sentences;}
	const std::vector<Entity>& entities() const		{return m_entities;}
	std::vector<Entity>& entities()				{return m_entities;}

	/// \brief Append a token, the ordinal position of the token must be the number of tokens defined before
	void addToken( const Token& token)			{m_tokens.push_back( token);}
	void setTokens( const std::vector<Token>& tokens_)	{m_tokens = tokens_;}
	void addSentence( const Span& sentence)			{m_sentences.push_back( sentence);}
	void setSentences( const std::vector<Span>& sentences_)	{m_sentences = sentences_;}
	void setEntities( const std::vector<Entity>& entities_)	{m_entities = entities_;}

	/// \brief Text of a token range, taken from the source if defined, the literal tokens joined with spaces otherwise
	std::string spanText( const Span& span) const
	{
		if (span.empty() || span.end() > m_tokens.size()) return std::string();
		const Token& first = m_tokens[ span.start()];
		const Token& last = m_tokens[ span.end()-1];
		if (!m_source.empty() && first.origpos() <= last.origend() && last.origend() <= m_source.size())
		{
			return std::string( m_source.c_str() + first.origpos(), last.origend() - first.origpos());
		}
		std::string rt;
		std::size_t ti = span.start(), te = span.end();
		for (; ti < te; ++ti)
		{
			if (ti > span.start()) rt.push_back( ' ');
			rt.append( m_tokens[ ti].literal());
		}
		return rt;
	}

private:
	std::string m_source;
	std::vector<Token> m_tokens;
	std::vector<Span> m_sentences;
	std::vector<Entity> m_entities;
};

}}//namespace
#endif

