/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Entity matched against a concept dictionary with its qualifier set
/// \file "entity.hpp"
#ifndef _CLINICAL_ANALYZER_ENTITY_HPP_INCLUDED
#define _CLINICAL_ANALYZER_ENTITY_HPP_INCLUDED
#include "clinical/analyzer/span.hpp"
#include "clinical/analyzer/qualifier.hpp"
#include <string>
#include <map>

namespace clinical {
namespace analyzer {

/// \brief Entity matched against a concept dictionary
/// \note Only the qualifier set is mutated after creation
class Entity
{
public:
	/// \brief Map of qualifier class name to the qualifier assigned
	typedef std::map<std::string,Qualifier> QualifierMap;

	Entity()
		:m_concept(),m_span(),m_text(),m_qualifiers(){}
	/// \brief Constructor
	/// \param[in] concept_ concept identifier
	/// \param[in] span_ token range of the entity
	/// \param[in] text_ text of the entity in the source
	Entity( const std::string& concept_, const Span& span_, const std::string& text_)
		:m_concept(concept_),m_span(span_),m_text(text_),m_qualifiers(){}
	Entity( const Entity& o)
		:m_concept(o.m_concept),m_span(o.m_span),m_text(o.m_text),m_qualifiers(o.m_qualifiers){}

	const std::string& concept() const		{return m_concept;}
	const Span& span() const			{return m_span;}
	std::size_t start() const			{return m_span.start();}
	std::size_t end() const				{return m_span.end();}
	const std::string& text() const			{return m_text;}

	/// \brief Complete set of qualifiers assigned, one per class
	const QualifierMap& qualifiers() const		{return m_qualifiers;}

	/// \brief Get the qualifier assigned for a class or NULL if not assigned
	const Qualifier* qualifier( const std::string& className) const
	{
		QualifierMap::const_iterator qi = m_qualifiers.find( className);
		return qi == m_qualifiers.end() ? 0 : &qi->second;
	}

	/// \brief Assign a qualifier, replacing the one of the same class
	void setQualifier( const Qualifier& qualifier_)
	{
		m_qualifiers[ qualifier_.className()] = qualifier_;
	}

	void clearQualifiers()
	{
		m_qualifiers.clear();
	}

private:
	std::string m_concept;
	Span m_span;
	std::string m_text;
	QualifierMap m_qualifiers;
};

}}//namespace
#endif

