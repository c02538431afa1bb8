/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Loading of concept dictionaries in JSON or tabular (CSV) form
/// \file "conceptLoader.cpp"
#include "conceptLoader.hpp"
#include "jsonDefinitions.hpp"
#include "lexems.hpp"
#include "editDistance.hpp"
#include "internationalization.hpp"
#include "clinical/entityMatcherInstanceInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include <vector>
#include <map>

using namespace clinical;
using json = nlohmann::json;

void clinical::loadConceptDefinitionsJson( EntityMatcherInstanceInterface* matcher, const std::string& source, strus::ErrorBufferInterface* errorhnd)
{
	json doc = parseJsonDocument( source);
	if (!doc.is_object())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("object mapping concepts to term lists expected as concept definitions"));
	}
	json::const_iterator ci = doc.begin(), ce = doc.end();
	for (; ci != ce; ++ci)
	{
		const std::string& concept = ci.key();
		if (!ci.value().is_array())
		{
			throw configuration_error( strus::ErrorCodeSyntax, _TXT("list of terms expected for concept '%s'"), concept.c_str());
		}
		std::vector<analyzer::Term> terms;
		json::const_iterator ti = ci.value().begin(), te = ci.value().end();
		for (; ti != te; ++ti)
		{
			try
			{
				terms.push_back( parseTerm( *ti));
			}
			catch (const config_error& err)
			{
				throw configuration_error( err.errorcode(), _TXT("in term %u of concept '%s': %s"), (unsigned int)(ti - ci.value().begin()) + 1, concept.c_str(), err.what());
			}
		}
		matcher->addTerms( concept, terms);
		if (errorhnd->hasError())
		{
			throw runtime_error( _TXT("failed to add terms of concept '%s': %s"), concept.c_str(), errorhnd->fetchError());
		}
	}
}

/// \brief Columns of the concept table
enum ConceptColumn
{
	ColConcept,
	ColPhrase,
	ColAttr,
	ColProximity,
	ColFuzzy,
	ColFuzzyMinLen,
	ColPseudo,
	NofConceptColumns
};

static const char* g_columnNames[ NofConceptColumns] = {"concept","phrase","attr","proximity","fuzzy","fuzzy_min_len","pseudo"};
// Columns accepted in the header but without meaning for the matcher
static const char* g_ignoredColumnNames[] = {"comment", 0};

static bool isIgnoredColumn( const std::string& name)
{
	for (int ii=0; g_ignoredColumnNames[ ii]; ++ii)
	{
		if (parser::isEqual( name, g_ignoredColumnNames[ ii])) return true;
	}
	return false;
}

static const char* closestColumnName( const std::string& name)
{
	CodePointString nm = decodeUtf8( name);
	const char* rt = 0;
	unsigned int maxdist = 2;
	for (int ci=0; ci != NofConceptColumns; ++ci)
	{
		unsigned int dist = editDistance( nm, decodeUtf8( g_columnNames[ ci]), maxdist);
		if (dist <= maxdist)
		{
			rt = g_columnNames[ ci];
			maxdist = dist;
		}
	}
	return rt;
}

static analyzer::Term parseTermRow( const std::vector<std::string>& row, const int* colidx)
{
	analyzer::Term rt( row[ colidx[ ColPhrase]]);
	int ci = ColAttr;
	for (; ci != NofConceptColumns; ++ci)
	{
		if (colidx[ ci] < 0 || colidx[ ci] >= (int)row.size()) continue;
		const std::string& value = row[ colidx[ ci]];
		if (value.empty()) continue;
		switch ((ConceptColumn)ci)
		{
			case ColAttr: rt.setAttribute( parseTokenAttribute( value)); break;
			case ColProximity: rt.setProximity( parser::parse_UNSIGNED( value)); break;
			case ColFuzzy: rt.setFuzzy( parser::parse_UNSIGNED( value)); break;
			case ColFuzzyMinLen: rt.setFuzzyMinLength( parser::parse_UNSIGNED( value)); break;
			case ColPseudo: rt.setPseudo( parser::parse_BOOLEAN( value)); break;
			case ColConcept:
			case ColPhrase:
			case NofConceptColumns:
				break;
		}
	}
	return rt;
}

void clinical::loadConceptDefinitionsCsv( EntityMatcherInstanceInterface* matcher, const std::string& source, strus::ErrorBufferInterface* errorhnd)
{
	unsigned int line = 1;
	char const* src = source.c_str();
	while (*src && parser::isEmptyLine( src))
	{
		parser::skipSpaces( src);
		parser::skipEoln( src, line);
	}
	if (!*src)
	{
		throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("missing header row in concept table"));
	}
	int colidx[ NofConceptColumns];
	for (int ci=0; ci != NofConceptColumns; ++ci) colidx[ ci] = -1;

	std::vector<std::string> header = parser::parse_CSV_ROW( src, line);
	std::vector<std::string>::const_iterator hi = header.begin(), he = header.end();
	for (int hidx=0; hi != he; ++hi,++hidx)
	{
		int ci = 0;
		for (; ci != NofConceptColumns && !parser::isEqual( *hi, g_columnNames[ ci]); ++ci){}
		if (ci == NofConceptColumns)
		{
			if (isIgnoredColumn( *hi)) continue;
			const char* closest = closestColumnName( *hi);
			if (closest)
			{
				throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown column '%s' in concept table header, perhaps '%s' was meant"), hi->c_str(), closest);
			}
			throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown column '%s' in concept table header"), hi->c_str());
		}
		if (colidx[ ci] >= 0)
		{
			throw configuration_error( strus::ErrorCodeDuplicateDefinition, _TXT("duplicate column '%s' in concept table header"), g_columnNames[ ci]);
		}
		colidx[ ci] = hidx;
	}
	if (colidx[ ColConcept] < 0 || colidx[ ColPhrase] < 0)
	{
		throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("concept table header must define the columns 'concept' and 'phrase'"));
	}
	while (*src)
	{
		if (parser::isEmptyLine( src))
		{
			parser::skipSpaces( src);
			parser::skipEoln( src, line);
			continue;
		}
		unsigned int rowline = line;
		try
		{
			std::vector<std::string> row = parser::parse_CSV_ROW( src, line);
			if ((int)row.size() <= colidx[ ColConcept] || (int)row.size() <= colidx[ ColPhrase]
				|| row[ colidx[ ColConcept]].empty() || row[ colidx[ ColPhrase]].empty())
			{
				throw runtime_error( _TXT("concept and phrase must be defined"));
			}
			matcher->addTerm( row[ colidx[ ColConcept]], parseTermRow( row, colidx));
		}
		catch (const std::runtime_error& err)
		{
			throw configuration_error( strus::ErrorCodeSyntax, _TXT("error in concept table on line %u: %s"), rowline, err.what());
		}
		if (errorhnd->hasError())
		{
			throw runtime_error( _TXT("failed to add term on line %u of concept table: %s"), rowline, errorhnd->fetchError());
		}
	}
}

