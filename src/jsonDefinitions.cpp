/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Parsing of terms and structured token patterns from JSON definitions
/// \file "jsonDefinitions.cpp"
#include "jsonDefinitions.hpp"
#include "lexems.hpp"
#include "internationalization.hpp"
#include "strus/base/stdint.h"
#include <cstring>
#include <limits>

using namespace clinical;
using json = nlohmann::json;

analyzer::TokenAttribute clinical::parseTokenAttribute( const std::string& name)
{
	if (parser::isEqual( name, "TEXT") || parser::isEqual( name, "ORTH"))
	{
		return analyzer::LiteralText;
	}
	else if (parser::isEqual( name, "NORM") || parser::isEqual( name, "LOWER"))
	{
		return analyzer::NormalizedText;
	}
	throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown token attribute '%s'"), name.c_str());
}

static bool isAttributeName( const std::string& name)
{
	return name == "TEXT" || name == "ORTH" || name == "NORM" || name == "LOWER";
}

static analyzer::TokenConstraint::Quantifier parseQuantifier( const json& op)
{
	if (!op.is_string())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("string expected as value of OP"));
	}
	std::string opstr = op.get<std::string>();
	if (opstr == "?") return analyzer::TokenConstraint::Optional;
	if (opstr == "*") return analyzer::TokenConstraint::ZeroOrMore;
	if (opstr == "+") return analyzer::TokenConstraint::OneOrMore;
	if (opstr == "!") return analyzer::TokenConstraint::Negation;
	if (opstr == "1") return analyzer::TokenConstraint::One;
	throw configuration_error( strus::ErrorCodeSyntax, _TXT("unknown OP '%s', expected one of '?', '*', '+', '!'"), opstr.c_str());
}

static std::vector<std::string> parseStringList( const char* key, const json& list)
{
	std::vector<std::string> rt;
	if (!list.is_array())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("list of strings expected as value of %s"), key);
	}
	json::const_iterator li = list.begin(), le = list.end();
	for (; li != le; ++li)
	{
		if (!li->is_string())
		{
			throw configuration_error( strus::ErrorCodeSyntax, _TXT("list of strings expected as value of %s"), key);
		}
		rt.push_back( li->get<std::string>());
	}
	return rt;
}

static std::string parseString( const char* key, const json& value)
{
	if (!value.is_string())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("string expected as value of %s"), key);
	}
	return value.get<std::string>();
}

static analyzer::TokenConstraint parseAttributeConstraint( analyzer::TokenAttribute attribute, const json& value)
{
	typedef analyzer::TokenConstraint TC;
	if (value.is_string())
	{
		return TC( TC::MatchEqual, attribute, value.get<std::string>());
	}
	if (!value.is_object() || value.size() != 1)
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("string or object with one operator expected as token attribute constraint"));
	}
	json::const_iterator oi = value.begin();
	const std::string& opname = oi.key();
	if (opname == "IN")
	{
		return TC( TC::MatchIn, attribute, parseStringList( "IN", oi.value()));
	}
	else if (opname == "NOT_IN")
	{
		return TC( TC::MatchNotIn, attribute, parseStringList( "NOT_IN", oi.value()));
	}
	else if (opname == "REGEX")
	{
		return TC( TC::MatchRegex, attribute, parseString( "REGEX", oi.value()));
	}
	else if (opname == "FUZZY")
	{
		return TC( TC::MatchFuzzy, attribute, parseString( "FUZZY", oi.value()));
	}
	else if (opname.size() == 6 && 0==std::memcmp( opname.c_str(), "FUZZY", 5) && opname[5] >= '1' && opname[5] <= '9')
	{
		return TC( TC::MatchFuzzy, attribute, parseString( "FUZZY", oi.value()), TC::One, opname[5] - '0');
	}
	throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown token constraint operator '%s'"), opname.c_str());
}

static analyzer::TokenConstraint parseTokenConstraint( const json& constraint)
{
	if (!constraint.is_object())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("object expected as token constraint of a structured pattern"));
	}
	analyzer::TokenConstraint rt;
	bool hasAttribute = false;
	bool hasOp = false;
	analyzer::TokenConstraint::Quantifier quantifier = analyzer::TokenConstraint::One;
	json::const_iterator ci = constraint.begin(), ce = constraint.end();
	for (; ci != ce; ++ci)
	{
		if (ci.key() == "OP")
		{
			hasOp = true;
			quantifier = parseQuantifier( ci.value());
		}
		else if (isAttributeName( ci.key()))
		{
			if (hasAttribute)
			{
				throw configuration_error( strus::ErrorCodeSyntax, _TXT("more than one token attribute in a token constraint"));
			}
			hasAttribute = true;
			rt = parseAttributeConstraint( parseTokenAttribute( ci.key()), ci.value());
		}
		else
		{
			throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown key '%s' in token constraint"), ci.key().c_str());
		}
	}
	if (hasOp) rt.setQuantifier( quantifier);
	return rt;
}

analyzer::TokenPattern clinical::parseTokenPattern( const json& pattern)
{
	analyzer::TokenPattern rt;
	if (!pattern.is_array())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("list of token constraints expected as structured pattern"));
	}
	if (pattern.empty())
	{
		throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("empty structured pattern"));
	}
	json::const_iterator pi = pattern.begin(), pe = pattern.end();
	for (; pi != pe; ++pi)
	{
		rt.push_back( parseTokenConstraint( *pi));
	}
	return rt;
}

static unsigned int parseUnsigned( const char* key, const json& value)
{
	if (!value.is_number_unsigned())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("non negative integer expected as value of '%s'"), key);
	}
	uint64_t vv = value.get<uint64_t>();
	if (vv > std::numeric_limits<unsigned int>::max())
	{
		throw configuration_error( strus::ErrorCodeValueOutOfRange, _TXT("value of '%s' out of range"), key);
	}
	return (unsigned int)vv;
}

analyzer::Term clinical::parseTerm( const json& term)
{
	if (term.is_string())
	{
		return analyzer::Term( term.get<std::string>());
	}
	else if (term.is_array())
	{
		return analyzer::Term( parseTokenPattern( term));
	}
	else if (!term.is_object())
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("string, term object or structured pattern expected as term"));
	}
	json::const_iterator phrase = term.find( "phrase");
	if (phrase == term.end())
	{
		throw configuration_error( strus::ErrorCodeIncompleteDefinition, _TXT("term object without 'phrase'"));
	}
	analyzer::Term rt( parseString( "phrase", *phrase));
	json::const_iterator ti = term.begin(), te = term.end();
	for (; ti != te; ++ti)
	{
		const std::string& key = ti.key();
		if (ti.value().is_null() || key == "phrase") continue;

		if (key == "attr")
		{
			rt.setAttribute( parseTokenAttribute( parseString( "attr", ti.value())));
		}
		else if (key == "proximity")
		{
			rt.setProximity( parseUnsigned( "proximity", ti.value()));
		}
		else if (key == "fuzzy")
		{
			rt.setFuzzy( parseUnsigned( "fuzzy", ti.value()));
		}
		else if (key == "fuzzy_min_len")
		{
			rt.setFuzzyMinLength( parseUnsigned( "fuzzy_min_len", ti.value()));
		}
		else if (key == "pseudo")
		{
			if (!ti.value().is_boolean())
			{
				throw configuration_error( strus::ErrorCodeSyntax, _TXT("boolean expected as value of 'pseudo'"));
			}
			rt.setPseudo( ti.value().get<bool>());
		}
		else
		{
			throw configuration_error( strus::ErrorCodeUnknownIdentifier, _TXT("unknown key '%s' in term object"), key.c_str());
		}
	}
	return rt;
}

json clinical::parseJsonDocument( const std::string& source)
{
	try
	{
		return json::parse( source);
	}
	catch (const json::parse_error& err)
	{
		throw configuration_error( strus::ErrorCodeSyntax, _TXT("JSON syntax error: %s"), err.what());
	}
}

