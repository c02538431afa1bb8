/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Serialization of the entities of a document with their qualifiers
/// \file "documentSerializer.cpp"
#include "documentSerializer.hpp"
#include "internationalization.hpp"
#include <nlohmann/json.hpp>

using namespace clinical;
using json = nlohmann::json;

std::string clinical::serializeDocumentEntities( const analyzer::Document& doc)
{
	json rt = json::array();
	std::vector<analyzer::Entity>::const_iterator ei = doc.entities().begin(), ee = doc.entities().end();
	for (; ei != ee; ++ei)
	{
		json entity = json::object();
		entity["concept"] = ei->concept();
		entity["start"] = ei->start();
		entity["end"] = ei->end();
		entity["text"] = ei->text();

		// The qualifier map is ordered by class name
		json qualifiers = json::array();
		analyzer::Entity::QualifierMap::const_iterator qi = ei->qualifiers().begin(), qe = ei->qualifiers().end();
		for (; qi != qe; ++qi)
		{
			json qualifier = json::object();
			qualifier["name"] = qi->second.className();
			qualifier["value"] = qi->second.value();
			qualifier["is_default"] = qi->second.isDefault();
			if (qi->second.hasProb())
			{
				qualifier["prob"] = qi->second.prob();
			}
			qualifiers.push_back( qualifier);
		}
		entity["qualifiers"] = qualifiers;
		rt.push_back( entity);
	}
	try
	{
		return rt.dump();
	}
	catch (const json::type_error& err)
	{
		throw runtime_error( _TXT("failed to serialize entities: %s"), err.what());
	}
}

