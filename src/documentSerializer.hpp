/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Serialization of the entities of a document with their qualifiers
/// \file "documentSerializer.hpp"
#ifndef _CLINICAL_DOCUMENT_SERIALIZER_HPP_INCLUDED
#define _CLINICAL_DOCUMENT_SERIALIZER_HPP_INCLUDED
#include "clinical/analyzer/document.hpp"
#include <string>

namespace clinical {

/// \brief Render the entities of a document as JSON array of {"concept","start","end","text","qualifiers":[...]}
/// \note Throws on error
std::string serializeDocumentEntities( const analyzer::Document& doc);

}//namespace
#endif

