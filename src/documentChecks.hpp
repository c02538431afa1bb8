/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Checks of the input contract of documents passed to the matchers
/// \file "documentChecks.hpp"
#ifndef _CLINICAL_DOCUMENT_CHECKS_HPP_INCLUDED
#define _CLINICAL_DOCUMENT_CHECKS_HPP_INCLUDED
#include "clinical/analyzer/document.hpp"

namespace clinical {

/// \brief Verify that the ordinal position of every token equals its index and that the source offsets of the tokens are ascending and do not overlap
/// \note Throws a std::logic_error on violation
void checkDocumentTokens( const analyzer::Document& doc);

}//namespace
#endif
