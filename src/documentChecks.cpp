/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Checks of the input contract of documents passed to the matchers
/// \file "documentChecks.cpp"
#include "documentChecks.hpp"
#include "internationalization.hpp"

using namespace clinical;

void clinical::checkDocumentTokens( const analyzer::Document& doc)
{
	const std::vector<analyzer::Token>& tokens = doc.tokens();
	std::vector<analyzer::Token>::const_iterator ti = tokens.begin(), te = tokens.end();
	for (std::size_t tidx=0; ti != te; ++ti,++tidx)
	{
		if (ti->ordpos() != tidx)
		{
			throw logic_error( _TXT("ordinal position %u of token '%s' does not match its index %u in the document"), (unsigned int)ti->ordpos(), ti->literal().c_str(), (unsigned int)tidx);
		}
		if (tidx && (ti-1)->origend() > ti->origpos())
		{
			throw logic_error( _TXT("source offset %u of token %u '%s' overlaps or precedes the previous token ending at %u"), (unsigned int)ti->origpos(), (unsigned int)tidx, ti->literal().c_str(), (unsigned int)(ti-1)->origend());
		}
	}
}
