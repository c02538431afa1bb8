/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Bounded edit distance of strings of code points
/// \file "editDistance.hpp"
#ifndef _CLINICAL_EDIT_DISTANCE_HPP_INCLUDED
#define _CLINICAL_EDIT_DISTANCE_HPP_INCLUDED
#include "unicodeUtils.hpp"

namespace clinical {

/// \brief Levenshtein distance with cost 1 for insertion, deletion and substitution (a transposition counts as two edits)
/// \param[in] aa first string
/// \param[in] bb second string
/// \param[in] maxdist maximum distance of interest
/// \return the distance if not bigger than maxdist, maxdist+1 else
unsigned int editDistance( const CodePointString& aa, const CodePointString& bb, unsigned int maxdist);

/// \brief Test if two strings are within a maximum edit distance
static inline bool withinEditDistance( const CodePointString& aa, const CodePointString& bb, unsigned int maxdist)
{
	return editDistance( aa, bb, maxdist) <= maxdist;
}

}//namespace
#endif

