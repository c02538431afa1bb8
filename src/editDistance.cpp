/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Bounded edit distance of strings of code points
/// \file "editDistance.cpp"
#include "editDistance.hpp"
#include <vector>
#include <algorithm>

using namespace clinical;

unsigned int clinical::editDistance( const CodePointString& aa, const CodePointString& bb, unsigned int maxdist)
{
	std::size_t alen = aa.size();
	std::size_t blen = bb.size();
	std::size_t lendiff = alen > blen ? (alen - blen) : (blen - alen);
	if (lendiff > maxdist) return maxdist+1;
	if (alen == 0) return (unsigned int)blen;
	if (blen == 0) return (unsigned int)alen;

	std::vector<unsigned int> prev( blen+1);
	std::vector<unsigned int> cur( blen+1);
	std::size_t bi = 0;
	for (; bi <= blen; ++bi) prev[ bi] = (unsigned int)bi;

	std::size_t ai = 1;
	for (; ai <= alen; ++ai)
	{
		cur[0] = (unsigned int)ai;
		unsigned int rowmin = cur[0];
		for (bi = 1; bi <= blen; ++bi)
		{
			unsigned int subst = prev[ bi-1] + (aa[ ai-1] == bb[ bi-1] ? 0:1);
			unsigned int dele = prev[ bi] + 1;
			unsigned int inse = cur[ bi-1] + 1;
			cur[ bi] = std::min( subst, std::min( dele, inse));
			if (cur[ bi] < rowmin) rowmin = cur[ bi];
		}
		if (rowmin > maxdist) return maxdist+1;
		prev.swap( cur);
	}
	return prev[ blen] > maxdist ? maxdist+1 : prev[ blen];
}

