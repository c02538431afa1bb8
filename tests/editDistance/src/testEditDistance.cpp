/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "editDistance.hpp"
#include "unicodeUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <string>

struct TestDef
{
	const char* aa;
	const char* bb;
	unsigned int maxdist;
	unsigned int expected;
};

static const TestDef g_tests[] =
{
	{"diabetes","diabetes",2,0},
	{"diabetes","diabetis",2,1},
	{"diabetes","diabetse",2,2},
	{"diabetes","diabetse",1,2},
	{"diabetes","diabete",2,1},
	{"diabetes","ddiabetes",2,1},
	{"koorts","",3,4},
	{"","",0,0},
	{"kitten","sitting",5,3},
	{"kitten","sitting",1,2},
	{"z\xC3\xAF" "ekte","ziekte",1,1},
	{"\xC3\xA9\xC3\xA9n","een",2,2},
	{0,0,0,0}
};

int main( int argc, const char** argv)
{
	try
	{
		if (argc > 1)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		std::size_t ti = 0;
		for (; g_tests[ti].aa; ++ti)
		{
			clinical::CodePointString aa = clinical::decodeUtf8( g_tests[ti].aa);
			clinical::CodePointString bb = clinical::decodeUtf8( g_tests[ti].bb);
			unsigned int dist = clinical::editDistance( aa, bb, g_tests[ti].maxdist);
			unsigned int reverse = clinical::editDistance( bb, aa, g_tests[ti].maxdist);
			if (dist != g_tests[ti].expected || reverse != dist)
			{
				std::ostringstream msg;
				msg << "edit distance of '" << g_tests[ti].aa << "' and '" << g_tests[ti].bb << "' with maximum " << g_tests[ti].maxdist
					<< " is " << dist << " (reverse " << reverse << "), expected " << g_tests[ti].expected;
				throw std::runtime_error( msg.str());
			}
			bool within = clinical::withinEditDistance( aa, bb, g_tests[ti].maxdist);
			if (within != (g_tests[ti].expected <= g_tests[ti].maxdist))
			{
				throw std::runtime_error( std::string("within edit distance check failed for '") + g_tests[ti].aa + "'");
			}
		}
		std::cerr << "OK" << std::endl;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		std::cerr << "error in edit distance test: " << err.what() << std::endl;
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory in edit distance test" << std::endl;
	}
	return -1;
}

