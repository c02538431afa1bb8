/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the clinical token pattern matching library
/// \file libclinical_pattern.cpp
#include "clinical/lib/pattern.hpp"
#include "strus/errorBufferInterface.hpp"
#include "tokenPatternMatch.hpp"
#include "tokenizer.hpp"
#include "strus/base/dll_tags.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"

using namespace clinical;
static bool g_intl_initialized = false;

DLL_PUBLIC TokenPatternMatchInterface* clinical::createTokenPatternMatch_std( strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		if (!g_intl_initialized)
		{
			clinical::initMessageTextDomain();
			g_intl_initialized = true;
		}
		return new TokenPatternMatch( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating token pattern match interface: %s"), *errorhnd, 0);
}

DLL_PUBLIC TokenizerInterface* clinical::createTokenizer_std( strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		if (!g_intl_initialized)
		{
			clinical::initMessageTextDomain();
			g_intl_initialized = true;
		}
		return new Tokenizer( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating tokenizer: %s"), *errorhnd, 0);
}

