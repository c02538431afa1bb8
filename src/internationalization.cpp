/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Internationalization of messages and formatted exceptions
/// \file "internationalization.cpp"
#include "internationalization.hpp"
#include <libintl.h>
#include <cstdarg>
#include <cstdio>

using namespace clinical;

const char* clinical::getMessageText( const char* msg)
{
	return ::dgettext( CLINICAL_GETTEXT_PACKAGE, msg);
}

void clinical::initMessageTextDomain()
{
	if (CLINICAL_GETTEXT_LOCALEDIR[0])
	{
		::bindtextdomain( CLINICAL_GETTEXT_PACKAGE, CLINICAL_GETTEXT_LOCALEDIR);
	}
}

static std::string formatMessage( const char* format, va_list args)
{
	char buf[ 2048];
	int len = ::vsnprintf( buf, sizeof(buf), format, args);
	if (len < 0) return std::string( format);
	if ((std::size_t)len >= sizeof(buf))
	{
		buf[ sizeof(buf)-1] = 0;
	}
	return std::string( buf);
}

std::runtime_error clinical::runtime_error( const char* format, ...)
{
	va_list ap;
	va_start( ap, format);
	std::string msg = formatMessage( format, ap);
	va_end( ap);
	return std::runtime_error( msg);
}

std::logic_error clinical::logic_error( const char* format, ...)
{
	va_list ap;
	va_start( ap, format);
	std::string msg = formatMessage( format, ap);
	va_end( ap);
	return std::logic_error( msg);
}

config_error clinical::configuration_error( strus::ErrorCode errorcode, const char* format, ...)
{
	va_list ap;
	va_start( ap, format);
	std::string msg = formatMessage( format, ap);
	va_end( ap);
	return config_error( errorcode, msg);
}

