/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Internationalization of messages and formatted exceptions
/// \file "internationalization.hpp"
#ifndef _CLINICAL_INTERNATIONALIZATION_HPP_INCLUDED
#define _CLINICAL_INTERNATIONALIZATION_HPP_INCLUDED
#include "strus/errorCodes.hpp"
#include <stdexcept>
#include <string>

#define CLINICAL_GETTEXT_PACKAGE "clinical-dom"
#define CLINICAL_GETTEXT_LOCALEDIR ""

namespace clinical {

/// \brief Get the translated message text for a message string
const char* getMessageText( const char* msg);

/// \brief Bind the text domain of this project once per library
void initMessageTextDomain();

/// \brief Build a runtime error exception with a printf style formatted message
std::runtime_error runtime_error( const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 1, 2)))
#endif
	;

/// \brief Build a logic error exception with a printf style formatted message
/// \note Used for input contract violations of collaborators
std::logic_error logic_error( const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 1, 2)))
#endif
	;

/// \brief Exception for configuration errors carrying an explicit error code
class config_error
	:public std::runtime_error
{
public:
	config_error( strus::ErrorCode errorcode_, const std::string& msg_)
		:std::runtime_error(msg_),m_errorcode(errorcode_){}

	strus::ErrorCode errorcode() const	{return m_errorcode;}

private:
	strus::ErrorCode m_errorcode;
};

/// \brief Build a configuration error exception with a printf style formatted message
config_error configuration_error( strus::ErrorCode errorcode, const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 2, 3)))
#endif
	;

}//namespace

#define _TXT(STRING) clinical::getMessageText(STRING)
#endif

