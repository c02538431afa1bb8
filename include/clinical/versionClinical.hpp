/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Version of the clinical libraries
/// \file versionClinical.hpp
#ifndef _CLINICAL_VERSION_HPP_INCLUDED
#define _CLINICAL_VERSION_HPP_INCLUDED

/// \brief clinical toplevel namespace
namespace clinical
{

/// \brief Version number of clinical
#define CLINICAL_VERSION (\
	0 * 1000000\
	+ 1 * 10000\
	+ 0\
)

/// \brief Major version number of clinical
#define CLINICAL_VERSION_MAJOR 0
/// \brief Minor version number of clinical
#define CLINICAL_VERSION_MINOR 1

/// \brief The version of the clinical libraries
#define CLINICAL_VERSION_STRING "0.1.0"

}//namespace
#endif

