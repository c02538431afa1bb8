/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Macros for mapping exceptions to the error buffer at interface boundaries
/// \file "errorUtils.hpp"
#ifndef _CLINICAL_ERROR_UTILS_HPP_INCLUDED
#define _CLINICAL_ERROR_UTILS_HPP_INCLUDED
#include "strus/errorBufferInterface.hpp"
#include "strus/errorCodes.hpp"
#include "internationalization.hpp"
#include <stdexcept>
#include <new>

#define CATCH_ERROR_MAP( contextExplainText, errorBuffer)\
	catch (const std::bad_alloc&)\
	{\
		(errorBuffer).report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));\
	}\
	catch (const clinical::config_error& err)\
	{\
		(errorBuffer).report( err.errorcode(), contextExplainText, err.what());\
	}\
	catch (const std::runtime_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeRuntimeError, contextExplainText, err.what());\
	}\
	catch (const std::logic_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeLogicError, contextExplainText, err.what());\
	}

#define CATCH_ERROR_MAP_RETURN( contextExplainText, errorBuffer, errorReturnValue)\
	catch (const std::bad_alloc&)\
	{\
		(errorBuffer).report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));\
		return errorReturnValue;\
	}\
	catch (const clinical::config_error& err)\
	{\
		(errorBuffer).report( err.errorcode(), contextExplainText, err.what());\
		return errorReturnValue;\
	}\
	catch (const std::runtime_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeRuntimeError, contextExplainText, err.what());\
		return errorReturnValue;\
	}\
	catch (const std::logic_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeLogicError, contextExplainText, err.what());\
		return errorReturnValue;\
	}

#endif

