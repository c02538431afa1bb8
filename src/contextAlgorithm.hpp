/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Rule based qualifier detector propagating trigger qualifiers to the entities in their scope
/// \file "contextAlgorithm.hpp"
#ifndef _CLINICAL_CONTEXT_ALGORITHM_HPP_INCLUDED
#define _CLINICAL_CONTEXT_ALGORITHM_HPP_INCLUDED
#include "clinical/qualifierDetectorInterface.hpp"

/// \brief strus forward declaration
namespace strus {
class ErrorBufferInterface;
}

namespace clinical {

/// \brief Forward declaration
class ContextRuleStoreInterface;

/// \brief Rule based qualifier detector propagating trigger qualifiers to the entities in their scope
/// \remark Trigger scopes never cross sentence boundaries
class ContextAlgorithm
	:public QualifierDetectorInterface
{
public:
	/// \brief Constructor
	/// \param[in] rulestore_ compiled rule store (not owned)
	/// \param[in] errorhnd_ error buffer interface
	ContextAlgorithm( const ContextRuleStoreInterface* rulestore_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_rulestore(rulestore_){}
	virtual ~ContextAlgorithm(){}

	virtual std::vector<analyzer::QualifierClass> qualifierClasses() const;

	virtual bool detect( analyzer::Document& doc) const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
	const ContextRuleStoreInterface* m_rulestore;
};

}//namespace
#endif

