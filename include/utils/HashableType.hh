/*
 * Copyright 2023-2025 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cxxabi.h>

#include <cstdlib>
#include <string>
#include <typeinfo>

namespace promsim {

/**
 * @brief Base class giving every model object a readable runtime type name
 *
 * @details
 * The CLASS_* logging macros use getTypeName() to label their output, so any
 * class that logs through them derives (virtually) from HashableType.
 */
class HashableType {
public:
	HashableType()          = default;
	virtual ~HashableType() = default;

	/**
	 * @brief Demangled name of the most derived type (e.g. "promsim::Memory")
	 */
	inline virtual const std::string getTypeName() const {
		int         status    = 0;
		const char* mangled   = typeid(*this).name();
		char*       demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
		std::string name      = (status == 0 && demangled) ? demangled : mangled;
		std::free(demangled);
		return name;
	}

	/** @brief Hash code of the most derived type */
	inline virtual size_t getTypeHash() const { return typeid(*this).hash_code(); }
};

}  // namespace promsim
