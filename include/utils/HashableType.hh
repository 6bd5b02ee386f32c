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

#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#include <string>
#include <typeinfo>

namespace wrrsim {

/**
 * @class HashableType
 * @brief Provides the demangled name of the most derived type.
 *
 * Used as the label source of the CLASS_* logging macros, so every class that
 * logs through them derives (virtually) from HashableType.
 */
class HashableType {
public:
	HashableType()          = default;
	virtual ~HashableType() = default;

	/**
	 * @brief Retrieves the demangled name of the most derived type.
	 *
	 * Falls back to the mangled name when the ABI demangler fails.
	 */
	inline virtual const std::string getTypeName() const {
		const char* mangled = typeid(*this).name();
		int         status  = 0;

		std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(mangled, nullptr, nullptr, &status),
		                                                 std::free);
		return (status == 0 && demangled) ? std::string(demangled.get()) : std::string(mangled);
	}
};

}  // namespace wrrsim
