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

#include <optional>
#include <string>

#include "common/BitVector.hh"
#include "utils/TypeDef.hh"
#include "verif/VerifError.hh"

namespace wrrsim {

/// @brief Shape of a sampled grant bus
enum class GrantKind { None, Single, Multiple };

/**
 * @brief Decoded grant bus
 *
 * All-zero decodes to None, exactly one set bit to Single with its index, and
 * anything else to Multiple.
 */
struct DecodedGrant {
	GrantKind kind  = GrantKind::None;
	ClientId  index = 0;  ///< valid only for GrantKind::Single

	static DecodedGrant decode(const BitVector& _grant);

	/// @note Asserts on GrantKind::Multiple, which has no single-index form
	std::optional<ClientId> toOptional() const;
};

/**
 * @brief Compares an observed grant bus against an expected grant
 *
 * The one-hot check runs first and independently of the expectation: a
 * multi-grant is reported as IllegalGrantError even when no expectation is
 * available.
 */
class GrantComparator {
public:
	/// @throws IllegalGrantError on more than one set bit
	static std::optional<ClientId> decodeOrThrow(Tick _cycle, const BitVector& _observed);

	/**
	 * @brief Full check of one cycle
	 *
	 * @param _ctx diagnostic context; `observed` and `expected` are filled in here
	 * @throws IllegalGrantError, GrantMismatchError
	 */
	static void check(const BitVector& _observed, const std::optional<ClientId>& _expected, MismatchContext _ctx);
};

}  // namespace wrrsim
