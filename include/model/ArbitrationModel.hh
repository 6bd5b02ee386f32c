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

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "common/Arbiter.hh"
#include "utils/TypeDef.hh"

namespace wrrsim {

/**
 * @file ArbitrationModel.hh
 * @brief Cycle-exact reference model of the weighted round-robin arbiter with atomic lock
 *
 * @details
 * The model is the oracle the conformance driver compares the DUT against. It
 * predicts the REGISTERED grant: `predictNext(inputs_t)` returns what the DUT
 * drives on its grant output after the clock edge that samples `inputs_t`.
 *
 * **Per-cycle evaluation order:**
 * ```
 *  owner held at start of cycle?
 *     │ no ──────────────────────────────────────────────┐
 *     │ yes                                              │
 *     ▼                                                  │
 *  OwnerRules, first matching guard wins:                │
 *   1. !request[owner]  -> Released  (grant ends)        │
 *   2.  lock[owner]     -> LockHeld  (kept, counter--*)  │
 *   3.  counter > 0     -> Held      (kept, counter--)   │
 *   4.  otherwise       -> Expired   (grant ends)        │
 *     │ ended                                            │
 *     ▼                                                  ▼
 *  rr_ptr = owner + 1 (mod N)         scan request from rr_ptr, cyclic
 *     └──────────────────────────────►  first hit: grant, counter = weight[hit]
 *                                       no hit:  no grant (NoOwner next cycle)
 *  (*) only while counter > 0
 * ```
 *
 * Lock bits of clients other than the owner at the start of the cycle are
 * never consulted. The counter is loaded only when a new grant begins.
 *
 * @code{.cpp}
 * ArbitrationModel model(4);
 * ArbiterInputs in(BitVector::fromUint64(4, 0b0011), BitVector(4), WeightTable::fromValues(4, {1, 0, 0, 0}));
 * model.predictNext(in);  // -> 0 (counter = 1)
 * model.predictNext(in);  // -> 0 (counter = 0)
 * model.predictNext(in);  // -> 1
 * @endcode
 */

/// @brief Persistent arbiter state, mirrored by the DUT's registers
struct ArbiterState {
	ClientId                rrPtr   = 0;  ///< round-robin search start
	std::optional<ClientId> owner;        ///< current grant holder
	uint32_t                counter = 0;  ///< remaining entitled cycles of `owner`

	bool operator==(const ArbiterState&) const = default;
};

/// @brief Which rule decided a cycle
enum class GrantDecision {
	NoOwner,   ///< nothing was held at the start of the cycle
	Released,  ///< owner stopped requesting (work conservation)
	LockHeld,  ///< owner locked; entitlement expiry suppressed
	Held,      ///< owner still entitled
	Expired    ///< entitlement exhausted
};

std::string toString(GrantDecision _decision);

/// @brief Result of one application of the transition function
struct Transition {
	ArbiterState  next;
	GrantDecision decision = GrantDecision::NoOwner;
	bool          newGrant = false;  ///< a grant began this cycle (counter was loaded)
};

/**
 * @brief Guard/decision pair of the owner-evaluation step
 *
 * Rules are evaluated in table order; the first guard that holds decides.
 */
struct OwnerRule {
	GrantDecision decision;
	bool (*guard)(const ArbiterState& _state, const ArbiterInputs& _inputs);
};

/// @brief Ordered owner rules: work conservation > lock > entitlement > expiry
extern const std::array<OwnerRule, 4> kOwnerRules;

/**
 * @brief Pure next-state function
 *
 * @param _state state before the clock edge (taken by value; the caller keeps ownership of its copy)
 * @param _inputs inputs sampled at the clock edge
 * @return next state plus the rule that fired
 */
Transition transition(ArbiterState _state, const ArbiterInputs& _inputs);

class ArbitrationModel : public Arbiter {
public:
	explicit ArbitrationModel(size_t _numClients);

	std::optional<ClientId> predictNext(const ArbiterInputs& _inputs) override;

	std::optional<ClientId> getCurrentGrant() const override { return this->state.owner; }

	void reset() override;

	std::string dumpState() const override;

	const ArbiterState& getState() const { return this->state; }

	GrantDecision getLastDecision() const { return this->lastDecision; }

	bool isNewGrant() const { return this->lastNewGrant; }

private:
	ArbiterState  state;
	GrantDecision lastDecision = GrantDecision::NoOwner;
	bool          lastNewGrant = false;
};

}  // namespace wrrsim
