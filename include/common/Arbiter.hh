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

#include <cstddef>
#include <optional>
#include <string>

#include "common/BitVector.hh"
#include "common/WeightTable.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"

namespace wrrsim {

/**
 * @brief Inputs sampled by an arbiter in one clock cycle
 *
 * `request` and `lock` carry one bit per client; `weights` is the full table as
 * seen on the weight bus in the same cycle.
 */
struct ArbiterInputs {
	BitVector   request;
	BitVector   lock;
	WeightTable weights;

	ArbiterInputs() = default;

	ArbiterInputs(const BitVector& _request, const BitVector& _lock, const WeightTable& _weights)
	    : request(_request), lock(_lock), weights(_weights) {}

	/// @brief All-zero request and lock with an all-zero weight table
	static ArbiterInputs idle(size_t _numClients, size_t _weightWidth) {
		return ArbiterInputs(BitVector(_numClients), BitVector(_numClients), WeightTable(_numClients, _weightWidth));
	}
};

/**
 * @file Arbiter.hh
 * @brief Base class for cycle-level arbitration policies
 *
 * @details
 * An Arbiter is a synchronous decision function: once per clock cycle it
 * consumes that cycle's ArbiterInputs and returns the client that holds the
 * grant after the clock edge (or std::nullopt when nobody does).
 *
 * **Implemented Policies:**
 *
 * | Policy | Grant duration | Lock |
 * |--------|----------------|------|
 * | RoundRobin | 1 cycle | ignored |
 * | ArbitrationModel | weight + 1 cycles, early release | owner only |
 *
 * **Design Pattern:**
 * ```
 * 1. Create arbiter with N components
 * 2. Each cycle, call predictNext(inputs)
 * 3. Compare / use the returned grant
 * 4. reset() returns the policy to its power-on state
 * ```
 *
 * **Thread Safety:**
 * - Not thread-safe; every arbiter is owned by exactly one driver
 *
 * @note Component indices are 0-based
 * @see RoundRobin, ArbitrationModel
 */
class Arbiter : virtual public HashableType {
public:
	explicit Arbiter(size_t _num) : componentNum(_num) {}

	virtual ~Arbiter() = default;

	size_t getComponentsNum() const { return this->componentNum; }

	/**
	 * @brief Advance one clock cycle
	 *
	 * @param _inputs request/lock vectors of width getComponentsNum() and the weight table
	 * @return Grant holder after this cycle's clock edge
	 */
	virtual std::optional<ClientId> predictNext(const ArbiterInputs& _inputs) = 0;

	/// @brief Grant holder after the most recent predictNext()
	virtual std::optional<ClientId> getCurrentGrant() const = 0;

	/// @brief Return to the reset state
	virtual void reset() = 0;

	/// @brief One-line internal state for diagnostics
	virtual std::string dumpState() const = 0;

protected:
	/// Asserts that the request and lock vectors match the component count.
	void checkInputs(const ArbiterInputs& _inputs) const;

	/// Number of components competing for arbitration
	size_t componentNum;
};

/**
 * @brief Request-aware round-robin arbitration, one cycle per grant
 *
 * @details
 * Each cycle the first requesting client at or after the pointer wins, and the
 * pointer moves to the winner + 1. Lock bits and weights are ignored, so this
 * is the degenerate case of the weighted policy with every weight 0 and no
 * lock asserted.
 *
 * **Example Sequence (all requesting):**
 * ```
 * predictNext() -> 0
 * predictNext() -> 1
 * predictNext() -> 2
 * predictNext() -> 3
 * predictNext() -> 0  // Wraps around
 * ```
 */
class RoundRobin : public Arbiter {
public:
	explicit RoundRobin(size_t _num) : Arbiter(_num), curIndex(0) {}

	std::optional<ClientId> predictNext(const ArbiterInputs& _inputs) override;

	std::optional<ClientId> getCurrentGrant() const override { return this->current; }

	void reset() override {
		this->curIndex = 0;
		this->current.reset();
	}

	std::string dumpState() const override;

	/// @brief Search start position for the next cycle
	size_t getCurIndex() const { return this->curIndex; }

private:
	size_t                  curIndex;
	std::optional<ClientId> current;
};

}  // namespace wrrsim
