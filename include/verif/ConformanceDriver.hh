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
#include <vector>

#include "common/Arbiter.hh"
#include "dut/DutInterface.hh"
#include "model/ArbitrationModel.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"
#include "verif/VerifError.hh"

namespace wrrsim {

/// @brief Everything observed in one driven cycle
struct CycleRecord {
	Tick                    cycle = 0;
	ArbiterInputs           inputs;
	BitVector               observedRaw;
	std::optional<ClientId> observed;
	std::optional<ClientId> predicted;
	GrantDecision           decision = GrantDecision::NoOwner;
	bool                    newGrant = false;
	ArbiterState            modelState;  ///< model state after the cycle
};

/**
 * @brief Per-cycle hook for checkers and statistics
 *
 * Observers see a cycle only after the DUT/model comparison of that cycle has
 * passed.
 */
class CycleObserver {
public:
	virtual ~CycleObserver() = default;

	virtual void onReset() {}

	virtual void onCycle(const CycleRecord& _record) = 0;
};

/**
 * @file ConformanceDriver.hh
 * @brief Lock-step driver of the DUT and the reference model
 *
 * @details
 * **One cycle (step()):**
 * ```
 *  apply request/lock/weight ──► eval()           inputs settle
 *  clk = 1 ──────────────────► eval()             rising edge, registers load
 *  clk = 0 ──────────────────► eval()             settle before sampling
 *  sample o_gnt
 *  model.predictNext(same inputs)
 *  compare (one-hot first, then model)            throws on first failure
 *  notify observers
 * ```
 * Next-cycle inputs are never applied before the current cycle's grant has
 * been sampled, so there is no race between stimulus and observation.
 *
 * **Reset (reset()):**
 * ```
 *  rst_n = 0, inputs cleared, 2 clock periods
 *  rst_n = 1, one clock period with idle inputs (model mirrors it)
 * ```
 *
 * **Geometry:** N and W are read from the DUT. A DUT that does not publish
 * them is driven with N=4, W=4 and a warning is logged.
 */
class ConformanceDriver : virtual public HashableType {
public:
	static constexpr size_t kDefaultNumClients  = 4;
	static constexpr size_t kDefaultWeightWidth = 4;

	explicit ConformanceDriver(DutInterface& _dut);

	virtual ~ConformanceDriver() = default;

	void reset();

	/**
	 * @brief Drive one cycle and compare DUT against the model
	 * @throws IllegalGrantError, GrantMismatchError, PropertyViolationError (from observers)
	 */
	CycleRecord step(const ArbiterInputs& _inputs);

	/**
	 * @brief Check a stepped cycle against an externally known grant
	 * @param _source label reported in the mismatch context, e.g. a scenario name
	 * @throws GrantMismatchError
	 */
	void expect(const CycleRecord& _record, const std::optional<ClientId>& _expected,
	            const std::string& _source) const;

	/// @brief Observers are not owned; they must outlive the driver or be removed
	void addObserver(CycleObserver* _observer) { this->observers.push_back(_observer); }

	void removeObserver(CycleObserver* _observer);

	size_t getNumClients() const { return this->numClients; }

	size_t getWeightWidth() const { return this->weightWidth; }

	/// @brief Cycles stepped since the last reset
	Tick getCycle() const { return this->cycle; }

	const ArbitrationModel& getModel() const { return this->model; }

	/// @brief Idle inputs of the driver's geometry
	ArbiterInputs idleInputs() const { return ArbiterInputs::idle(this->numClients, this->weightWidth); }

private:
	void applyInputs(const ArbiterInputs& _inputs);

	void clockPeriod();

	MismatchContext makeContext(const CycleRecord& _record, const std::string& _source) const;

	DutInterface&               dut;
	size_t                      numClients;
	size_t                      weightWidth;
	ArbitrationModel            model;
	Tick                        cycle = 0;
	std::vector<CycleObserver*> observers;
};

}  // namespace wrrsim
