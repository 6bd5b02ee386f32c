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

#include <cstdint>
#include <optional>

#include "profiling/Statistics.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"
#include "verif/ConformanceDriver.hh"
#include "verif/StimulusGenerator.hh"

namespace wrrsim {

/**
 * @brief Coverage counters of a stress run
 *
 * A grant run is the span of consecutive cycles one client holds the grant,
 * from its new grant until it loses it or is granted afresh.
 */
class StressReport : public CycleObserver, virtual public HashableType {
public:
	void onReset() override;

	void onCycle(const CycleRecord& _record) override;

	/// @brief Close the grant run still in progress
	void finish();

	/// @brief Print the counters with LABELED_STATISTICS
	void log() const;

	uint64_t getCycles() const { return this->cycles; }
	uint64_t getIdleCycles() const { return this->idleCycles; }
	uint64_t getGrants() const { return this->grants; }
	uint64_t getSwitches() const { return this->switches; }
	uint64_t getLockHeldCycles() const { return this->lockHeldCycles; }
	uint64_t getEarlyReleases() const { return this->earlyReleases; }
	uint64_t getExpirations() const { return this->expirations; }

	/// @brief Cycles `_client` held the grant, valid after finish()
	uint64_t getGrantCycles(ClientId _client) const;

	const CategorizedStatistics<ClientId, uint64_t>& getGrantRuns() const { return this->grantRuns; }

private:
	void closeRun();

	uint64_t cycles         = 0;
	uint64_t idleCycles     = 0;
	uint64_t grants         = 0;
	uint64_t switches       = 0;  // new grants to a different client
	uint64_t lockHeldCycles = 0;
	uint64_t earlyReleases  = 0;
	uint64_t expirations    = 0;

	std::optional<ClientId>                   runOwner;
	uint64_t                                  runLength = 0;
	std::optional<ClientId>                   lastOwner;
	CategorizedStatistics<ClientId, uint64_t> grantRuns;
};

/**
 * @brief Randomized stress: a fixed cycle budget of generated inputs
 *
 * Every cycle goes through ConformanceDriver::step(), so the first model
 * divergence or illegal grant aborts the run with its exception. The budget is
 * fixed; there is no time-out or early stop on success.
 */
class StressRunner : virtual public HashableType {
public:
	StressRunner(ConformanceDriver& _driver, const StimulusProfile& _profile, Tick _cycles);

	/**
	 * @brief Reset the driver and run the whole budget
	 * @throws IllegalGrantError, GrantMismatchError, PropertyViolationError
	 */
	const StressReport& run();

	const StressReport& getReport() const { return this->report; }

private:
	ConformanceDriver& driver;
	StimulusProfile    profile;
	Tick               cycles;
	StressReport       report;
};

}  // namespace wrrsim
