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
#include <string>
#include <vector>

#include "common/Arbiter.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"

namespace wrrsim {

class ConformanceDriver;

/**
 * @brief One step of a directed scenario: inputs plus the grant expected after the edge
 */
struct ScenarioStep {
	ArbiterInputs           inputs;
	std::optional<ClientId> expected;
};

struct Scenario {
	std::string               name;
	std::string               description;
	size_t                    numClients;
	size_t                    weightWidth;
	std::vector<ScenarioStep> steps;
};

/**
 * @brief Fluent construction of a Scenario
 *
 * Inputs are sticky: request(), lock() and weights() change the inputs of
 * every following expect() until changed again, the way a testbench holds a
 * signal at its last driven value.
 *
 * @code{.cpp}
 * Scenario s = ScenarioBuilder("lock_to_switch", "...")
 *                  .weights({1, 0, 0, 0}).request(0b0011).expect(0)
 *                  .lock(0b0001).expect(0, 5)
 *                  .lock(0b0000).expect(1)
 *                  .build();
 * @endcode
 */
class ScenarioBuilder {
public:
	ScenarioBuilder(const std::string& _name, const std::string& _description, size_t _numClients = 4,
	                size_t _weightWidth = 4);

	ScenarioBuilder& request(uint64_t _mask);
	ScenarioBuilder& lock(uint64_t _mask);
	ScenarioBuilder& weights(const std::vector<uint32_t>& _values);

	/// @brief Append `_cycles` steps with the current inputs, each expecting `_grant`
	ScenarioBuilder& expect(std::optional<ClientId> _grant, size_t _cycles = 1);

	Scenario build() const { return this->scenario; }

private:
	Scenario      scenario;
	ArbiterInputs current;
};

/**
 * @brief Directed scenarios targeting the rule interactions of the arbiter
 *
 * All scenarios are written for 4 clients with 4-bit weights and start from
 * reset. Expected grants are the registered grant after each step's edge.
 */
class ScenarioLibrary : virtual public HashableType {
public:
	ScenarioLibrary();

	const std::vector<Scenario>& getScenarios() const { return this->scenarios; }

	/// @return nullptr if no scenario has that name
	const Scenario* find(const std::string& _name) const;

	/**
	 * @brief Reset the driver, then step and check every step of `_scenario`
	 *
	 * @return false (with a warning) if the driver's geometry differs from the scenario's
	 * @throws IllegalGrantError, GrantMismatchError, PropertyViolationError
	 */
	bool run(ConformanceDriver& _driver, const Scenario& _scenario) const;

	/**
	 * @brief Run every scenario, or only `_only` when it is not "all"
	 * @return number of scenarios executed
	 */
	size_t runAll(ConformanceDriver& _driver, const std::string& _only = "all") const;

	/// @brief How many of the scenarios selected by `_only` runAll() would execute on an N x W driver
	size_t countRunnable(size_t _numClients, size_t _weightWidth, const std::string& _only = "all") const;

private:
	std::vector<Scenario> scenarios;
};

}  // namespace wrrsim
