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

#include "verif/ScenarioLibrary.hh"

#include "utils/Logging.hh"
#include "verif/ConformanceDriver.hh"

namespace wrrsim {

ScenarioBuilder::ScenarioBuilder(const std::string& _name, const std::string& _description, size_t _numClients,
                                 size_t _weightWidth)
    : scenario{_name, _description, _numClients, _weightWidth, {}},
      current(ArbiterInputs::idle(_numClients, _weightWidth)) {}

ScenarioBuilder& ScenarioBuilder::request(uint64_t _mask) {
	this->current.request = BitVector::fromUint64(this->scenario.numClients, _mask);
	return *this;
}

ScenarioBuilder& ScenarioBuilder::lock(uint64_t _mask) {
	this->current.lock = BitVector::fromUint64(this->scenario.numClients, _mask);
	return *this;
}

ScenarioBuilder& ScenarioBuilder::weights(const std::vector<uint32_t>& _values) {
	LABELED_ASSERT_MSG(_values.size() == this->scenario.numClients, this->scenario.name,
	                   "Expected " << this->scenario.numClients << " weights, got " << _values.size() << ".");
	this->current.weights = WeightTable::fromValues(this->scenario.weightWidth, _values);
	return *this;
}

ScenarioBuilder& ScenarioBuilder::expect(std::optional<ClientId> _grant, size_t _cycles) {
	for (size_t i = 0; i < _cycles; ++i) { this->scenario.steps.push_back({this->current, _grant}); }
	return *this;
}

ScenarioLibrary::ScenarioLibrary() {
	constexpr std::optional<ClientId> kNone = std::nullopt;

	// clang-format off
	this->scenarios.push_back(
	    ScenarioBuilder("basic_rotation", "All clients requesting with weight 0 rotate 0,1,2,3,0,...")
	        .weights({0, 0, 0, 0}).request(0b1111)
	        .expect(0).expect(1).expect(2).expect(3)
	        .expect(0).expect(1).expect(2).expect(3)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("weighted_fairness", "Weight k holds the grant for k+1 cycles")
	        .weights({1, 3, 0, 0}).request(0b1111)
	        .expect(0, 2).expect(1, 4).expect(2).expect(3)
	        .expect(0, 2)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("early_drop", "An owner that stops requesting loses the grant immediately")
	        .weights({15, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .request(0b0010)
	        .expect(1, 3)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("lock_hold", "A locked owner keeps the grant far past its weight")
	        .weights({0, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .lock(0b0001).expect(0, 10)
	        .lock(0b0000).expect(1).expect(0)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("illegal_lock", "A lock from a non-owner has no effect until that client owns the grant")
	        .weights({5, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .lock(0b0010).expect(0, 5)
	        .expect(1)
	        .expect(1, 8)
	        .lock(0b0000).expect(0)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("lock_to_switch", "Unlocking after the entitlement is spent switches at once, no reload")
	        .weights({1, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .lock(0b0001).expect(0, 5)
	        .lock(0b0000).expect(1)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("lock_at_expiry", "Lock asserted in the cycle the counter reaches zero keeps the grant")
	        .weights({2, 0, 0, 0}).request(0b0011)
	        .expect(0, 3)
	        .lock(0b0001).expect(0, 3)
	        .lock(0b0000).expect(1)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("drop_while_locked", "Work conservation outranks the lock")
	        .weights({5, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .lock(0b0001).request(0b0010).expect(1)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("weight_lowered_mid_grant", "Lowering a weight does not shorten a grant in progress")
	        .weights({3, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .weights({0, 0, 0, 0}).expect(0, 3)
	        .expect(1).expect(0).expect(1)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("weight_raised_mid_grant", "Raising a weight does not extend a grant in progress")
	        .weights({0, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .weights({7, 0, 0, 0}).expect(1)
	        .expect(0, 8).expect(1)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("weight_change_at_transition", "A new grant loads the weight sampled in its deciding cycle")
	        .weights({0, 0, 0, 0}).request(0b0011)
	        .expect(0)
	        .weights({0, 2, 0, 0}).expect(1, 3)
	        .expect(0)
	        .build());

	this->scenarios.push_back(
	    ScenarioBuilder("idle_rescan", "Idle cycles re-scan from the pointer left by the last grant")
	        .weights({0, 0, 0, 0}).request(0b0000)
	        .expect(kNone, 3)
	        .request(0b1000).expect(3)
	        .request(0b1001).expect(0)
	        .request(0b0000).expect(kNone, 2)
	        .request(0b0011).expect(1)
	        .build());
	// clang-format on
}

const Scenario* ScenarioLibrary::find(const std::string& _name) const {
	for (const auto& s : this->scenarios) {
		if (s.name == _name) return &s;
	}
	return nullptr;
}

bool ScenarioLibrary::run(ConformanceDriver& _driver, const Scenario& _scenario) const {
	if (_driver.getNumClients() != _scenario.numClients || _driver.getWeightWidth() != _scenario.weightWidth) {
		CLASS_WARNING << "Skipping '" << _scenario.name << "': written for " << _scenario.numClients << "x"
		              << _scenario.weightWidth << ", the DUT is " << _driver.getNumClients() << "x"
		              << _driver.getWeightWidth() << ".";
		return false;
	}

	CLASS_INFO << "--- Scenario " << _scenario.name << ": " << _scenario.description << " ---";

	_driver.reset();
	for (const auto& step : _scenario.steps) {
		CycleRecord record = _driver.step(step.inputs);
		_driver.expect(record, step.expected, _scenario.name);
	}
	return true;
}

size_t ScenarioLibrary::runAll(ConformanceDriver& _driver, const std::string& _only) const {
	if (_only != "all") {
		const Scenario* s = this->find(_only);
		CLASS_ASSERT_MSG(s != nullptr, "Unknown scenario '" << _only << "'.");
		return this->run(_driver, *s) ? 1 : 0;
	}

	size_t executed = 0;
	for (const auto& s : this->scenarios) {
		if (this->run(_driver, s)) ++executed;
	}
	CLASS_INFO << executed << " of " << this->scenarios.size() << " scenarios passed.";
	return executed;
}

size_t ScenarioLibrary::countRunnable(size_t _numClients, size_t _weightWidth, const std::string& _only) const {
	size_t count = 0;
	for (const auto& s : this->scenarios) {
		if (_only != "all" && s.name != _only) continue;
		if (s.numClients == _numClients && s.weightWidth == _weightWidth) ++count;
	}
	return count;
}

}  // namespace wrrsim
