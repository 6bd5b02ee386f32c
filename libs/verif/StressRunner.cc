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

#include "verif/StressRunner.hh"

#include <iomanip>

#include "utils/Logging.hh"

namespace wrrsim {

namespace {

/// Keeps an observer attached to the driver for the lifetime of the scope
class ScopedObserver {
public:
	ScopedObserver(ConformanceDriver& _driver, CycleObserver* _observer) : driver(_driver), observer(_observer) {
		this->driver.addObserver(this->observer);
	}

	~ScopedObserver() { this->driver.removeObserver(this->observer); }

private:
	ConformanceDriver& driver;
	CycleObserver*     observer;
};

}  // namespace

void StressReport::onReset() {
	this->cycles = this->idleCycles = this->grants = this->switches = 0;
	this->lockHeldCycles = this->earlyReleases = this->expirations = 0;
	this->runOwner.reset();
	this->lastOwner.reset();
	this->runLength = 0;
	this->grantRuns.clear();
}

void StressReport::closeRun() {
	if (this->runOwner) this->grantRuns.getEntry(*this->runOwner).push(this->runLength);
	this->runOwner.reset();
	this->runLength = 0;
}

void StressReport::onCycle(const CycleRecord& _record) {
	++this->cycles;

	switch (_record.decision) {
		case GrantDecision::LockHeld: ++this->lockHeldCycles; break;
		case GrantDecision::Released: ++this->earlyReleases; break;
		case GrantDecision::Expired: ++this->expirations; break;
		default: break;
	}

	if (!_record.observed) {
		++this->idleCycles;
		this->closeRun();
		return;
	}

	if (_record.newGrant) {
		this->closeRun();
		++this->grants;
		if (this->lastOwner && *this->lastOwner != *_record.observed) ++this->switches;
		this->runOwner  = _record.observed;
		this->lastOwner = _record.observed;
	}
	++this->runLength;
}

void StressReport::finish() { this->closeRun(); }

uint64_t StressReport::getGrantCycles(ClientId _client) const {
	for (const auto& [client, runs] : this->grantRuns) {
		if (client == _client) return runs.sum();
	}
	return 0;
}

void StressReport::log() const {
	LABELED_STATISTICS("StressReport") << "cycles=" << this->cycles << " idle=" << this->idleCycles
	                                   << " grants=" << this->grants << " switches=" << this->switches;
	LABELED_STATISTICS("StressReport") << "lock-held cycles=" << this->lockHeldCycles
	                                   << " early releases=" << this->earlyReleases
	                                   << " expirations=" << this->expirations;

	const auto share = this->grantRuns.sumDistribution();
	for (const auto& [client, runs] : this->grantRuns) {
		LABELED_STATISTICS("StressReport") << "client " << client << ": " << runs.sum() << " cycles ("
		                                   << std::fixed << std::setprecision(1) << share.at(client) * 100.0
		                                   << "%), " << runs.size() << " grants, avg run " << std::setprecision(2)
		                                   << runs.avg() << ", max run " << runs.max();
	}
}

StressRunner::StressRunner(ConformanceDriver& _driver, const StimulusProfile& _profile, Tick _cycles)
    : driver(_driver), profile(_profile), cycles(_cycles) {
	CLASS_ASSERT_MSG(_cycles > 0, "A stress run needs a positive cycle budget.");
}

const StressReport& StressRunner::run() {
	ScopedObserver    attach(this->driver, &this->report);
	StimulusGenerator gen(this->driver.getNumClients(), this->driver.getWeightWidth(), this->profile);

	CLASS_INFO << "Stress: " << this->cycles << " cycles, seed=" << this->profile.seed
	           << " p(req)=" << this->profile.requestProbability << " p(lock)=" << this->profile.lockProbability
	           << " weight period=" << this->profile.weightPeriod;

	this->driver.reset();
	for (Tick i = 0; i < this->cycles; ++i) { this->driver.step(gen.next()); }

	this->report.finish();
	CLASS_INFO << "Stress passed after " << this->report.getCycles() << " cycles.";
	this->report.log();
	return this->report;
}

}  // namespace wrrsim
