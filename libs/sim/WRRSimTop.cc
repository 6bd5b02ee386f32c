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

#include "sim/WRRSimTop.hh"

#include <exception>
#include <utility>

#include "config/WRRSimConfig.hh"
#include "dut/RtlArbiter.hh"
#include "dut/VerilatedDut.hh"
#include "utils/Logging.hh"
#include "verif/ScenarioLibrary.hh"

namespace wrrsim {

std::shared_ptr<WRRSimTop> top = nullptr;

WRRSimTop::WRRSimTop(const std::vector<std::string>& _configFilePaths)
    : CLIManager("WRRSim: weighted round-robin arbiter conformance runner", _configFilePaths) {
	// Register custom terminate function
	// Ref: https://en.cppreference.com/w/cpp/error/set_terminate
	std::set_terminate(&LogOStream::handleTerminate);
}

void WRRSimTop::registerConfigs() {
	this->addConfig("arbiter", new WRRSimConfig("arbiter"));
	this->addConfig("stress", new StressConfig("stress"));
	this->addConfig("run", new RunConfig("run"));
}

void WRRSimTop::registerCLIArguments() {
	this->addCLIOption<int>("--num-clients", "Number of clients N of the built-in DUT", "arbiter", "num_clients");
	this->addCLIOption<int>("--weight-width", "Weight width W of the built-in DUT", "arbiter", "weight_width");

	this->addCLIOption<Tick>("--cycles", "Cycle budget of the stress run", "stress", "cycles");
	this->addCLIOption<int>("--seed", "Seed of the stress stimulus", "stress", "seed");
	this->addCLIOption<double>("--req-prob", "Per-client request probability", "stress", "request_probability");
	this->addCLIOption<double>("--lock-prob", "Per-client lock probability", "stress", "lock_probability");
	this->addCLIOption<int>("--weight-period", "Cycles between weight table re-draws", "stress", "weight_period");

	this->addCLIOption<RunMode>("--mode", "What to run: Scenarios, Stress or All", "run", "mode")
	    ->transform(CLI::CheckedTransformer(RunModeMap, CLI::ignore_case));
	this->addCLIOption<std::string>("--scenario", "Directed scenario to run, or \"all\"", "run", "scenario");
	this->addCLIOption<int>("--monitor", "Attach the property monitor (1) or not (0)", "run", "monitor");
}

void WRRSimTop::initConfig(int argc, char** argv) {
	// [Priority #3 : SimConfig Default Value]
	this->registerConfigs();

	this->registerWRRSimCLIArguments();
	this->registerCLIArguments();

	this->parseCLIArguments(argc, argv);

	// [Priority #2 : JSON Configuration File] built-in paths first, then --config
	this->parseConfigFiles(this->getAllConfigFilePaths());

	// [Priority #1 : CLI Arguments]
	this->setCLIParametersToSimConfig();

	this->validateConfigs();

	VERBOSE_CLASS_INFO << "[WRRSim] Command Line Arguments:";
	VERBOSE_CLASS_INFO << "	- Google Test (1:Enabled / 0:Disabled): " + std::to_string(this->gTestMode);
	VERBOSE_CLASS_INFO << "	- Run Mode: " + RunModeReMap[this->getParameter<RunMode>("run", "mode")];
}

std::unique_ptr<DutInterface> WRRSimTop::createDut(size_t _numClients, size_t _weightWidth) {
	return std::make_unique<VerilatedDut<RtlArbiter>>(std::make_unique<RtlArbiter>(_numClients, _weightWidth));
}

StimulusProfile WRRSimTop::getStimulusProfile() const {
	StimulusProfile profile;
	profile.seed               = static_cast<uint64_t>(this->getParameter<int>("stress", "seed"));
	profile.requestProbability = this->getParameter<double>("stress", "request_probability");
	profile.lockProbability    = this->getParameter<double>("stress", "lock_probability");
	profile.weightPeriod       = static_cast<Tick>(this->getParameter<int>("stress", "weight_period"));
	return profile;
}

void WRRSimTop::init(int argc, char** argv) {
	this->initConfig(argc, argv);

	const auto n = static_cast<size_t>(this->getParameter<int>("arbiter", "num_clients"));
	const auto w = static_cast<size_t>(this->getParameter<int>("arbiter", "weight_width"));

	auto dut    = this->createDut(n, w);
	auto driver = std::make_unique<ConformanceDriver>(*dut);

	// A scenarios-only run that would skip every scenario checks nothing
	const auto scenario = this->getParameter<std::string>("run", "scenario");
	if (this->getParameter<RunMode>("run", "mode") == RunMode::Scenarios &&
	    ScenarioLibrary().countRunnable(driver->getNumClients(), driver->getWeightWidth(), scenario) == 0) {
		CLASS_ERROR << "No scenario '" << scenario << "' is written for a " << driver->getNumClients() << "x"
		            << driver->getWeightWidth() << " DUT. Use --mode Stress on this geometry.";
	}

	this->dut    = std::move(dut);
	this->driver = std::move(driver);

	if (this->getParameter<int>("run", "monitor") != 0) {
		this->monitor = std::make_unique<PropertyMonitor>();
		this->driver->addObserver(this->monitor.get());
	}
}

void WRRSimTop::run() {
	CLASS_ASSERT_MSG(this->driver, "WRRSimTop::run() called before init().");

	const RunMode mode = this->getParameter<RunMode>("run", "mode");

	if (mode == RunMode::Scenarios || mode == RunMode::All) {
		ScenarioLibrary library;
		this->nScenarios = library.runAll(*this->driver, this->getParameter<std::string>("run", "scenario"));
	}

	if (mode == RunMode::Stress || mode == RunMode::All) {
		Tick cycles = this->getParameter<Tick>("stress", "cycles");
		if (this->isGTestMode() && cycles > kGTestStressCycles) {
			CLASS_INFO << "Google Test mode: stress run shortened from " << cycles << " to " << kGTestStressCycles
			           << " cycles.";
			cycles = kGTestStressCycles;
		}

		StressRunner runner(*this->driver, this->getStimulusProfile(), cycles);
		this->stressCycles = runner.run().getCycles();
	}
}

void WRRSimTop::finish() {
	LABELED_STATISTICS("WRRSim") << "Scenarios passed: " << this->nScenarios;
	LABELED_STATISTICS("WRRSim") << "Stress cycles passed: " << this->stressCycles;
	if (this->monitor) {
		LABELED_STATISTICS("WRRSim") << "Cycles checked by the property monitor: " << this->monitor->getCheckedCycles();
	}
	CLASS_INFO << "Conformance run finished.";
}

}  // namespace wrrsim
