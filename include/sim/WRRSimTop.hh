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

#include <memory>
#include <string>
#include <vector>

#include "config/CLIManager.hh"
#include "dut/DutInterface.hh"
#include "utils/TypeDef.hh"
#include "verif/ConformanceDriver.hh"
#include "verif/PropertyMonitor.hh"
#include "verif/StressRunner.hh"

namespace wrrsim {

/**
 * @file WRRSimTop.hh
 * @brief Top level of a WRRSim conformance run
 *
 * @details
 * ```
 * init(argc, argv)
 *   ├─ registerConfigs()                  "arbiter", "stress", "run" with defaults
 *   ├─ registerWRRSimCLIArguments()       -c/--config, -g/--googletest
 *   ├─ registerCLIArguments()             --num-clients, --cycles, --mode, ...
 *   ├─ parseCLIArguments()
 *   ├─ parseConfigFiles()                 built-in files, then --config files
 *   ├─ setCLIParametersToSimConfig()      CLI overrides
 *   ├─ validateConfigs()
 *   └─ createDut() → ConformanceDriver (+ PropertyMonitor)
 * run()
 *   ├─ ScenarioLibrary::runAll()          mode Scenarios or All
 *   └─ StressRunner::run()                mode Stress or All
 * finish()
 * ```
 * The first verification failure propagates out of run() as a
 * VerificationError. Configuration errors propagate out of init() as
 * std::runtime_error.
 *
 * The global `top` supplies the cycle stamp of every log line.
 */
class WRRSimTop : public CLIManager {
public:
	/// @brief Stress cycle cap under -g,--googletest
	static constexpr Tick kGTestStressCycles = 1000;

	WRRSimTop(const std::vector<std::string>& _configFilePaths = {});

	virtual ~WRRSimTop() = default;

	void init(int argc, char** argv);

	/**
	 * @throws IllegalGrantError, GrantMismatchError, PropertyViolationError
	 */
	void run();

	void finish();

	/// @brief Current cycle of the conformance driver, 0 before init()
	Tick getGlobalTick() const { return this->driver ? this->driver->getCycle() : 0; }

	ConformanceDriver* getDriver() const { return this->driver.get(); }

	const PropertyMonitor* getMonitor() const { return this->monitor.get(); }

	/// @brief Stimulus settings of the "stress" config
	StimulusProfile getStimulusProfile() const;

protected:
	void registerConfigs() override;

	void registerCLIArguments() override;

	/**
	 * @brief Build the device under test
	 *
	 * The default is the built-in RtlArbiter behind the Verilator-style
	 * adapter. Override to drive a Verilator-generated model instead.
	 */
	virtual std::unique_ptr<DutInterface> createDut(size_t _numClients, size_t _weightWidth);

private:
	void initConfig(int argc, char** argv);

	std::unique_ptr<DutInterface>      dut;
	std::unique_ptr<ConformanceDriver> driver;
	std::unique_ptr<PropertyMonitor>   monitor;

	size_t nScenarios   = 0;
	Tick   stressCycles = 0;
};

extern std::shared_ptr<WRRSimTop> top;

}  // namespace wrrsim
