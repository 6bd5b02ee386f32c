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

/**
 * @file WRRSimConfig.hh
 * @brief The SimConfigs of the WRRSim conformance runner
 *
 * | JSON key | Class | Parameters |
 * |----------|-------|------------|
 * | `"arbiter"` | WRRSimConfig | num_clients, weight_width |
 * | `"stress"` | StressConfig | cycles, seed, request_probability, lock_probability, weight_period |
 * | `"run"` | RunConfig | mode, scenario, monitor |
 *
 * `run.mode` is an enum given as `{"type": "RunMode", "params": "Stress"}`.
 */

#pragma once

#include <map>
#include <string>

#include "config/SimConfig.hh"
#include "utils/TypeDef.hh"

namespace wrrsim {

enum class RunMode { Scenarios, Stress, All };

// for the CLI to parse --mode
extern std::map<std::string, RunMode> RunModeMap;

// for printing the parameter
extern std::map<RunMode, std::string> RunModeReMap;

/**
 * @brief Geometry of the arbiter under test
 *
 * Only used for DUTs whose parameters are chosen at construction; a DUT that
 * reports its own N and W is driven with those.
 */
class WRRSimConfig : public SimConfig {
public:
	WRRSimConfig(const std::string& _name = "arbiter") : SimConfig(_name) {
		this->addParameter<int>("num_clients", 4, ParamType::INT);
		this->addParameter<int>("weight_width", 4, ParamType::INT);
	}

	void validate() const override;
};

class StressConfig : public SimConfig {
public:
	StressConfig(const std::string& _name = "stress") : SimConfig(_name) {
		this->addParameter<Tick>("cycles", 5000, ParamType::TICK);
		this->addParameter<int>("seed", 1, ParamType::INT);
		this->addParameter<double>("request_probability", 0.8, ParamType::FLOAT);
		this->addParameter<double>("lock_probability", 0.1, ParamType::FLOAT);
		this->addParameter<int>("weight_period", 64, ParamType::INT);
	}

	void validate() const override;
};

class RunConfig : public SimConfig {
public:
	RunConfig(const std::string& _name = "run") : SimConfig(_name) {
		this->addParameter<RunMode>("mode", RunMode::All, ParamType::USER_DEFINED);
		this->addParameter<std::string>("scenario", "all", ParamType::STRING);
		this->addParameter<int>("monitor", 1, ParamType::INT);
	}

	/// @brief `scenario` must be "all" or the name of a library scenario
	void validate() const override;

protected:
	void parseParametersUserDefined(const std::string& _paramName, const json& _paramValue) override;
};

}  // namespace wrrsim
