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

#include "config/WRRSimConfig.hh"

#include "utils/Logging.hh"
#include "verif/ScenarioLibrary.hh"

namespace wrrsim {

std::map<std::string, RunMode> RunModeMap = {
    {"Scenarios", RunMode::Scenarios}, {"Stress", RunMode::Stress}, {"All", RunMode::All}};

std::map<RunMode, std::string> RunModeReMap = {
    {RunMode::Scenarios, "RunMode::Scenarios"}, {RunMode::Stress, "RunMode::Stress"}, {RunMode::All, "RunMode::All"}};

void WRRSimConfig::validate() const {
	const int n = this->getParameter<int>("num_clients");
	const int w = this->getParameter<int>("weight_width");

	LABELED_ASSERT_MSG(n >= 1 && n <= 64, this->getName(), "num_clients=" << n << " is not in [1, 64].");
	LABELED_ASSERT_MSG(w >= 1 && w <= 32, this->getName(), "weight_width=" << w << " is not in [1, 32].");
	LABELED_ASSERT_MSG(n * w <= 64, this->getName(),
	                   "num_clients * weight_width = " << n * w << " does not fit the 64-bit weight bus.");
}

void StressConfig::validate() const {
	const double pReq  = this->getParameter<double>("request_probability");
	const double pLock = this->getParameter<double>("lock_probability");

	LABELED_ASSERT_MSG(this->getParameter<Tick>("cycles") > 0, this->getName(), "cycles must be positive.");
	LABELED_ASSERT_MSG(pReq >= 0.0 && pReq <= 1.0, this->getName(),
	                   "request_probability=" << pReq << " is not in [0, 1].");
	LABELED_ASSERT_MSG(pLock >= 0.0 && pLock <= 1.0, this->getName(),
	                   "lock_probability=" << pLock << " is not in [0, 1].");
	LABELED_ASSERT_MSG(this->getParameter<int>("weight_period") > 0, this->getName(),
	                   "weight_period must be positive.");
}

void RunConfig::validate() const {
	const auto scenario = this->getParameter<std::string>("scenario");

	LABELED_ASSERT_MSG(scenario == "all" || ScenarioLibrary().find(scenario) != nullptr, this->getName(),
	                   "Unknown scenario \'" << scenario << "\'.");
}

void RunConfig::parseParametersUserDefined(const std::string& _paramName, const json& _paramValue) {
	std::string data_type;
	_paramValue.at("type").get_to(data_type);

	if (data_type == "RunMode") {
		const auto name = _paramValue.at("params").get<std::string>();
		LABELED_ASSERT_MSG(RunModeMap.contains(name), this->getName(), "Unknown RunMode \'" << name << "\'.");
		this->setParameter<RunMode>(_paramName, RunModeMap.at(name));
		VERBOSE_LABELED_INFO(this->getName()) << _paramName << " set to " << RunModeReMap.at(RunModeMap.at(name));
	} else {
		LABELED_ERROR(this->getName()) << "Undefined type \'" << data_type << "\' for \'" << _paramName << "\'.";
	}
}

}  // namespace wrrsim
