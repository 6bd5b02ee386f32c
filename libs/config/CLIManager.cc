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

#include "config/CLIManager.hh"

namespace wrrsim {

void CLIManager::setCLIParametersToSimConfig() {
	for (auto& cli_param : this->cliParameters) { cli_param.updateFunc(); }
}

void CLIManager::addCLIParameter(const std::string& _configName, const std::string& _paramName,
                                 std::function<void()> _updateFunc) {
	this->cliParameters.push_back(CLIParameter{_configName, _paramName, _updateFunc});
}

std::vector<std::string> CLIManager::getAllConfigFilePaths() const {
	std::vector<std::string> paths = this->configFilePaths;
	paths.insert(paths.end(), this->configFilePathsFromCLI.begin(), this->configFilePathsFromCLI.end());
	return paths;
}

void CLIManager::registerWRRSimCLIArguments() {
	this->getCLIApp()
	    ->add_flag("-g,--googletest", this->gTestMode, "Google Test mode: caps the stress run at a short budget")
	    ->default_val(this->gTestMode);
	this->getCLIApp()
	    ->add_option("-c,--config", this->configFilePathsFromCLI, "Specifies the path(s) to configuration file(s).")
	    ->expected(0, -1);
}

}  // namespace wrrsim
