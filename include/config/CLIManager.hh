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
 * @file CLIManager.hh
 * @brief Command-line overrides of SimConfig parameters, using CLI11
 *
 * **Configuration Priority (highest to lowest):**
 * ```
 * 1. Command-line arguments (--cycles=20000)
 * 2. JSON configuration files (--config a.json b.json), applied in order; a key may appear in only one file
 * 3. Default values registered in the SimConfig constructors
 * ```
 *
 * CLI values are captured while parsing but applied only after the config
 * files, through setCLIParametersToSimConfig(), so they always win.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "config/SimConfig.hh"
#include "config/SimConfigManager.hh"

// Third-Party Library
#include <CLI/CLI.hpp>

namespace wrrsim {

class CLIManager : public SimConfigManager {
	/// @brief A deferred CLI override of one parameter
	struct CLIParameter {
		std::string           configName;
		std::string           paramName;
		std::function<void()> updateFunc;
	};

public:
	/**
	 * @param _name Manager identifier, also the CLI11 application description
	 * @param _configFilePaths Config files always applied before those given with --config
	 */
	CLIManager(const std::string& _name, const std::vector<std::string>& _configFilePaths = {})
	    : SimConfigManager("SimConfigManager"), configFilePaths(_configFilePaths), gTestMode(false), app{_name} {}

	virtual ~CLIManager() = default;

	bool isGTestMode() const { return this->gTestMode; }

protected:
	/// @brief Register the framework-level options -c/--config and -g/--googletest
	void registerWRRSimCLIArguments();

	/// @brief Register application options with addCLIOption(); called after registerWRRSimCLIArguments()
	virtual void registerCLIArguments() {}

	/**
	 * @brief Parse argc/argv with CLI11
	 *
	 * `--help` exits with status 0; a malformed command line prints CLI11's
	 * message and exits with status 2.
	 */
	void parseCLIArguments(int argc, char** argv) {
		argv = this->app.ensure_utf8(argv);
		try {
			this->app.parse(argc, argv);
		} catch (const CLI::ParseError& e) { exit(this->app.exit(e) == 0 ? 0 : 2); }
	}

	/**
	 * @brief Add a CLI option mapped to a SimConfig parameter
	 *
	 * @tparam T Parameter type, must match the registered one
	 * @param _defaultValue show the current parameter value in --help
	 * @return the CLI11 option, for further configuration such as transform()
	 */
	template <typename T>
	inline CLI::Option* addCLIOption(const std::string& _optionName, const std::string& _optionDescription,
	                                 const std::string& _configName, const std::string& _paramName,
	                                 const bool& _defaultValue = true);

	/// @brief Apply the captured CLI overrides; call after parseConfigFiles()
	void setCLIParametersToSimConfig();

	CLI::App* getCLIApp() { return &this->app; }

	/// @brief Every config file to apply, built-in ones first
	std::vector<std::string> getAllConfigFilePaths() const;

	std::vector<std::string> configFilePaths = {};

	/// @brief Config files given with --config
	std::vector<std::string> configFilePathsFromCLI = {};

	bool gTestMode;

private:
	void addCLIParameter(const std::string& _configName, const std::string& _paramName,
	                     std::function<void()> _updateFunc);

	std::vector<CLIParameter> cliParameters;

	CLI::App app;
};

}  // end of namespace wrrsim

#include "config/CLIManager.inl"
