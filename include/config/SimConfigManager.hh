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

#include <string>
#include <unordered_map>
#include <vector>

#include "config/SimConfig.hh"
#include "utils/HashableType.hh"
#include "utils/Logging.hh"

namespace wrrsim {

/**
 * @class SimConfigManager
 * @brief Registry of SimConfig objects keyed by their JSON top-level key
 *
 * Registered configs are owned and deleted by the manager.
 */
class SimConfigManager : virtual public HashableType {
public:
	SimConfigManager(const std::string& _name) : name(_name) {}

	virtual ~SimConfigManager() {
		for (auto& it : configs) {
			VERBOSE_CLASS_INFO << "Deleting SimConfig object : " << it.first;
			delete it.second;
		}
	}

	template <typename T>
	T getParameter(const std::string& _configName, const std::string& _paramName) const {
		return this->getConfig(_configName)->getParameter<T>(_paramName);
	}

	SimConfig* getConfig(const std::string& _configName) const;

protected:
	/// @brief Register the configs of the derived simulator with addConfig()
	virtual void registerConfigs() {}

	void addConfig(const std::string& _name, SimConfig* _config);

	/**
	 * @brief Apply JSON config files in order
	 *
	 * A missing or unparsable file and a top-level key repeated across files are
	 * errors. Keys without a registered config are warned and skipped.
	 */
	void parseConfigFiles(const std::vector<std::string>& _configFilePaths);

	/// @brief Run SimConfig::validate() on every registered config
	void validateConfigs() const;

	template <typename T>
	void updateParameter(const std::string& _configName, const std::string& _paramName, const T& _value) {
		this->getConfig(_configName)->setParameter<T>(_paramName, _value);
		VERBOSE_CLASS_INFO << "Parameter \'" + _configName + "::" + _paramName + "\' is updated";
	}

private:
	std::unordered_map<std::string, SimConfig*> configs;

	const std::string name;
};

}  // end of namespace wrrsim
