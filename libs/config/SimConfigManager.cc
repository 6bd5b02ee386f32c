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

#include "config/SimConfigManager.hh"

#include <filesystem>
#include <fstream>
#include <unordered_set>

#include "config/SimConfig.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace wrrsim {

void SimConfigManager::addConfig(const std::string& _name, SimConfig* _config) {
	CLASS_ASSERT_MSG(!this->configs.contains(_name),
	                 "SimConfig `" + _name + "` is already registered in SimConfigManager.");
	VERBOSE_CLASS_INFO << "Adding SimConfig: " << _name;
	this->configs.emplace(_name, _config);
}

void SimConfigManager::parseConfigFiles(const std::vector<std::string>& _configFilePaths) {
	std::unordered_set<std::string> processed_keys;

	for (const auto& path : _configFilePaths) {
		LABELED_ASSERT_MSG(std::filesystem::exists(path), this->name, "File " << path << " does not exist.");

		std::fstream f(path);
		LABELED_ASSERT_MSG(f.is_open(), this->name, "Error opening file: " << path);

		nlohmann::json j;
		try {
			j = nlohmann::json::parse(f);
		} catch (const nlohmann::json::parse_error& e) {
			LABELED_ERROR(this->name) << "JSON parsing error: " << e.what() << " in file " << path;
		}

		for (const auto& [key, params] : j.items()) {
			if (processed_keys.contains(key)) {
				LABELED_ERROR(this->name) << "Duplicate key found: '" << key << "' in file " << path << ".";
			}
			processed_keys.insert(key);

			if (auto iter = this->configs.find(key); iter != this->configs.end()) {
				iter->second->parseParameters(params);
			} else {
				LABELED_WARNING(this->name) << "Unrecognized configuration key: \'" << key << "\' found in \'" << path
				                            << "\'. It is not registered in WRRSim and will be skipped.";
			}
		}
	}
}

void SimConfigManager::validateConfigs() const {
	for (const auto& [key, config] : this->configs) { config->validate(); }
}

SimConfig* SimConfigManager::getConfig(const std::string& _configName) const {
	auto iter = this->configs.find(_configName);
	CLASS_ASSERT_MSG(iter != this->configs.end(), "The config \'" + _configName + "\' does not exist.");
	return iter->second;
}

}  // namespace wrrsim
