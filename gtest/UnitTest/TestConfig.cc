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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "config/SimConfigManager.hh"
#include "config/WRRSimConfig.hh"

namespace unit_test {

using namespace wrrsim;

namespace {

class TestConfigManager : public SimConfigManager {
public:
	TestConfigManager() : SimConfigManager("TestConfigManager") {
		this->addConfig("arbiter", new WRRSimConfig("arbiter"));
		this->addConfig("stress", new StressConfig("stress"));
		this->addConfig("run", new RunConfig("run"));
	}

	using SimConfigManager::parseConfigFiles;
	using SimConfigManager::updateParameter;
	using SimConfigManager::validateConfigs;
};

std::string writeTempJson(const std::string& _name, const std::string& _content) {
	auto path = std::filesystem::temp_directory_path() / _name;
	std::ofstream(path) << _content;
	return path.string();
}

}  // namespace

TEST(ConfigTest, Defaults) {
	TestConfigManager mgr;
	EXPECT_EQ(mgr.getParameter<int>("arbiter", "num_clients"), 4);
	EXPECT_EQ(mgr.getParameter<int>("arbiter", "weight_width"), 4);
	EXPECT_EQ(mgr.getParameter<Tick>("stress", "cycles"), 5000u);
	EXPECT_EQ(mgr.getParameter<int>("stress", "seed"), 1);
	EXPECT_DOUBLE_EQ(mgr.getParameter<double>("stress", "request_probability"), 0.8);
	EXPECT_DOUBLE_EQ(mgr.getParameter<double>("stress", "lock_probability"), 0.1);
	EXPECT_EQ(mgr.getParameter<int>("stress", "weight_period"), 64);
	EXPECT_EQ(mgr.getParameter<RunMode>("run", "mode"), RunMode::All);
	EXPECT_EQ(mgr.getParameter<std::string>("run", "scenario"), "all");
	EXPECT_NO_THROW(mgr.validateConfigs());
}

TEST(ConfigTest, ParseParametersFromJson) {
	StressConfig cfg;
	cfg.parseParameters(json::parse(R"({"cycles": 20000, "seed": 7, "request_probability": 0.5,
	                                    "unknown_knob": 3})"));

	EXPECT_EQ(cfg.getParameter<Tick>("cycles"), 20000u);
	EXPECT_EQ(cfg.getParameter<int>("seed"), 7);
	EXPECT_DOUBLE_EQ(cfg.getParameter<double>("request_probability"), 0.5);
	EXPECT_FALSE(cfg.hasParameter("unknown_knob")) << "Unknown keys are skipped.";
}

TEST(ConfigTest, WrongJsonTypeIsAnError) {
	StressConfig cfg;
	EXPECT_THROW(cfg.parseParameters(json::parse(R"({"seed": "seven"})")), std::runtime_error);
}

TEST(ConfigTest, ParameterTypeIsChecked) {
	WRRSimConfig cfg;
	EXPECT_THROW(cfg.getParameter<double>("num_clients"), std::runtime_error);
	EXPECT_THROW(cfg.getParameter<int>("no_such_parameter"), std::runtime_error);
}

TEST(ConfigTest, RunModeFromJson) {
	RunConfig cfg;
	cfg.parseParameters(json::parse(R"({"mode": {"type": "RunMode", "params": "Stress"}, "scenario": "lock_hold"})"));
	EXPECT_EQ(cfg.getParameter<RunMode>("mode"), RunMode::Stress);
	EXPECT_EQ(cfg.getParameter<std::string>("scenario"), "lock_hold");

	EXPECT_THROW(cfg.parseParameters(json::parse(R"({"mode": {"type": "RunMode", "params": "Sometimes"}})")),
	             std::runtime_error);
	EXPECT_THROW(cfg.parseParameters(json::parse(R"({"mode": {"type": "Colour", "params": "All"}})")),
	             std::runtime_error);
}

TEST(ConfigTest, ValidationRejectsOutOfRange) {
	{
		TestConfigManager mgr;
		mgr.updateParameter<int>("arbiter", "num_clients", 0);
		EXPECT_THROW(mgr.validateConfigs(), std::runtime_error);
	}
	{
		TestConfigManager mgr;
		mgr.updateParameter<int>("arbiter", "weight_width", 33);
		EXPECT_THROW(mgr.validateConfigs(), std::runtime_error);
	}
	{
		TestConfigManager mgr;
		mgr.updateParameter<int>("arbiter", "num_clients", 16);
		mgr.updateParameter<int>("arbiter", "weight_width", 8);
		EXPECT_THROW(mgr.validateConfigs(), std::runtime_error) << "16 x 8 bits overflow the weight bus.";
	}
	{
		TestConfigManager mgr;
		mgr.updateParameter<double>("stress", "lock_probability", 1.5);
		EXPECT_THROW(mgr.validateConfigs(), std::runtime_error);
	}
	{
		TestConfigManager mgr;
		mgr.updateParameter<Tick>("stress", "cycles", 0);
		EXPECT_THROW(mgr.validateConfigs(), std::runtime_error);
	}
	{
		TestConfigManager mgr;
		mgr.updateParameter<int>("stress", "weight_period", 0);
		EXPECT_THROW(mgr.validateConfigs(), std::runtime_error);
	}
	{
		TestConfigManager mgr;
		mgr.updateParameter<std::string>("run", "scenario", "lock_hodl");
		EXPECT_THROW(mgr.validateConfigs(), std::runtime_error) << "Scenario names are checked at load time.";
	}
	{
		TestConfigManager mgr;
		mgr.updateParameter<std::string>("run", "scenario", "lock_hold");
		EXPECT_NO_THROW(mgr.validateConfigs());
	}
}

TEST(ConfigTest, ConfigFilesApplyInOrder) {
	auto base   = writeTempJson("wrrsim_base.json", R"({"arbiter": {"num_clients": 8, "weight_width": 2}})");
	auto stress = writeTempJson("wrrsim_stress.json", R"({"stress": {"cycles": 100}, "tracing": {"on": 1}})");

	TestConfigManager mgr;
	mgr.parseConfigFiles({base, stress});

	EXPECT_EQ(mgr.getParameter<int>("arbiter", "num_clients"), 8);
	EXPECT_EQ(mgr.getParameter<int>("arbiter", "weight_width"), 2);
	EXPECT_EQ(mgr.getParameter<Tick>("stress", "cycles"), 100u);
}

TEST(ConfigTest, DuplicateKeyAcrossFilesIsAnError) {
	auto a = writeTempJson("wrrsim_dup_a.json", R"({"stress": {"seed": 2}})");
	auto b = writeTempJson("wrrsim_dup_b.json", R"({"stress": {"seed": 3}})");

	TestConfigManager mgr;
	EXPECT_THROW(mgr.parseConfigFiles({a, b}), std::runtime_error);
}

TEST(ConfigTest, MissingOrMalformedFileIsAnError) {
	TestConfigManager mgr;
	EXPECT_THROW(mgr.parseConfigFiles({"/nonexistent/wrrsim.json"}), std::runtime_error);

	auto bad = writeTempJson("wrrsim_bad.json", "{ \"stress\": ");
	EXPECT_THROW(mgr.parseConfigFiles({bad}), std::runtime_error);
}

}  // namespace unit_test
