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

#include <memory>
#include <string>
#include <vector>

#include "TestConformance.hh"
#include "WRRSim.hh"

using namespace wrrsim;

class ConformanceTest : public testing::Test {
public:
	std::vector<char*> wrrsim_args;

	// Store argc and argv as static members
	static int    argc;
	static char** argv;

	// Static method to set argc and argv
	static void init(int _argc, char** _argv) {
		ConformanceTest::argc = _argc;
		ConformanceTest::argv = _argv;
	}

	void SetUp() override { wrrsim_args = wrrsim::getWRRSimArguments(argc, argv); }

	void TearDown() override {
		if (wrrsim::top) {
			wrrsim::top->finish();
			wrrsim::top.reset();
		}
	}

	/// @brief Initialize a fresh global top with the command line plus `_extra`
	void initTop(const std::vector<std::string>& _extra) {
		this->extraArgs = _extra;
		std::vector<char*> args = this->wrrsim_args;
		for (auto& s : this->extraArgs) { args.push_back(s.data()); }

		wrrsim::top = std::make_shared<WRRSimTop>();
		wrrsim::top->init(args.size(), args.data());
	}

	/// @brief Run `_scenarioName` against a mutant and return the error it raised
	template <typename TError>
	void expectCaughtByScenario(Fault _fault, const std::string& _scenarioName) {
		VerilatedDut<MutantArbiter> dut(std::make_unique<MutantArbiter>(_fault));
		ConformanceDriver           driver(dut);
		ScenarioLibrary             library;

		const Scenario* scenario = library.find(_scenarioName);
		ASSERT_NE(scenario, nullptr);
		EXPECT_THROW(library.run(driver, *scenario), TError) << "Scenario " << _scenarioName;
	}

private:
	std::vector<std::string> extraArgs;
};

// Definition of static members
int    ConformanceTest::argc = 0;
char** ConformanceTest::argv = nullptr;

TEST_F(ConformanceTest, ScenarioLibraryPassesOnRtl) {
	VerilatedDut<RtlArbiter> dut(std::make_unique<RtlArbiter>(4, 4));
	ConformanceDriver        driver(dut);
	PropertyMonitor          monitor;
	driver.addObserver(&monitor);

	ScenarioLibrary library;
	for (const auto& scenario : library.getScenarios()) {
		SCOPED_TRACE(scenario.name);
		EXPECT_NO_THROW(EXPECT_TRUE(library.run(driver, scenario)));
		EXPECT_EQ(driver.getCycle(), scenario.steps.size());
	}
	EXPECT_GT(monitor.getCheckedCycles(), 0u);
}

TEST_F(ConformanceTest, ScenarioExpectationMismatchNamesScenario) {
	VerilatedDut<RtlArbiter> dut(std::make_unique<RtlArbiter>());
	ConformanceDriver        driver(dut);

	Scenario wrong = ScenarioBuilder("wrong_on_purpose", "expects client 1 first").request(0b0011).expect(1).build();

	try {
		ScenarioLibrary().run(driver, wrong);
		FAIL() << "The DUT grants client 0 first.";
	} catch (const GrantMismatchError& e) {
		EXPECT_EQ(e.getContext().source, "wrong_on_purpose");
		EXPECT_EQ(e.getContext().observed, std::optional<ClientId>(0));
		EXPECT_EQ(e.getCycle(), 1u);
	}
}

TEST_F(ConformanceTest, StressPassesOnRtl) {
	VerilatedDut<RtlArbiter> dut(std::make_unique<RtlArbiter>(4, 4));
	ConformanceDriver        driver(dut);
	PropertyMonitor          monitor;
	driver.addObserver(&monitor);

	StimulusProfile profile;
	profile.seed = 11;
	StressRunner runner(driver, profile, 5000);

	const StressReport& report = runner.run();
	EXPECT_EQ(report.getCycles(), 5000u);
	EXPECT_EQ(monitor.getCheckedCycles(), 5000u);
	EXPECT_GT(report.getLockHeldCycles(), 0u);
	EXPECT_GT(report.getEarlyReleases(), 0u);
	EXPECT_GT(report.getExpirations(), 0u);
	EXPECT_GT(report.getSwitches(), 0u);

	uint64_t granted = 0;
	for (ClientId c = 0; c < 4; ++c) {
		EXPECT_GT(report.getGrantCycles(c), 0u) << "client " << c << " was never granted";
		granted += report.getGrantCycles(c);
	}
	EXPECT_EQ(granted + report.getIdleCycles(), report.getCycles()) << "Every cycle is either granted or idle.";
}

TEST_F(ConformanceTest, StressIsReproducible) {
	StimulusProfile profile;
	profile.seed = 5;

	VerilatedDut<RtlArbiter> dutA(std::make_unique<RtlArbiter>()), dutB(std::make_unique<RtlArbiter>());
	ConformanceDriver        driverA(dutA), driverB(dutB);
	StressRunner             runnerA(driverA, profile, 2000), runnerB(driverB, profile, 2000);

	const StressReport& a = runnerA.run();
	const StressReport& b = runnerB.run();
	EXPECT_EQ(a.getGrants(), b.getGrants());
	EXPECT_EQ(a.getSwitches(), b.getSwitches());
	EXPECT_EQ(a.getLockHeldCycles(), b.getLockHeldCycles());
	EXPECT_EQ(a.getIdleCycles(), b.getIdleCycles());
}

TEST_F(ConformanceTest, StressOtherGeometries) {
	const std::vector<std::pair<size_t, size_t>> geometries = {{1, 1}, {2, 32}, {8, 3}, {16, 4}, {64, 1}};

	for (auto [n, w] : geometries) {
		SCOPED_TRACE("N=" + std::to_string(n) + " W=" + std::to_string(w));

		VerilatedDut<RtlArbiter> dut(std::make_unique<RtlArbiter>(n, w));
		ConformanceDriver        driver(dut);
		PropertyMonitor          monitor;
		driver.addObserver(&monitor);
		ASSERT_EQ(driver.getNumClients(), n);
		ASSERT_EQ(driver.getWeightWidth(), w);

		StimulusProfile profile;
		profile.seed            = n * 100 + w;
		profile.lockProbability = 0.2;
		StressRunner runner(driver, profile, 2000);
		EXPECT_NO_THROW(runner.run());

		if (n != 4 || w != 4) {
			EXPECT_EQ(ScenarioLibrary().runAll(driver), 0u) << "4x4 scenarios are skipped on other geometries.";
		}
	}
}

TEST_F(ConformanceTest, ResetReturnsToIdle) {
	VerilatedDut<RtlArbiter> dut(std::make_unique<RtlArbiter>());
	ConformanceDriver        driver(dut);

	StimulusProfile profile;
	StressRunner(driver, profile, 300).run();

	driver.reset();
	EXPECT_EQ(driver.getCycle(), 0u);
	EXPECT_EQ(driver.getModel().getState(), ArbiterState{});
	EXPECT_TRUE(dut.getGrant().allEqual(false));
}

TEST_F(ConformanceTest, OpaqueDutFallsBackToDefaults) {
	VerilatedDut<OpaqueArbiter> dut(std::make_unique<OpaqueArbiter>());
	EXPECT_EQ(dut.getNumClients(), std::nullopt);

	ConformanceDriver driver(dut);
	EXPECT_EQ(driver.getNumClients(), ConformanceDriver::kDefaultNumClients);
	EXPECT_EQ(driver.getWeightWidth(), ConformanceDriver::kDefaultWeightWidth);

	EXPECT_EQ(ScenarioLibrary().runAll(driver), ScenarioLibrary().getScenarios().size());
}

TEST_F(ConformanceTest, CatchesReloadOnUnlock) {
	this->expectCaughtByScenario<GrantMismatchError>(Fault::ReloadOnUnlock, "lock_to_switch");
}

TEST_F(ConformanceTest, CatchesHonouredIllegalLock) {
	this->expectCaughtByScenario<GrantMismatchError>(Fault::HonourIllegalLock, "illegal_lock");
}

TEST_F(ConformanceTest, CatchesMissingEarlyRelease) {
	this->expectCaughtByScenario<GrantMismatchError>(Fault::NoEarlyRelease, "early_drop");
}

TEST_F(ConformanceTest, CatchesMultiGrant) {
	this->expectCaughtByScenario<IllegalGrantError>(Fault::MultiGrant, "basic_rotation");
}

TEST_F(ConformanceTest, StressCatchesEveryMutant) {
	for (Fault fault : {Fault::ReloadOnUnlock, Fault::HonourIllegalLock, Fault::NoEarlyRelease, Fault::MultiGrant}) {
		SCOPED_TRACE(static_cast<int>(fault));

		VerilatedDut<MutantArbiter> dut(std::make_unique<MutantArbiter>(fault));
		ConformanceDriver           driver(dut);

		StimulusProfile profile;
		profile.seed            = 3;
		profile.lockProbability = 0.3;
		EXPECT_THROW(StressRunner(driver, profile, 5000).run(), VerificationError);
	}
}

TEST_F(ConformanceTest, TopRunsScenariosAndStress) {
	this->initTop({"--mode", "all", "--cycles", "2000", "--seed", "3"});
	ASSERT_NE(top->getDriver(), nullptr);
	ASSERT_NE(top->getMonitor(), nullptr);

	EXPECT_NO_THROW(top->run());
	EXPECT_EQ(top->getGlobalTick(), 2000u) << "The stress run is the last to reset the driver.";
	EXPECT_GT(top->getMonitor()->getCheckedCycles(), 2000u);
}

TEST_F(ConformanceTest, TopReadsConfigFile) {
	this->initTop({"--config", "configs/default.json", "--mode", "Scenarios", "--scenario", "lock_hold",
	               "--monitor", "0"});
	EXPECT_EQ(top->getMonitor(), nullptr);
	EXPECT_EQ(top->getParameter<Tick>("stress", "cycles"), 5000u);

	EXPECT_NO_THROW(top->run());
}

TEST_F(ConformanceTest, TopRejectsInvalidConfig) {
	EXPECT_THROW(this->initTop({"--num-clients", "0"}), std::runtime_error);
	EXPECT_EQ(top->getDriver(), nullptr);
	top.reset();
}

TEST_F(ConformanceTest, TopRejectsUnknownScenario) {
	EXPECT_THROW(this->initTop({"--mode", "Scenarios", "--scenario", "lock_hodl"}), std::runtime_error);
	EXPECT_EQ(top->getDriver(), nullptr);
	top.reset();
}

TEST_F(ConformanceTest, TopRejectsScenarioRunThatChecksNothing) {
	EXPECT_THROW(this->initTop({"--num-clients", "8", "--mode", "Scenarios"}), std::runtime_error);
	EXPECT_EQ(top->getDriver(), nullptr);
	top.reset();

	// Stress runs on any geometry
	this->initTop({"--num-clients", "8", "--mode", "All", "--cycles", "500"});
	EXPECT_NO_THROW(top->run());
	EXPECT_EQ(top->getGlobalTick(), 500u);
}

TEST_F(ConformanceTest, CountRunnableFollowsGeometryAndSelection) {
	ScenarioLibrary library;
	EXPECT_EQ(library.countRunnable(4, 4), library.getScenarios().size());
	EXPECT_EQ(library.countRunnable(4, 4, "lock_hold"), 1u);
	EXPECT_EQ(library.countRunnable(4, 4, "lock_hodl"), 0u);
	EXPECT_EQ(library.countRunnable(8, 4), 0u);
}

TEST_F(ConformanceTest, GoogleTestModeShortensStress) {
	this->initTop({"--googletest", "--mode", "Stress", "--cycles", "50000"});
	ASSERT_TRUE(top->isGTestMode());

	EXPECT_NO_THROW(top->run());
	EXPECT_EQ(top->getGlobalTick(), WRRSimTop::kGTestStressCycles);
}

TEST_F(ConformanceTest, StressBudgetKeptOutsideGoogleTestMode) {
	this->initTop({"--mode", "Stress", "--cycles", "1500"});
	ASSERT_FALSE(top->isGTestMode());

	EXPECT_NO_THROW(top->run());
	EXPECT_EQ(top->getGlobalTick(), 1500u);
}

int main(int argc, char** argv) {
	ConformanceTest::init(argc, argv);

	std::vector<char*> gtest_args = wrrsim::getGoogleTestArguments(argc, argv);
	int                gtest_argc = gtest_args.size();
	testing::InitGoogleTest(&gtest_argc, gtest_args.data());

	return RUN_ALL_TESTS();
}
