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

#include <random>
#include <string>
#include <vector>

#include "model/ArbitrationModel.hh"
#include "verif/PropertyMonitor.hh"

namespace unit_test {

using namespace wrrsim;

class PropertyMonitorTest : public testing::Test {
protected:
	void feed(uint64_t _req, uint64_t _lock, uint64_t _gnt, const std::vector<uint32_t>& _weights = {0, 0, 0, 0}) {
		CycleRecord r;
		r.cycle       = ++this->cycle;
		r.inputs      = ArbiterInputs(BitVector::fromUint64(4, _req), BitVector::fromUint64(4, _lock),
		                              WeightTable::fromValues(4, _weights));
		r.observedRaw = BitVector::fromUint64(4, _gnt);
		r.observed    = r.observedRaw.findNextSet(0);
		this->monitor.onCycle(r);
	}

	/// @return the property name of the violation raised by `_fn`, or "" if none
	template <typename TFn>
	std::string violationOf(TFn _fn) {
		try {
			_fn();
		} catch (const PropertyViolationError& e) { return e.getProperty(); }
		return "";
	}

	PropertyMonitor monitor;
	Tick            cycle = 0;
};

TEST_F(PropertyMonitorTest, AcceptsReferenceModelStream) {
	ArbitrationModel                        model(4);
	std::mt19937                            rng(99);
	std::bernoulli_distribution             req(0.7), lock(0.2);
	std::uniform_int_distribution<uint32_t> weight(0, 15);

	std::vector<uint32_t> w = {0, 0, 0, 0};
	for (int i = 0; i < 3000; ++i) {
		if (i % 50 == 0) {
			for (auto& x : w) x = weight(rng);
		}
		uint64_t r = 0, l = 0;
		for (int c = 0; c < 4; ++c) {
			r |= uint64_t(req(rng)) << c;
			l |= uint64_t(lock(rng)) << c;
		}
		auto     grant = model.predictNext(ArbiterInputs(BitVector::fromUint64(4, r), BitVector::fromUint64(4, l),
		                                                 WeightTable::fromValues(4, w)));
		uint64_t gnt   = grant ? (uint64_t(1) << *grant) : 0;
		ASSERT_NO_THROW(this->feed(r, l, gnt, w)) << "cycle " << this->cycle << " " << model.dumpState();
	}
	EXPECT_EQ(this->monitor.getCheckedCycles(), 3000u);
}

TEST_F(PropertyMonitorTest, WorkConservation) {
	this->feed(0b0001, 0, 0b0001, {5, 0, 0, 0});
	EXPECT_EQ(this->violationOf([&] { this->feed(0b0000, 0, 0b0001, {5, 0, 0, 0}); }), "work-conservation");
}

TEST_F(PropertyMonitorTest, LockExtension) {
	this->feed(0b0011, 0, 0b0001);
	EXPECT_EQ(this->violationOf([&] { this->feed(0b0011, 0b0001, 0b0010); }), "lock-extension");
}

TEST_F(PropertyMonitorTest, WeightEntitlement) {
	this->feed(0b0011, 0, 0b0001, {2, 0, 0, 0});
	this->feed(0b0011, 0, 0b0001, {2, 0, 0, 0});
	EXPECT_EQ(this->violationOf([&] { this->feed(0b0011, 0, 0b0010, {2, 0, 0, 0}); }), "weight-entitlement")
	    << "Weight 2 entitles three cycles.";
}

TEST_F(PropertyMonitorTest, EntitlementUsesWeightAtGrant) {
	this->feed(0b0011, 0, 0b0001, {0, 0, 0, 0});
	EXPECT_NO_THROW(this->feed(0b0011, 0, 0b0010, {9, 0, 0, 0}))
	    << "Raising the owner's weight after its grant began does not extend it.";
}

TEST_F(PropertyMonitorTest, LockReleaseDoesNotReload) {
	this->feed(0b0011, 0, 0b0001, {1, 0, 0, 0});
	this->feed(0b0011, 0b0001, 0b0001, {1, 0, 0, 0});
	this->feed(0b0011, 0b0001, 0b0001, {1, 0, 0, 0});
	EXPECT_EQ(this->violationOf([&] { this->feed(0b0011, 0, 0b0001, {1, 0, 0, 0}); }), "lock-release-non-reload");
}

TEST_F(PropertyMonitorTest, LoneRequesterMayBeRegranted) {
	this->feed(0b0100, 0, 0b0100);
	EXPECT_NO_THROW(this->feed(0b0100, 0, 0b0100));
	EXPECT_NO_THROW(this->feed(0b0100, 0, 0b0100));
}

TEST_F(PropertyMonitorTest, NoIdleWithRequests) {
	EXPECT_EQ(this->violationOf([&] { this->feed(0b0100, 0, 0); }), "no-idle-with-requests");
}

TEST_F(PropertyMonitorTest, GrantToRequester) {
	EXPECT_EQ(this->violationOf([&] { this->feed(0b0001, 0, 0b0100); }), "grant-to-requester");
}

TEST_F(PropertyMonitorTest, ResetForgetsOwner) {
	this->feed(0b0001, 0b0001, 0b0001, {5, 0, 0, 0});
	this->monitor.onReset();
	EXPECT_NO_THROW(this->feed(0b0010, 0, 0b0010)) << "After reset there is no owner to continue.";
}

}  // namespace unit_test
