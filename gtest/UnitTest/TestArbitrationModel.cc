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
#include <vector>

#include "common/Arbiter.hh"
#include "model/ArbitrationModel.hh"

namespace unit_test {

using namespace wrrsim;

namespace {

ArbiterInputs makeInputs(uint64_t _req, uint64_t _lock, const std::vector<uint32_t>& _weights = {0, 0, 0, 0}) {
	return ArbiterInputs(BitVector::fromUint64(_weights.size(), _req), BitVector::fromUint64(_weights.size(), _lock),
	                     WeightTable::fromValues(4, _weights));
}

ArbiterState ownedBy(ClientId _owner, uint32_t _counter, ClientId _rrPtr = 0) {
	ArbiterState s;
	s.rrPtr   = _rrPtr;
	s.owner   = _owner;
	s.counter = _counter;
	return s;
}

}  // namespace

TEST(ArbitrationModelTest, OwnerRulesAreOrdered) {
	ASSERT_EQ(kOwnerRules.size(), 4u);
	EXPECT_EQ(kOwnerRules[0].decision, GrantDecision::Released);
	EXPECT_EQ(kOwnerRules[1].decision, GrantDecision::LockHeld);
	EXPECT_EQ(kOwnerRules[2].decision, GrantDecision::Held);
	EXPECT_EQ(kOwnerRules[3].decision, GrantDecision::Expired);
}

TEST(ArbitrationModelTest, ResetState) {
	ArbitrationModel model(4);
	model.predictNext(makeInputs(0b0010, 0));
	model.reset();

	EXPECT_EQ(model.getState(), ArbiterState{}) << "Reset must give rr_ptr=0, no owner, counter=0.";
	EXPECT_EQ(model.getCurrentGrant(), std::nullopt);
}

TEST(ArbitrationModelTest, ReleaseOutranksLock) {
	Transition t = transition(ownedBy(0, 5), makeInputs(0b0010, 0b0001));

	EXPECT_EQ(t.decision, GrantDecision::Released) << "A locked owner that stops requesting still loses the grant.";
	EXPECT_EQ(t.next.owner, std::optional<ClientId>(1));
	EXPECT_EQ(t.next.rrPtr, 1u);
	EXPECT_TRUE(t.newGrant);
}

TEST(ArbitrationModelTest, LockStillDecrementsCounter) {
	Transition t = transition(ownedBy(2, 3, 1), makeInputs(0b1111, 0b0100));
	EXPECT_EQ(t.decision, GrantDecision::LockHeld);
	EXPECT_EQ(t.next, ownedBy(2, 2, 1)) << "Lock keeps the grant but the counter keeps running.";
	EXPECT_FALSE(t.newGrant);

	Transition sat = transition(ownedBy(2, 0, 1), makeInputs(0b1111, 0b0100));
	EXPECT_EQ(sat.decision, GrantDecision::LockHeld);
	EXPECT_EQ(sat.next.counter, 0u) << "The counter saturates at zero.";
}

TEST(ArbitrationModelTest, HeldWhileEntitled) {
	Transition t = transition(ownedBy(1, 2), makeInputs(0b0011, 0, {9, 9, 9, 9}));
	EXPECT_EQ(t.decision, GrantDecision::Held);
	EXPECT_EQ(t.next, ownedBy(1, 1)) << "A weight change does not touch the running counter.";
}

TEST(ArbitrationModelTest, ExpiryMovesPointerPastOwner) {
	Transition t = transition(ownedBy(1, 0), makeInputs(0b0011, 0, {4, 0, 0, 0}));
	EXPECT_EQ(t.decision, GrantDecision::Expired);
	EXPECT_EQ(t.next.rrPtr, 2u);
	EXPECT_EQ(t.next.owner, std::optional<ClientId>(0)) << "The scan from 2 wraps to client 0.";
	EXPECT_EQ(t.next.counter, 4u);
}

TEST(ArbitrationModelTest, LoneRequesterIsRegranted) {
	Transition t = transition(ownedBy(3, 0), makeInputs(0b1000, 0, {0, 0, 0, 2}));
	EXPECT_EQ(t.decision, GrantDecision::Expired);
	EXPECT_EQ(t.next.owner, std::optional<ClientId>(3));
	EXPECT_EQ(t.next.counter, 2u) << "A re-grant is a new grant and reloads the counter.";
	EXPECT_TRUE(t.newGrant);
}

TEST(ArbitrationModelTest, IdleRescansFromSamePointer) {
	ArbiterState s = ownedBy(2, 0);

	Transition drop = transition(s, makeInputs(0, 0));
	EXPECT_EQ(drop.next.owner, std::nullopt);
	EXPECT_EQ(drop.next.rrPtr, 3u);

	Transition idle = transition(drop.next, makeInputs(0, 0));
	EXPECT_EQ(idle.decision, GrantDecision::NoOwner);
	EXPECT_EQ(idle.next.rrPtr, 3u) << "Idle cycles leave the pointer alone.";

	Transition wake = transition(idle.next, makeInputs(0b0101, 0));
	EXPECT_EQ(wake.next.owner, std::optional<ClientId>(0));
	EXPECT_EQ(wake.next.rrPtr, 3u) << "The pointer only moves when a grant ends.";
}

TEST(ArbitrationModelTest, NonOwnerLockIgnored) {
	ArbitrationModel model(4);
	auto             w = std::vector<uint32_t>{0, 0, 0, 0};

	EXPECT_EQ(model.predictNext(makeInputs(0b0011, 0b0010, w)), std::optional<ClientId>(0))
	    << "A lock from client 1 does not steer the initial grant.";
	EXPECT_EQ(model.predictNext(makeInputs(0b0011, 0b0010, w)), std::optional<ClientId>(1))
	    << "Client 0's weight-0 grant expires even though client 1 is locking.";
	EXPECT_EQ(model.getLastDecision(), GrantDecision::Expired);
	EXPECT_EQ(model.predictNext(makeInputs(0b0011, 0b0010, w)), std::optional<ClientId>(1))
	    << "Once owner, client 1's lock is honoured.";
	EXPECT_EQ(model.getLastDecision(), GrantDecision::LockHeld);
}

TEST(ArbitrationModelTest, LockInGrantCycleHasNoEffect) {
	Transition t = transition(ArbiterState{}, makeInputs(0b0010, 0b0010, {0, 3, 0, 0}));
	EXPECT_EQ(t.decision, GrantDecision::NoOwner);
	EXPECT_EQ(t.next, ownedBy(1, 3)) << "The counter is loaded with the weight regardless of the lock.";
}

TEST(ArbitrationModelTest, NewGrantLoadsWeightOfDecidingCycle) {
	Transition t = transition(ownedBy(0, 0), makeInputs(0b0011, 0, {0, 2, 0, 0}));
	EXPECT_EQ(t.next, ownedBy(1, 2, 1));
}

TEST(ArbitrationModelTest, WeightKGivesKPlusOneCycles) {
	for (uint32_t k = 0; k <= 15; ++k) {
		ArbitrationModel model(4);
		auto             in = makeInputs(0b0011, 0, {k, 0, 0, 0});

		size_t held = 0;
		while (model.predictNext(in) == std::optional<ClientId>(0)) { ++held; }
		EXPECT_EQ(held, k + 1) << "Client 0 with weight " << k << " should hold for " << k + 1 << " cycles.";
	}
}

TEST(ArbitrationModelTest, WeightedFairnessSequence) {
	ArbitrationModel model(4);
	auto             in = makeInputs(0b1111, 0, {1, 3, 0, 0});

	std::vector<ClientId> expected = {0, 0, 1, 1, 1, 1, 2, 3, 0, 0};
	for (size_t i = 0; i < expected.size(); ++i) {
		EXPECT_EQ(model.predictNext(in), std::optional<ClientId>(expected[i])) << "Cycle " << i + 1;
	}
}

TEST(ArbitrationModelTest, ZeroWeightsNoLockMatchRoundRobin) {
	ArbitrationModel model(5);
	RoundRobin       rr(5);
	std::mt19937     rng(2024);

	for (int cycle = 0; cycle < 2000; ++cycle) {
		ArbiterInputs in(BitVector::fromUint64(5, rng() & 0x1F), BitVector(5), WeightTable(5, 4));
		ASSERT_EQ(model.predictNext(in), rr.predictNext(in))
		    << "Cycle " << cycle << ": " << model.dumpState() << " vs " << rr.dumpState();
	}
}

TEST(ArbitrationModelTest, RejectsMismatchedInputs) {
	ArbitrationModel model(4);
	ArbiterInputs    in(BitVector(3), BitVector(4), WeightTable(4, 4));
	EXPECT_THROW(model.predictNext(in), std::runtime_error);
}

TEST(ArbitrationModelTest, DumpState) {
	ArbitrationModel model(4);
	EXPECT_EQ(model.dumpState(), "rr_ptr=0 owner=none counter=0");

	model.predictNext(makeInputs(0b0100, 0, {0, 0, 6, 0}));
	EXPECT_EQ(model.dumpState(), "rr_ptr=0 owner=2 counter=6");
	EXPECT_EQ(toString(model.getLastDecision()), "NoOwner");
}

}  // namespace unit_test
