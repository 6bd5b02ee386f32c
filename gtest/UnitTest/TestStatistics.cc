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

#include "profiling/Statistics.hh"
#include "verif/StimulusGenerator.hh"

namespace unit_test {

using namespace wrrsim;

TEST(StatisticsTest, Aggregates) {
	Statistics<uint64_t> s;
	EXPECT_EQ(s.sum(), 0u);
	EXPECT_DOUBLE_EQ(s.avg(), 0.0) << "An empty statistic averages to zero.";

	s.push(2);
	s.push(7);
	s.push(3);
	EXPECT_EQ(s.sum(), 12u);
	EXPECT_DOUBLE_EQ(s.avg(), 4.0);
	EXPECT_EQ(s.max(), 7u);
	EXPECT_EQ(s.size(), 3u);
}

TEST(StatisticsTest, CategorizedDistribution) {
	CategorizedStatistics<ClientId, uint64_t> runs;
	runs.getEntry(0).push(3);
	runs.getEntry(0).push(1);
	runs.getEntry(2).push(4);

	EXPECT_EQ(runs.sum(), 8u);
	auto share = runs.sumDistribution();
	EXPECT_DOUBLE_EQ(share.at(0), 0.5);
	EXPECT_DOUBLE_EQ(share.at(2), 0.5);
	EXPECT_FALSE(share.contains(1));
}

TEST(StimulusGeneratorTest, SameSeedSameSequence) {
	StimulusProfile profile;
	profile.seed = 1234;

	StimulusGenerator a(6, 3, profile), b(6, 3, profile);
	for (int i = 0; i < 500; ++i) {
		ArbiterInputs x = a.next(), y = b.next();
		ASSERT_EQ(x.request, y.request) << "cycle " << i;
		ASSERT_EQ(x.lock, y.lock) << "cycle " << i;
		ASSERT_EQ(x.weights, y.weights) << "cycle " << i;
	}
	EXPECT_EQ(a.getGenerated(), 500u);
}

TEST(StimulusGeneratorTest, ProbabilitiesAreHonoured) {
	StimulusProfile quiet;
	quiet.requestProbability = 0.0;
	quiet.lockProbability    = 0.0;

	StimulusGenerator gen(4, 4, quiet);
	for (int i = 0; i < 100; ++i) {
		ArbiterInputs in = gen.next();
		ASSERT_TRUE(in.request.allEqual(false));
		ASSERT_TRUE(in.lock.allEqual(false));
	}

	StimulusProfile busy;
	busy.requestProbability = 1.0;
	StimulusGenerator all(4, 4, busy);
	EXPECT_TRUE(all.next().request.allEqual(true));
}

TEST(StimulusGeneratorTest, WeightsHoldForThePeriod) {
	StimulusProfile profile;
	profile.weightPeriod = 10;

	StimulusGenerator gen(8, 8, profile);
	WeightTable       first = gen.next().weights;
	EXPECT_EQ(first.getWidth(), 8u);
	for (int i = 1; i < 10; ++i) { ASSERT_EQ(gen.next().weights, first) << "cycle " << i; }
}

}  // namespace unit_test
