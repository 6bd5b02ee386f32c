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

#include <cstdint>
#include <random>

#include "common/Arbiter.hh"
#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"

namespace wrrsim {

/// @brief Knobs of the random stimulus
struct StimulusProfile {
	uint64_t seed               = 1;
	double   requestProbability = 0.8;
	double   lockProbability    = 0.1;
	Tick     weightPeriod       = 64;  ///< cycles between weight table re-draws
};

/**
 * @brief Seeded random ArbiterInputs source
 *
 * Every client's request and lock bit is an independent Bernoulli draw per
 * cycle. Lock bits are drawn for all clients, so locks from non-owners are
 * exercised as often as legal ones. The weight table is redrawn uniformly over
 * [0, 2^W - 1] on the first cycle and then every `weightPeriod` cycles, which
 * also changes weights in the middle of grants.
 *
 * The same seed always yields the same sequence.
 */
class StimulusGenerator : virtual public HashableType {
public:
	StimulusGenerator(size_t _numClients, size_t _weightWidth, const StimulusProfile& _profile);

	ArbiterInputs next();

	const StimulusProfile& getProfile() const { return this->profile; }

	/// @brief Cycles generated so far
	Tick getGenerated() const { return this->generated; }

private:
	void redrawWeights();

	size_t          numClients;
	size_t          weightWidth;
	StimulusProfile profile;

	std::mt19937_64                         rng;
	std::bernoulli_distribution             requestDist;
	std::bernoulli_distribution             lockDist;
	std::uniform_int_distribution<uint32_t> weightDist;

	WeightTable weights;
	Tick        generated = 0;
};

}  // namespace wrrsim
