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

#include "verif/StimulusGenerator.hh"

#include "utils/Logging.hh"

namespace wrrsim {

StimulusGenerator::StimulusGenerator(size_t _numClients, size_t _weightWidth, const StimulusProfile& _profile)
    : numClients(_numClients),
      weightWidth(_weightWidth),
      profile(_profile),
      rng(_profile.seed),
      requestDist(_profile.requestProbability),
      lockDist(_profile.lockProbability),
      weights(_numClients, _weightWidth) {
	CLASS_ASSERT_MSG(_profile.weightPeriod > 0, "weight_period must be positive.");
	this->weightDist = std::uniform_int_distribution<uint32_t>(0, this->weights.getMaxWeight());
}

void StimulusGenerator::redrawWeights() {
	for (size_t i = 0; i < this->numClients; ++i) { this->weights.set(i, this->weightDist(this->rng)); }
	VERBOSE_CLASS_INFO << "New weight table " << this->weights.toString();
}

ArbiterInputs StimulusGenerator::next() {
	if (this->generated % this->profile.weightPeriod == 0) this->redrawWeights();
	++this->generated;

	ArbiterInputs in{BitVector(this->numClients), BitVector(this->numClients), this->weights};
	for (size_t i = 0; i < this->numClients; ++i) {
		in.request.setBit(i, this->requestDist(this->rng));
		in.lock.setBit(i, this->lockDist(this->rng));
	}
	return in;
}

}  // namespace wrrsim
