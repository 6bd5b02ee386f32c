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

#include "common/Arbiter.hh"

#include <sstream>

#include "utils/Logging.hh"

namespace wrrsim {

void Arbiter::checkInputs(const ArbiterInputs& _inputs) const {
	CLASS_ASSERT_MSG(_inputs.request.getSize() == this->componentNum,
	                 "Request vector has " << _inputs.request.getSize() << " bits for " << this->componentNum
	                                       << " clients.");
	CLASS_ASSERT_MSG(_inputs.lock.getSize() == this->componentNum,
	                 "Lock vector has " << _inputs.lock.getSize() << " bits for " << this->componentNum << " clients.");
	CLASS_ASSERT_MSG(_inputs.weights.getNumClients() == this->componentNum,
	                 "Weight table has " << _inputs.weights.getNumClients() << " entries for " << this->componentNum
	                                     << " clients.");
}

std::optional<ClientId> RoundRobin::predictNext(const ArbiterInputs& _inputs) {
	this->checkInputs(_inputs);

	this->current = _inputs.request.findNextSet(this->curIndex);
	if (this->current) { this->curIndex = (*this->current + 1) % this->componentNum; }

	return this->current;
}

std::string RoundRobin::dumpState() const {
	std::stringstream ss;
	ss << "curIndex=" << this->curIndex << " grant=";
	if (this->current)
		ss << *this->current;
	else
		ss << "none";
	return ss.str();
}

}  // namespace wrrsim
