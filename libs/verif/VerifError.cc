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

#include "verif/VerifError.hh"

#include <sstream>

namespace wrrsim {

std::string grantToString(const std::optional<ClientId>& _grant) {
	return _grant ? std::to_string(*_grant) : std::string("none");
}

std::string MismatchContext::toString() const {
	std::stringstream ss;
	ss << "cycle=" << this->cycle << " source=" << this->source << " observed=" << grantToString(this->observed)
	   << " (o_gnt=" << this->observedRaw.toString() << ") expected=" << grantToString(this->expected)
	   << " req=" << this->request.toString() << " lock=" << this->lock.toString() << " weights=" << this->weights
	   << " model{" << this->modelState << "}";
	return ss.str();
}

IllegalGrantError::IllegalGrantError(Tick _cycle, const BitVector& _grant)
    : VerificationError("Multiple simultaneous grants at cycle " + std::to_string(_cycle) +
                            ": o_gnt=" + _grant.toString(),
                        _cycle),
      grant(_grant) {}

GrantMismatchError::GrantMismatchError(const MismatchContext& _ctx)
    : VerificationError("Grant mismatch: " + _ctx.toString(), _ctx.cycle), ctx(_ctx) {}

PropertyViolationError::PropertyViolationError(Tick _cycle, const std::string& _property, const std::string& _detail)
    : VerificationError("Property '" + _property + "' violated at cycle " + std::to_string(_cycle) + ": " + _detail,
                        _cycle),
      property(_property) {}

}  // namespace wrrsim
