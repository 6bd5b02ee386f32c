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

#include "verif/GrantComparator.hh"

#include "utils/Logging.hh"

namespace wrrsim {

DecodedGrant DecodedGrant::decode(const BitVector& _grant) {
	switch (_grant.count()) {
		case 0: return DecodedGrant{GrantKind::None, 0};
		case 1: return DecodedGrant{GrantKind::Single, *_grant.findNextSet(0)};
		default: return DecodedGrant{GrantKind::Multiple, 0};
	}
}

std::optional<ClientId> DecodedGrant::toOptional() const {
	ASSERT_MSG(this->kind != GrantKind::Multiple, "A multi-grant has no single client index.");
	if (this->kind == GrantKind::None) return std::nullopt;
	return this->index;
}

std::optional<ClientId> GrantComparator::decodeOrThrow(Tick _cycle, const BitVector& _observed) {
	DecodedGrant decoded = DecodedGrant::decode(_observed);
	if (decoded.kind == GrantKind::Multiple) { throw IllegalGrantError(_cycle, _observed); }
	return decoded.toOptional();
}

void GrantComparator::check(const BitVector& _observed, const std::optional<ClientId>& _expected,
                            MismatchContext _ctx) {
	_ctx.observedRaw = _observed;
	_ctx.observed    = decodeOrThrow(_ctx.cycle, _observed);
	_ctx.expected    = _expected;

	if (_ctx.observed != _ctx.expected) { throw GrantMismatchError(_ctx); }
}

}  // namespace wrrsim
