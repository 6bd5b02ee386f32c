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
#include <optional>

#include "utils/HashableType.hh"
#include "utils/TypeDef.hh"
#include "verif/ConformanceDriver.hh"

namespace wrrsim {

/**
 * @brief Online checker of the arbitration properties, independent of the model
 *
 * Works only from each cycle's inputs and the observed grant, so it catches a
 * DUT defect even when the reference model shares it.
 *
 * | Property | Check on cycle t with previous owner c |
 * |----------|----------------------------------------|
 * | one-hot | grant bus has at most one bit set |
 * | work conservation | !req[c] -> grant != c |
 * | lock extension | req[c] & lock[c] -> grant == c |
 * | weight entitlement | req[c] & !lock[c] & held < k+1 -> grant == c |
 * | lock-release non-reload | req[c] & !lock[c] & held >= k+1 & others requesting -> grant != c |
 * | grant to requester | a new grantee requested in the deciding cycle |
 * | no idle with requests | any req -> some grant |
 *
 * `held` counts the observed cycles of the current grant including its first,
 * and `k` is the weight sampled in the cycle that started it. Lock bits of
 * non-owners never enter any check, so an honoured illegal lock shows up as an
 * entitlement or round-robin violation.
 */
class PropertyMonitor : public CycleObserver, virtual public HashableType {
public:
	PropertyMonitor() = default;

	void onReset() override;

	void onCycle(const CycleRecord& _record) override;

	uint64_t getCheckedCycles() const { return this->checkedCycles; }

private:
	void fail(Tick _cycle, const char* _property, const std::string& _detail) const;

	void checkOwnerContinuity(const CycleRecord& _record, ClientId _owner) const;

	std::optional<ClientId> owner;
	uint64_t                held        = 0;  // observed cycles of the current grant
	uint32_t                entitlement = 0;  // weight loaded when the current grant began

	uint64_t checkedCycles = 0;
};

}  // namespace wrrsim
