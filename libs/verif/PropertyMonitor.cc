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

#include "verif/PropertyMonitor.hh"

#include <sstream>

#include "utils/Logging.hh"
#include "verif/GrantComparator.hh"

namespace wrrsim {

void PropertyMonitor::onReset() {
	this->owner.reset();
	this->held        = 0;
	this->entitlement = 0;
}

void PropertyMonitor::fail(Tick _cycle, const char* _property, const std::string& _detail) const {
	throw PropertyViolationError(_cycle, _property, _detail);
}

void PropertyMonitor::checkOwnerContinuity(const CycleRecord& _record, ClientId _owner) const {
	const auto& in      = _record.inputs;
	const auto  granted = _record.observed;

	std::stringstream ss;
	ss << "owner " << _owner << " held " << this->held << " cycle(s), weight " << this->entitlement
	   << ", req=" << in.request.toString() << " lock=" << in.lock.toString() << ", grant now "
	   << grantToString(granted);

	if (!in.request.getBit(_owner)) {
		if (granted == _owner) this->fail(_record.cycle, "work-conservation", ss.str());
		return;
	}

	if (in.lock.getBit(_owner)) {
		if (granted != _owner) this->fail(_record.cycle, "lock-extension", ss.str());
		return;
	}

	if (this->held < uint64_t(this->entitlement) + 1) {
		if (granted != _owner) this->fail(_record.cycle, "weight-entitlement", ss.str());
		return;
	}

	// entitlement used up; only a lone requester may be re-granted
	BitVector others = in.request;
	others.setBit(_owner, false);
	if (others.count() > 0 && granted == _owner) this->fail(_record.cycle, "lock-release-non-reload", ss.str());
}

void PropertyMonitor::onCycle(const CycleRecord& _record) {
	const auto granted = GrantComparator::decodeOrThrow(_record.cycle, _record.observedRaw);
	const auto& in     = _record.inputs;

	if (this->owner) this->checkOwnerContinuity(_record, *this->owner);

	if (!granted && in.request.count() > 0) {
		this->fail(_record.cycle, "no-idle-with-requests", "req=" + in.request.toString() + " but no grant");
	}

	// the previous owner re-granted after expiry is a new grant too
	const bool continued = this->owner && granted == this->owner && in.request.getBit(*this->owner) &&
	                       (in.lock.getBit(*this->owner) || this->held < uint64_t(this->entitlement) + 1);

	if (granted && !continued) {
		if (!in.request.getBit(*granted)) {
			this->fail(_record.cycle, "grant-to-requester",
			           "client " + std::to_string(*granted) + " granted without requesting");
		}
		this->held        = 1;
		this->entitlement = in.weights.get(*granted);
	} else if (granted) {
		++this->held;
	}

	this->owner = granted;
	++this->checkedCycles;
}

}  // namespace wrrsim
