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

#include "model/ArbitrationModel.hh"

#include <sstream>

#include "utils/Logging.hh"

namespace wrrsim {

std::string toString(GrantDecision _decision) {
	switch (_decision) {
		case GrantDecision::NoOwner: return "NoOwner";
		case GrantDecision::Released: return "Released";
		case GrantDecision::LockHeld: return "LockHeld";
		case GrantDecision::Held: return "Held";
		case GrantDecision::Expired: return "Expired";
	}
	return "Unknown";
}

const std::array<OwnerRule, 4> kOwnerRules = {{
    {GrantDecision::Released, [](const ArbiterState& s, const ArbiterInputs& in) { return !in.request.getBit(*s.owner); }},
    {GrantDecision::LockHeld, [](const ArbiterState& s, const ArbiterInputs& in) { return in.lock.getBit(*s.owner); }},
    {GrantDecision::Held, [](const ArbiterState& s, const ArbiterInputs&) { return s.counter > 0; }},
    {GrantDecision::Expired, [](const ArbiterState&, const ArbiterInputs&) { return true; }},
}};

namespace {

GrantDecision evaluateOwner(const ArbiterState& _state, const ArbiterInputs& _inputs) {
	if (!_state.owner) return GrantDecision::NoOwner;

	for (const auto& rule : kOwnerRules) {
		if (rule.guard(_state, _inputs)) return rule.decision;
	}
	return GrantDecision::Expired;
}

}  // namespace

Transition transition(ArbiterState _state, const ArbiterInputs& _inputs) {
	Transition t;
	t.decision = evaluateOwner(_state, _inputs);

	switch (t.decision) {
		case GrantDecision::LockHeld:
		case GrantDecision::Held:
			// lock keeps the grant but never freezes the counter
			if (_state.counter > 0) --_state.counter;
			t.next = _state;
			return t;

		case GrantDecision::Released:
		case GrantDecision::Expired: _state.rrPtr = (*_state.owner + 1) % _inputs.request.getSize(); break;

		case GrantDecision::NoOwner: break;
	}

	// re-arbitration: scan from rr_ptr, idle cycles re-scan from the same pointer
	_state.owner = _inputs.request.findNextSet(_state.rrPtr);
	if (_state.owner) {
		_state.counter = _inputs.weights.get(*_state.owner);
		t.newGrant     = true;
	} else {
		_state.counter = 0;
	}

	t.next = _state;
	return t;
}

ArbitrationModel::ArbitrationModel(size_t _numClients) : Arbiter(_numClients) {
	CLASS_ASSERT_MSG(_numClients > 0, "An arbiter needs at least one client.");
}

std::optional<ClientId> ArbitrationModel::predictNext(const ArbiterInputs& _inputs) {
	this->checkInputs(_inputs);

	Transition t       = transition(this->state, _inputs);
	this->state        = t.next;
	this->lastDecision = t.decision;
	this->lastNewGrant = t.newGrant;

	VERBOSE_CLASS_INFO << "req=" << _inputs.request.toString() << " lock=" << _inputs.lock.toString() << " -> "
	                   << toString(t.decision) << ", " << this->dumpState();

	return this->state.owner;
}

void ArbitrationModel::reset() {
	this->state        = ArbiterState{};
	this->lastDecision = GrantDecision::NoOwner;
	this->lastNewGrant = false;
}

std::string ArbitrationModel::dumpState() const {
	std::stringstream ss;
	ss << "rr_ptr=" << this->state.rrPtr << " owner=";
	if (this->state.owner)
		ss << *this->state.owner;
	else
		ss << "none";
	ss << " counter=" << this->state.counter;
	return ss.str();
}

}  // namespace wrrsim
