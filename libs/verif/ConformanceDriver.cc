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

#include "verif/ConformanceDriver.hh"

#include <algorithm>

#include "utils/Logging.hh"
#include "verif/GrantComparator.hh"

namespace wrrsim {

namespace {

size_t resolveParameter(const std::optional<size_t>& _reported, size_t _fallback, const char* _name) {
	if (_reported) return *_reported;

	LABELED_WARNING("ConformanceDriver") << "The DUT does not expose " << _name << "; falling back to " << _fallback
	                                     << ".";
	return _fallback;
}

}  // namespace

ConformanceDriver::ConformanceDriver(DutInterface& _dut)
    : dut(_dut),
      numClients(resolveParameter(_dut.getNumClients(), kDefaultNumClients, "NUM_CLIENTS")),
      weightWidth(resolveParameter(_dut.getWeightWidth(), kDefaultWeightWidth, "WEIGHT_WIDTH")),
      model(numClients) {
	this->dut.setGeometry(this->numClients, this->weightWidth);
	CLASS_INFO << "Driving a " << this->numClients << "-client arbiter with " << this->weightWidth
	           << "-bit weights.";
}

void ConformanceDriver::removeObserver(CycleObserver* _observer) {
	this->observers.erase(std::remove(this->observers.begin(), this->observers.end(), _observer),
	                      this->observers.end());
}

void ConformanceDriver::applyInputs(const ArbiterInputs& _inputs) {
	CLASS_ASSERT_MSG(_inputs.request.getSize() == this->numClients && _inputs.lock.getSize() == this->numClients,
	                 "Stimulus vectors must be " << this->numClients << " bits wide.");
	CLASS_ASSERT_MSG(_inputs.weights.getNumClients() == this->numClients &&
	                     _inputs.weights.getWidth() == this->weightWidth,
	                 "Stimulus weight table must be " << this->numClients << "x" << this->weightWidth << ".");

	this->dut.setRequest(_inputs.request);
	this->dut.setLock(_inputs.lock);
	this->dut.setWeight(_inputs.weights.pack());
}

void ConformanceDriver::clockPeriod() {
	this->dut.setClock(true);
	this->dut.eval();
	this->dut.setClock(false);
	this->dut.eval();
}

void ConformanceDriver::reset() {
	const ArbiterInputs idle = this->idleInputs();

	this->dut.setClock(false);
	this->dut.setResetN(false);
	this->applyInputs(idle);
	this->dut.eval();
	for (int i = 0; i < 2; ++i) { this->clockPeriod(); }

	this->dut.setResetN(true);
	this->dut.eval();
	this->clockPeriod();

	this->model.reset();
	this->model.predictNext(idle);
	this->cycle = 0;

	MismatchContext ctx;
	ctx.source     = "reset";
	ctx.request    = idle.request;
	ctx.lock       = idle.lock;
	ctx.weights    = idle.weights.toString();
	ctx.modelState = this->model.dumpState();
	GrantComparator::check(this->dut.getGrant(), std::nullopt, ctx);

	for (auto* observer : this->observers) { observer->onReset(); }
	VERBOSE_CLASS_INFO << "Reset complete.";
}

CycleRecord ConformanceDriver::step(const ArbiterInputs& _inputs) {
	// inputs settle before the edge samples them
	this->applyInputs(_inputs);
	this->dut.eval();

	this->clockPeriod();
	++this->cycle;

	CycleRecord record;
	record.cycle       = this->cycle;
	record.inputs      = _inputs;
	record.observedRaw = this->dut.getGrant();
	record.predicted   = this->model.predictNext(_inputs);
	record.decision    = this->model.getLastDecision();
	record.newGrant    = this->model.isNewGrant();
	record.modelState  = this->model.getState();

	GrantComparator::check(record.observedRaw, record.predicted, this->makeContext(record, "model"));
	record.observed = record.predicted;

	VERBOSE_CLASS_INFO << "req=" << _inputs.request.toString() << " lock=" << _inputs.lock.toString()
	                   << " gnt=" << record.observedRaw.toString() << " " << toString(record.decision);

	for (auto* observer : this->observers) { observer->onCycle(record); }
	return record;
}

void ConformanceDriver::expect(const CycleRecord& _record, const std::optional<ClientId>& _expected,
                               const std::string& _source) const {
	GrantComparator::check(_record.observedRaw, _expected, this->makeContext(_record, _source));
}

MismatchContext ConformanceDriver::makeContext(const CycleRecord& _record, const std::string& _source) const {
	MismatchContext ctx;
	ctx.cycle      = _record.cycle;
	ctx.source     = _source;
	ctx.request    = _record.inputs.request;
	ctx.lock       = _record.inputs.lock;
	ctx.weights    = _record.inputs.weights.toString();
	ctx.modelState = this->model.dumpState();
	return ctx;
}

}  // namespace wrrsim
