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

#include "TestConformance.hh"

void MutantArbiter::eval() {
	if (!this->rst_n) {
		this->owner.reset();
		this->ptr        = 0;
		this->cnt        = 0;
		this->lockedLast = false;
		this->extra      = 0;
	} else if (this->clk && !this->clkPrev) {
		this->risingEdge();
	}

	this->clkPrev = this->clk;
	this->o_gnt   = (this->owner ? (uint64_t(1) << *this->owner) : 0) | this->extra;
}

void MutantArbiter::risingEdge() {
	const bool own_req  = this->owner && this->requesting(*this->owner);
	const bool own_lock = this->owner && this->locking(*this->owner);
	const bool any_lock = (this->i_lock & this->i_req & 0xF) != 0;

	bool keep = false;
	switch (this->fault) {
		case Fault::NoEarlyRelease: keep = this->owner && (own_lock || this->cnt > 0); break;
		case Fault::HonourIllegalLock: keep = own_req && (any_lock || this->cnt > 0); break;
		default: keep = own_req && (own_lock || this->cnt > 0); break;
	}

	if (this->fault == Fault::ReloadOnUnlock && own_req && this->lockedLast && !own_lock) {
		this->cnt = this->weightOf(*this->owner) + 1;
		keep      = true;
	}

	this->extra = 0;
	if (keep) {
		if (this->cnt > 0) --this->cnt;
		this->lockedLast = own_lock;
		return;
	}

	if (this->owner) this->ptr = (*this->owner + 1) % 4;
	this->owner.reset();
	this->cnt        = 0;
	this->lockedLast = false;

	for (size_t step = 0; step < 4; ++step) {
		const size_t c = (this->ptr + step) % 4;
		if (!this->requesting(c)) continue;

		if (!this->owner) {
			this->owner = c;
			this->cnt   = this->weightOf(c);
		} else if (this->fault == Fault::MultiGrant) {
			this->extra = uint64_t(1) << c;
			break;
		}
	}
}
