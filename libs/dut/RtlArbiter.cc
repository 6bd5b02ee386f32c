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

#include "dut/RtlArbiter.hh"

#include <bit>

#include "utils/Logging.hh"

namespace wrrsim {

RtlArbiter::RtlArbiter(size_t _numClients, size_t _weightWidth)
    : NUM_CLIENTS(_numClients), WEIGHT_WIDTH(_weightWidth) {
	LABELED_ASSERT_MSG(_numClients >= 1 && _numClients <= 64, "RtlArbiter",
	                   "NUM_CLIENTS=" << _numClients << " is not in [1, 64].");
	LABELED_ASSERT_MSG(_weightWidth >= 1 && _weightWidth <= 32 && _numClients * _weightWidth <= 64, "RtlArbiter",
	                   "WEIGHT_WIDTH=" << _weightWidth << " does not fit the weight port.");
}

uint32_t RtlArbiter::weightOf(uint32_t _client) const {
	uint64_t field = i_weight >> (_client * WEIGHT_WIDTH);
	return static_cast<uint32_t>(field & ((uint64_t(1) << WEIGHT_WIDTH) - 1));
}

RtlArbiter::NextState RtlArbiter::combinational() const {
	const uint64_t req  = i_req & clientMask();
	const uint64_t lock = i_lock & clientMask();

	const bool own_valid = gnt_q != 0;
	const bool own_req   = (req & gnt_q) != 0;
	const bool own_lock  = (lock & gnt_q) != 0;

	const bool keep_current = own_valid && own_req && (own_lock || cnt_q != 0);
	if (keep_current) return {gnt_q, ptr_q, cnt_q != 0 ? cnt_q - 1 : 0};

	// pointer moves past the previous owner whenever its grant ends
	const uint32_t search_ptr =
	    own_valid ? static_cast<uint32_t>((std::countr_zero(gnt_q) + 1) % NUM_CLIENTS) : ptr_q;

	// two-level pick: requests at or above the pointer first, then wrap to the bottom
	const uint64_t upper_mask = clientMask() & ~((uint64_t(1) << search_ptr) - 1);
	const uint64_t masked_req = req & upper_mask;
	const uint64_t pick_from  = masked_req != 0 ? masked_req : req;

	if (pick_from == 0) return {0, search_ptr, 0};

	const uint32_t winner = static_cast<uint32_t>(std::countr_zero(pick_from));
	return {uint64_t(1) << winner, search_ptr, weightOf(winner)};
}

void RtlArbiter::eval() {
	if (!rst_n) {
		gnt_q = 0;
		ptr_q = 0;
		cnt_q = 0;
	} else if (clk && !clk_prev) {
		const NextState d = combinational();

		gnt_q = d.gnt;
		ptr_q = d.ptr;
		cnt_q = d.cnt;
	}

	clk_prev = clk;
	o_gnt    = gnt_q;
}

}  // namespace wrrsim
