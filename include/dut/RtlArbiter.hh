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

#include <cstddef>
#include <cstdint>

namespace wrrsim {

/**
 * @file RtlArbiter.hh
 * @brief Register-transfer model of the weighted round-robin arbiter with atomic lock
 *
 * @details
 * Stands in for the synthesizable arbiter and exposes the same ports a
 * Verilator build of it would (`clk`, `rst_n`, `i_req`, `i_lock`, `i_weight`,
 * `o_gnt`), so it plugs into VerilatedDut unchanged.
 *
 * It is written the way the hardware is built, not the way the reference
 * model reasons: a one-hot grant register, a pointer register, a down-counter
 * and one block of combinational logic.
 *
 * ```
 *            ┌──────────────── comb ────────────────┐
 * i_req ───► │ keep_current = own_req &             │
 * i_lock ──► │        (own_lock | cnt_q != 0)       │      ┌────────┐
 * i_weight ► │ masked RR pick from search_ptr       ├─────►│ gnt_q  ├──► o_gnt
 *            │ cnt_d = keep ? cnt_q-1 : weight[pick]│      │ ptr_q  │
 *            └──────────────────────────────────────┘      │ cnt_q  │
 *                                                          └────────┘
 *                                       posedge clk / negedge rst_n
 * ```
 *
 * Reset is asynchronous and active low. Outputs are registered: `o_gnt`
 * changes only on a rising clock edge or on reset.
 */
class RtlArbiter {
public:
	// Ports
	uint8_t  clk      = 0;
	uint8_t  rst_n    = 0;
	uint64_t i_req    = 0;
	uint64_t i_lock   = 0;
	uint64_t i_weight = 0;
	uint64_t o_gnt    = 0;

	// Parameters
	const size_t NUM_CLIENTS;
	const size_t WEIGHT_WIDTH;

	RtlArbiter(size_t _numClients = 4, size_t _weightWidth = 4);

	/// @brief Settle combinational logic and process clock/reset edges
	void eval();

private:
	struct NextState {
		uint64_t gnt;
		uint32_t ptr;
		uint32_t cnt;
	};

	NextState combinational() const;

	uint32_t weightOf(uint32_t _client) const;

	uint64_t clientMask() const { return NUM_CLIENTS >= 64 ? ~uint64_t(0) : ((uint64_t(1) << NUM_CLIENTS) - 1); }

	// Registers
	uint64_t gnt_q = 0;
	uint32_t ptr_q = 0;
	uint32_t cnt_q = 0;

	uint8_t clk_prev = 0;
};

}  // namespace wrrsim
