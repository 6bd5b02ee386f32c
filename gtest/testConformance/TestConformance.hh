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
#include <optional>

#include "WRRSim.hh"

/// @brief Defects injected into MutantArbiter
enum class Fault {
	ReloadOnUnlock,     ///< counter reloads from the weight when the owner drops its lock
	HonourIllegalLock,  ///< a lock from any requesting client holds the current grant
	NoEarlyRelease,     ///< owner keeps the grant after it stops requesting
	MultiGrant          ///< a new grant also raises the next requester's bit
};

/**
 * @brief A faulty arbiter with Verilator-style ports, one defect per instance
 *
 * Fixed at 4 clients with 4-bit weights.
 */
class MutantArbiter {
public:
	uint8_t  clk      = 0;
	uint8_t  rst_n    = 0;
	uint64_t i_req    = 0;
	uint64_t i_lock   = 0;
	uint64_t i_weight = 0;
	uint64_t o_gnt    = 0;

	const size_t NUM_CLIENTS  = 4;
	const size_t WEIGHT_WIDTH = 4;

	explicit MutantArbiter(Fault _fault) : fault(_fault) {}

	void eval();

private:
	void risingEdge();

	bool requesting(size_t _client) const { return (this->i_req >> _client) & 1; }

	bool locking(size_t _client) const { return (this->i_lock >> _client) & 1; }

	uint32_t weightOf(size_t _client) const { return (this->i_weight >> (_client * 4)) & 0xF; }

	Fault                 fault;
	std::optional<size_t> owner;
	size_t                ptr        = 0;
	uint32_t              cnt        = 0;
	bool                  lockedLast = false;
	uint64_t              extra      = 0;  // spurious grant bit of Fault::MultiGrant
	uint8_t               clkPrev    = 0;
};

/**
 * @brief The built-in RTL arbiter with its parameters hidden
 *
 * Stands for a generated model that does not publish NUM_CLIENTS and
 * WEIGHT_WIDTH, so the driver has to fall back to its defaults.
 */
class OpaqueArbiter : private wrrsim::RtlArbiter {
public:
	OpaqueArbiter() : wrrsim::RtlArbiter(4, 4) {}

	using wrrsim::RtlArbiter::clk;
	using wrrsim::RtlArbiter::eval;
	using wrrsim::RtlArbiter::i_lock;
	using wrrsim::RtlArbiter::i_req;
	using wrrsim::RtlArbiter::i_weight;
	using wrrsim::RtlArbiter::o_gnt;
	using wrrsim::RtlArbiter::rst_n;
};
