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
#include <string>
#include <vector>

#include "common/BitVector.hh"
#include "utils/TypeDef.hh"

namespace wrrsim {

/**
 * @file WeightTable.hh
 * @brief Per-client weight table and its packed bus encoding
 *
 * @details
 * A weight `k` entitles a newly granted client to `k` extra cycles beyond the
 * first. Every stored value is masked to `width` bits, exactly as the packed
 * bus truncates it.
 *
 * **Packing (little-endian, client-major):**
 * ```
 * bit:    [W-1 .. 0] [2W-1 .. W] ... [N*W-1 .. (N-1)*W]
 * client:     0          1      ...        N-1
 * ```
 *
 * @code{.cpp}
 * WeightTable w = WeightTable::fromValues(4, {1, 3, 0, 0});
 * w.pack().toUint64();  // -> 0x0031
 * @endcode
 */
class WeightTable {
public:
	WeightTable() : width(0) {}

	WeightTable(size_t _numClients, size_t _width, uint32_t _initial = 0);

	/// @brief Table of `_values.size()` clients, each value masked to `_width` bits
	static WeightTable fromValues(size_t _width, const std::vector<uint32_t>& _values);

	/// @brief Inverse of pack(); `_packed` must be exactly `_numClients * _width` bits
	static WeightTable unpack(size_t _numClients, size_t _width, const BitVector& _packed);

	BitVector pack() const;

	void set(ClientId _client, uint32_t _value);

	uint32_t get(ClientId _client) const;

	size_t getNumClients() const { return this->weights.size(); }

	size_t getWidth() const { return this->width; }

	/// @brief Largest weight representable in `width` bits
	uint32_t getMaxWeight() const { return this->mask(UINT32_MAX); }

	/// @brief e.g. "[1, 3, 0, 0]"
	std::string toString() const;

	bool operator==(const WeightTable& _other) const = default;

private:
	uint32_t mask(uint32_t _value) const {
		return this->width >= 32 ? _value : (_value & ((uint32_t(1) << this->width) - 1));
	}

	size_t                width;
	std::vector<uint32_t> weights;
};

}  // namespace wrrsim
