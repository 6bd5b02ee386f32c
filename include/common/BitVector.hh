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
#include <string>
#include <vector>

namespace wrrsim {

/**
 * @file BitVector.hh
 * @brief Fixed-width bit vector used for the request, lock and grant buses
 *
 * @details
 * Bits are stored little-endian in 64-bit words: bit `i` lives in word `i / 64`
 * at position `i % 64`. Unused high bits of the last word are always zero, so
 * word-wise comparison and popcount need no masking.
 *
 * | Operation | Complexity |
 * |-----------|-----------|
 * | setBit() / getBit() | O(1) |
 * | count() / allEqual() | O(words) |
 * | findNextSet() | O(size) worst case |
 *
 * @code{.cpp}
 * BitVector req(4);
 * req.setBit(1, true);
 * req.setBit(3, true);
 * req.findNextSet(2);  // -> 3
 * req.findNextSet(0);  // -> 1
 * @endcode
 */
class BitVector {
	const static uint64_t ALL_ONE;

public:
	explicit BitVector(size_t _size = 0, bool _initial = false);

	BitVector(const BitVector& _other) = default;

	BitVector& operator=(const BitVector& _other) = default;

	~BitVector() = default;

	/**
	 * @brief Builds a vector of `_size` bits from the low bits of `_value`
	 * @note Bits of `_value` at positions >= `_size` are discarded
	 */
	static BitVector fromUint64(size_t _size, uint64_t _value);

	void setBit(size_t _idx, bool _value);

	bool getBit(size_t _idx) const;

	size_t getSize() const { return this->size; }

	bool allEqual(bool _value) const;

	/// @brief Number of set bits
	size_t count() const;

	/// @brief True when exactly one bit is set
	bool isOneHot() const { return this->count() == 1; }

	/**
	 * @brief First set bit at or after `_start`, wrapping around to 0
	 *
	 * Scans `_start, _start+1, ..., size-1, 0, ..., _start-1` and returns the first
	 * set position, or std::nullopt if no bit is set.
	 */
	std::optional<size_t> findNextSet(size_t _start) const;

	/**
	 * @brief The low 64 bits as an integer
	 * @note Asserts if the vector is wider than 64 bits and any upper bit is set
	 */
	uint64_t toUint64() const;

	/// @brief MSB-first binary string, e.g. "0101" for bits {0, 2} of a 4-bit vector
	std::string toString() const;

	bool operator==(const BitVector& _other) const { return size == _other.size && bitvec == _other.bitvec; }

	bool operator!=(const BitVector& _other) const { return !(*this == _other); }

	void reset();

private:
	size_t                size;    // number of valid bits
	std::vector<uint64_t> bitvec;  // little-endian 64-bit words
};

}  // end of namespace wrrsim
