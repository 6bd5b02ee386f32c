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

#include "common/BitVector.hh"

#include <bit>
#include <string>

#include "utils/Logging.hh"

namespace wrrsim {

const uint64_t BitVector::ALL_ONE = UINT64_MAX;

BitVector::BitVector(size_t _size, bool _initial) : size(_size), bitvec((_size + 63) >> 6, (uint64_t)0) {
	if (_initial) {
		for (size_t idx = 0; idx < bitvec.size(); ++idx) {
			size_t offset = _size - (idx << 6);  // the index in the current uint64_t
			if (offset >= 64)
				bitvec[idx] = BitVector::ALL_ONE;
			else
				// Only set used bits to 1
				bitvec[idx] = ((uint64_t)1 << offset) - 1;
		}
	}
}

BitVector BitVector::fromUint64(size_t _size, uint64_t _value) {
	BitVector vec(_size);
	if (vec.bitvec.empty()) return vec;

	vec.bitvec[0] = (_size >= 64) ? _value : (_value & (((uint64_t)1 << _size) - 1));
	return vec;
}

void BitVector::setBit(size_t _idx, bool _value) {
	ASSERT_MSG(size > _idx, "The argument _idx=" + std::to_string(_idx) + " is out of range.");

	size_t vec_idx = _idx >> 6;
	size_t int_vec = _idx % 64;

	if (_value)
		bitvec[vec_idx] |= ((uint64_t)1 << int_vec);
	else
		bitvec[vec_idx] &= ~((uint64_t)1 << int_vec);
}

bool BitVector::getBit(size_t _idx) const {
	ASSERT_MSG(size > _idx, "The argument _idx=" + std::to_string(_idx) + " is out of range.");

	size_t vec_idx = _idx >> 6;
	size_t int_vec = _idx % 64;

	return ((bitvec[vec_idx] >> int_vec) & 1) == 1;
}

void BitVector::reset() {
	for (size_t idx = 0; idx < bitvec.size(); ++idx) { bitvec[idx] = 0; }
}

bool BitVector::allEqual(bool _value) const {
	// unused high bits are kept at zero, so a full vector has exactly `size` ones
	return _value ? this->count() == this->size : this->count() == 0;
}

size_t BitVector::count() const {
	size_t n = 0;
	for (auto word : bitvec) { n += std::popcount(word); }
	return n;
}

std::optional<size_t> BitVector::findNextSet(size_t _start) const {
	if (this->size == 0) return std::nullopt;

	for (size_t step = 0; step < this->size; ++step) {
		size_t idx = (_start + step) % this->size;
		if (this->getBit(idx)) return idx;
	}
	return std::nullopt;
}

uint64_t BitVector::toUint64() const {
	if (bitvec.empty()) return 0;

	for (size_t idx = 1; idx < bitvec.size(); ++idx) {
		ASSERT_MSG(bitvec[idx] == 0, "A " << size << "-bit vector with bits above 63 set does not fit in uint64_t.");
	}
	return bitvec[0];
}

std::string BitVector::toString() const {
	std::string s;
	s.reserve(this->size);
	for (size_t i = this->size; i > 0; --i) { s.push_back(this->getBit(i - 1) ? '1' : '0'); }
	return s;
}

}  // end of namespace wrrsim
