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

#include "common/WeightTable.hh"

#include <sstream>

#include "utils/Logging.hh"

namespace wrrsim {

WeightTable::WeightTable(size_t _numClients, size_t _width, uint32_t _initial)
    : width(_width), weights(_numClients, 0) {
	LABELED_ASSERT_MSG(_width >= 1 && _width <= 32, "WeightTable", "Weight width " << _width << " is not in [1, 32].");
	for (auto& w : this->weights) { w = this->mask(_initial); }
}

WeightTable WeightTable::fromValues(size_t _width, const std::vector<uint32_t>& _values) {
	WeightTable table(_values.size(), _width);
	for (ClientId c = 0; c < _values.size(); ++c) { table.set(c, _values[c]); }
	return table;
}

WeightTable WeightTable::unpack(size_t _numClients, size_t _width, const BitVector& _packed) {
	LABELED_ASSERT_MSG(_packed.getSize() == _numClients * _width, "WeightTable",
	                   "Packed weight bus has " << _packed.getSize() << " bits, expected " << _numClients * _width
	                                            << ".");
	WeightTable table(_numClients, _width);
	for (ClientId c = 0; c < _numClients; ++c) {
		uint32_t value = 0;
		for (size_t b = 0; b < _width; ++b) {
			if (_packed.getBit(c * _width + b)) value |= (uint32_t(1) << b);
		}
		table.weights[c] = value;
	}
	return table;
}

BitVector WeightTable::pack() const {
	BitVector packed(this->weights.size() * this->width);
	for (ClientId c = 0; c < this->weights.size(); ++c) {
		for (size_t b = 0; b < this->width; ++b) { packed.setBit(c * this->width + b, (this->weights[c] >> b) & 1); }
	}
	return packed;
}

void WeightTable::set(ClientId _client, uint32_t _value) {
	LABELED_ASSERT_MSG(_client < this->weights.size(), "WeightTable", "Client " << _client << " is out of range.");
	this->weights[_client] = this->mask(_value);
}

uint32_t WeightTable::get(ClientId _client) const {
	LABELED_ASSERT_MSG(_client < this->weights.size(), "WeightTable", "Client " << _client << " is out of range.");
	return this->weights[_client];
}

std::string WeightTable::toString() const {
	std::stringstream ss;
	ss << "[";
	for (size_t i = 0; i < this->weights.size(); ++i) { ss << (i ? ", " : "") << this->weights[i]; }
	ss << "]";
	return ss.str();
}

}  // namespace wrrsim
