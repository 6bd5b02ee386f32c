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
#include <optional>

#include "common/BitVector.hh"
#include "utils/HashableType.hh"

namespace wrrsim {

/**
 * @file DutInterface.hh
 * @brief Signal-level boundary of the arbiter under test
 *
 * @details
 * | Signal | Direction | Width | Accessor |
 * |--------|-----------|-------|----------|
 * | clock | in | 1 | setClock() |
 * | active-low reset | in | 1 | setResetN() |
 * | request vector | in | N | setRequest() |
 * | lock vector | in | N | setLock() |
 * | weight table | in | N*W | setWeight() (packed, client-major) |
 * | grant vector | out | N | getGrant() (registered) |
 *
 * Setters only stage values; nothing propagates until eval(), which settles
 * combinational logic and processes any clock or reset edge implied by the
 * staged values, like Verilator's `eval()`.
 *
 * N and W are instantiation parameters of the DUT. getNumClients() and
 * getWeightWidth() report them when the DUT exposes them and return
 * std::nullopt otherwise; the driver then picks the documented default and
 * calls setGeometry() before driving any vector.
 */
class DutInterface : virtual public HashableType {
public:
	virtual ~DutInterface() = default;

	virtual std::optional<size_t> getNumClients() const  = 0;
	virtual std::optional<size_t> getWeightWidth() const = 0;

	/// @brief Fix the vector widths used by the setters and getGrant()
	virtual void setGeometry(size_t _numClients, size_t _weightWidth) = 0;

	virtual void setClock(bool _level)           = 0;
	virtual void setResetN(bool _level)          = 0;
	virtual void setRequest(const BitVector& _v) = 0;
	virtual void setLock(const BitVector& _v)    = 0;
	virtual void setWeight(const BitVector& _v)  = 0;

	virtual void eval() = 0;

	virtual BitVector getGrant() const = 0;
};

}  // namespace wrrsim
