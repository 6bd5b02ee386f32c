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

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include "dut/DutInterface.hh"
#include "utils/Logging.hh"

namespace wrrsim {

/**
 * @brief Port layout of a Verilator-generated arbiter model
 *
 * Matches the C++ class Verilator emits for the arbiter top level: public port
 * members named after the HDL ports and an eval() method. Buses up to 64 bits
 * are plain integers (Verilator's CData/QData).
 */
template <typename TModel>
concept VerilatedArbiterPorts = requires(TModel& m) {
	m.clk      = uint8_t{0};
	m.rst_n    = uint8_t{0};
	m.i_req    = uint64_t{0};
	m.i_lock   = uint64_t{0};
	m.i_weight = uint64_t{0};
	{ m.o_gnt } -> std::convertible_to<uint64_t>;
	m.eval();
};

/// @brief Models that publish their NUM_CLIENTS / WEIGHT_WIDTH parameters
template <typename TModel>
concept IntrospectableArbiter = requires(const TModel& m) {
	{ m.NUM_CLIENTS } -> std::convertible_to<size_t>;
	{ m.WEIGHT_WIDTH } -> std::convertible_to<size_t>;
};

/**
 * @brief DutInterface adapter over a Verilator-style model
 *
 * @tparam TModel generated (or hand-written) model class with the VerilatedArbiterPorts layout
 *
 * @note Limited to N <= 64 and N*W <= 64, the widths that fit a QData port
 */
template <VerilatedArbiterPorts TModel>
class VerilatedDut : public DutInterface {
public:
	explicit VerilatedDut(std::unique_ptr<TModel> _model) : model(std::move(_model)) {}

	std::optional<size_t> getNumClients() const override {
		if constexpr (IntrospectableArbiter<TModel>) {
			return static_cast<size_t>(this->model->NUM_CLIENTS);
		} else {
			return std::nullopt;
		}
	}

	std::optional<size_t> getWeightWidth() const override {
		if constexpr (IntrospectableArbiter<TModel>) {
			return static_cast<size_t>(this->model->WEIGHT_WIDTH);
		} else {
			return std::nullopt;
		}
	}

	void setGeometry(size_t _numClients, size_t _weightWidth) override {
		CLASS_ASSERT_MSG(_numClients >= 1 && _numClients <= 64,
		                 "A 64-bit grant port cannot carry " << _numClients << " clients.");
		CLASS_ASSERT_MSG(_numClients * _weightWidth <= 64,
		                 "A 64-bit weight port cannot carry " << _numClients << "x" << _weightWidth << " bits.");
		this->numClients = _numClients;
	}

	void setClock(bool _level) override { this->model->clk = _level; }

	void setResetN(bool _level) override { this->model->rst_n = _level; }

	void setRequest(const BitVector& _v) override { this->model->i_req = _v.toUint64(); }

	void setLock(const BitVector& _v) override { this->model->i_lock = _v.toUint64(); }

	void setWeight(const BitVector& _v) override { this->model->i_weight = _v.toUint64(); }

	void eval() override { this->model->eval(); }

	/// @note Bits above the configured client count are not part of the grant bus and are dropped
	BitVector getGrant() const override {
		return BitVector::fromUint64(this->numClients, static_cast<uint64_t>(this->model->o_gnt));
	}

	TModel& getModel() { return *this->model; }

private:
	std::unique_ptr<TModel> model;
	size_t                  numClients = 0;
};

}  // namespace wrrsim
