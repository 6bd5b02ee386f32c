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

#include <optional>
#include <stdexcept>
#include <string>

#include "common/BitVector.hh"
#include "utils/TypeDef.hh"

namespace wrrsim {

/**
 * @file VerifError.hh
 * @brief Fatal verification outcomes
 *
 * | Exception | Raised when |
 * |-----------|-------------|
 * | IllegalGrantError | more than one grant bit is set (DUT defect) |
 * | GrantMismatchError | observed grant differs from the model or a scenario expectation |
 * | PropertyViolationError | a model-independent property check fails |
 *
 * None of them is ever retried: the run stops at the first one.
 */

/// @brief Everything needed to triage one failing cycle
struct MismatchContext {
	Tick                    cycle = 0;
	std::string             source;  ///< "model" or the scenario name
	BitVector               observedRaw;
	std::optional<ClientId> observed;
	std::optional<ClientId> expected;
	BitVector               request;
	BitVector               lock;
	std::string             weights;
	std::string             modelState;  ///< rr_ptr / owner / counter of the model

	std::string toString() const;
};

class VerificationError : public std::runtime_error {
public:
	VerificationError(const std::string& _what, Tick _cycle) : std::runtime_error(_what), cycle(_cycle) {}

	Tick getCycle() const { return this->cycle; }

private:
	Tick cycle;
};

class IllegalGrantError : public VerificationError {
public:
	IllegalGrantError(Tick _cycle, const BitVector& _grant);

	const BitVector& getGrant() const { return this->grant; }

private:
	BitVector grant;
};

class GrantMismatchError : public VerificationError {
public:
	explicit GrantMismatchError(const MismatchContext& _ctx);

	const MismatchContext& getContext() const { return this->ctx; }

private:
	MismatchContext ctx;
};

class PropertyViolationError : public VerificationError {
public:
	PropertyViolationError(Tick _cycle, const std::string& _property, const std::string& _detail);

	const std::string& getProperty() const { return this->property; }

private:
	std::string property;
};

/// @brief "none" or the decimal client index
std::string grantToString(const std::optional<ClientId>& _grant);

}  // namespace wrrsim
