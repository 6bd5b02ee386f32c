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

/**
 * @file SimConfig.hh
 * @brief Named, typed parameter storage filled from JSON
 *
 * A SimConfig is one top-level key of a WRRSim config file. Each parameter is
 * registered with a default value and a ParamType that selects how its JSON
 * value is parsed.
 *
 * ```json
 * {
 *   "stress": { "cycles": 20000, "seed": 7, "request_probability": 0.5 },
 *   "run":    { "mode": { "type": "RunMode", "params": "Stress" } }
 * }
 * ```
 *
 * @see SimConfigManager For multi-config management
 * @see CLIManager For command-line integration
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>

#include "utils/HashableType.hh"
#include "utils/Logging.hh"

// Third-Party Library
#include <nlohmann/json.hpp>

namespace wrrsim {

using json = nlohmann::json;

/**
 * @enum ParamType
 * @brief How a parameter's JSON value is parsed
 */
enum class ParamType {
	INT,          ///< int
	FLOAT,        ///< double
	STRING,       ///< std::string
	TICK,         ///< cycle counts (Tick)
	USER_DEFINED  ///< enums and objects, parsed by SimConfig::parseParametersUserDefined()
};

/**
 * @brief Type-erased base of Parameter<T>
 */
class ParameterBase {
public:
	ParameterBase(std::string _name, ParamType _type) : name(_name), type(_type) {}

	virtual ~ParameterBase() = default;

	std::string getName() const { return this->name; }

	ParamType getType() const { return this->type; }

private:
	std::string name;
	ParamType   type;
};

template <typename T>
class Parameter : public ParameterBase {
public:
	Parameter(const std::string& _name, const T& _value, ParamType _type) : ParameterBase(_name, _type), value(_value) {}

	~Parameter() override = default;

	/**
	 * @throws std::runtime_error if TParam is not T
	 */
	template <typename TParam>
	void setValue(const TParam& _value) {
		if constexpr (std::is_same_v<TParam, T>) {
			this->value = _value;
		} else {
			throw std::runtime_error("Type mismatch! Expected " + std::string(typeid(T).name()) + " but got " +
			                         std::string(typeid(TParam).name()) + ".");
		}
	}

	/**
	 * @throws std::runtime_error if TParam is not T
	 */
	template <typename TParam>
	TParam getValue() const {
		if constexpr (std::is_same_v<T, TParam>) {
			return this->value;
		} else {
			throw std::runtime_error("Type mismatch! Expected " + std::string(typeid(T).name()) + " but got " +
			                         std::string(typeid(TParam).name()) + ".");
		}
	}

private:
	T value;
};

/**
 * @class SimConfig
 * @brief A named group of parameters
 *
 * Parameters are owned by the config and deleted with it. Derived configs
 * register their parameters in the constructor, override
 * parseParametersUserDefined() for USER_DEFINED ones and validate() for
 * cross-parameter constraints.
 */
class SimConfig : virtual public HashableType {
	friend class SimConfigManager;

public:
	SimConfig(const std::string& _name) : name(_name) {}

	virtual ~SimConfig() {
		for (auto& it : parameters) {
			VERBOSE_LABELED_INFO(this->name) << "Deleting Parameter objects : " << it.first;
			delete it.second;
		}
	}

	SimConfig(const SimConfig&)            = delete;
	SimConfig& operator=(const SimConfig&) = delete;

	std::string getName() const { return this->name; }

	bool hasParameter(const std::string& _name) const { return this->parameters.contains(_name); }

	template <typename T>
	void setParameter(const std::string& _name, const T& _value);

	template <typename T>
	T getParameter(const std::string& _name) const;

	/**
	 * @brief Update parameters from one JSON object
	 *
	 * Unknown keys are warned and skipped. A value of the wrong JSON type is an
	 * error naming the config and the parameter.
	 */
	void parseParameters(const json& _params);

	/**
	 * @brief Check constraints after all sources have been applied
	 *
	 * Raises an error through the logging macros on an invalid value.
	 */
	virtual void validate() const {}

protected:
	/// Override in derived classes to handle USER_DEFINED parameter types
	virtual void parseParametersUserDefined(const std::string& _paramName, const json& _paramValue) {
		LABELED_ERROR(this->name) << "No parser for the user-defined parameter \'" << _paramName << "\'.";
	}

	template <typename T>
	void addParameter(const std::string& _name, const T& _value, ParamType _type);

private:
	template <typename T>
	Parameter<T>* getParameterPtr(const std::string& _name) const;

	std::unordered_map<std::string, ParameterBase*> parameters;

	const std::string name;
};

}  // end of namespace wrrsim

#include "config/SimConfig.inl"
