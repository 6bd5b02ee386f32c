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

#include "config/SimConfig.hh"

#include "utils/TypeDef.hh"

namespace wrrsim {

void SimConfig::parseParameters(const json& _params) {
	for (const auto& [param_name, param_value] : _params.items()) {
		if (!this->parameters.contains(param_name)) {
			LABELED_WARNING(this->name) << "The parameter \'" << param_name << "\' is not defined in \'" << this->name
			                            << "\'. It will be skipped during the config file parsing.";
			continue;
		}

		try {
			switch (this->parameters.at(param_name)->getType()) {
				case ParamType::INT: {
					auto i = param_value.get<int>();
					this->setParameter<int>(param_name, i);
					VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << i;
					break;
				}
				case ParamType::FLOAT: {
					auto f = param_value.get<double>();
					this->setParameter<double>(param_name, f);
					VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << f;
					break;
				}
				case ParamType::STRING: {
					auto s = param_value.get<std::string>();
					this->setParameter<std::string>(param_name, s);
					VERBOSE_LABELED_INFO(this->name) << param_name + " set to " + s;
					break;
				}
				case ParamType::TICK: {
					auto t = param_value.get<Tick>();
					this->setParameter<Tick>(param_name, t);
					VERBOSE_LABELED_INFO(this->name) << param_name + " set to " << t;
					break;
				}
				case ParamType::USER_DEFINED: {
					this->parseParametersUserDefined(param_name, param_value);
					break;
				}
			}
		} catch (const json::exception& e) {
			LABELED_ERROR(this->name) << "Invalid value for \'" << param_name << "\': " << e.what();
		}
	}
}

}  // namespace wrrsim
