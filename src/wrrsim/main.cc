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
 * @file main.cc
 * @brief Command-line entry of the WRRSim conformance runner
 *
 * ```
 * wrrsim --mode All --cycles 20000 --seed 7
 * wrrsim --config configs/default.json --scenario lock_hold
 * ```
 *
 * Exit status: 0 when every selected check passed, 1 on the first
 * verification failure, 2 on a configuration error.
 */

#include <iostream>
#include <sstream>

#include "WRRSim.hh"

int main(int argc, char** argv) {
	using namespace wrrsim;

	top = std::make_shared<WRRSimTop>();

	try {
		top->init(argc, argv);
	} catch (const std::exception&) {
		// the logging layer has already printed the cause
		std::cerr << "WRRSim: invalid configuration, nothing was run." << std::endl;
		return 2;
	}

	try {
		top->run();
	} catch (const VerificationError& e) {
		std::stringstream ss;
		ss << ANSI_SGR(ANSI_SGR::PARAMETER::FG_RED).getCode() << "FAILED" << ANSI_SGR(ANSI_SGR::PARAMETER::RESET).getCode()
		   << " at cycle " << e.getCycle() << ": " << e.what();
		std::cerr << ss.str() << std::endl;
		return 1;
	}

	top->finish();
	return 0;
}
