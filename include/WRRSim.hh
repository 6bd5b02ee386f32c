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

// Utilities
#include "utils/Arguments.hh"
#include "utils/HashableType.hh"
#include "utils/Logging.hh"
#include "utils/TypeDef.hh"

// Data types
#include "common/Arbiter.hh"
#include "common/BitVector.hh"
#include "common/WeightTable.hh"
#include "profiling/Statistics.hh"

// Configuration
#include "config/CLIManager.hh"
#include "config/SimConfig.hh"
#include "config/SimConfigManager.hh"
#include "config/WRRSimConfig.hh"

// Reference model and device under test
#include "dut/DutInterface.hh"
#include "dut/RtlArbiter.hh"
#include "dut/VerilatedDut.hh"
#include "model/ArbitrationModel.hh"

// Verification
#include "verif/ConformanceDriver.hh"
#include "verif/GrantComparator.hh"
#include "verif/PropertyMonitor.hh"
#include "verif/ScenarioLibrary.hh"
#include "verif/StimulusGenerator.hh"
#include "verif/StressRunner.hh"
#include "verif/VerifError.hh"

// Top
#include "sim/WRRSimTop.hh"
