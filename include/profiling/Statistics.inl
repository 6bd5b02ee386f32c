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

#include <algorithm>
#include <numeric>

#include "profiling/Statistics.hh"

namespace wrrsim {

/**************************
 *                        *
 *       Statistics       *
 *                        *
 **************************/

template <typename TValue>
TValue Statistics<TValue>::sum() const {
	return std::accumulate(this->samples.begin(), this->samples.end(), TValue{0});
}

template <typename TValue>
double Statistics<TValue>::avg() const {
	return (this->samples.size() != 0) ? static_cast<double>(this->sum()) / this->samples.size() : 0.0;
}

template <typename TValue>
TValue Statistics<TValue>::max() const {
	return (this->samples.size() > 0) ? *std::max_element(this->samples.begin(), this->samples.end()) : TValue{0};
}

/**********************************
 *                                *
 *     CategorizedStatistics      *
 *                                *
 **********************************/

template <typename TCategory, typename TValue>
TValue CategorizedStatistics<TCategory, TValue>::sum() const {
	TValue sum = 0;
	for (const auto& [cat, stat] : this->entries) { sum += stat.sum(); }
	return sum;
}

template <typename TCategory, typename TValue>
std::map<TCategory, double> CategorizedStatistics<TCategory, TValue>::sumDistribution() const {
	std::map<TCategory, double> distribution_map;
	for (const auto& [cat, stat] : this->entries) { distribution_map[cat] = static_cast<double>(stat.sum()); }

	const double total = static_cast<double>(this->sum());
	if (total != 0) {
		for (auto& [cat, val] : distribution_map) { val = val / total; }
	}

	return distribution_map;
}

}  // namespace wrrsim
