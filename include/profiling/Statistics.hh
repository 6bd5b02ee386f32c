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
#include <map>
#include <vector>

namespace wrrsim {

/**
 * @brief A collection of samples with basic aggregates
 *
 * @tparam TValue arithmetic sample type
 */
template <typename TValue>
class Statistics {
public:
	Statistics() = default;

	/**
	 * @brief Adds a new sample.
	 * @param _val The value to be added.
	 */
	void push(const TValue& _val) { this->samples.push_back(_val); }

	/**
	 * @brief Computes the sum of all samples.
	 */
	TValue sum() const;

	/**
	 * @brief Computes the arithmetic mean of all samples, 0 when empty.
	 */
	double avg() const;

	/**
	 * @brief Finds the largest sample, 0 when empty.
	 */
	TValue max() const;

	size_t size() const { return this->samples.size(); }

	void clear() { this->samples.clear(); }

private:
	std::vector<TValue> samples;
};

/**
 * @brief Statistics grouped by a sorted category key
 *
 * @tparam TCategory The type used for category keys.
 * @tparam TValue The type of values stored in the statistics.
 */
template <typename TCategory, typename TValue>
class CategorizedStatistics {
	using MapType = std::map<TCategory, Statistics<TValue>>;

public:
	CategorizedStatistics() = default;

	/**
	 * @brief Get a category entry. The entry will be constructed if it does not exist.
	 * @param _cat The category key to be retrieved.
	 */
	Statistics<TValue>& getEntry(const TCategory& _cat) { return this->entries[_cat]; }

	/**
	 * @brief Get the summation of all values across all category entries.
	 */
	TValue sum() const;

	/**
	 * @brief Share of the overall sum held by each category.
	 * @return A map from each category to its fraction in [0, 1].
	 */
	std::map<TCategory, double> sumDistribution() const;

	void clear() { this->entries.clear(); }

	typename MapType::const_iterator begin() const { return this->entries.begin(); }

	typename MapType::const_iterator end() const { return this->entries.end(); }

private:
	MapType entries;
};

}  // namespace wrrsim

#include "profiling/Statistics.inl"
