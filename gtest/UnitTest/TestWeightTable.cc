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

#include <gtest/gtest.h>

#include "common/WeightTable.hh"

namespace unit_test {

using namespace wrrsim;

TEST(WeightTableTest, PackIsClientMajorLittleEndian) {
	WeightTable t = WeightTable::fromValues(4, {1, 3, 0, 0});

	EXPECT_EQ(t.pack().toUint64(), 0x31u) << "Client 0 occupies bits [3:0], client 1 bits [7:4].";
	EXPECT_EQ(t.pack().getSize(), 16u);

	WeightTable u = WeightTable::fromValues(4, {15, 0, 0, 5});
	EXPECT_EQ(u.pack().toUint64(), 0x500Fu);
}

TEST(WeightTableTest, ValuesAreMaskedToWidth) {
	WeightTable t = WeightTable::fromValues(2, {7, 4, 3});
	EXPECT_EQ(t.get(0), 3u) << "7 truncated to 2 bits.";
	EXPECT_EQ(t.get(1), 0u);
	EXPECT_EQ(t.get(2), 3u);
	EXPECT_EQ(t.getMaxWeight(), 3u);

	t.set(1, 0xFF);
	EXPECT_EQ(t.get(1), 3u);

	EXPECT_EQ(WeightTable(2, 32).getMaxWeight(), UINT32_MAX);
}

TEST(WeightTableTest, UnpackInvertsPack) {
	WeightTable t        = WeightTable::fromValues(3, {5, 0, 7, 2});
	WeightTable restored = WeightTable::unpack(4, 3, t.pack());
	EXPECT_EQ(restored, t);
	EXPECT_EQ(restored.toString(), "[5, 0, 7, 2]");

	EXPECT_THROW(WeightTable::unpack(4, 3, BitVector(11)), std::runtime_error)
	    << "A bus of the wrong width must be rejected.";
}

TEST(WeightTableTest, RejectsInvalidWidthAndClient) {
	EXPECT_THROW(WeightTable(4, 0), std::runtime_error);
	EXPECT_THROW(WeightTable(4, 33), std::runtime_error);

	WeightTable t(4, 4);
	EXPECT_THROW(t.get(4), std::runtime_error);
}

}  // namespace unit_test
