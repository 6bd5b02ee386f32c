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

#include "common/BitVector.hh"

namespace unit_test {

using namespace wrrsim;

TEST(BitVectorTest, ConstructAndAccess) {
	BitVector zeros(5);
	EXPECT_EQ(zeros.getSize(), 5u);
	EXPECT_TRUE(zeros.allEqual(false)) << "A default vector should be all zero.";

	BitVector ones(70, true);
	EXPECT_TRUE(ones.allEqual(true)) << "A 70-bit all-one vector spans two words.";
	EXPECT_EQ(ones.count(), 70u);

	zeros.setBit(3, true);
	EXPECT_TRUE(zeros.getBit(3));
	EXPECT_FALSE(zeros.getBit(2));
	zeros.setBit(3, false);
	EXPECT_TRUE(zeros.allEqual(false));

	EXPECT_THROW(zeros.getBit(5), std::runtime_error) << "Out-of-range access must be reported.";
}

TEST(BitVectorTest, FromUint64MasksToSize) {
	BitVector v = BitVector::fromUint64(4, 0xF5);
	EXPECT_EQ(v.toUint64(), 0x5u) << "Bits above the vector size are dropped.";
	EXPECT_EQ(v.toString(), "0101");

	BitVector wide = BitVector::fromUint64(64, UINT64_MAX);
	EXPECT_EQ(wide.count(), 64u);
}

TEST(BitVectorTest, OneHot) {
	EXPECT_FALSE(BitVector::fromUint64(4, 0b0000).isOneHot());
	EXPECT_TRUE(BitVector::fromUint64(4, 0b0100).isOneHot());
	EXPECT_FALSE(BitVector::fromUint64(4, 0b0110).isOneHot());
}

TEST(BitVectorTest, FindNextSetWrapsAround) {
	BitVector v = BitVector::fromUint64(4, 0b1001);

	EXPECT_EQ(v.findNextSet(0), std::optional<size_t>(0));
	EXPECT_EQ(v.findNextSet(1), std::optional<size_t>(3)) << "Search starts at the given index.";
	EXPECT_EQ(v.findNextSet(3), std::optional<size_t>(3));

	BitVector only_low = BitVector::fromUint64(4, 0b0010);
	EXPECT_EQ(only_low.findNextSet(2), std::optional<size_t>(1)) << "Search wraps past the top index.";

	EXPECT_EQ(BitVector(4).findNextSet(0), std::nullopt);
	EXPECT_EQ(BitVector(0).findNextSet(0), std::nullopt);
}

TEST(BitVectorTest, ToUint64RejectsHighBits) {
	BitVector v(80);
	v.setBit(70, true);
	EXPECT_THROW(v.toUint64(), std::runtime_error);

	v.reset();
	EXPECT_EQ(v.toUint64(), 0u);
}

TEST(BitVectorTest, Equality) {
	EXPECT_EQ(BitVector::fromUint64(4, 3), BitVector::fromUint64(4, 3));
	EXPECT_NE(BitVector::fromUint64(4, 3), BitVector::fromUint64(5, 3)) << "Width is part of the value.";
	EXPECT_NE(BitVector::fromUint64(4, 3), BitVector::fromUint64(4, 2));
}

}  // namespace unit_test
