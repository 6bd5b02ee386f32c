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

#include <string>

#include "verif/GrantComparator.hh"
#include "verif/VerifError.hh"

namespace unit_test {

using namespace wrrsim;

TEST(GrantComparatorTest, DecodeShapes) {
	DecodedGrant none = DecodedGrant::decode(BitVector::fromUint64(4, 0));
	EXPECT_EQ(none.kind, GrantKind::None);
	EXPECT_EQ(none.toOptional(), std::nullopt);

	DecodedGrant single = DecodedGrant::decode(BitVector::fromUint64(4, 0b1000));
	EXPECT_EQ(single.kind, GrantKind::Single);
	EXPECT_EQ(single.toOptional(), std::optional<ClientId>(3));

	DecodedGrant multi = DecodedGrant::decode(BitVector::fromUint64(4, 0b0101));
	EXPECT_EQ(multi.kind, GrantKind::Multiple);
	EXPECT_THROW(multi.toOptional(), std::runtime_error);
}

TEST(GrantComparatorTest, MultiGrantIsIllegal) {
	try {
		GrantComparator::decodeOrThrow(17, BitVector::fromUint64(4, 0b0011));
		FAIL() << "A two-hot grant must raise IllegalGrantError.";
	} catch (const IllegalGrantError& e) {
		EXPECT_EQ(e.getCycle(), 17u);
		EXPECT_EQ(e.getGrant().toString(), "0011");
	}
}

TEST(GrantComparatorTest, MultiGrantIsReportedBeforeMismatch) {
	MismatchContext ctx;
	ctx.cycle = 3;
	EXPECT_THROW(GrantComparator::check(BitVector::fromUint64(4, 0b0110), 1, ctx), IllegalGrantError)
	    << "A multi-grant is its own failure even if one of its bits is the expected client.";
}

TEST(GrantComparatorTest, MismatchCarriesContext) {
	MismatchContext ctx;
	ctx.cycle      = 42;
	ctx.source     = "lock_hold";
	ctx.request    = BitVector::fromUint64(4, 0b0011);
	ctx.lock       = BitVector::fromUint64(4, 0b0001);
	ctx.weights    = "[0, 0, 0, 0]";
	ctx.modelState = "rr_ptr=0 owner=0 counter=0";

	try {
		GrantComparator::check(BitVector::fromUint64(4, 0b0010), 0, ctx);
		FAIL() << "Observed 1 against expected 0 must raise GrantMismatchError.";
	} catch (const GrantMismatchError& e) {
		EXPECT_EQ(e.getCycle(), 42u);
		EXPECT_EQ(e.getContext().observed, std::optional<ClientId>(1));
		EXPECT_EQ(e.getContext().expected, std::optional<ClientId>(0));

		const std::string what = e.what();
		EXPECT_NE(what.find("source=lock_hold"), std::string::npos) << what;
		EXPECT_NE(what.find("req=0011"), std::string::npos) << what;
		EXPECT_NE(what.find("rr_ptr=0 owner=0 counter=0"), std::string::npos) << what;
	}
}

TEST(GrantComparatorTest, NoneVersusGrantIsMismatch) {
	MismatchContext ctx;
	EXPECT_THROW(GrantComparator::check(BitVector(4), 2, ctx), GrantMismatchError);
	EXPECT_THROW(GrantComparator::check(BitVector::fromUint64(4, 0b0100), std::nullopt, ctx), GrantMismatchError);
	EXPECT_NO_THROW(GrantComparator::check(BitVector(4), std::nullopt, ctx));
	EXPECT_NO_THROW(GrantComparator::check(BitVector::fromUint64(4, 0b0100), 2, ctx));
}

TEST(GrantComparatorTest, ErrorsShareBase) {
	EXPECT_THROW(throw PropertyViolationError(1, "lock-extension", "detail"), VerificationError);
	EXPECT_THROW(throw IllegalGrantError(1, BitVector(2, true)), VerificationError);
	EXPECT_EQ(grantToString(std::nullopt), "none");
	EXPECT_EQ(grantToString(7), "7");
}

}  // namespace unit_test
