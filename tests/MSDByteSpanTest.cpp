/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: t; c-basic-offset: 4 -*- */
/* libmsdoc
 * Version: MPL 2.0 / LGPLv2.1+
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 * For minor contributions see the git repository.
 *
 * Alternatively, the contents of this file may be used under the terms
 * of the GNU Lesser General Public License Version 2.1 or later
 * (LGPLv2.1+), in which case the provisions of the LGPLv2.1+ are
 * applicable instead of those above.
 */

#include <vector>

#include <gtest/gtest.h>

#include "libmsdoc_internal.h"

#include "MSDByteSpan.h"

namespace
{
std::vector<unsigned char> getData()
{
	static unsigned char const values[] = { 0x01, 0x02, 0x03, 0x04, 0xff, 0xff, 0xff, 0xff, 0x10 };
	return std::vector<unsigned char>(values, values+sizeof(values));
}
}

TEST(MSDByteSpanTest, readLittleEndianValues)
{
	std::vector<unsigned char> data = getData();
	MSDByteSpan span(data);
	uint8_t v8 = 0;
	uint16_t v16 = 0;
	uint32_t v32 = 0;
	int32_t s32 = 0;
	ASSERT_TRUE(span.readU8(8, v8));
	EXPECT_EQ(0x10, int(v8));
	ASSERT_TRUE(span.readU16(0, v16));
	EXPECT_EQ(0x0201, int(v16));
	ASSERT_TRUE(span.readU32(0, v32));
	EXPECT_EQ(0x04030201U, v32);
	ASSERT_TRUE(span.read32(4, s32));
	EXPECT_EQ(-1, s32);
}

TEST(MSDByteSpanTest, readOutsideFails)
{
	std::vector<unsigned char> data = getData();
	MSDByteSpan span(data);
	uint8_t v8 = 0x55;
	uint16_t v16 = 0x55;
	uint32_t v32 = 0x55;
	EXPECT_FALSE(span.readU8(9, v8));
	EXPECT_FALSE(span.readU16(8, v16));
	EXPECT_FALSE(span.readU32(6, v32));
	EXPECT_FALSE(span.readU32(0xfffffffeUL, v32));
	EXPECT_EQ(0x55, int(v8));
	EXPECT_EQ(0x55, int(v16));
	EXPECT_EQ(0x55U, v32);

	MSDByteSpan empty;
	EXPECT_TRUE(empty.empty());
	EXPECT_FALSE(empty.readU8(0, v8));
	EXPECT_EQ(static_cast<unsigned char const *>(0), empty.get(0, 0));
}

TEST(MSDByteSpanTest, checkRangeDoesNotOverflow)
{
	std::vector<unsigned char> data = getData();
	MSDByteSpan span(data);
	EXPECT_TRUE(span.checkRange(0, 9));
	EXPECT_TRUE(span.checkRange(9, 0));
	EXPECT_FALSE(span.checkRange(10, 0));
	EXPECT_FALSE(span.checkRange(1, 9));
	EXPECT_FALSE(span.checkRange(2, ~0UL));
	EXPECT_FALSE(span.checkRange(~0UL, 2));
}

TEST(MSDByteSpanTest, subSpanIsClamped)
{
	std::vector<unsigned char> data = getData();
	MSDByteSpan span(data, 100);
	MSDByteSpan sub = span.subSpan(2, 4);
	EXPECT_EQ(4UL, sub.size());
	EXPECT_EQ(102UL, sub.base());
	uint16_t v16 = 0;
	ASSERT_TRUE(sub.readU16(0, v16));
	EXPECT_EQ(0x0403, int(v16));

	MSDByteSpan end = span.subSpan(6, 100);
	EXPECT_EQ(3UL, end.size());
	EXPECT_TRUE(span.subSpan(20, 4).empty());
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
