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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "libmsdoc_internal.h"

#include "MSDByteSpan.h"
#include "MSDPieceTable.h"
#include "MSDText.h"
#include "MSDTestDocument.h"

using namespace MSDTest;

namespace
{
MSDPiece getPiece(uint32_t cpStart, uint32_t cpEnd, uint32_t offset, bool singleByte)
{
	MSDPiece piece;
	piece.m_cpStart = cpStart;
	piece.m_cpEnd = cpEnd;
	piece.m_fileOffset = offset;
	piece.m_singleByte = singleByte;
	return piece;
}

std::string clean(std::vector<uint32_t> const &text)
{
	std::vector<uint32_t> res;
	libmsdoc::cleanText(text, res);
	return toUTF8(res);
}
}

TEST(MSDTextTest, readPiecesInTableOrder)
{
	// "World" in UTF-16 at 0, "Hello " in cp1252 at 10
	Bytes stream = toUTF16("World");
	Bytes hello = toBytes("Hello ");
	stream.insert(stream.end(), hello.begin(), hello.end());
	std::vector<MSDPiece> pieces;
	pieces.push_back(getPiece(0, 6, 10, true));
	pieces.push_back(getPiece(6, 11, 0, false));
	std::vector<uint32_t> text;
	ASSERT_TRUE(libmsdoc::extractPieceText(MSDByteSpan(stream), pieces, 11, text));
	EXPECT_EQ("Hello World", toUTF8(text));
}

TEST(MSDTextTest, stopAtTextLength)
{
	Bytes stream = toBytes("Main text and footnotes");
	std::vector<MSDPiece> pieces;
	pieces.push_back(getPiece(0, 4, 0, true));
	pieces.push_back(getPiece(4, 23, 4, true));
	std::vector<uint32_t> text;
	ASSERT_TRUE(libmsdoc::extractPieceText(MSDByteSpan(stream), pieces, 9, text));
	EXPECT_EQ("Main text", toUTF8(text));
	ASSERT_TRUE(libmsdoc::extractPieceText(MSDByteSpan(stream), pieces, 0, text));
	EXPECT_TRUE(text.empty());
}

TEST(MSDTextTest, decodeCp1252)
{
	Bytes stream;
	stream.push_back(0x93);
	stream.push_back('a');
	stream.push_back(0x94);
	stream.push_back(0x80);
	stream.push_back(0xe9);
	stream.push_back(0x81);
	std::vector<MSDPiece> pieces;
	pieces.push_back(getPiece(0, 6, 0, true));
	std::vector<uint32_t> text;
	ASSERT_TRUE(libmsdoc::extractPieceText(MSDByteSpan(stream), pieces, 6, text));
	ASSERT_EQ(6U, text.size());
	EXPECT_EQ(0x201cU, text[0]);
	EXPECT_EQ(uint32_t('a'), text[1]);
	EXPECT_EQ(0x201dU, text[2]);
	EXPECT_EQ(0x20acU, text[3]);
	EXPECT_EQ(0xe9U, text[4]);
	EXPECT_EQ(0x81U, text[5]);
}

TEST(MSDTextTest, pieceOutsideStream)
{
	Bytes stream = toBytes("Some text");
	std::vector<MSDPiece> pieces;
	pieces.push_back(getPiece(0, 4, 0, true));
	pieces.push_back(getPiece(4, 20, 4, false));
	std::vector<uint32_t> text;
	EXPECT_FALSE(libmsdoc::extractPieceText(MSDByteSpan(stream), pieces, 20, text));
	EXPECT_EQ("Some", toUTF8(text));
}

TEST(MSDTextTest, removeFields)
{
	std::vector<uint32_t> text = toUnits("See ");
	text.push_back(0x13);
	std::vector<uint32_t> code = toUnits(" HYPERLINK \"http://a.b\" ");
	text.insert(text.end(), code.begin(), code.end());
	text.push_back(0x14);
	std::vector<uint32_t> result = toUnits("the site");
	text.insert(text.end(), result.begin(), result.end());
	text.push_back(0x15);
	text.push_back('.');
	EXPECT_EQ("See the site.", clean(text));
}

TEST(MSDTextTest, convertSpecialCharacters)
{
	std::vector<uint32_t> text = toUnits("a");
	text.push_back(0x0d);
	text.push_back('b');
	text.push_back(0x0b);
	text.push_back('c');
	text.push_back(0x0c);
	text.push_back('d');
	text.push_back(0x07);
	text.push_back('e');
	text.push_back(0x01);
	text.push_back(0x08);
	text.push_back(0x02);
	text.push_back(0x1f);
	text.push_back('f');
	EXPECT_EQ("a\nb\nc\n\nd ef", clean(text));
}

TEST(MSDTextTest, collapseWhiteSpaces)
{
	std::vector<uint32_t> text;
	text.push_back(' ');
	text.push_back(0x0d);
	text.push_back('a');
	for (int i = 0; i < 5; ++i)
		text.push_back(0x0d);
	text.push_back('b');
	text.push_back('\t');
	text.push_back('\t');
	text.push_back(0x07);
	text.push_back('c');
	text.push_back(0x0c);
	text.push_back(0x0d);
	text.push_back(0xa0);
	EXPECT_EQ("a\n\nb c", clean(text));
}

TEST(MSDTextTest, blankText)
{
	std::vector<uint32_t> text;
	text.push_back(' ');
	text.push_back(0x3000);
	text.push_back('\n');
	EXPECT_TRUE(libmsdoc::isBlank(text));
	text.push_back('x');
	EXPECT_FALSE(libmsdoc::isBlank(text));
	EXPECT_TRUE(libmsdoc::isBlank(std::vector<uint32_t>()));
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
