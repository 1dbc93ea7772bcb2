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

#include <librevenge/librevenge.h>
#include <librevenge-generators/librevenge-generators.h>
#include <librevenge-stream/librevenge-stream.h>

#include <libmsdoc/libmsdoc.h>

#include "MSDTestDocument.h"

using namespace libmsdoc;
using namespace MSDTest;

namespace
{
Bytes getDocument()
{
	std::vector<Piece> pieces;
	Bytes first = toBytes("First paragraph with a ");
	first.push_back(0x93);
	Bytes tmp = toBytes("quote");
	first.insert(first.end(), tmp.begin(), tmp.end());
	first.push_back(0x94);
	tmp = toBytes("\r\rSecond\vline\r");
	first.insert(first.end(), tmp.begin(), tmp.end());
	pieces.push_back(Piece::singleByte(first));
	pieces.push_back(Piece::utf16("Third\tparagraph"));
	return buildDocFile(pieces);
}

//! returns a file which only contains some UTF-16 text
Bytes getLostText(std::string const &text)
{
	OLEBuilder builder;
	builder.addStream("Contents", toUTF16(text));
	return builder.build();
}

std::string const s_expected("First paragraph with a \xe2\x80\x9cquote\xe2\x80\x9d\n\nSecond\nline\nThird paragraph");
}

TEST(MSDDocumentTest, extractTextFromMemory)
{
	Bytes file = getDocument();
	librevenge::RVNGString text;
	MSDSource source = MSD_SOURCE_NONE;
	ASSERT_EQ(MSD_OK, MSDDocument::extractText(&file[0], (unsigned long) file.size(), text, &source));
	EXPECT_EQ(MSD_SOURCE_PIECE_TABLE, source);
	EXPECT_EQ(s_expected, std::string(text.cstr()));
}

TEST(MSDDocumentTest, extractTextFromStream)
{
	Bytes file = getDocument();
	librevenge::RVNGStringStream input(&file[0], (unsigned) file.size());
	librevenge::RVNGString text;
	ASSERT_EQ(MSD_OK, MSDDocument::extractText(&input, text));
	EXPECT_EQ(s_expected, std::string(text.cstr()));
}

TEST(MSDDocumentTest, extractLostText)
{
	std::string const str("This text is stored in a stream which is not a Word stream.");
	Bytes file = getLostText(str);
	librevenge::RVNGString text;
	MSDSource source = MSD_SOURCE_NONE;
	ASSERT_EQ(MSD_OK, MSDDocument::extractText(&file[0], (unsigned long) file.size(), text, &source));
	EXPECT_EQ(MSD_SOURCE_FALLBACK, source);
	EXPECT_EQ(str, std::string(text.cstr()));
}

TEST(MSDDocumentTest, noText)
{
	Bytes noise;
	for (int i = 0; i < 2000; ++i)
		noise.push_back((unsigned char)((i % 2) ? 0 : 1+(i % 7)));
	librevenge::RVNGString text("previous");
	MSDSource source = MSD_SOURCE_PIECE_TABLE;
	EXPECT_EQ(MSD_NO_TEXT_ERROR, MSDDocument::extractText(&noise[0], (unsigned long) noise.size(), text, &source));
	EXPECT_EQ(MSD_SOURCE_NONE, source);
	EXPECT_EQ(0, text.len());

	EXPECT_EQ(MSD_NO_TEXT_ERROR, MSDDocument::extractText(0, 0, text));
	EXPECT_EQ(MSD_FILE_ACCESS_ERROR, MSDDocument::extractText(0, 10, text));
	EXPECT_EQ(MSD_FILE_ACCESS_ERROR, MSDDocument::extractText(0, text));
}

TEST(MSDDocumentTest, confidence)
{
	Bytes file = getDocument();
	librevenge::RVNGStringStream document(&file[0], (unsigned) file.size());
	EXPECT_EQ(MSD_CONFIDENCE_EXCELLENT, MSDDocument::isFileFormatSupported(&document));

	std::vector<Piece> pieces;
	pieces.push_back(Piece::singleByte("Secret"));
	WordOptions options;
	options.m_encrypted = true;
	file = buildDocFile(pieces, options);
	librevenge::RVNGStringStream encrypted(&file[0], (unsigned) file.size());
	EXPECT_EQ(MSD_CONFIDENCE_SUPPORTED_ENCRYPTION, MSDDocument::isFileFormatSupported(&encrypted));

	file = getLostText("This text is stored in a stream which is not a Word stream.");
	librevenge::RVNGStringStream lost(&file[0], (unsigned) file.size());
	EXPECT_EQ(MSD_CONFIDENCE_WEAK, MSDDocument::isFileFormatSupported(&lost));

	file = Bytes(1024, 0);
	librevenge::RVNGStringStream zeros(&file[0], (unsigned) file.size());
	EXPECT_EQ(MSD_CONFIDENCE_NONE, MSDDocument::isFileFormatSupported(&zeros));
	EXPECT_EQ(MSD_CONFIDENCE_NONE, MSDDocument::isFileFormatSupported(0));
}

TEST(MSDDocumentTest, sendParagraphs)
{
	Bytes file = getDocument();
	librevenge::RVNGStringStream input(&file[0], (unsigned) file.size());
	librevenge::RVNGString output;
	librevenge::RVNGTextTextGenerator generator(output);
	ASSERT_EQ(MSD_OK, MSDDocument::parse(&input, &generator, "/tmp/Letter.doc"));
	std::string const text(output.cstr());
	EXPECT_NE(std::string::npos, text.find("First paragraph with a \xe2\x80\x9cquote\xe2\x80\x9d\n"));
	EXPECT_NE(std::string::npos, text.find("Second\nline"));
	EXPECT_NE(std::string::npos, text.find("Third"));
	EXPECT_NE(std::string::npos, text.find("paragraph"));
	EXPECT_EQ(std::string::npos, text.find("\n\n\n"));
}

TEST(MSDDocumentTest, parseWithoutText)
{
	Bytes file(1024, 0);
	librevenge::RVNGStringStream input(&file[0], (unsigned) file.size());
	librevenge::RVNGString output;
	librevenge::RVNGTextTextGenerator generator(output);
	EXPECT_EQ(MSD_NO_TEXT_ERROR, MSDDocument::parse(&input, &generator));
	EXPECT_EQ(0, output.len());
	EXPECT_EQ(MSD_UNKNOWN_ERROR, MSDDocument::parse(&input, 0));
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
