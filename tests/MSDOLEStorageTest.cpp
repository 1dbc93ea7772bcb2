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

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "libmsdoc_internal.h"

#include "MSDByteSpan.h"
#include "MSDOLEStorage.h"
#include "MSDTestDocument.h"

using namespace MSDTest;

namespace
{
Bytes getPattern(size_t size)
{
	Bytes res(size);
	for (size_t i = 0; i < size; ++i)
		res[i] = (unsigned char)((i*7+3) & 0xff);
	return res;
}
}

TEST(MSDOLEStorageTest, notOLE)
{
	Bytes small(100, 0);
	libmsdocOLE::Storage tooSmall((MSDByteSpan(small)));
	EXPECT_EQ(libmsdocOLE::Storage::NotOLE, tooSmall.result());
	EXPECT_FALSE(tooSmall.isStructuredDocument());

	Bytes zeros(2048, 0);
	libmsdocOLE::Storage badSignature((MSDByteSpan(zeros)));
	EXPECT_EQ(libmsdocOLE::Storage::NotOLE, badSignature.result());
	EXPECT_EQ(static_cast<libmsdocOLE::DirEntry const *>(0), badSignature.findEntry("WordDocument"));
}

TEST(MSDOLEStorageTest, badSectorShift)
{
	OLEBuilder builder;
	builder.addStream("Data", getPattern(100));
	Bytes file = builder.build();
	writeU16(file, 0x1e, 6);
	libmsdocOLE::Storage lowShift((MSDByteSpan(file)));
	EXPECT_EQ(libmsdocOLE::Storage::BadOLE, lowShift.result());
	writeU16(file, 0x1e, 17);
	libmsdocOLE::Storage highShift((MSDByteSpan(file)));
	EXPECT_EQ(libmsdocOLE::Storage::BadOLE, highShift.result());
	EXPECT_FALSE(highShift.isStructuredDocument());
}

TEST(MSDOLEStorageTest, readDirectory)
{
	OLEBuilder builder;
	builder.addStream("WordDocument", getPattern(5000));
	builder.addStream("1Table", getPattern(100));
	Bytes file = builder.build();
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	ASSERT_EQ(libmsdocOLE::Storage::Ok, storage.result());
	EXPECT_EQ(512UL, storage.sectorSize());
	ASSERT_EQ(3U, storage.entries().size());
	EXPECT_TRUE(storage.entries()[0].isRoot());
	EXPECT_EQ("Root Entry", storage.entries()[0].name());

	libmsdocOLE::DirEntry const *entry = storage.findEntry("1Table");
	ASSERT_TRUE(entry != 0);
	EXPECT_TRUE(entry->isStream());
	EXPECT_EQ(100UL, entry->m_size);
	EXPECT_EQ(2U, entry->m_index);
}

TEST(MSDOLEStorageTest, findEntryIsExact)
{
	OLEBuilder builder;
	builder.addStream("WordDocument", getPattern(100));
	Bytes file = builder.build();
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	EXPECT_TRUE(storage.findEntry("WordDocument") != 0);
	EXPECT_EQ(static_cast<libmsdocOLE::DirEntry const *>(0), storage.findEntry("worddocument"));
	EXPECT_EQ(static_cast<libmsdocOLE::DirEntry const *>(0), storage.findEntry("WordDoc"));
	EXPECT_EQ(static_cast<libmsdocOLE::DirEntry const *>(0), storage.findEntry("0Table"));
	// the root is not a stream
	EXPECT_EQ(static_cast<libmsdocOLE::DirEntry const *>(0), storage.findEntry("Root Entry"));
}

TEST(MSDOLEStorageTest, readStreams)
{
	Bytes smallData = getPattern(100), bigData = getPattern(5000);
	OLEBuilder builder;
	builder.addStream("Small", smallData);
	builder.addStream("Big", bigData);
	Bytes file = builder.build();
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	ASSERT_EQ(libmsdocOLE::Storage::Ok, storage.result());

	std::vector<unsigned char> data;
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Small");
	ASSERT_TRUE(entry != 0);
	ASSERT_TRUE(storage.readStream(*entry, data));
	EXPECT_EQ(smallData, data);

	entry = storage.findEntry("Big");
	ASSERT_TRUE(entry != 0);
	ASSERT_TRUE(storage.readStream(*entry, data));
	EXPECT_EQ(bigData, data);
}

TEST(MSDOLEStorageTest, readSmallStreamInBigSectors)
{
	Bytes smallData = getPattern(700);
	OLEBuilder builder;
	builder.setUseMiniStream(false);
	builder.addStream("Small", smallData);
	Bytes file = builder.build();
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Small");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	ASSERT_TRUE(storage.readStream(*entry, data));
	EXPECT_EQ(smallData, data);
}

TEST(MSDOLEStorageTest, emptyStream)
{
	OLEBuilder builder;
	builder.addStream("Empty", Bytes());
	Bytes file = builder.build();
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Empty");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	EXPECT_FALSE(storage.readStream(*entry, data));
	EXPECT_TRUE(data.empty());
}

TEST(MSDOLEStorageTest, readThroughDIFAT)
{
	Bytes bigData = getPattern(5000);
	OLEBuilder builder;
	builder.setUseDIFAT(true);
	builder.addStream("Small", getPattern(100));
	builder.addStream("Big", bigData);
	Bytes file = builder.build();
	ASSERT_GE(builder.difatSector(), 0);
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	ASSERT_EQ(libmsdocOLE::Storage::Ok, storage.result());
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Big");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	ASSERT_TRUE(storage.readStream(*entry, data));
	EXPECT_EQ(bigData, data);

	entry = storage.findEntry("Small");
	ASSERT_TRUE(entry != 0);
	ASSERT_TRUE(storage.readStream(*entry, data));
	EXPECT_EQ(getPattern(100), data);
}

TEST(MSDOLEStorageTest, loopInDIFAT)
{
	Bytes bigData = getPattern(5000);
	OLEBuilder builder;
	builder.setUseDIFAT(true);
	builder.addStream("Big", bigData);
	Bytes file = builder.build();
	long difat = builder.difatSector();
	ASSERT_GE(difat, 0);
	// the DIFAT sector points to itself
	writeU32(file, size_t((difat+1)*512+508), (unsigned long) difat);
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	ASSERT_EQ(libmsdocOLE::Storage::Ok, storage.result());
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Big");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	ASSERT_TRUE(storage.readStream(*entry, data));
	EXPECT_EQ(bigData, data);
}

TEST(MSDOLEStorageTest, loopInChain)
{
	OLEBuilder builder;
	builder.setUseMiniStream(false);
	builder.addStream("Data", getPattern(2000));
	Bytes file = builder.build();
	long start = builder.startSector("Data");
	ASSERT_GE(start, 0);
	// the second sector points to the first one
	writeU32(file, OLEBuilder::fatPosition(start+1), (unsigned long) start);
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Data");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	EXPECT_FALSE(storage.readStream(*entry, data));
}

TEST(MSDOLEStorageTest, truncatedChain)
{
	Bytes pattern = getPattern(2000);
	OLEBuilder builder;
	builder.setUseMiniStream(false);
	builder.addStream("Data", pattern);
	Bytes file = builder.build();
	long start = builder.startSector("Data");
	ASSERT_GE(start, 0);
	// the chain ends after the first sector
	writeU32(file, OLEBuilder::fatPosition(start), 0xfffffffe);
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Data");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	EXPECT_FALSE(storage.readStream(*entry, data));
	ASSERT_EQ(512U, data.size());
	EXPECT_TRUE(std::equal(data.begin(), data.end(), pattern.begin()));
}

TEST(MSDOLEStorageTest, sectorOutsideTable)
{
	OLEBuilder builder;
	builder.setUseMiniStream(false);
	builder.addStream("Data", getPattern(2000));
	Bytes file = builder.build();
	long start = builder.startSector("Data");
	ASSERT_GE(start, 0);
	writeU32(file, OLEBuilder::fatPosition(start), 100000);
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Data");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	EXPECT_FALSE(storage.readStream(*entry, data));
}

TEST(MSDOLEStorageTest, truncatedFile)
{
	Bytes pattern = getPattern(2000);
	OLEBuilder builder;
	builder.setUseMiniStream(false);
	builder.addStream("Data", pattern);
	Bytes file = builder.build();
	// remove the last sector
	file.resize(file.size()-512);
	libmsdocOLE::Storage storage((MSDByteSpan(file)));
	ASSERT_EQ(libmsdocOLE::Storage::Ok, storage.result());
	libmsdocOLE::DirEntry const *entry = storage.findEntry("Data");
	ASSERT_TRUE(entry != 0);
	std::vector<unsigned char> data;
	EXPECT_FALSE(storage.readStream(*entry, data));
	EXPECT_EQ(3*512U, data.size());
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
