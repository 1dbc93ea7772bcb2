/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: t; c-basic-offset: 4 -*- */
/* POLE - Portable C++ library to access OLE Storage
   Copyright (C) 2002-2005 Ariya Hidayat <ariya@kde.org>

   Performance optimization: Dmitry Fedorov
   Copyright 2009 <www.bioimage.ucsb.edu> <www.dimin.net>

   Fix for more than 236 mbat block entries : Michel Boudinot
   Copyright 2010 <Michel.Boudinot@inaf.cnrs-gif.fr>

   Version: 0.4

   Redistribution and use in source and binary forms, with or without
   modification, are permitted provided that the following conditions
   are met:
   * Redistributions of source code must retain the above copyright notice,
     this list of conditions and the following disclaimer.
   * Redistributions in binary form must reproduce the above copyright notice,
     this list of conditions and the following disclaimer in the documentation
     and/or other materials provided with the distribution.
   * Neither the name of the authors nor the names of its contributors may be
     used to endorse or promote products derived from this software without
     specific prior written permission.

   THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
   AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
   IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
   ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
   LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
   CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
   SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
   INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
   CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
   ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF
   THE POSSIBILITY OF SUCH DAMAGE.
*/

/*
 This file is largly inspirated from librevenge RVNGOLEStream.cpp
*/

#include <cstring>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "MSDDebug.h"

#include "MSDOLEStorage.h"

namespace libmsdocOLE
{
////////////////////////////////////////////////////////////
// internal: basic enum
////////////////////////////////////////////////////////////
enum { Avail = 0xffffffff, Eof = 0xfffffffe, Bat = 0xfffffffd, MetaBat = 0xfffffffc };

//! returns true if a sector value ends a chain: Eof, Bat, ... or any negative value
static inline bool isEndOfChain(unsigned long sector)
{
	return sector >= 0x80000000;
}

////////////////////////////////////////////////////////////
// internal: basic classes
////////////////////////////////////////////////////////////

////////////////////////////////////////////////////////////
//            =========== Header ==========
class Header
{
public:
	unsigned char m_magic[8];       // signature, or magic identifier
	unsigned m_shift_bbat;          // bbat->blockSize = 1 << m_shift_bbat
	unsigned m_shift_sbat;          // sbat->blockSize = 1 << m_shift_sbat
	unsigned long m_start_dirent;   // starting block for directory info
	unsigned long m_threshold;      // switch from small to big file (usually 4K)
	unsigned long m_start_sbat;     // starting block index to store small bat
	unsigned long m_start_mbat;     // starting block to store meta bat
	unsigned long m_blocks_bbat[109];

	Header();
	unsigned long bigBlockSize() const
	{
		return 1UL << m_shift_bbat;
	}
	unsigned long smallBlockSize() const
	{
		return 1UL << m_shift_sbat;
	}
	bool valid_signature() const
	{
		for (unsigned i = 0; i < 8; i++)
			if (m_magic[i] != s_ole_magic[i]) return false;
		return true;
	}
	bool valid() const;
	bool load(MSDByteSpan const &data);

	friend std::ostream &operator<<(std::ostream &o, Header const &h);

protected:
	static const unsigned char s_ole_magic[];
};

const unsigned char Header::s_ole_magic[] =
{ 0xd0, 0xcf, 0x11, 0xe0, 0xa1, 0xb1, 0x1a, 0xe1 };

Header::Header() :
	m_shift_bbat(9), m_shift_sbat(6), m_start_dirent(0), m_threshold(4096),
	m_start_sbat(Eof), m_start_mbat(Eof)
{
	for (unsigned i = 0; i < 8; i++)
		m_magic[i] = 0;
	for (unsigned j=0; j<109; j++)
		m_blocks_bbat[j] = Avail;
}

bool Header::valid() const
{
	if (m_shift_bbat < 7 || m_shift_bbat > 16) return false;
	if (m_shift_sbat > m_shift_bbat) return false;
	return true;
}

bool Header::load(MSDByteSpan const &data)
{
	if (data.size() < 512)
		return false;
	for (unsigned i = 0; i < 8; i++)
		m_magic[i] = data.data()[i];
	uint16_t val16;
	uint32_t val32;
	data.readU16(0x1e, val16);
	m_shift_bbat = val16;
	data.readU16(0x20, val16);
	m_shift_sbat = val16;
	data.readU32(0x30, val32);
	m_start_dirent = val32;
	data.readU32(0x38, val32);
	m_threshold = val32;
	data.readU32(0x3c, val32);
	m_start_sbat = val32;
	data.readU32(0x44, val32);
	m_start_mbat = val32;
	for (unsigned j=0; j<109; j++)
	{
		data.readU32(0x4C+j*4, val32);
		m_blocks_bbat[j] = val32;
	}
	return true;
}

std::ostream &operator<<(std::ostream &o, Header const &h)
{
	o << "blockSize=" << std::hex << (1<<h.m_shift_bbat) << std::dec << ",";
	o << "sBlockSize=" << std::hex << (1<<h.m_shift_sbat) << std::dec << ",";
	if (!isEndOfChain(h.m_start_sbat))
		o << "smallBat=" << h.m_start_sbat << ",";
	if (!isEndOfChain(h.m_start_mbat))
		o << "metaBat=" << h.m_start_mbat << ",";
	o << "dirInfoBlock=" << h.m_start_dirent << ",";
	o << "threshold=" << std::hex << h.m_threshold << std::dec << ",";
	return o;
}

////////////////////////////////////////////////////////////
//            =========== AllocTable ==========
class AllocTable
{
public:
	AllocTable() : m_data()
	{
	}
	unsigned long count() const
	{
		return (unsigned long) m_data.size();
	}
	unsigned long operator[](unsigned long index) const
	{
		if (index >= count()) return Eof;
		return m_data[size_t(index)];
	}
	//! appends the values stored in a sector
	void append(MSDByteSpan const &sector)
	{
		unsigned long numValues = sector.size()/4;
		for (unsigned long i = 0; i < numValues; i++)
		{
			uint32_t val = 0;
			sector.readU32(4*i, val);
			m_data.push_back(val);
		}
	}
	/** follows the chain which begins in start until the end of chain
		or until maxLength sectors are found.

		\return false if the chain loops, is too long or points outside the table */
	bool follow(unsigned long start, unsigned long maxLength, std::vector<unsigned long> &chain) const;
private:
	std::vector<unsigned long> m_data;
	AllocTable(const AllocTable &);
	AllocTable &operator=(const AllocTable &);
};

bool AllocTable::follow(unsigned long start, unsigned long maxLength, std::vector<unsigned long> &chain) const
{
	chain.resize(0);
	std::set<unsigned long> seens;
	unsigned long p = start;
	while (chain.size() < maxLength)
	{
		if (isEndOfChain(p)) return true;
		if (p >= count())
		{
			MSD_DEBUG_MSG(("AllocTable::follow: the sector %lu is outside the table\n", p));
			return false;
		}
		if (chain.size() >= Storage::MaxChainLength || seens.find(p) != seens.end())
		{
			MSD_DEBUG_MSG(("AllocTable::follow: find a loop in the chain beginning in %lu\n", start));
			return false;
		}
		seens.insert(p);
		chain.push_back(p);
		p = m_data[size_t(p)];
	}
	return true;
}

//////////////////////////////////////////////////////////////////////
//            =========== DirEntry ==========
std::ostream &operator<<(std::ostream &o, DirEntry const &e)
{
	if (e.m_name.length()) o << "name=" << e.m_name << ",";
	if (e.m_type) o << "type=" << e.m_type << ",";
	if (e.m_size) o << "sz=" << e.m_size << ",";
	if (e.m_start >= 0) o << "start=" << e.m_start << ",";
	return o;
}

bool DirEntry::load(MSDByteSpan const &slot, unsigned index)
{
	*this=DirEntry();
	m_index = index;
	uint16_t nameLen;
	if (slot.size() != 128 || !slot.readU16(0x40, nameLen))
	{
		MSD_DEBUG_MSG(("DirEntry::load: unexpected len for DirEntry::load\n"));
		return false;
	}
	if (nameLen == 0 || nameLen > 64)
		return false;

	// the name is stored in UTF-16, its length includes the final 0
	unsigned numChars = nameLen >= 2 ? unsigned(nameLen-1)/2 : 0;
	for (unsigned j=0; j < numChars; j++)
	{
		uint16_t c = 0;
		slot.readU16(2*j, c);
		if (c < 0x20)
		{
			m_name.append(1, char(c));
			continue;
		}
		librevenge::RVNGString str;
		libmsdoc::appendUnicode(c, str);
		m_name.append(str.cstr());
	}

	// 2 = file (aka stream), 1 = directory (aka storage), 5 = root
	uint8_t type=0;
	slot.readU8(0x42, type);
	m_type = type;
	uint32_t size=0;
	slot.read32(0x74, m_start);
	slot.readU32(0x78, size);
	m_size = size;
	return true;
}

////////////////////////////////////////////////////////////
//            =========== IStorage ==========
class IStorage
{
public:
	explicit IStorage(MSDByteSpan const &data) : m_data(data), m_result(Storage::NotOLE), m_header(), m_bbat(), m_sbat(),
		m_entries(), m_smallStreamLoaded(false), m_smallStream(), m_asciiFile(data)
	{
		load();
	}

	//! the data
	MSDByteSpan m_data;
	//! the reading result
	Storage::Result m_result;
	//! the header
	Header m_header;
	//! the big block allocation table
	AllocTable m_bbat;
	//! the small block allocation table
	AllocTable m_sbat;
	//! the directory entries
	std::vector<DirEntry> m_entries;
	//! a flag to know if the small stream container is read
	mutable bool m_smallStreamLoaded;
	//! the small stream container
	mutable std::vector<unsigned char> m_smallStream;
	//! the debug file
	libmsdoc::DebugFile m_asciiFile;

	//! returns the big sector size
	unsigned long bigBlockSize() const
	{
		return m_header.bigBlockSize();
	}
	//! returns the zone corresponding to a big sector (maybe truncated if it is the last sector)
	MSDByteSpan bigBlock(unsigned long block) const
	{
		if (block >= (m_data.size() >> m_header.m_shift_bbat))
			return MSDByteSpan();
		return m_data.subSpan((block+1)*bigBlockSize(), bigBlockSize());
	}
	//! returns true if a big sector is fully stored in the data
	bool isFullBigBlock(unsigned long block) const
	{
		return bigBlock(block).size() == bigBlockSize();
	}

	//! reads a chain of big sectors
	bool readBigChain(unsigned long start, unsigned long size, std::vector<unsigned char> &data) const;
	//! reads a chain of small sectors
	bool readSmallChain(unsigned long start, unsigned long size, std::vector<unsigned char> &data) const;
	//! loads the small stream container
	void loadSmallStream() const;

protected:
	//! loads the header, the tables and the directory
	void load();
	//! loads the big allocation table
	void loadBigAllocTable();
	//! loads the directory
	void loadDirectory();
	//! loads the small allocation table
	void loadSmallAllocTable();

private:
	IStorage(const IStorage &);
	IStorage &operator=(const IStorage &);
};

void IStorage::load()
{
	m_result = Storage::NotOLE;
	if (m_data.size() < 512 || !m_header.load(m_data) || !m_header.valid_signature())
	{
		MSD_DEBUG_MSG(("IStorage::load: the data does not begin with an OLE header\n"));
		return;
	}
	if (!m_header.valid())
	{
		MSD_DEBUG_MSG(("IStorage::load: the OLE header seems bad\n"));
		m_result = Storage::BadOLE;
		return;
	}
	m_asciiFile.open("OLE");
	libmsdoc::DebugStream f;
	f << "Entries(OLEHeader):" << m_header;
	m_asciiFile.addPos(0);
	m_asciiFile.addNote(f.str().c_str());

	loadBigAllocTable();
	loadDirectory();
	loadSmallAllocTable();
	m_result = Storage::Ok;
}

void IStorage::loadBigAllocTable()
{
	std::vector<unsigned long> blocks;
	for (unsigned i = 0; i < 109; i++)
	{
		if (isEndOfChain(m_header.m_blocks_bbat[i])) continue;
		blocks.push_back(m_header.m_blocks_bbat[i]);
	}

	// the meta blocks store the remaining FAT sectors
	unsigned long const bSize = bigBlockSize();
	unsigned long const numBlocksInMeta = bSize/4-1;
	std::set<unsigned long> seens;
	unsigned long meta = m_header.m_start_mbat;
	for (int n = 0; !isEndOfChain(meta) && n < Storage::MaxDIFATSectors; ++n)
	{
		if (seens.find(meta) != seens.end() || !isFullBigBlock(meta))
		{
			MSD_DEBUG_MSG(("IStorage::loadBigAllocTable: the meta block %lu is bad\n", meta));
			break;
		}
		seens.insert(meta);
		MSDByteSpan block = bigBlock(meta);
		m_asciiFile.addPos(block.base());
		m_asciiFile.addNote("OLE(MetaBat)");
		for (unsigned long i = 0; i < numBlocksInMeta; i++)
		{
			int32_t val = -1;
			block.read32(4*i, val);
			if (val >= 0)
				blocks.push_back((unsigned long) val);
		}
		uint32_t next = Eof;
		block.readU32(bSize-4, next);
		meta = next;
	}

	for (size_t i = 0; i < blocks.size(); ++i)
	{
		if (!isFullBigBlock(blocks[i]))
		{
			MSD_DEBUG_MSG(("IStorage::loadBigAllocTable: the bat block %lu is outside the file\n", blocks[i]));
			break;
		}
		MSDByteSpan block = bigBlock(blocks[i]);
		m_asciiFile.addPos(block.base());
		m_asciiFile.addNote("OLE(BigBat)");
		m_bbat.append(block);
	}
}

void IStorage::loadDirectory()
{
	unsigned long const bSize = bigBlockSize();
	std::set<unsigned long> seens;
	unsigned long dir = m_header.m_start_dirent;
	unsigned index = 0;
	for (int n = 0; !isEndOfChain(dir) && n < Storage::MaxDirectorySectors; ++n)
	{
		if (seens.find(dir) != seens.end() || !isFullBigBlock(dir))
			break;
		seens.insert(dir);
		MSDByteSpan block = bigBlock(dir);
		for (unsigned long pos = 0; pos+128 <= bSize; pos += 128, ++index)
		{
			DirEntry entry;
			if (!entry.load(block.subSpan(pos, 128), index))
				continue;
			libmsdoc::DebugStream f;
			f << "OLE(DirEntry" << index << "):" << entry;
			m_asciiFile.addPos(block.base()+pos);
			m_asciiFile.addNote(f.str().c_str());
			m_entries.push_back(entry);
		}
		dir = m_bbat[dir];
	}
}

void IStorage::loadSmallAllocTable()
{
	std::set<unsigned long> seens;
	unsigned long sbat = m_header.m_start_sbat;
	for (int n = 0; !isEndOfChain(sbat) && n < Storage::MaxMiniFATSectors; ++n)
	{
		if (seens.find(sbat) != seens.end() || !isFullBigBlock(sbat))
			break;
		seens.insert(sbat);
		MSDByteSpan block = bigBlock(sbat);
		m_asciiFile.addPos(block.base());
		m_asciiFile.addNote("OLE(SmallBat)");
		m_sbat.append(block);
		sbat = m_bbat[sbat];
	}
}

void IStorage::loadSmallStream() const
{
	if (m_smallStreamLoaded) return;
	m_smallStreamLoaded = true;
	for (size_t i = 0; i < m_entries.size(); ++i)
	{
		DirEntry const &entry = m_entries[i];
		if (!entry.isRoot()) continue;
		if (entry.m_start < 0) return;
		if (!readBigChain((unsigned long) entry.m_start, entry.m_size, m_smallStream))
		{
			MSD_DEBUG_MSG(("IStorage::loadSmallStream: can only read %lu bytes of the small stream container\n",
			               (unsigned long) m_smallStream.size()));
		}
		return;
	}
}

bool IStorage::readBigChain(unsigned long start, unsigned long size, std::vector<unsigned char> &data) const
{
	data.resize(0);
	unsigned long const bSize = bigBlockSize();
	std::vector<unsigned long> chain;
	bool ok = m_bbat.follow(start, (size+bSize-1)/bSize, chain);
	for (size_t i = 0; i < chain.size() && data.size() < size; ++i)
	{
		unsigned long chunk = size-(unsigned long) data.size();
		if (chunk > bSize) chunk = bSize;
		MSDByteSpan block = bigBlock(chain[i]);
		if (block.size() < chunk)
			break;
		data.insert(data.end(), block.data(), block.data()+chunk);
	}
	return ok && data.size() == size;
}

bool IStorage::readSmallChain(unsigned long start, unsigned long size, std::vector<unsigned char> &data) const
{
	data.resize(0);
	loadSmallStream();
	unsigned long const sSize = m_header.smallBlockSize();
	MSDByteSpan container(m_smallStream);
	std::vector<unsigned long> chain;
	bool ok = m_sbat.follow(start, (size+sSize-1)/sSize, chain);
	for (size_t i = 0; i < chain.size() && data.size() < size; ++i)
	{
		unsigned long chunk = size-(unsigned long) data.size();
		if (chunk > sSize) chunk = sSize;
		if (chain[i] > container.size()/sSize)
			break;
		unsigned char const *ptr = container.get(chain[i]*sSize, chunk);
		if (!ptr)
			break;
		data.insert(data.end(), ptr, ptr+chunk);
	}
	return ok && data.size() == size;
}

////////////////////////////////////////////////////////////
//            =========== Storage ==========
Storage::Storage(MSDByteSpan const &data) : m_io(0)
{
	m_io = new IStorage(data);
}

Storage::~Storage()
{
	delete m_io;
}

Storage::Result Storage::result() const
{
	return m_io->m_result;
}

unsigned long Storage::sectorSize() const
{
	return m_io->bigBlockSize();
}

std::vector<DirEntry> const &Storage::entries() const
{
	return m_io->m_entries;
}

DirEntry const *Storage::findEntry(std::string const &name) const
{
	for (size_t i = 0; i < m_io->m_entries.size(); ++i)
	{
		DirEntry const &entry = m_io->m_entries[i];
		if (entry.isStream() && entry.name() == name)
			return &entry;
	}
	return 0;
}

bool Storage::readStream(DirEntry const &entry, std::vector<unsigned char> &data) const
{
	data.resize(0);
	if (result() != Ok || entry.m_size == 0 || entry.m_start < 0)
		return false;
	unsigned long const start = (unsigned long) entry.m_start;
	if (entry.m_size < m_io->m_header.m_threshold && entry.isStream())
	{
		if (m_io->readSmallChain(start, entry.m_size, data))
			return true;
		MSD_DEBUG_MSG(("Storage::readStream: can not read %s in the small stream, try the big blocks\n", entry.name().c_str()));
	}
	if (m_io->readBigChain(start, entry.m_size, data))
		return true;
	MSD_DEBUG_MSG(("Storage::readStream: can only read %lu/%lu bytes of %s\n",
	               (unsigned long) data.size(), entry.m_size, entry.name().c_str()));
	return false;
}

}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
