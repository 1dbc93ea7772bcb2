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

#ifndef MSDOLESTORAGE_H
#define MSDOLESTORAGE_H

#include <ostream>
#include <string>
#include <vector>

#include "libmsdoc_internal.h"

#include "MSDByteSpan.h"

namespace libmsdocOLE
{

class IStorage;

//////////////////////////////////////////////////////////////////////
/**
   a directory entry of an OLE file: a stream, a storage or the root
*/
class DirEntry
{
public:
	//! constructor
	DirEntry() : m_type(0), m_start(-1), m_size(0), m_index(0), m_name("")
	{
	}
	//! returns true for a stream
	bool isStream() const
	{
		return m_type==2;
	}
	//! returns true for the root entry
	bool isRoot() const
	{
		return m_type==5;
	}
	//! returns the name (UTF-8 encoded)
	std::string const &name() const
	{
		return m_name;
	}
	/** reads an entry content.

	\return false if the slot is unused or if its name length is invalid */
	bool load(MSDByteSpan const &slot, unsigned index);
	//! operator<<
	friend std::ostream &operator<<(std::ostream &o, DirEntry const &e);

	unsigned m_type;         /** the type: 1 storage, 2 stream, 5 root */
	int32_t m_start;         /** starting sector, negative means no data */
	unsigned long m_size;    /** the declared size */
	unsigned m_index;        /** the entry index in the directory */
protected:
	std::string m_name;      /** the name */
};

/** class used to read an OLE file stored in memory

	\note the data must remain valid while the storage is used
 */
class Storage
{
public:

	// for Storage::result()
	enum Result { Ok, NotOLE, BadOLE };
	//! the limits used when following a chain
	enum { MaxChainLength=100000, MaxDIFATSectors=1000, MaxDirectorySectors=10000, MaxMiniFATSectors=10000 };

	/**
	 * Constructs a storage with data.
	 **/
	explicit Storage(MSDByteSpan const &data);

	/**
	 * Destroys the storage.
	 **/
	~Storage();

	/**
	 * Returns the result of the header and the tables reading.
	 **/
	Result result() const;

	/**
	 * Checks whether the storage is OLE2 storage.
	 **/
	bool isStructuredDocument() const
	{
		return result()==Ok;
	}

	//! returns the sector size
	unsigned long sectorSize() const;

	//! returns the list of directory entries, in directory order
	std::vector<DirEntry> const &entries() const;

	/**
	 * Returns the first stream whose name is exactly name or 0
	 **/
	DirEntry const *findEntry(std::string const &name) const;

	/**
	 * Reads the content of a stream.

	 \return true if the declared size was read; if not, data contains
	 the bytes which could be read
	 **/
	bool readStream(DirEntry const &entry, std::vector<unsigned char> &data) const;

private:
	//! the main data storage
	IStorage *m_io;

	// no copy or assign
	Storage(const Storage &);
	Storage &operator=(const Storage &);

};

}  // namespace libmsdocOLE

#endif // MSDOLESTORAGE_H
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
