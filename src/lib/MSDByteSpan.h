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

#ifndef MSD_BYTE_SPAN_H
#define MSD_BYTE_SPAN_H

#include <vector>

#include "libmsdoc_internal.h"

/** \brief a read-only view on a zone of a memory buffer
 *
 * All the positions are relative to the beginning of the zone; the
 * base offset is only used to retrieve the position of the zone in the
 * original file. Each read checks that it stays in the zone and
 * returns false otherwise.
 */
class MSDByteSpan
{
public:
	//! constructor
	MSDByteSpan(unsigned char const *data=0, unsigned long size=0, unsigned long base=0)
		: m_data(data), m_size(data ? size : 0), m_base(base)
	{
	}
	//! constructor from a vector, the vector must not be modified when the span is used
	explicit MSDByteSpan(std::vector<unsigned char> const &data, unsigned long base=0)
		: m_data(data.empty() ? 0 : &data[0]), m_size((unsigned long) data.size()), m_base(base)
	{
	}
	//! returns the data
	unsigned char const *data() const
	{
		return m_data;
	}
	//! returns the zone size
	unsigned long size() const
	{
		return m_size;
	}
	//! returns true if the zone is empty
	bool empty() const
	{
		return m_size==0;
	}
	//! returns the position of the zone in the original data
	unsigned long base() const
	{
		return m_base;
	}
	//! returns true if the zone [pos,pos+len) is contained in the span
	bool checkRange(unsigned long pos, unsigned long len) const
	{
		return pos <= m_size && len <= m_size-pos;
	}
	//! returns a pointer on the data at pos if the zone [pos,pos+len) is valid or 0
	unsigned char const *get(unsigned long pos, unsigned long len) const
	{
		if (!m_data || !checkRange(pos, len)) return 0;
		return m_data+pos;
	}

	//! tries to read an unsigned 8-bit value
	bool readU8(unsigned long pos, uint8_t &val) const;
	//! tries to read a little endian unsigned 16-bit value
	bool readU16(unsigned long pos, uint16_t &val) const;
	//! tries to read a little endian unsigned 32-bit value
	bool readU32(unsigned long pos, uint32_t &val) const;
	//! tries to read a little endian signed 32-bit value
	bool read32(unsigned long pos, int32_t &val) const;

	/** returns the sub zone [pos,pos+len).

	\note the sub zone is clamped to the current zone */
	MSDByteSpan subSpan(unsigned long pos, unsigned long len) const;
protected:
	//! the data
	unsigned char const *m_data;
	//! the data size
	unsigned long m_size;
	//! the position of the first byte in the original data
	unsigned long m_base;
};

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
