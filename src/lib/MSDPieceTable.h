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

#ifndef MSD_PIECE_TABLE_H
#define MSD_PIECE_TABLE_H

#include <vector>

#include "libmsdoc_internal.h"

class MSDByteSpan;

//! a piece: a run of characters stored contiguously in the WordDocument stream
struct MSDPiece
{
	//! constructor
	MSDPiece() : m_cpStart(0), m_cpEnd(0), m_fileOffset(0), m_singleByte(false)
	{
	}
	//! returns the number of characters, 0 if the limits are inverted
	unsigned long numChars() const
	{
		return m_cpEnd > m_cpStart ? (unsigned long)(m_cpEnd-m_cpStart) : 0;
	}

	//! the first character position
	uint32_t m_cpStart;
	//! the character position after the last character
	uint32_t m_cpEnd;
	//! the position of the first character in the WordDocument stream
	uint32_t m_fileOffset;
	//! true if the characters are stored with one byte (cp1252), false for UTF-16
	bool m_singleByte;
};

/** \brief the piece table stored in the CLX of the table stream
 *
 * The CLX begins with some formatting runs (marker 1) which are skipped,
 * followed by the PlcPcd (marker 2) which stores the pieces.
 */
class MSDPieceTable
{
public:
	//! the maximal number of formatting runs which are skipped
	enum { MaxFormattingRuns=1000 };
	//! the flag which indicates a cp1252 piece in a fc
	enum { CompressedFlag=0x40000000 };

	//! constructor
	MSDPieceTable() : m_pieces()
	{
	}
	/** reads the CLX stored in table at [fcClx,fcClx+lcbClx)

		\return false if the CLX is not valid or if it contains no piece */
	bool read(MSDByteSpan const &table, uint32_t fcClx, uint32_t lcbClx);
	//! returns the list of pieces in table order
	std::vector<MSDPiece> const &pieces() const
	{
		return m_pieces;
	}
	//! returns the number of pieces
	size_t size() const
	{
		return m_pieces.size();
	}
	//! returns true if there is no piece
	bool empty() const
	{
		return m_pieces.empty();
	}
protected:
	//! the pieces
	std::vector<MSDPiece> m_pieces;
};

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
