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

#include "MSDByteSpan.h"

#include "MSDPieceTable.h"

bool MSDPieceTable::read(MSDByteSpan const &table, uint32_t fcClx, uint32_t lcbClx)
{
	m_pieces.resize(0);
	if (!table.checkRange(fcClx, lcbClx))
	{
		MSD_DEBUG_MSG(("MSDPieceTable::read: the clx zone is outside the table stream\n"));
		return false;
	}
	unsigned long pos = fcClx;
	unsigned long const endPos = (unsigned long) fcClx+lcbClx;

	// skip the Prc: 1, cbGrpprl, grpprl
	uint8_t marker = 0;
	for (int run = 0; pos < endPos && run < MaxFormattingRuns; ++run)
	{
		table.readU8(pos, marker);
		if (marker == 2) break;
		if (marker != 1)
		{
			MSD_DEBUG_MSG(("MSDPieceTable::read: find unexpected marker %d\n", int(marker)));
			return false;
		}
		uint16_t cbGrpprl;
		if (pos+3 > endPos || !table.readU16(pos+1, cbGrpprl))
		{
			MSD_DEBUG_MSG(("MSDPieceTable::read: a formatting run is truncated\n"));
			return false;
		}
		pos += 3+(unsigned long) cbGrpprl;
	}
	if (pos >= endPos || !table.readU8(pos, marker) || marker != 2)
	{
		MSD_DEBUG_MSG(("MSDPieceTable::read: can not find the PlcPcd\n"));
		return false;
	}

	// the PlcPcd: 2, lcb, n+1 cp, n pcd
	uint32_t lcb;
	if (pos+5 > endPos || !table.readU32(pos+1, lcb))
		return false;
	pos += 5;
	if (!table.checkRange(pos, lcb) || lcb < 16 || (lcb-4)%12)
	{
		MSD_DEBUG_MSG(("MSDPieceTable::read: the PlcPcd size %u seems bad\n", unsigned(lcb)));
		return false;
	}
	unsigned long const numPieces = (unsigned long)(lcb-4)/12;
	unsigned long const pcdPos = pos+4*(numPieces+1);
	for (unsigned long i = 0; i < numPieces; ++i)
	{
		MSDPiece piece;
		uint32_t fc;
		if (!table.readU32(pos+4*i, piece.m_cpStart) || !table.readU32(pos+4*i+4, piece.m_cpEnd) ||
		        !table.readU32(pcdPos+8*i+2, fc))
			break;
		if (fc & CompressedFlag)
		{
			piece.m_singleByte = true;
			piece.m_fileOffset = (fc & ~uint32_t(CompressedFlag)) >> 1;
		}
		else
			piece.m_fileOffset = fc;
		m_pieces.push_back(piece);
	}
	return !m_pieces.empty();
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
