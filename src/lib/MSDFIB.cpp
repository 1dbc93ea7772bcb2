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

#include <iomanip>

#include "MSDByteSpan.h"

#include "MSDFIB.h"

bool MSDFIB::read(MSDByteSpan const &stream)
{
	*this = MSDFIB();
	if (stream.size() < 68)
	{
		MSD_DEBUG_MSG(("MSDFIB::read: the stream is too short\n"));
		return false;
	}
	uint16_t ident=0, flags=0;
	stream.readU16(0, ident);
	if (ident != Identifier)
	{
		MSD_DEBUG_MSG(("MSDFIB::read: bad identifier %x\n", unsigned(ident)));
		return false;
	}
	stream.readU16(2, m_nFib);
	stream.readU16(10, flags);
	m_encrypted = (flags & 0x100) != 0;
	m_whichTable = ((flags >> 9) & 1) != 0;

	// FibRgW97: csw words
	unsigned long pos = 32;
	uint16_t csw;
	if (!stream.readU16(pos, csw)) return false;
	pos += 2 + 2*(unsigned long) csw;

	// FibRgLw97: cslw longs, ccpText is the fourth
	uint16_t cslw;
	if (!stream.readU16(pos, cslw)) return false;
	pos += 2;
	if (cslw < 4 || !stream.readU32(pos+12, m_ccpText))
	{
		MSD_DEBUG_MSG(("MSDFIB::read: can not find the text length\n"));
		return false;
	}
	pos += 4*(unsigned long) cslw;

	// FibRgFcLcb: cbRgFcLcb pairs of fc/lcb
	uint16_t cbRgFcLcb;
	if (!stream.readU16(pos, cbRgFcLcb)) return false;
	pos += 2;
	if (cbRgFcLcb <= ClxPairIndex ||
	        !stream.readU32(pos+8*ClxPairIndex, m_fcClx) || !stream.readU32(pos+8*ClxPairIndex+4, m_lcbClx))
	{
		MSD_DEBUG_MSG(("MSDFIB::read: can not find the clx position\n"));
		return false;
	}
	if (m_lcbClx == 0)
	{
		MSD_DEBUG_MSG(("MSDFIB::read: the clx is empty\n"));
		return false;
	}
	return true;
}

std::ostream &operator<<(std::ostream &o, MSDFIB const &fib)
{
	o << "nFib=" << std::hex << fib.m_nFib << std::dec << ",";
	if (fib.m_encrypted) o << "encrypted,";
	o << fib.tableStreamName() << ",";
	o << "ccpText=" << fib.m_ccpText << ",";
	o << "clx=" << std::hex << fib.m_fcClx << "<->" << fib.m_fcClx+fib.m_lcbClx << std::dec << ",";
	return o;
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
