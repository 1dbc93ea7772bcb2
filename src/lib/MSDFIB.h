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

#ifndef MSD_FIB_H
#define MSD_FIB_H

#include <ostream>
#include <string>

#include "libmsdoc_internal.h"

class MSDByteSpan;

/** \brief the file information block: the header of the WordDocument stream
 *
 * Only the fields needed to find the text are kept.
 */
struct MSDFIB
{
	//! the Word identifier stored at the beginning of the stream
	enum { Identifier=0xA5EC };
	//! the position of the fcClx/lcbClx pair in the fc/lcb array
	enum { ClxPairIndex=33 };

	//! constructor
	MSDFIB() : m_nFib(0), m_whichTable(false), m_encrypted(false), m_ccpText(0), m_fcClx(0), m_lcbClx(0)
	{
	}
	/** reads the FIB which begins the WordDocument stream

		\return false if the stream is too short, does not begin with
		the Word identifier or if the piece table position is not found */
	bool read(MSDByteSpan const &stream);
	//! returns the name of the table stream: 1Table or 0Table
	std::string tableStreamName() const
	{
		return m_whichTable ? "1Table" : "0Table";
	}
	//! operator<<
	friend std::ostream &operator<<(std::ostream &o, MSDFIB const &fib);

	//! the file format version
	uint16_t m_nFib;
	//! true if the table stream is 1Table
	bool m_whichTable;
	//! true if the document is encrypted
	bool m_encrypted;
	//! the number of characters in the main text
	uint32_t m_ccpText;
	//! the position of the CLX in the table stream
	uint32_t m_fcClx;
	//! the size of the CLX
	uint32_t m_lcbClx;
};

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
