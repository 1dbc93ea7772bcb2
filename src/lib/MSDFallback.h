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

#ifndef MSD_FALLBACK_H
#define MSD_FALLBACK_H

#include <vector>

#include "libmsdoc_internal.h"

class MSDByteSpan;

/** \brief a class used to recover some text from a damaged or an unknown file
 *
 * The data is scanned for long runs of printable UTF-16 characters and,
 * if none is found, for long runs of printable ASCII characters.
 */
class MSDFallback
{
public:
	//! the minimal length of a UTF-16 run, and of an ASCII run
	enum { MinUTF16Run=41, MinASCIIRun=51 };

	/** tries to retrieve the text stored in data

		\return false if no text is found */
	static bool extractText(MSDByteSpan const &data, std::vector<uint32_t> &text);
	//! looks for runs of printable UTF-16LE characters stored at even positions
	static bool extractUTF16Runs(MSDByteSpan const &data, std::vector<uint32_t> &text);
	//! looks for runs of printable ASCII characters
	static bool extractASCIIRuns(MSDByteSpan const &data, std::vector<uint32_t> &text);
	/** removes the control characters excepted tab and newlines, converts
		the CR and CRLF in LF, then collapses the newlines and trims the text */
	static void cleanText(std::vector<uint32_t> &text);
protected:
	//! returns true if c is a printable UTF-16 code unit
	static bool isPrintable(uint32_t c)
	{
		if (c == '\t' || c == '\n' || c == '\r') return true;
		if (c < 0x20) return false;
		return c != 0xfffe && c != 0xffff;
	}
	//! returns true if c is a printable ASCII character
	static bool isPrintableASCII(unsigned char c)
	{
		return (c >= 0x20 && c <= 0x7e) || c == '\t' || c == '\n' || c == '\r';
	}
	//! appends a run to the text, separated by an empty line
	static void appendRun(std::vector<uint32_t> const &run, std::vector<uint32_t> &text);
};

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
