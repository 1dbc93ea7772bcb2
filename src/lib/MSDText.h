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

#ifndef MSD_TEXT_H
#define MSD_TEXT_H

#include <vector>

#include "libmsdoc_internal.h"

class MSDByteSpan;
struct MSDPiece;

/* The text is stored as a list of UTF-16 code units, each one stored in a uint32_t. */
namespace libmsdoc
{
//! the special characters used in the main text
enum SpecialCharacter { CHAR_CELL_END=0x7, CHAR_PICTURE=0x1, CHAR_ANNOTATION=0x8,
                        CHAR_LINE_BREAK=0xb, CHAR_PAGE_BREAK=0xc, CHAR_PARAGRAPH_END=0xd,
                        CHAR_FIELD_BEGIN=0x13, CHAR_FIELD_SEPARATOR=0x14, CHAR_FIELD_END=0x15
                      };

/** retrieves the main text: reads the pieces in table order until
	ccpText characters are found.

	\return false if a piece is outside the stream; in this case, text
	contains the characters read before this piece */
bool extractPieceText(MSDByteSpan const &stream, std::vector<MSDPiece> const &pieces, unsigned long ccpText,
                      std::vector<uint32_t> &text);
/** removes the field instructions and the special characters, converts the
	paragraph, line and page breaks in newlines, the cell ends in tabs, then
	normalizes the spaces */
void cleanText(std::vector<uint32_t> const &text, std::vector<uint32_t> &res);

//! returns true if c is a white space
bool isWhiteSpace(uint32_t c);
//! returns true if the text contains only white spaces
bool isBlank(std::vector<uint32_t> const &text);
//! replaces three or more consecutive newlines by two newlines
void collapseNewLines(std::vector<uint32_t> &text);
//! removes the white spaces at the beginning and at the end
void trimWhiteSpaces(std::vector<uint32_t> &text);
}

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
