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

#include "libmsdoc_tools_win.h"

#include "MSDByteSpan.h"
#include "MSDPieceTable.h"

#include "MSDText.h"

namespace libmsdoc
{
bool extractPieceText(MSDByteSpan const &stream, std::vector<MSDPiece> const &pieces, unsigned long ccpText,
                      std::vector<uint32_t> &text)
{
	text.resize(0);
	unsigned long numChars = 0;
	for (size_t p = 0; p < pieces.size() && numChars < ccpText; ++p)
	{
		MSDPiece const &piece = pieces[p];
		unsigned long toRead = piece.numChars();
		if (toRead > ccpText-numChars)
			toRead = ccpText-numChars;
		if (!toRead) continue;

		unsigned long const charSize = piece.m_singleByte ? 1 : 2;
		if (toRead > stream.size()/charSize || !stream.checkRange(piece.m_fileOffset, toRead*charSize))
		{
			MSD_DEBUG_MSG(("libmsdoc::extractPieceText: the piece %d is outside the stream\n", int(p)));
			return false;
		}
		unsigned char const *ptr = stream.get(piece.m_fileOffset, toRead*charSize);
		for (unsigned long c = 0; c < toRead; ++c)
		{
			if (piece.m_singleByte)
				text.push_back(uint32_t(libmsdoc_tools_win::Font::unicode(ptr[c], libmsdoc_tools_win::Font::WIN3_WEUROPE)));
			else
				text.push_back(MSD_LE_GET_GUINT16(ptr+2*c));
		}
		numChars += toRead;
	}
	return true;
}

void cleanText(std::vector<uint32_t> const &text, std::vector<uint32_t> &res)
{
	res.resize(0);
	bool inField = false;
	for (size_t i = 0; i < text.size(); ++i)
	{
		uint32_t c = text[i];
		switch (c)
		{
		case CHAR_FIELD_BEGIN:
			inField = true;
			continue;
		case CHAR_FIELD_END:
			inField = false;
			continue;
		case CHAR_FIELD_SEPARATOR:
			continue;
		default:
			break;
		}
		if (inField) continue;
		switch (c)
		{
		case CHAR_PARAGRAPH_END:
		case CHAR_LINE_BREAK:
			res.push_back('\n');
			break;
		case CHAR_PAGE_BREAK:
			res.push_back('\n');
			res.push_back('\n');
			break;
		case CHAR_CELL_END:
			res.push_back('\t');
			break;
		case CHAR_PICTURE:
		case CHAR_ANNOTATION:
			break;
		default:
			if (c < 0x20 && c != '\t' && c != '\n')
				break;
			res.push_back(c);
			break;
		}
	}
	collapseNewLines(res);

	// a run of tabs becomes a space
	size_t w = 0;
	bool prevTab = false;
	for (size_t r = 0; r < res.size(); ++r)
	{
		bool isTab = res[r] == '\t';
		if (!isTab)
			res[w++] = res[r];
		else if (!prevTab)
			res[w++] = ' ';
		prevTab = isTab;
	}
	res.resize(w);
	trimWhiteSpaces(res);
}

bool isWhiteSpace(uint32_t c)
{
	if ((c >= 0x9 && c <= 0xd) || c == 0x20 || c == 0xa0)
		return true;
	if (c == 0x1680 || (c >= 0x2000 && c <= 0x200a))
		return true;
	return c == 0x2028 || c == 0x2029 || c == 0x202f || c == 0x205f || c == 0x3000 || c == 0xfeff;
}

bool isBlank(std::vector<uint32_t> const &text)
{
	for (size_t i = 0; i < text.size(); ++i)
	{
		if (!isWhiteSpace(text[i]))
			return false;
	}
	return true;
}

void collapseNewLines(std::vector<uint32_t> &text)
{
	size_t w = 0;
	int numNewLines = 0;
	for (size_t r = 0; r < text.size(); ++r)
	{
		if (text[r] == '\n')
		{
			if (++numNewLines > 2) continue;
		}
		else
			numNewLines = 0;
		text[w++] = text[r];
	}
	text.resize(w);
}

void trimWhiteSpaces(std::vector<uint32_t> &text)
{
	size_t last = text.size();
	while (last > 0 && isWhiteSpace(text[last-1]))
		--last;
	size_t first = 0;
	while (first < last && isWhiteSpace(text[first]))
		++first;
	text.erase(text.begin()+long(last), text.end());
	text.erase(text.begin(), text.begin()+long(first));
}
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
