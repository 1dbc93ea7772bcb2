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

#include <cstdarg>
#include <cstdio>
#include <string>

#include <librevenge/librevenge.h>

#include "libmsdoc_internal.h"

namespace libmsdoc
{
bool readDataToEnd(librevenge::RVNGInputStream *input, std::vector<unsigned char> &data)
{
	data.clear();
	if (!input) return false;
	if (input->seek(0, librevenge::RVNG_SEEK_SET) != 0)
	{
		MSD_DEBUG_MSG(("libmsdoc::readDataToEnd: can not go to the beginning of the input\n"));
		return false;
	}
	while (!input->isEnd())
	{
		unsigned long numBytesRead = 0;
		unsigned char const *p = input->read(4096, numBytesRead);
		if (!p || numBytesRead == 0)
			break;
		data.insert(data.end(), p, p+numBytesRead);
	}
	return true;
}

void appendUnicode(uint32_t val, librevenge::RVNGString &buffer)
{
	if (val < 0x20 && val != 0x9 && val != 0xa)
	{
		MSD_DEBUG_MSG(("libmsdoc::appendUnicode: find an old char %x, skip it\n", val));
		return;
	}
	uint8_t first;
	int len;
	if (val < 0x80)
	{
		first = 0;
		len = 1;
	}
	else if (val < 0x800)
	{
		first = 0xc0;
		len = 2;
	}
	else if (val < 0x10000)
	{
		first = 0xe0;
		len = 3;
	}
	else
	{
		if (val > 0x10FFFF) val = 0xFFFD;
		first = 0xf0;
		len = 4;
	}

	char outbuf[5];
	int i;
	for (i = len - 1; i > 0; --i)
	{
		outbuf[i] = char((val & 0x3f) | 0x80);
		val >>= 6;
	}
	outbuf[0] = char(val | first);
	outbuf[len] = 0;
	buffer.append(outbuf);
}

librevenge::RVNGString toUTF8(std::vector<uint32_t> const &units)
{
	librevenge::RVNGString res;
	size_t numUnits = units.size();
	for (size_t i = 0; i < numUnits; ++i)
	{
		uint32_t c = units[i];
		if (c >= 0xD800 && c < 0xDC00)
		{
			if (i+1 < numUnits && units[i+1] >= 0xDC00 && units[i+1] < 0xE000)
			{
				appendUnicode(0x10000+((c-0xD800)<<10)+(units[i+1]-0xDC00), res);
				++i;
			}
			else
				appendUnicode(0xFFFD, res);
			continue;
		}
		if (c >= 0xDC00 && c < 0xE000)
			c = 0xFFFD;
		appendUnicode(c, res);
	}
	return res;
}

std::string statusToString(ParseStatus status)
{
	switch (status)
	{
	case PARSE_OK:
		return "ok";
	case CONTAINER_INVALID:
		return "container invalid";
	case STREAM_MISSING:
		return "stream missing";
	case HEADER_INVALID:
		return "header invalid";
	case PIECE_TABLE_INVALID:
		return "piece table invalid";
	case NO_TEXT:
		return "no text";
	default:
		break;
	}
	return "unknown";
}
}

////////////////////////////////////////////////////////////
// debug
////////////////////////////////////////////////////////////

namespace libmsdoc
{
#ifdef DEBUG
void printDebugMsg(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	std::vfprintf(stderr, format, args);
	va_end(args);
}
#endif
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
