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
#include "MSDText.h"

#include "MSDFallback.h"

bool MSDFallback::extractText(MSDByteSpan const &data, std::vector<uint32_t> &text)
{
	if (extractUTF16Runs(data, text))
		return true;
	MSD_DEBUG_MSG(("MSDFallback::extractText: no UTF-16 text, try to find ASCII text\n"));
	return extractASCIIRuns(data, text);
}

void MSDFallback::appendRun(std::vector<uint32_t> const &run, std::vector<uint32_t> &text)
{
	if (!text.empty())
	{
		text.push_back('\n');
		text.push_back('\n');
	}
	text.insert(text.end(), run.begin(), run.end());
}

bool MSDFallback::extractUTF16Runs(MSDByteSpan const &data, std::vector<uint32_t> &text)
{
	text.resize(0);
	std::vector<uint32_t> run;
	for (unsigned long pos = 0; pos+2 <= data.size(); pos += 2)
	{
		uint16_t c = 0;
		data.readU16(pos, c);
		if (isPrintable(c))
		{
			run.push_back(c);
			continue;
		}
		if (run.size() >= MinUTF16Run)
			appendRun(run, text);
		run.resize(0);
	}
	if (run.size() >= MinUTF16Run)
		appendRun(run, text);
	if (text.empty())
		return false;
	cleanText(text);
	return !text.empty();
}

bool MSDFallback::extractASCIIRuns(MSDByteSpan const &data, std::vector<uint32_t> &text)
{
	text.resize(0);
	std::vector<uint32_t> run;
	unsigned char const *ptr = data.data();
	for (unsigned long pos = 0; pos < data.size(); ++pos)
	{
		if (isPrintableASCII(ptr[pos]))
		{
			run.push_back(ptr[pos]);
			continue;
		}
		if (run.size() >= MinASCIIRun)
			appendRun(run, text);
		run.resize(0);
	}
	if (run.size() >= MinASCIIRun)
		appendRun(run, text);
	if (text.empty())
		return false;
	cleanText(text);
	return !text.empty();
}

void MSDFallback::cleanText(std::vector<uint32_t> &text)
{
	size_t w = 0;
	for (size_t r = 0; r < text.size(); ++r)
	{
		uint32_t c = text[r];
		if (c < 0x20 && c != '\t' && c != '\n' && c != '\r')
			continue;
		text[w++] = c;
	}
	text.resize(w);

	// CRLF and CR become LF
	w = 0;
	for (size_t r = 0; r < text.size(); ++r)
	{
		if (text[r] != '\r')
			text[w++] = text[r];
		else if (r+1 >= text.size() || text[r+1] != '\n')
			text[w++] = '\n';
	}
	text.resize(w);
	libmsdoc::collapseNewLines(text);
	libmsdoc::trimWhiteSpaces(text);
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
