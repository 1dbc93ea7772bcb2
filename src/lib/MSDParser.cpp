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

#include <sstream>

#include "MSDFallback.h"
#include "MSDFIB.h"
#include "MSDOLEStorage.h"
#include "MSDPieceTable.h"
#include "MSDText.h"

#include "MSDParser.h"

namespace MSDParserInternal
{
//! the parser state
struct State
{
	//! constructor
	State() : m_status(libmsdoc::PARSE_OK), m_source(libmsdoc::MSD_SOURCE_NONE), m_isTruncated(false),
		m_isEncrypted(false), m_fib(), m_text()
	{
	}
	//! the status of the piece table pipeline
	libmsdoc::ParseStatus m_status;
	//! the way the text was retrieved
	libmsdoc::MSDSource m_source;
	//! a flag to know if the main text decoding stopped early
	bool m_isTruncated;
	//! a flag to know if the document is encrypted
	bool m_isEncrypted;
	//! the file information block
	MSDFIB m_fib;
	//! the text
	std::vector<uint32_t> m_text;
};
}

MSDParser::MSDParser(MSDByteSpan const &data) : m_data(data), m_state(new MSDParserInternal::State)
{
}

MSDParser::~MSDParser()
{
}

libmsdoc::ParseStatus MSDParser::status() const
{
	return m_state->m_status;
}

libmsdoc::MSDSource MSDParser::source() const
{
	return m_state->m_source;
}

bool MSDParser::isTruncated() const
{
	return m_state->m_isTruncated;
}

bool MSDParser::isEncrypted() const
{
	return m_state->m_isEncrypted;
}

std::vector<uint32_t> const &MSDParser::text() const
{
	return m_state->m_text;
}

librevenge::RVNGString MSDParser::getText() const
{
	return libmsdoc::toUTF8(m_state->m_text);
}

bool MSDParser::parse()
{
	*m_state = MSDParserInternal::State();
	m_state->m_status = readPieceText(false);
	if (m_state->m_status == libmsdoc::PARSE_OK)
	{
		m_state->m_source = libmsdoc::MSD_SOURCE_PIECE_TABLE;
		return true;
	}
	MSD_DEBUG_MSG(("MSDParser::parse: can not use the piece table: %s, try to scan the data\n",
	               libmsdoc::statusToString(m_state->m_status).c_str()));
	if (!MSDFallback::extractText(m_data, m_state->m_text))
	{
		MSD_DEBUG_MSG(("MSDParser::parse: can not find any text\n"));
		m_state->m_text.resize(0);
		return false;
	}
	m_state->m_source = libmsdoc::MSD_SOURCE_FALLBACK;
	return true;
}

libmsdoc::ParseStatus MSDParser::checkStructure()
{
	*m_state = MSDParserInternal::State();
	m_state->m_status = readPieceText(true);
	return m_state->m_status;
}

bool MSDParser::readStream(libmsdocOLE::Storage const &storage, char const *name, std::vector<unsigned char> &data)
{
	data.resize(0);
	libmsdocOLE::DirEntry const *entry = storage.findEntry(name);
	if (!entry)
	{
		MSD_DEBUG_MSG(("MSDParser::readStream: can not find the %s stream\n", name));
		return false;
	}
	if (!storage.readStream(*entry, data))
	{
		// a short read means a broken chain, the stream can not be used
		MSD_DEBUG_MSG(("MSDParser::readStream: can not read the %s stream (%d bytes found)\n", name, int(data.size())));
		data.resize(0);
		return false;
	}
	return true;
}

libmsdoc::ParseStatus MSDParser::readPieceText(bool onlyCheck)
{
	libmsdocOLE::Storage storage(m_data);
	if (!storage.isStructuredDocument())
		return libmsdoc::CONTAINER_INVALID;

	std::vector<unsigned char> mainData;
	if (!readStream(storage, "WordDocument", mainData))
		return libmsdoc::STREAM_MISSING;
	MSDByteSpan mainStream(mainData);
	MSDFIB &fib = m_state->m_fib;
	if (!fib.read(mainStream))
		return libmsdoc::HEADER_INVALID;
#ifdef DEBUG
	std::stringstream f;
	f << fib;
	MSD_DEBUG_MSG(("MSDParser::readPieceText: FIB=%s\n", f.str().c_str()));
#endif
	if (fib.m_encrypted)
	{
		MSD_DEBUG_MSG(("MSDParser::readPieceText: the document is encrypted\n"));
		m_state->m_isEncrypted = true;
		return libmsdoc::HEADER_INVALID;
	}

	std::vector<unsigned char> tableData;
	if (!readStream(storage, fib.tableStreamName().c_str(), tableData))
		return libmsdoc::STREAM_MISSING;
	MSDPieceTable pieceTable;
	if (!pieceTable.read(MSDByteSpan(tableData), fib.m_fcClx, fib.m_lcbClx))
		return libmsdoc::PIECE_TABLE_INVALID;
	if (onlyCheck)
		return libmsdoc::PARSE_OK;

	std::vector<uint32_t> rawText;
	if (!libmsdoc::extractPieceText(mainStream, pieceTable.pieces(), fib.m_ccpText, rawText))
		m_state->m_isTruncated = true;
	if (libmsdoc::isBlank(rawText))
		return libmsdoc::NO_TEXT;
	libmsdoc::cleanText(rawText, m_state->m_text);
	if (m_state->m_text.empty())
		return libmsdoc::NO_TEXT;
	return libmsdoc::PARSE_OK;
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
