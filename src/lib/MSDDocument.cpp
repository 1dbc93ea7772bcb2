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

#include <new>
#include <string>

#include <libmsdoc/libmsdoc.h>

#include "libmsdoc_internal.h"

#include "MSDByteSpan.h"
#include "MSDContentListener.h"
#include "MSDFallback.h"
#include "MSDParser.h"

using namespace libmsdoc;

/**
\mainpage libmsdoc documentation
This document contains both the libmsdoc API specification and the normal libmsdoc
documentation.
\section api_docs libmsdoc API documentation
The external libmsdoc API is provided by the MSDDocument class. This class, combined
with the librevenge's librevenge::RVNGTextInterface class, are the only two classes that will be
of interest for the application programmer using libmsdoc.
\section lib_docs libmsdoc documentation
libmsdoc retrieves the text of Microsoft Word 97-2003 documents: the OLE container is read
by libmsdocOLE::Storage, the text is rebuilt from the piece table by MSDParser and, when
the document is damaged, recovered by MSDFallback.

 \warning When compiled with -DDEBUG_WITH_FILES, code is added to store the structure of the OLE
 container in a file OLE.ascii. This file is created in the current repository.*/

namespace MSDDocumentInternal
{
//! reads the whole input, throws a libmsdoc::FileException if this is not possible
static void readInput(librevenge::RVNGInputStream *input, std::vector<unsigned char> &data)
{
	if (!input || !libmsdoc::readDataToEnd(input, data))
		throw libmsdoc::FileException();
}

//! returns the file name without its directory and its .doc extension
static librevenge::RVNGString getTitle(char const *fileName)
{
	if (!fileName) return librevenge::RVNGString();
	std::string name(fileName);
	std::string::size_type sep = name.find_last_of("/\\");
	if (sep != std::string::npos)
		name = name.substr(sep+1);
	size_t const len = name.length();
	if (len >= 4 && name[len-4] == '.' && (name[len-3] == 'd' || name[len-3] == 'D') &&
	        (name[len-2] == 'o' || name[len-2] == 'O') && (name[len-1] == 'c' || name[len-1] == 'C'))
		name.resize(len-4);
	return librevenge::RVNGString(name.c_str());
}

//! retrieves the text stored in data
static MSDResult extractText(MSDByteSpan const &data, std::vector<uint32_t> &text, MSDSource *source)
{
	MSDParser parser(data);
	if (!parser.parse())
	{
		if (source) *source = MSD_SOURCE_NONE;
		MSD_DEBUG_MSG(("MSDDocument::extractText: could not extract text from this file\n"));
		return MSD_NO_TEXT_ERROR;
	}
	if (source) *source = parser.source();
	text = parser.text();
	return MSD_OK;
}
}

MSDLIB MSDConfidence MSDDocument::isFileFormatSupported(librevenge::RVNGInputStream *input)
{
	MSD_DEBUG_MSG(("MSDDocument::isFileFormatSupported()\n"));
	if (!input)
		return MSD_CONFIDENCE_NONE;

	try
	{
		std::vector<unsigned char> data;
		MSDDocumentInternal::readInput(input, data);
		MSDByteSpan span(data);
		MSDParser parser(span);
		if (parser.checkStructure() == PARSE_OK)
			return MSD_CONFIDENCE_EXCELLENT;
		if (parser.isEncrypted())
			return MSD_CONFIDENCE_SUPPORTED_ENCRYPTION;
		std::vector<uint32_t> text;
		if (MSDFallback::extractText(span, text))
			return MSD_CONFIDENCE_WEAK;
	}
	catch (libmsdoc::FileException)
	{
		MSD_DEBUG_MSG(("File exception trapped\n"));
	}
	catch (std::bad_alloc &)
	{
		MSD_DEBUG_MSG(("Memory exception trapped\n"));
	}
	return MSD_CONFIDENCE_NONE;
}

MSDLIB MSDResult MSDDocument::extractText(librevenge::RVNGInputStream *input, librevenge::RVNGString &text, MSDSource *source)
{
	text.clear();
	if (source) *source = MSD_SOURCE_NONE;
	MSDResult error = MSD_OK;
	try
	{
		std::vector<unsigned char> data;
		MSDDocumentInternal::readInput(input, data);
		std::vector<uint32_t> units;
		error = MSDDocumentInternal::extractText(MSDByteSpan(data), units, source);
		if (error == MSD_OK)
			text = toUTF8(units);
	}
	catch (libmsdoc::FileException)
	{
		MSD_DEBUG_MSG(("File exception trapped\n"));
		error = MSD_FILE_ACCESS_ERROR;
	}
	catch (std::bad_alloc &)
	{
		MSD_DEBUG_MSG(("Memory exception trapped\n"));
		error = MSD_UNKNOWN_ERROR;
	}
	return error;
}

MSDLIB MSDResult MSDDocument::extractText(unsigned char const *data, unsigned long size, librevenge::RVNGString &text, MSDSource *source)
{
	text.clear();
	if (source) *source = MSD_SOURCE_NONE;
	if (!data && size)
		return MSD_FILE_ACCESS_ERROR;
	MSDResult error = MSD_OK;
	try
	{
		std::vector<uint32_t> units;
		error = MSDDocumentInternal::extractText(MSDByteSpan(data, size), units, source);
		if (error == MSD_OK)
			text = toUTF8(units);
	}
	catch (std::bad_alloc &)
	{
		MSD_DEBUG_MSG(("Memory exception trapped\n"));
		error = MSD_UNKNOWN_ERROR;
	}
	return error;
}

MSDLIB MSDResult MSDDocument::parse(librevenge::RVNGInputStream *input, librevenge::RVNGTextInterface *documentInterface,
                                    char const *fileName)
{
	if (!input || !documentInterface)
		return MSD_UNKNOWN_ERROR;

	MSDResult error = MSD_OK;
	try
	{
		std::vector<unsigned char> data;
		MSDDocumentInternal::readInput(input, data);
		std::vector<uint32_t> text;
		error = MSDDocumentInternal::extractText(MSDByteSpan(data), text, 0);
		if (error == MSD_OK)
		{
			MSDContentListener listener(documentInterface);
			listener.setDocumentTitle(MSDDocumentInternal::getTitle(fileName));
			listener.startDocument();
			listener.sendText(text);
			listener.endDocument();
		}
	}
	catch (libmsdoc::FileException)
	{
		MSD_DEBUG_MSG(("File exception trapped\n"));
		error = MSD_FILE_ACCESS_ERROR;
	}
	catch (std::bad_alloc &)
	{
		MSD_DEBUG_MSG(("Memory exception trapped\n"));
		error = MSD_UNKNOWN_ERROR;
	}

	return error;
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
