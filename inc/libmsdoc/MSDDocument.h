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


#ifndef MSDDOCUMENT_H
#define MSDDOCUMENT_H

#include <librevenge/librevenge.h>

#ifdef DLL_EXPORT
#ifdef BUILD_MSD
#define MSDLIB __declspec(dllexport)
#else
#define MSDLIB __declspec(dllimport)
#endif
#else // !DLL_EXPORT
#ifdef LIBMSDOC_VISIBILITY
#define MSDLIB __attribute__((visibility("default")))
#else
#define MSDLIB
#endif
#endif


namespace libmsdoc
{

enum MSDConfidence { MSD_CONFIDENCE_NONE=0, MSD_CONFIDENCE_WEAK, MSD_CONFIDENCE_EXCELLENT, MSD_CONFIDENCE_SUPPORTED_ENCRYPTION };
enum MSDResult { MSD_OK, MSD_FILE_ACCESS_ERROR, MSD_NO_TEXT_ERROR, MSD_UNKNOWN_ERROR };
/** the way the text was retrieved */
enum MSDSource { MSD_SOURCE_NONE=0 /**< no text */,
                 MSD_SOURCE_PIECE_TABLE /**< the text was rebuilt from the piece table */,
                 MSD_SOURCE_FALLBACK /**< the text was recovered by scanning the raw bytes */
               };

/**
This class provides all the functions an application would need to retrieve the
text of a Microsoft Word 97-2003 document.
*/
class MSDDocument
{
public:
	/** Analyzes the content of an input stream to see if it can be parsed.
		\param input The input stream

		\return A confidence value which represents the likelyhood that the content from
		the input stream can be parsed:
		- MSD_CONFIDENCE_NONE if no text can be found,
		- MSD_CONFIDENCE_WEAK if only the raw byte scanner finds some text,
		- MSD_CONFIDENCE_EXCELLENT if the file is a Word document with a valid piece table,
		- MSD_CONFIDENCE_SUPPORTED_ENCRYTION if the file is an encrypted Word document
	*/
	static MSDLIB MSDConfidence isFileFormatSupported(librevenge::RVNGInputStream *input);

	/** Retrieves the text of the document stored in input.
		\param input The input stream, read from its beginning to its end
		\param text The cleaned text, UTF-8 encoded
		\param source If not null, set to the way the text was retrieved

		\return MSD_NO_TEXT_ERROR if no text can be retrieved
	*/
	static MSDLIB MSDResult extractText(librevenge::RVNGInputStream *input, librevenge::RVNGString &text, MSDSource *source=0);
	//! Retrieves the text of the document stored in a memory buffer
	static MSDLIB MSDResult extractText(unsigned char const *data, unsigned long size, librevenge::RVNGString &text, MSDSource *source=0);

	/**
	   Parses the input stream content. It will make callbacks to the functions provided by a
	   librevenge::RVNGTextInterface class implementation when needed: one paragraph
	   is created for each block of text separated by an empty line.
	   \param input The input stream
	   \param documentInterface A librevenge::RVNGTextInterface implementation
	   \param fileName the file name, only used to define the document title
	*/
	static MSDLIB MSDResult parse(librevenge::RVNGInputStream *input, librevenge::RVNGTextInterface *documentInterface,
	                              char const *fileName="");
};

} // namespace libmsdoc

#endif /* MSDDOCUMENT_H */
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
