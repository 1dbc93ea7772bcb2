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

#ifndef MSD_PARSER_H
#define MSD_PARSER_H

#include <vector>

#include <libmsdoc/libmsdoc.h>

#include "libmsdoc_internal.h"

#include "MSDByteSpan.h"

namespace MSDParserInternal
{
struct State;
}

namespace libmsdocOLE
{
class Storage;
}

/** \brief the main parser: retrieves the text of a Word 97-2003 document
 *
 * The text is rebuilt from the piece table stored in the OLE container.
 * If one of the stages fails, the text is recovered by scanning the raw
 * data with MSDFallback.
 */
class MSDParser
{
public:
	//! constructor, the data must remain valid while the parser is used
	explicit MSDParser(MSDByteSpan const &data);
	//! destructor
	~MSDParser();

	/** retrieves the text

		\return false if no text can be found */
	bool parse();
	/** only checks the structure: the OLE container, the FIB and the piece table

		\note the encrypted documents are reported as HEADER_INVALID */
	libmsdoc::ParseStatus checkStructure();

	//! returns the state of the piece table pipeline
	libmsdoc::ParseStatus status() const;
	//! returns the way the text was retrieved
	libmsdoc::MSDSource source() const;
	//! returns true if a piece of the main text lies outside the WordDocument stream
	bool isTruncated() const;
	//! returns true if the document is encrypted
	bool isEncrypted() const;
	//! returns the cleaned text as a list of UTF-16 code units
	std::vector<uint32_t> const &text() const;
	//! returns the cleaned text UTF-8 encoded
	librevenge::RVNGString getText() const;

protected:
	//! reads the main text using the piece table, returns the first stage which fails
	libmsdoc::ParseStatus readPieceText(bool onlyCheck);
	//! reads the content of a stream, returns false if the stream is missing or shorter than its declared size
	bool readStream(libmsdocOLE::Storage const &storage, char const *name, std::vector<unsigned char> &data);

	//! the data
	MSDByteSpan m_data;
	//! the internal state
	shared_ptr<MSDParserInternal::State> m_state;

private:
	MSDParser(MSDParser const &orig);
	MSDParser &operator=(MSDParser const &orig);
};

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
