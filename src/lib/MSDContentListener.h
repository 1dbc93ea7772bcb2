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

#ifndef MSDCONTENTLISTENER_H
#define MSDCONTENTLISTENER_H

#include <vector>

#include <librevenge/librevenge.h>

#include "libmsdoc_internal.h"

/** \brief the class which sends the text to a librevenge::RVNGTextInterface
 *
 * The document contains one page span; each block of text separated by an
 * empty line is sent as a paragraph.
 */
class MSDContentListener
{
public:
	//! constructor
	explicit MSDContentListener(librevenge::RVNGTextInterface *documentInterface);
	//! destructor
	~MSDContentListener();

	//! sets the document title, must be called before startDocument
	void setDocumentTitle(librevenge::RVNGString const &title);
	//! starts the document and opens the page span
	void startDocument();
	//! closes the page span and ends the document
	void endDocument();

	//! sends a cleaned text: one paragraph by block separated by empty lines
	void sendText(std::vector<uint32_t> const &text);

	//! opens a paragraph if needed and adds a character
	void insertUnicode(uint32_t c);
	//! adds a tabulation
	void insertTab();
	//! adds a line break in the current paragraph
	void insertLineBreak();
	//! closes the current paragraph
	void insertParagraphBreak();

protected:
	//! opens a paragraph and a span
	void _openParagraph();
	//! closes the paragraph and the span
	void _closeParagraph();
	//! sends the text buffer, using insertSpace for consecutive spaces
	void _flushText();

	//! the document interface
	librevenge::RVNGTextInterface *m_documentInterface;
	//! the meta data
	librevenge::RVNGPropertyList m_metaData;
	//! a flag to know if the document is started
	bool m_isDocumentStarted;
	//! a flag to know if a paragraph is opened
	bool m_isParagraphOpened;
	//! the text buffer
	librevenge::RVNGString m_textBuffer;

private:
	MSDContentListener(const MSDContentListener &);
	MSDContentListener &operator=(const MSDContentListener &);
};

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
