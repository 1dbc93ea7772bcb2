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

#include "MSDText.h"

#include "MSDContentListener.h"

MSDContentListener::MSDContentListener(librevenge::RVNGTextInterface *documentInterface) :
	m_documentInterface(documentInterface), m_metaData(), m_isDocumentStarted(false),
	m_isParagraphOpened(false), m_textBuffer()
{
}

MSDContentListener::~MSDContentListener()
{
}

void MSDContentListener::setDocumentTitle(librevenge::RVNGString const &title)
{
	if (title.len() == 0) return;
	m_metaData.insert("dc:title", title);
}

void MSDContentListener::startDocument()
{
	if (m_isDocumentStarted)
	{
		MSD_DEBUG_MSG(("MSDContentListener::startDocument: the document is already started\n"));
		return;
	}
	m_documentInterface->setDocumentMetaData(m_metaData);
	m_documentInterface->startDocument(librevenge::RVNGPropertyList());

	librevenge::RVNGPropertyList propList;
	propList.insert("fo:page-width", 8.5, librevenge::RVNG_INCH);
	propList.insert("fo:page-height", 11., librevenge::RVNG_INCH);
	propList.insert("fo:margin-left", 1., librevenge::RVNG_INCH);
	propList.insert("fo:margin-right", 1., librevenge::RVNG_INCH);
	propList.insert("fo:margin-top", 1., librevenge::RVNG_INCH);
	propList.insert("fo:margin-bottom", 1., librevenge::RVNG_INCH);
	m_documentInterface->openPageSpan(propList);
	m_isDocumentStarted = true;
}

void MSDContentListener::endDocument()
{
	if (!m_isDocumentStarted)
	{
		MSD_DEBUG_MSG(("MSDContentListener::endDocument: the document is not started\n"));
		return;
	}
	if (m_isParagraphOpened)
		_closeParagraph();
	m_documentInterface->closePageSpan();
	m_documentInterface->endDocument();
	m_isDocumentStarted = false;
}

void MSDContentListener::sendText(std::vector<uint32_t> const &text)
{
	// split the text in lines, a blank line ends the block
	std::vector<uint32_t> block;
	size_t lineBegin = 0;
	while (lineBegin <= text.size())
	{
		size_t lineEnd = lineBegin;
		while (lineEnd < text.size() && text[lineEnd] != '\n')
			++lineEnd;
		std::vector<uint32_t> line(text.begin()+long(lineBegin), text.begin()+long(lineEnd));
		bool isLast = lineEnd >= text.size();
		if (!libmsdoc::isBlank(line))
		{
			if (!block.empty())
				block.push_back('\n');
			block.insert(block.end(), line.begin(), line.end());
		}
		if ((libmsdoc::isBlank(line) || isLast) && !block.empty())
		{
			libmsdoc::trimWhiteSpaces(block);
			for (size_t c = 0; c < block.size(); ++c)
			{
				if (block[c] == '\n')
					insertLineBreak();
				else if (block[c] == '\t')
					insertTab();
				else if (block[c] >= 0xd800 && block[c] < 0xdc00 && c+1 < block.size() &&
				         block[c+1] >= 0xdc00 && block[c+1] < 0xe000)
				{
					insertUnicode(0x10000+((block[c]-0xd800)<<10)+(block[c+1]-0xdc00));
					++c;
				}
				else if (block[c] >= 0xd800 && block[c] < 0xe000)
					insertUnicode(0xfffd);
				else
					insertUnicode(block[c]);
			}
			insertParagraphBreak();
			block.resize(0);
		}
		lineBegin = lineEnd+1;
	}
}

void MSDContentListener::insertUnicode(uint32_t c)
{
	if (!m_isParagraphOpened)
		_openParagraph();
	libmsdoc::appendUnicode(c, m_textBuffer);
}

void MSDContentListener::insertTab()
{
	if (!m_isParagraphOpened)
		_openParagraph();
	_flushText();
	m_documentInterface->insertTab();
}

void MSDContentListener::insertLineBreak()
{
	if (!m_isParagraphOpened)
		_openParagraph();
	_flushText();
	m_documentInterface->insertLineBreak();
}

void MSDContentListener::insertParagraphBreak()
{
	if (m_isParagraphOpened)
		_closeParagraph();
}

void MSDContentListener::_openParagraph()
{
	if (!m_isDocumentStarted)
		startDocument();
	m_documentInterface->openParagraph(librevenge::RVNGPropertyList());
	m_documentInterface->openSpan(librevenge::RVNGPropertyList());
	m_isParagraphOpened = true;
}

void MSDContentListener::_closeParagraph()
{
	_flushText();
	m_documentInterface->closeSpan();
	m_documentInterface->closeParagraph();
	m_isParagraphOpened = false;
}

void MSDContentListener::_flushText()
{
	if (m_textBuffer.len() == 0) return;

	// when some many ' ' follows each other, call insertSpace
	librevenge::RVNGString tmpText;
	int numConsecutiveSpaces = 0;
	librevenge::RVNGString::Iter i(m_textBuffer);
	for (i.rewind(); i.next();)
	{
		if (*(i()) == 0x20) // this test is compatible with unicode format
			numConsecutiveSpaces++;
		else
			numConsecutiveSpaces = 0;

		if (numConsecutiveSpaces > 1)
		{
			if (tmpText.len() > 0)
			{
				m_documentInterface->insertText(tmpText);
				tmpText.clear();
			}
			m_documentInterface->insertSpace();
		}
		else
			tmpText.append(i());
	}
	if (tmpText.len() > 0)
		m_documentInterface->insertText(tmpText);
	m_textBuffer.clear();
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
