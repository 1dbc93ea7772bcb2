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

#include <iomanip>

#include "MSDDebug.h"

#if defined(DEBUG_WITH_FILES)
namespace libmsdoc
{
namespace Debug
{
std::string toFileName(std::string const &name)
{
	std::string res(name);
	for (size_t i = 0; i < res.length(); ++i)
	{
		unsigned char c = (unsigned char) res[i];
		if (c < 0x20 || c == '/' || c == '\\' || c == ':' || c == ' ')
			res[i] = '_';
	}
	return res;
}
}

bool DebugFile::open(std::string const &name)
{
	if (m_file.is_open()) return true;
	std::string fileName = Debug::toFileName(name)+".ascii";
	m_file.open(fileName.c_str());
	return m_file.is_open();
}

void DebugFile::addNote(char const *note)
{
	if (!m_file.is_open() || !note || !*note) return;
	m_notes.insert(std::pair<unsigned long const, std::string>(m_actualPos, note));
}

void DebugFile::writeBytes(unsigned long begin, unsigned long end)
{
	if (begin >= end) return;
	m_file << std::hex << std::setfill('0') << std::setw(8) << m_data.base()+begin << ":";
	for (unsigned long pos = begin; pos < end; ++pos)
	{
		uint8_t c = 0;
		m_data.readU8(pos, c);
		m_file << " " << std::setw(2) << int(c);
	}
	m_file << std::dec << "\n";
}

void DebugFile::write()
{
	if (!m_file.is_open()) return;
	std::multimap<unsigned long, std::string>::const_iterator it = m_notes.begin();
	unsigned long pos = 0;
	unsigned long const size = m_data.size();
	while (pos < size)
	{
		while (it != m_notes.end() && it->first <= pos)
		{
			m_file << "[" << it->second << "]\n";
			++it;
		}
		// a line ends at the next multiple of 16 or at the next note
		unsigned long end = (pos/16+1)*16;
		if (end > size) end = size;
		if (it != m_notes.end() && it->first < end) end = it->first;
		writeBytes(pos, end);
		pos = end;
	}
	for (; it != m_notes.end(); ++it)
		m_file << "[" << it->second << "]\n";
	m_notes.clear();
	m_file.close();
}
}
#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
