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

#ifndef MSD_DEBUG
#  define MSD_DEBUG

#include <string>

#include "libmsdoc_internal.h"

#include "MSDByteSpan.h"

#  if defined(DEBUG_WITH_FILES)
#include <fstream>
#include <map>
#include <sstream>

namespace libmsdoc
{
namespace Debug
{
//! returns a name which can be used as a file name: the separators are replaced by _
std::string toFileName(std::string const &name);
}

//! a basic stream (if debug_with_files is not defined, does nothing)
typedef std::stringstream DebugStream;

/** \brief stores a hexadecimal dump of a span with some notes

	The notes are sorted by position; each note begins a new line
	in the dump. The file is written when the object is destroyed. */
class DebugFile
{
public:
	//! constructor given the data
	explicit DebugFile(MSDByteSpan const &data) : m_file(), m_data(data), m_actualPos(0), m_notes()
	{
	}
	//! destructor: writes the file
	~DebugFile()
	{
		write();
	}
	//! opens the file name.ascii in the current directory
	bool open(std::string const &name);
	//! sets the position of the next notes
	void addPos(unsigned long pos)
	{
		m_actualPos = pos;
	}
	//! adds a note at the current position
	void addNote(char const *note);

protected:
	//! writes the dump
	void write();
	//! writes a line of bytes: [begin, end)
	void writeBytes(unsigned long begin, unsigned long end);

	//! the output file
	std::ofstream m_file;
	//! the data
	MSDByteSpan m_data;
	//! the position of the next notes
	unsigned long m_actualPos;
	//! the notes sorted by position
	std::multimap<unsigned long, std::string> m_notes;

private:
	DebugFile(DebugFile const &orig);
	DebugFile &operator=(DebugFile const &orig);
};
}
#  else
namespace libmsdoc
{
namespace Debug
{
inline std::string toFileName(std::string const &name)
{
	return name;
}
}

class DebugStream
{
public:
	template <class T>
	DebugStream &operator<<(T const &)
	{
		return *this;
	}

	static std::string str()
	{
		return std::string("");
	}
};

class DebugFile
{
public:
	explicit DebugFile(MSDByteSpan const &) {}

	static bool open(std::string const &)
	{
		return true;
	}
	static void addPos(unsigned long) {}
	static void addNote(char const *) {}
};
}
#  endif

#endif

/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
