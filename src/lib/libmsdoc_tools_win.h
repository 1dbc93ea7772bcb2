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

/* This header contains code specific to windows file :
 *     - a class used to convert Windows single-byte characters in unicode
 */

#ifndef MSD_WIN
#  define MSD_WIN

#  include "libmsdoc_internal.h"

/** some Windows© classes and tools */
namespace libmsdoc_tools_win
{
//!\brief a class to convert a Windows© character in unicode
class Font
{
public:
	//! enum Type \brief the knowned Windows© code pages
	enum Type { WIN3_WEUROPE /**< cp1252 */ };
	/** converts a character in unicode, knowing the character and the font type

	\note in cp1252, the undefined characters of 0x80-0x9f are returned unchanged */
	static unsigned long unicode(unsigned char c, Type type);
};
}

#endif
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
