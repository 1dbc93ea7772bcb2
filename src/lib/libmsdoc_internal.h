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

#ifndef LIBMSDOC_INTERNAL_H
#define LIBMSDOC_INTERNAL_H

#ifdef DEBUG
#include <stdio.h>
#endif

#include <string>
#include <vector>

#include <librevenge-stream/librevenge-stream.h>
#include <librevenge/librevenge.h>

#if defined(_MSC_VER) || defined(__DJGPP__)
typedef signed char int8_t;
typedef unsigned char uint8_t;
typedef signed short int16_t;
typedef unsigned short uint16_t;
typedef signed int int32_t;
typedef unsigned int uint32_t;
#else /* !_MSC_VER && !__DJGPP__*/
#  include <inttypes.h>
#endif /* _MSC_VER || __DJGPP__*/

/* ---------- memory  --------------- */
#ifdef HAVE_CONFIG_H
#  include "config.h"
#endif

#if defined(SHAREDPTR_TR1)
#include <tr1/memory>
using std::tr1::shared_ptr;
#elif defined(SHAREDPTR_STD)
#include <memory>
using std::shared_ptr;
#else
#include <boost/shared_ptr.hpp>
using boost::shared_ptr;
#endif

#if defined(__clang__) || defined(__GNUC__)
#  define MSD_ATTRIBUTE_PRINTF(fmt, arg) __attribute__((__format__(__printf__, fmt, arg)))
#else
#  define MSD_ATTRIBUTE_PRINTF(fmt, arg)
#endif
/* ---------- debug  --------------- */
#ifdef DEBUG
namespace libmsdoc
{
void printDebugMsg(const char *format, ...) MSD_ATTRIBUTE_PRINTF(1, 2);
}
#define MSD_DEBUG_MSG(M) libmsdoc::printDebugMsg M
#else
#define MSD_DEBUG_MSG(M)
#endif

/* ---------- exception  ------------ */
namespace libmsdoc
{
// Various exceptions
class FileException
{
	// needless to say, we could flesh this class out a bit
};
}

/* ---------- input ----------------- */
namespace libmsdoc
{
//! try to read the input from its beginning to its end and store the result in data
bool readDataToEnd(librevenge::RVNGInputStream *input, std::vector<unsigned char> &data);
//! adds an unicode character to a string ( with correct encoding ), keeps \\t and \\n
void appendUnicode(uint32_t val, librevenge::RVNGString &buffer);
/** converts a list of UTF-16 code units in an UTF-8 string.

	Surrogate pairs are joined, lonely surrogates are replaced by U+FFFD.
 */
librevenge::RVNGString toUTF8(std::vector<uint32_t> const &units);
}

#define MSD_LE_GET_GUINT16(p)				  			\
        (uint16_t)((((uint8_t const *)(p))[0] << 0)  |	\
                  (((uint8_t const *)(p))[1] << 8))
#define MSD_LE_GET_GUINT32(p)				  			\
        (uint32_t)((((uint8_t const *)(p))[0] << 0) |	\
                  (((uint8_t const *)(p))[1] << 8)  |	\
                  (((uint8_t const *)(p))[2] << 16) |	\
                  (((uint8_t const *)(p))[3] << 24))

/* ---------- small enum ------------- */
namespace libmsdoc
{
/** the state of the main pipeline: the first stage which fails */
enum ParseStatus { PARSE_OK=0, CONTAINER_INVALID, STREAM_MISSING, HEADER_INVALID, PIECE_TABLE_INVALID, NO_TEXT };
//! returns a string corresponding to a parse status
std::string statusToString(ParseStatus status);
}

#endif /* LIBMSDOC_INTERNAL_H */
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
