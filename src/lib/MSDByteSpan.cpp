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

#include "MSDByteSpan.h"

bool MSDByteSpan::readU8(unsigned long pos, uint8_t &val) const
{
	unsigned char const *p = get(pos, 1);
	if (!p) return false;
	val = *p;
	return true;
}

bool MSDByteSpan::readU16(unsigned long pos, uint16_t &val) const
{
	unsigned char const *p = get(pos, 2);
	if (!p) return false;
	val = MSD_LE_GET_GUINT16(p);
	return true;
}

bool MSDByteSpan::readU32(unsigned long pos, uint32_t &val) const
{
	unsigned char const *p = get(pos, 4);
	if (!p) return false;
	val = MSD_LE_GET_GUINT32(p);
	return true;
}

bool MSDByteSpan::read32(unsigned long pos, int32_t &val) const
{
	uint32_t v;
	if (!readU32(pos, v)) return false;
	val = int32_t(v);
	return true;
}

MSDByteSpan MSDByteSpan::subSpan(unsigned long pos, unsigned long len) const
{
	if (pos > m_size) pos = m_size;
	if (len > m_size-pos) len = m_size-pos;
	return MSDByteSpan(m_data ? m_data+pos : 0, len, m_base+pos);
}
/* vim:set shiftwidth=4 softtabstop=4 noexpandtab: */
