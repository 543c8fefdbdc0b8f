/** \file    TextUtil.h
 *  \brief   Declarations of text related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Jiangtao Hu
 */

/*
 *  Copyright 2003-2009 Project iVia.
 *  Copyright 2003-2009 The Regents of The University of California.
 *  Copyright 2015-2024 Universitätsbibliothek Tübingen.
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <string>


namespace TextUtil {


inline bool IsStartOfUTF8CodePoint(const char ch) {
    // Test whether we have an ASCII character or a character whose uppermost two bits are both 1.
    return (static_cast<unsigned char>(ch) & 128u) == 0 or (static_cast<unsigned char>(ch) & 192u) == 192u;
}


inline bool IsUFT8ContinuationByte(const char ch) { return not IsStartOfUTF8CodePoint(ch); }


/** \return The offset of the code point following the one that starts at "offset", or s.length() + 1 if "offset" is
 *          already at or past the end of "s".  Continuation bytes following "offset" are skipped, so a stray
 *          continuation byte never stalls the caller.
 */
size_t NextUTF8CodePointOffset(const std::string &s, const size_t offset);


/** \brief Replaces C-style backslash escapes in "s" with the characters they stand for.
 *  \note  Supported are \n, \t, \b, \r, \f, \v, \a, \\, \", \#, octal escapes of up to three digits and
 *         hexadecimal escapes of up to two digits.
 *  \throws std::runtime_error on unknown or truncated escape sequences.
 *  \return The converted string.
 */
std::string &CStyleUnescape(std::string * const s);
inline std::string CStyleUnescape(std::string s) {
    return CStyleUnescape(&s);
}


} // namespace TextUtil
