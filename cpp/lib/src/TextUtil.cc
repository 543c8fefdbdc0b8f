/** \file    TextUtil.cc
 *  \brief   Implementation of text related utility functions.
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
#include "TextUtil.h"
#include <stdexcept>
#include "Compiler.h"


namespace TextUtil {


size_t NextUTF8CodePointOffset(const std::string &s, const size_t offset) {
    if (offset >= s.length())
        return s.length() + 1;

    size_t next_offset(offset + 1);
    while (next_offset < s.length() and IsUFT8ContinuationByte(s[next_offset]))
        ++next_offset;

    return next_offset;
}


namespace {


inline bool IsOctalDigit(const char ch) {
    return ch >= '0' and ch <= '7';
}


inline bool IsHexDigit(const char ch) {
    return (ch >= '0' and ch <= '9') or (ch >= 'a' and ch <= 'f') or (ch >= 'A' and ch <= 'F');
}


unsigned HexDigitValue(const char ch) {
    if (ch >= '0' and ch <= '9')
        return ch - '0';
    if (ch >= 'a' and ch <= 'f')
        return ch - 'a' + 10u;
    return ch - 'A' + 10u;
}


// "ch" points at the first octal digit.  On return it points at the last digit consumed.
char DecodeOctalEscapeSequence(std::string::const_iterator &ch, const std::string::const_iterator &end) {
    unsigned code(0);
    for (unsigned digit_count(0); digit_count < 3 and ch != end and IsOctalDigit(*ch); ++digit_count, ++ch)
        code = code * 8u + (*ch - '0');
    --ch;

    if (unlikely(code > 0377u))
        throw std::runtime_error("octal escape sequence out of range!");
    return static_cast<char>(code);
}


// "ch" points at the 'x'.  On return it points at the last hex digit consumed.
char DecodeHexadecimalEscapeSequence(std::string::const_iterator &ch, const std::string::const_iterator &end) {
    ++ch;
    if (unlikely(ch == end or not IsHexDigit(*ch)))
        throw std::runtime_error("missing hex digit after \\x!");

    unsigned code(0);
    for (unsigned digit_count(0); digit_count < 2 and ch != end and IsHexDigit(*ch); ++digit_count, ++ch)
        code = code * 16u + HexDigitValue(*ch);
    --ch;

    return static_cast<char>(code);
}


} // unnamed namespace


std::string &CStyleUnescape(std::string * const s) {
    std::string unescaped_string;
    bool backslash_seen(false);
    for (auto ch(s->cbegin()); ch != s->cend(); ++ch) {
        if (not backslash_seen) {
            if (*ch == '\\')
                backslash_seen = true;
            else
                unescaped_string += *ch;
        } else {
            switch (*ch) {
            case 'n':
                unescaped_string += '\n';
                break;
            case 't':
                unescaped_string += '\t';
                break;
            case 'b':
                unescaped_string += '\b';
                break;
            case 'r':
                unescaped_string += '\r';
                break;
            case 'f':
                unescaped_string += '\f';
                break;
            case 'v':
                unescaped_string += '\v';
                break;
            case 'a':
                unescaped_string += '\a';
                break;
            case '\\':
            case '"':
            case '#':
                unescaped_string += *ch;
                break;
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
                unescaped_string += DecodeOctalEscapeSequence(ch, s->cend());
                break;
            case 'x':
                unescaped_string += DecodeHexadecimalEscapeSequence(ch, s->cend());
                break;
            default:
                throw std::runtime_error("unknown escape sequence: backslash followed by '" + std::string(1, *ch) + "'!");
            }
            backslash_seen = false;
        }
    }

    if (unlikely(backslash_seen))
        throw std::runtime_error("trailing backslash at the end of \"" + *s + "\"!");

    s->swap(unescaped_string);
    return *s;
}


} // namespace TextUtil
