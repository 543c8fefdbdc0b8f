/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Wagner Truppel
 *  \author  Paul Vander Griend
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2002-2005 Dr. Johannes Ruscheinski.
 *  Copyright 2017 Universitätsbibliothek Tübingen
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
#include "StringUtil.h"
#include <stdexcept>


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\f\r");


std::string &Trim(const std::string &trim_set, std::string * const s) {
    const auto first_kept(s->find_first_not_of(trim_set));
    if (first_kept == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last_kept(s->find_last_not_of(trim_set));
    *s = s->substr(first_kept, last_kept - first_kept + 1);
    return *s;
}


bool ToBool(const std::string &value, bool * const b) {
    if (::strcasecmp(value.c_str(), "true") == 0 or ::strcasecmp(value.c_str(), "yes") == 0
        or ::strcasecmp(value.c_str(), "on") == 0)
    {
        *b = true;
        return true;
    }

    if (::strcasecmp(value.c_str(), "false") == 0 or ::strcasecmp(value.c_str(), "off") == 0
        or ::strcasecmp(value.c_str(), "no") == 0)
    {
        *b = false;
        return true;
    }

    return false;
}


bool ToBool(const std::string &value) {
    bool b;
    if (likely(ToBool(value, &b)))
        return b;

    throw std::runtime_error("in StringUtil::ToBool: can't convert \"" + value + "\" to a bool!");
}


char ToHex(const unsigned nibble) {
    static const char HEX_DIGITS[] = "0123456789ABCDEF";
    return HEX_DIGITS[nibble & 0xFu];
}


} // namespace StringUtil
