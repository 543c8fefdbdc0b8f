/** \file    StringUtil.h
 *  \brief   Declarations for Infomine string utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *  \author  Artur Kedzierski
 *  \author  Wagner Truppel
 *  \author  Walt Howard
 */

/*
 *  Copyright 2002-2009 Project iVia.
 *  Copyright 2002-2009 The Regents of The University of California.
 *  Copyright 2002-2004 Dr. Johannes Ruscheinski.
 *  Copyright 2015 Universitätsbibliothek Tübingen
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
#include <cstring>
#include <strings.h>
#include "Compiler.h"


namespace StringUtil {


extern const std::string WHITE_SPACE;


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string &Trim(const std::string &trim_set, std::string * const s);


inline std::string Trim(const std::string &s, const std::string &trim_set) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


inline std::string &TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief  Converts a string to a boolean value.
 *  \param  value  Must be one of "true", "false", "yes", "no", "on" or "off".
 *  \param  b      Where the value of "value" is being returned.
 *  \return True if "value" equals one of the recognized strings, otherwise false.
 *  \note   The capitalisation of the recognised strings does not matter.
 */
bool ToBool(const std::string &value, bool * const b);


/** \brief  Converts a string to a boolean value.
 *  \throws std::runtime_error if "value" is not one of the strings recognised by the two-argument version.
 */
bool ToBool(const std::string &value);


// \return The hex digit for the lower 4 bits of "nibble".
char ToHex(const unsigned nibble);


inline bool IsAsciiLetter(const char ch) {
    return (ch >= 'A' and ch <= 'Z') or (ch >= 'a' and ch <= 'z');
}


inline bool IsDigit(const char ch) {
    return ch >= '0' and ch <= '9';
}


inline bool IsAlphanumeric(const char ch) {
    return IsAsciiLetter(ch) or IsDigit(ch);
}


/** \brief  Splits "source" around "delimiter".
 *  \param  container                  Cleared, then receives the fields in order.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of fields stored in "container".
 */
template <typename InsertableContainer>
unsigned Split(const std::string &source, const char delimiter, InsertableContainer * const container,
               const bool suppress_empty_components = true) {
    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const auto next_delimiter(source.find(delimiter, start));
        const std::string component(source.substr(start, next_delimiter == std::string::npos ? std::string::npos
                                                                                               : next_delimiter - start));
        if (not component.empty() or not suppress_empty_components) {
            container->insert(container->end(), component);
            ++count;
        }

        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + 1;
    }
}


/** \brief  Split a string, then trim the component substrings' whitespace.
 *  \param  suppress_empty_components  If true, we skip components that are empty after trimming.
 *  \return The number of components stored in "container".
 */
template <typename InsertableContainer>
unsigned SplitThenTrimWhite(const std::string &source, const char delimiter, InsertableContainer * const container,
                            const bool suppress_empty_components = true) {
    InsertableContainer untrimmed_components;
    Split(source, delimiter, &untrimmed_components, /* suppress_empty_components = */ false);

    container->clear();
    unsigned count(0);
    for (const auto &untrimmed_component : untrimmed_components) {
        const std::string component(TrimWhite(untrimmed_component));
        if (component.empty() and suppress_empty_components)
            continue;
        container->insert(container->end(), component);
        ++count;
    }

    return count;
}


} // namespace StringUtil
