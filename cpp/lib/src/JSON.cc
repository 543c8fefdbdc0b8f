/** \file   JSON.cc
 *  \brief  Implementation of the JSON output helpers.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2017-2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "JSON.h"
#include "StringUtil.h"


namespace JSON {


std::string EscapeString(const std::string &unescaped_string) {
    std::string escaped_string;
    escaped_string.reserve(unescaped_string.length());
    for (const char ch : unescaped_string) {
        switch (ch) {
        case '\\':
            escaped_string += "\\\\";
            break;
        case '"':
            escaped_string += "\\\"";
            break;
        case '\b':
            escaped_string += "\\b";
            break;
        case '\f':
            escaped_string += "\\f";
            break;
        case '\n':
            escaped_string += "\\n";
            break;
        case '\r':
            escaped_string += "\\r";
            break;
        case '\t':
            escaped_string += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(ch) > 0x1Fu)
                escaped_string += ch;
            else { // Escape control characters.
                escaped_string += "\\u00";
                escaped_string += StringUtil::ToHex(static_cast<unsigned char>(ch) >> 4u);
                escaped_string += StringUtil::ToHex(static_cast<unsigned char>(ch) & 0xFu);
            }
        }
    }

    return escaped_string;
}


std::string ToStringOrNull(const std::optional<std::string> &value) {
    return value ? "\"" + EscapeString(*value) + "\"" : "null";
}


} // namespace JSON
