/** \file   JSON.h
 *  \brief  JSON output helpers.
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
#pragma once


#include <optional>
#include <string>


namespace JSON {


// Escapes control codes, backslashes, double quotes, form feeds, newlines, carriage returns, and tab characters.
std::string EscapeString(const std::string &unescaped_string);


// \return "value" escaped and in double quotes, or null if "value" is std::nullopt.
std::string ToStringOrNull(const std::optional<std::string> &value);


} // namespace JSON
