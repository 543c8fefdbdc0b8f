/** \file   Record.cc
 *  \brief  Implementation of the Record class.
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "Record.h"
#include <algorithm>
#include <stdexcept>
#include "Compiler.h"
#include "JSON.h"


namespace RegexRecords {


Record::const_iterator Record::find(const std::string &field_name) const {
    return std::find_if(fields_.cbegin(), fields_.cend(), [&field_name](const Field &field) { return field.name_ == field_name; });
}


const std::optional<std::string> &Record::getValue(const std::string &field_name) const {
    const auto field(find(field_name));
    if (unlikely(field == end()))
        throw std::out_of_range("in RegexRecords::Record::getValue: no field named \"" + field_name + "\"!");
    return field->value_;
}


std::vector<std::string> Record::getFieldNames() const {
    std::vector<std::string> field_names;
    field_names.reserve(fields_.size());
    for (const auto &field : fields_)
        field_names.emplace_back(field.name_);

    return field_names;
}


std::string Record::toString() const {
    std::string as_string("{");
    for (const auto &field : fields_) {
        if (as_string.length() > 1)
            as_string += ',';
        as_string += "\"" + JSON::EscapeString(field.name_) + "\":" + JSON::ToStringOrNull(field.value_);
    }
    as_string += '}';

    return as_string;
}


} // namespace RegexRecords
