/** \file   Record.h
 *  \brief  The structured output produced for each regex match.
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
#pragma once


#include <optional>
#include <string>
#include <utility>
#include <vector>


namespace RegexRecords {


/** \class Record
 *  \brief An ordered list of named fields.  Field values are std::nullopt for capture groups that did not take part in
 *         the match, which is different from a group that captured the empty string.
 *  \note  Records can't be changed after they have been constructed.
 */
class Record {
public:
    struct Field {
        std::string name_;
        std::optional<std::string> value_;
    public:
        Field(const std::string &name, const std::optional<std::string> &value): name_(name), value_(value) { }

        inline bool operator==(const Field &rhs) const { return name_ == rhs.name_ and value_ == rhs.value_; }
        inline bool operator!=(const Field &rhs) const { return not operator==(rhs); }
    };

    typedef std::vector<Field>::const_iterator const_iterator;
private:
    std::vector<Field> fields_;
public:
    Record() = default;
    explicit Record(std::vector<Field> &&fields): fields_(std::move(fields)) { }

    inline size_t size() const { return fields_.size(); }
    inline bool empty() const { return fields_.empty(); }
    inline const_iterator begin() const { return fields_.cbegin(); }
    inline const_iterator end() const { return fields_.cend(); }

    const_iterator find(const std::string &field_name) const;
    inline bool hasField(const std::string &field_name) const { return find(field_name) != end(); }

    /** \return The value of the field named "field_name", std::nullopt for an absent value.
     *  \throws std::out_of_range if there is no field named "field_name".
     */
    const std::optional<std::string> &getValue(const std::string &field_name) const;

    std::vector<std::string> getFieldNames() const;

    inline bool operator==(const Record &rhs) const { return fields_ == rhs.fields_; }
    inline bool operator!=(const Record &rhs) const { return not operator==(rhs); }

    // \return A JSON object, e.g. {"alpha":"abc","0":"abc 123","1":null}, with the fields in order.
    std::string toString() const;
};


} // namespace RegexRecords
