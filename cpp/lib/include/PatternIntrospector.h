/** \file   PatternIntrospector.h
 *  \brief  Discovery of the capture groups of a compiled pattern.
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


#include <set>
#include <stdexcept>
#include <string>
#include "RegexMatcher.h"


namespace RegexRecords {


// Thrown when the names or the number of the capture groups of a pattern can't be determined.
class IntrospectionError : public std::runtime_error {
public:
    explicit IntrospectionError(const std::string &err_msg): std::runtime_error(err_msg) { }
};


/** \brief What we know about the capture groups of a pattern.
 *  \note  "group_count_" includes the implicit group 0 and is therefore always at least 1.  Group 0 never has a name.
 */
struct GroupMetadata {
    std::set<std::string> group_names_;
    unsigned group_count_;

public:
    GroupMetadata(): group_count_(1) { }
    GroupMetadata(const std::set<std::string> &group_names, const unsigned group_count)
        : group_names_(group_names), group_count_(group_count) { }

    inline bool hasNamedGroups() const { return not group_names_.empty(); }
    std::string toString() const;
};


/** \class PatternIntrospector
 *  \brief Extracts the capture group names and the capture group count from a compiled pattern.
 *  \note  Both operations are called exactly once per pattern, when a Parser is constructed.  Implementations that can't
 *         deliver must throw an IntrospectionError, never guess.
 */
class PatternIntrospector {
public:
    virtual ~PatternIntrospector() = default;

    // \return The distinct names of all named capture groups, possibly none.
    virtual std::set<std::string> extractGroupNames(const RegexMatcher &pattern) const = 0;

    // \return The number of capture groups including group 0, e.g. 3 for "(a)(b)".
    virtual unsigned extractGroupCount(const RegexMatcher &pattern) const = 0;

    // Calls both of the above.
    GroupMetadata introspect(const RegexMatcher &pattern) const;
};


// The default.  Reads the name table and the capture count that PCRE keeps in every compiled pattern.
class PcrePatternIntrospector : public PatternIntrospector {
public:
    std::set<std::string> extractGroupNames(const RegexMatcher &pattern) const override;
    unsigned extractGroupCount(const RegexMatcher &pattern) const override;
};


/** \class FixedPatternIntrospector
 *  \brief Returns caller-supplied metadata and ignores the pattern.
 *  \note  This is the escape hatch for environments where PcrePatternIntrospector can't be used.  The Parser still checks
 *         the supplied names and count against the compiled pattern.
 */
class FixedPatternIntrospector : public PatternIntrospector {
    const std::set<std::string> group_names_;
    const unsigned group_count_;
public:
    FixedPatternIntrospector(const std::set<std::string> &group_names, const unsigned group_count)
        : group_names_(group_names), group_count_(group_count) { }

    std::set<std::string> extractGroupNames(const RegexMatcher &/*pattern*/) const override { return group_names_; }
    unsigned extractGroupCount(const RegexMatcher &pattern) const override;
};


} // namespace RegexRecords
