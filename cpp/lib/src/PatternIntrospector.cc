/** \file   PatternIntrospector.cc
 *  \brief  Implementation of the pattern introspectors.
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
#include "PatternIntrospector.h"
#include "Compiler.h"


namespace RegexRecords {


std::string GroupMetadata::toString() const {
    std::string as_string("names: {");
    bool first(true);
    for (const auto &group_name : group_names_) {
        if (not first)
            as_string += ", ";
        as_string += group_name;
        first = false;
    }
    as_string += "}, count: " + std::to_string(group_count_);

    return as_string;
}


GroupMetadata PatternIntrospector::introspect(const RegexMatcher &pattern) const {
    return GroupMetadata(extractGroupNames(pattern), extractGroupCount(pattern));
}


namespace {


void GetPatternInfo(const RegexMatcher &pattern, const int what, const std::string &what_as_string, void * const where) {
    const int retcode(pattern.getInfo(what, where));
    if (unlikely(retcode != 0))
        throw IntrospectionError("pcre_fullinfo(" + what_as_string + ") failed for \"" + pattern.getPattern() + "\" (error code "
                                 + std::to_string(retcode) + ")!");
}


} // unnamed namespace


std::set<std::string> PcrePatternIntrospector::extractGroupNames(const RegexMatcher &pattern) const {
    int name_count;
    GetPatternInfo(pattern, PCRE_INFO_NAMECOUNT, "PCRE_INFO_NAMECOUNT", &name_count);
    if (name_count == 0)
        return {};

    int name_entry_size;
    GetPatternInfo(pattern, PCRE_INFO_NAMEENTRYSIZE, "PCRE_INFO_NAMEENTRYSIZE", &name_entry_size);
    const unsigned char *name_table;
    GetPatternInfo(pattern, PCRE_INFO_NAMETABLE, "PCRE_INFO_NAMETABLE", &name_table);

    // Each entry is the group number as a 2-byte big-endian integer followed by the NUL-terminated name.
    std::set<std::string> group_names;
    for (int entry_no(0); entry_no < name_count; ++entry_no) {
        const unsigned char * const entry(name_table + entry_no * name_entry_size);
        group_names.emplace(reinterpret_cast<const char *>(entry + 2));
    }

    return group_names;
}


unsigned PcrePatternIntrospector::extractGroupCount(const RegexMatcher &pattern) const {
    int capture_count;
    GetPatternInfo(pattern, PCRE_INFO_CAPTURECOUNT, "PCRE_INFO_CAPTURECOUNT", &capture_count);
    if (unlikely(capture_count < 0))
        throw IntrospectionError("PCRE reported a negative capture count for \"" + pattern.getPattern() + "\"!");

    return static_cast<unsigned>(capture_count) + 1;
}


unsigned FixedPatternIntrospector::extractGroupCount(const RegexMatcher &pattern) const {
    if (unlikely(group_count_ == 0))
        throw IntrospectionError("a group count of 0 was supplied for \"" + pattern.getPattern() + "\" but group 0 always exists!");
    return group_count_;
}


} // namespace RegexRecords
