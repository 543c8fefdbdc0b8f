/** \file   RegexRecordParser.h
 *  \brief  Turns text into records, one record per regex match.
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


#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "PatternIntrospector.h"
#include "Record.h"
#include "RegexMatcher.h"


namespace RegexRecords {


/** \class Parser
 *  \brief Applies a regular expression to a payload and emits one Record per non-overlapping match.
 *
 *  For the pattern "(?<alpha>[a-z]+) ([0-9]+)" and the payload "abc 123 efg 456" we produce the two records
 *  {"alpha":"abc","0":"abc 123","1":"abc","2":"123"} and {"alpha":"efg","0":"efg 456","1":"efg","2":"456"}.
 *
 *  Named capture groups become fields of the same name.  If "include_all_groups" is true, or if the pattern has no named
 *  groups at all, every group, including group 0 for the whole match, also becomes a field named after its number.
 *  Named fields come first, ordered by group number, followed by the numbered fields.  If (?J) gives several groups
 *  the same name, the named field holds the capture of the first of those groups that took part in the match.
 *
 *  \note The pattern and its group metadata are fixed at construction time and parse() has no side effects, so a Parser
 *        can be shared by any number of threads.
 */
class Parser {
    const RegexMatcher pattern_;
    const bool include_all_groups_;
    GroupMetadata group_metadata_;
    // Names and their group numbers, ordered by the lowest group number.  (?J) allows several groups of the same name.
    std::vector<std::pair<std::string, std::vector<unsigned>>> named_groups_;
public:
    /** \throws PatternCompileError if "regex" does not compile.
     *  \throws IntrospectionError if PCRE won't tell us about the capture groups.
     */
    explicit Parser(const std::string &regex, const bool include_all_groups = true,
                    const unsigned options = RegexMatcher::ENABLE_UTF8);

    /** \brief Like the above but "introspector" determines the capture group metadata.
     *  \throws IntrospectionError if "introspector" fails or returns names that are not group names of "regex" or a
     *          group count that doesn't cover them.
     */
    Parser(const std::string &regex, const bool include_all_groups, const PatternIntrospector &introspector,
           const unsigned options = RegexMatcher::ENABLE_UTF8);

    inline const std::string &getPattern() const { return pattern_.getPattern(); }
    inline bool includeAllGroups() const { return include_all_groups_; }
    inline const GroupMetadata &getGroupMetadata() const { return group_metadata_; }

    /** \brief Finds all non-overlapping matches in "payload", from left to right.
     *  \return One record per match, in the order of the match start positions.  Empty if nothing matched.
     *  \throws MatchError if PCRE fails while searching, e.g. because "payload" is not valid UTF-8 in UTF-8 mode.
     */
    std::vector<Record> parse(const std::string &payload) const;
private:
    void resolveGroupNames();
    Record project(const RegexMatcher::MatchResult &match_result) const;
};


// \return The records for all "payloads", in order.
std::vector<Record> ParseAll(const Parser &parser, const std::vector<std::string> &payloads);


struct ExtractionStats {
    unsigned payload_count_;
    unsigned failed_payload_count_;
    size_t record_count_;

public:
    ExtractionStats(): payload_count_(0), failed_payload_count_(0), record_count_(0) { }

    // \return Something like "extracted 3 record(s) from 2 payload(s), 1 payload(s) failed."
    std::string toString() const;
};


/** \brief Writes the records for "payload" to "output", one JSON object per line, and updates "stats".
 *  \note  A MatchError only costs us the records of "payload": we log a warning and count the payload as failed.
 */
void ProcessPayload(const Parser &parser, const std::string &payload, std::ostream &output, ExtractionStats * const stats);


// Like ProcessPayload() for each line of "input" until EOF.
void ProcessPayloads(const Parser &parser, std::istream &input, std::ostream &output, ExtractionStats * const stats);


} // namespace RegexRecords
