/** \file   RegexRecordParser.cc
 *  \brief  Implementation of the RegexRecords::Parser class.
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
#include "RegexRecordParser.h"
#include <algorithm>
#include <iterator>
#include "Compiler.h"
#include "TextUtil.h"
#include "util.h"


namespace RegexRecords {


Parser::Parser(const std::string &regex, const bool include_all_groups, const unsigned options)
    : Parser(regex, include_all_groups, PcrePatternIntrospector(), options) { }


Parser::Parser(const std::string &regex, const bool include_all_groups, const PatternIntrospector &introspector,
               const unsigned options)
    : pattern_(regex, options), include_all_groups_(include_all_groups), group_metadata_(introspector.introspect(pattern_))
{
    if (unlikely(group_metadata_.group_count_ == 0))
        throw IntrospectionError("group count of 0 for \"" + regex + "\"!");
    resolveGroupNames();

    LOG_DEBUG("pattern \"" + regex + "\": " + group_metadata_.toString());
}


void Parser::resolveGroupNames() {
    for (const auto &group_name : group_metadata_.group_names_) {
        const auto group_numbers(pattern_.getGroupNumbers(group_name));
        if (unlikely(group_numbers.empty() or group_numbers.front() == 0))
            throw IntrospectionError("\"" + group_name + "\" is not the name of a capture group in \"" + pattern_.getPattern() + "\"!");
        if (unlikely(group_numbers.back() >= group_metadata_.group_count_))
            throw IntrospectionError("group \"" + group_name + "\" has number " + std::to_string(group_numbers.back())
                                     + " which is not less than the group count " + std::to_string(group_metadata_.group_count_)
                                     + " of \"" + pattern_.getPattern() + "\"!");
        named_groups_.emplace_back(group_name, group_numbers);
    }

    std::sort(named_groups_.begin(), named_groups_.end(),
              [](const std::pair<std::string, std::vector<unsigned>> &lhs, const std::pair<std::string, std::vector<unsigned>> &rhs) {
                  return lhs.second.front() < rhs.second.front();
              });
}


Record Parser::project(const RegexMatcher::MatchResult &match_result) const {
    std::vector<Record::Field> fields;
    for (const auto &name_and_numbers : named_groups_) {
        std::optional<std::string> captured_text;
        for (const unsigned group : name_and_numbers.second) {
            if (match_result.participated(group)) {
                captured_text = match_result.getGroup(group);
                break;
            }
        }
        fields.emplace_back(name_and_numbers.first, captured_text);
    }

    if (include_all_groups_ or not group_metadata_.hasNamedGroups()) {
        for (unsigned group(0); group < group_metadata_.group_count_; ++group)
            fields.emplace_back(std::to_string(group), match_result.getGroup(group));
    }

    return Record(std::move(fields));
}


std::vector<Record> Parser::parse(const std::string &payload) const {
    std::vector<Record> records;

    // the matches need to be sequentially sorted from left to right
    size_t subject_start_offset(0), match_start_offset(0), match_end_offset(0);
    unsigned match_flags(0);
    while (subject_start_offset <= payload.length()) {
        const auto match_result(pattern_.match(payload, subject_start_offset, &match_start_offset, &match_end_offset, match_flags));
        if (unlikely(not match_result.getErrorMessage().empty()))
            throw MatchError("in RegexRecords::Parser::parse: search for \"" + pattern_.getPattern() + "\" starting at offset "
                             + std::to_string(subject_start_offset) + " failed: " + match_result.getErrorMessage());
        if (not match_result)
            break;

        records.emplace_back(project(match_result));

        // PCRE has validated "payload" during the first call.
        match_flags = RegexMatcher::SKIP_UTF8_CHECK;

        // An empty match would be found again at the same offset, so we have to move on by at least one character.
        if (match_end_offset == match_start_offset)
            subject_start_offset = pattern_.utf8Enabled() ? TextUtil::NextUTF8CodePointOffset(payload, match_end_offset)
                                                          : match_end_offset + 1;
        else
            subject_start_offset = match_end_offset;
    }

    return records;
}


std::vector<Record> ParseAll(const Parser &parser, const std::vector<std::string> &payloads) {
    std::vector<Record> records;
    for (const auto &payload : payloads) {
        auto payload_records(parser.parse(payload));
        std::move(payload_records.begin(), payload_records.end(), std::back_inserter(records));
    }

    return records;
}


std::string ExtractionStats::toString() const {
    return "extracted " + std::to_string(record_count_) + " record(s) from " + std::to_string(payload_count_) + " payload(s), "
           + std::to_string(failed_payload_count_) + " payload(s) failed.";
}


void ProcessPayload(const Parser &parser, const std::string &payload, std::ostream &output, ExtractionStats * const stats) {
    ++stats->payload_count_;

    std::vector<Record> records;
    try {
        records = parser.parse(payload);
    } catch (const MatchError &x) {
        ++stats->failed_payload_count_;
        LOG_WARNING("skipping payload #" + std::to_string(stats->payload_count_) + ": " + std::string(x.what()));
        return;
    }

    for (const auto &record : records)
        output << record.toString() << '\n';
    stats->record_count_ += records.size();
}


void ProcessPayloads(const Parser &parser, std::istream &input, std::ostream &output, ExtractionStats * const stats) {
    std::string line;
    while (std::getline(input, line))
        ProcessPayload(parser, line, output, stats);
}


} // namespace RegexRecords
