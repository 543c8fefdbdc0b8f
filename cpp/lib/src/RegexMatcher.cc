/** \file   RegexMatcher.cc
 *  \brief  Implementation of the RegexMatcher class.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2015-2024 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "RegexMatcher.h"
#include <algorithm>
#include "Compiler.h"
#include "util.h"


namespace {


bool PCRESupportsUTF8() {
    int utf8_available;
    if (::pcre_config(PCRE_CONFIG_UTF8, reinterpret_cast<void *>(&utf8_available)) == PCRE_ERROR_BADOPTION)
        return false;
    return utf8_available == 1;
}


void CompileRegex(const std::string &pattern, const unsigned options, ::pcre **pcre_arg, ::pcre_extra **pcre_extra_arg) {
    if (options & RegexMatcher::ENABLE_UTF8) {
        static const bool utf8_supported(PCRESupportsUTF8());
        if (unlikely(not utf8_supported))
            throw PatternCompileError("This version of the PCRE library does not support UTF8!");
    }

    int pcre_options(0);
    if (options & RegexMatcher::ENABLE_UTF8)
        pcre_options |= PCRE_UTF8;
    if (options & RegexMatcher::ENABLE_UCP)
        pcre_options |= PCRE_UCP;
    if (options & RegexMatcher::CASE_INSENSITIVE)
        pcre_options |= PCRE_CASELESS;
    if (options & RegexMatcher::MULTILINE)
        pcre_options |= PCRE_MULTILINE;

    const char *errptr;
    int erroffset;
    *pcre_arg = ::pcre_compile(pattern.c_str(), pcre_options, &errptr, &erroffset, nullptr);
    if (*pcre_arg == nullptr) {
        *pcre_extra_arg = nullptr;
        throw PatternCompileError("failed to compile invalid regular expression: \"" + pattern + "\"! (" + std::string(errptr)
                                  + " at offset " + std::to_string(erroffset) + ")");
    }

    // Can't use PCRE_STUDY_JIT_COMPILE because it's not thread safe.
    *pcre_extra_arg = ::pcre_study(*pcre_arg, 0, &errptr);
    if (*pcre_extra_arg == nullptr and errptr != nullptr) {
        ::pcre_free(*pcre_arg);
        *pcre_arg = nullptr;
        throw PatternCompileError("failed to \"study\" the compiled pattern \"" + pattern + "\"! (" + std::string(errptr) + ")");
    }
}


} // unnamed namespace


RegexMatcher::MatchResult::MatchResult(const std::string &subject, const size_t substr_indices_size)
    : subject_(&subject), matched_(false), match_count_(0), substr_indices_(substr_indices_size, -1) { }


bool RegexMatcher::MatchResult::participated(const unsigned group) const {
    if (group >= match_count_)
        return false;
    return substr_indices_[group * 2] >= 0;
}


std::optional<std::string> RegexMatcher::MatchResult::getGroup(const unsigned group) const {
    if (not participated(group))
        return std::nullopt;

    const unsigned first_index(group * 2);
    return subject_->substr(substr_indices_[first_index], substr_indices_[first_index + 1] - substr_indices_[first_index]);
}


std::string RegexMatcher::MatchResult::operator[](const unsigned group) const {
    if (unlikely(group >= match_count_)) {
        throw std::out_of_range("in RegexMatcher::MatchResult::operator[]: group(" + std::to_string(group) + ") >= "
                                + std::to_string(match_count_) + "!");
    }

    const auto captured_text(getGroup(group));
    return captured_text ? *captured_text : "";
}


RegexMatcher::RegexMatcher(const std::string &pattern, const unsigned options)
    : pattern_(pattern), options_(options), pcre_data_(new PcreData), substr_indices_size_(MAX_SUBSTRING_MATCHES * 3)
{
    CompileRegex(pattern_, options_, &pcre_data_->pcre_, &pcre_data_->pcre_extra_);

    // PCRE needs one third of the vector as scratch space, hence the factor of 3.
    int capture_count;
    if (likely(getInfo(PCRE_INFO_CAPTURECOUNT, &capture_count) == 0))
        substr_indices_size_ = (static_cast<size_t>(capture_count) + 1) * 3;
    else
        LOG_WARNING("can't determine the number of groups of \"" + pattern_ + "\", we only support "
                    + std::to_string(MAX_SUBSTRING_MATCHES - 1) + " substrings!");
}


RegexMatcher::MatchResult RegexMatcher::match(const std::string &subject, const size_t subject_start_offset, size_t * const start_pos,
                                              size_t * const end_pos, const unsigned match_flags) const
{
    MatchResult match_result(subject, substr_indices_size_);
    if (unlikely(subject.length() > MAX_SUBJECT_LENGTH)) {
        match_result.error_message_ = "subject too long for PCRE (" + std::to_string(subject.length()) + " bytes, at most "
                                      + std::to_string(MAX_SUBJECT_LENGTH) + " are supported)";
        return match_result;
    }
    if (unlikely(subject_start_offset > subject.length())) {
        match_result.error_message_ = "start offset " + std::to_string(subject_start_offset) + " is past the end of the subject ("
                                      + std::to_string(subject.length()) + " bytes)";
        return match_result;
    }

    const int exec_options((match_flags & SKIP_UTF8_CHECK) ? PCRE_NO_UTF8_CHECK : 0);
    const int retcode(::pcre_exec(pcre_data_->pcre_, pcre_data_->pcre_extra_, subject.data(), static_cast<int>(subject.length()),
                                  static_cast<int>(subject_start_offset), exec_options, &match_result.substr_indices_[0],
                                  static_cast<int>(match_result.substr_indices_.size())));

    if (retcode == 0) {
        match_result.error_message_ = "Too many captured substrings! (We only support "
                                      + std::to_string(match_result.substr_indices_.size() / 3 - 1) + " substrings.)";
        return match_result;
    }

    if (retcode > 0) {
        match_result.match_count_ = retcode;
        match_result.matched_ = true;
        if (start_pos != nullptr)
            *start_pos = match_result.substr_indices_[0];
        if (end_pos != nullptr)
            *end_pos = match_result.substr_indices_[1];

        return match_result;
    }

    switch (retcode) {
    case PCRE_ERROR_NOMATCH:
        break;
    case PCRE_ERROR_BADUTF8:
        match_result.error_message_ = "invalid UTF-8 in subject";
        break;
    case PCRE_ERROR_BADUTF8_OFFSET:
        match_result.error_message_ = "start offset " + std::to_string(subject_start_offset) + " is not at the start of a UTF-8 character";
        break;
    case PCRE_ERROR_MATCHLIMIT:
        match_result.error_message_ = "PCRE match limit exceeded for pattern '" + pattern_ + "'";
        break;
    case PCRE_ERROR_RECURSIONLIMIT:
        match_result.error_message_ = "PCRE recursion limit exceeded for pattern '" + pattern_ + "'";
        break;
    default:
        match_result.error_message_ = "unknown PCRE error for pattern '" + pattern_ + "': " + std::to_string(retcode);
    }

    return match_result;
}


std::vector<unsigned> RegexMatcher::getGroupNumbers(const std::string &group_name) const {
    std::vector<unsigned> group_numbers;

    // Each name table entry starts with the group number as a big-endian 16 bit integer.
    char *first, *last;
    const int entry_size(::pcre_get_stringtable_entries(pcre_data_->pcre_, group_name.c_str(), &first, &last));
    if (entry_size <= 0)
        return group_numbers;

    for (const char *entry(first); entry <= last; entry += entry_size) {
        const auto * const number_bytes(reinterpret_cast<const unsigned char *>(entry));
        group_numbers.emplace_back((static_cast<unsigned>(number_bytes[0]) << 8u) | number_bytes[1]);
    }
    std::sort(group_numbers.begin(), group_numbers.end());

    return group_numbers;
}


int RegexMatcher::getInfo(const int what, void * const where) const {
    return ::pcre_fullinfo(pcre_data_->pcre_, pcre_data_->pcre_extra_, what, where);
}
