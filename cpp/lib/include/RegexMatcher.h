/** \file   RegexMatcher.h
 *  \brief  Interface for the RegexMatcher class.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2014-2024 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <pcre.h>


class PatternCompileError : public std::runtime_error {
public:
    explicit PatternCompileError(const std::string &err_msg): std::runtime_error(err_msg) { }
};


// Thrown when PCRE reports anything but "no match" while matching.
class MatchError : public std::runtime_error {
public:
    explicit MatchError(const std::string &err_msg): std::runtime_error(err_msg) { }
};


/** \class RegexMatcher
 *  \brief Wrapper class for the PCRE library.
 *  \note  Instances are immutable after construction.  Copies share the compiled pattern and all state of an individual
 *         match lives in the returned MatchResult, so a single instance may be used by several threads at once.
 */
class RegexMatcher {
public:
    class MatchResult {
        friend class RegexMatcher;

        const std::string *subject_;
        bool matched_;
        unsigned match_count_;
        std::vector<int> substr_indices_;
        std::string error_message_;
    public:
        /** \note "subject" is not copied and must outlive the MatchResult.  This is why RegexMatcher::match() refuses
         *        temporaries.
         */
        MatchResult(const std::string &subject, const size_t substr_indices_size);
        MatchResult(const MatchResult &) = default;
        MatchResult(MatchResult &&) = default;
        MatchResult &operator=(const MatchResult &) = default;

        inline operator bool() const { return matched_; }

        /** \return 1 + the number of the highest-numbered group that took part in the match, 0 if we didn't match. */
        inline unsigned size() const { return match_count_; }

        /** \return A non-empty string if PCRE reported an error other than "no match". */
        inline const std::string &getErrorMessage() const { return error_message_; }

        inline size_t getStartOffset() const { return static_cast<size_t>(substr_indices_[0]); }
        inline size_t getEndOffset() const { return static_cast<size_t>(substr_indices_[1]); }

        /** \return True if capture group "group" captured something, possibly the empty string, in this match. */
        bool participated(const unsigned group) const;

        /** \return The text captured by "group" or std::nullopt if "group" did not take part in the match or does
         *          not exist.
         */
        std::optional<std::string> getGroup(const unsigned group) const;

        /** \brief Returns either the full match or a matched substring.
         *  \param group  When "group" is 0, the full match will be returned, o/w the n-th substring match.  Groups
         *                that did not participate yield the empty string.
         *  \throws std::out_of_range when "group" is not less than size().
         */
        std::string operator[](const unsigned group) const;
    };

    // We need this wrapper class to use the incomplete
    // PCRE types with the STL smart pointers
    struct PcreData {
        ::pcre *pcre_;
        ::pcre_extra *pcre_extra_;
    public:
        PcreData(): pcre_(nullptr), pcre_extra_(nullptr) { }
        ~PcreData() {
            if (pcre_extra_ != nullptr)
                ::pcre_free_study(pcre_extra_);

            if (pcre_ != nullptr)
                ::pcre_free(pcre_);
        }
    };

    enum Option { ENABLE_UTF8 = 1, CASE_INSENSITIVE = 2, MULTILINE = 4, ENABLE_UCP = 8 }; // These need to be powers of 2.
    enum MatchFlag { SKIP_UTF8_CHECK = 1 };
private:
    // Used when PCRE won't tell us how many groups a pattern has.
    static constexpr size_t MAX_SUBSTRING_MATCHES = 40;
public:
    // pcre_exec(3) takes lengths and offsets as ints.
    static constexpr size_t MAX_SUBJECT_LENGTH = static_cast<size_t>(std::numeric_limits<int>::max());
private:

    const std::string pattern_;
    const unsigned options_;
    std::shared_ptr<PcreData> pcre_data_;
    size_t substr_indices_size_;
public:
    /** \throws PatternCompileError if "pattern" is not a valid PCRE pattern. */
    explicit RegexMatcher(const std::string &pattern, const unsigned options = ENABLE_UTF8);
    RegexMatcher(const RegexMatcher &rhs) = default;
    RegexMatcher &operator=(const RegexMatcher &) = delete;

    inline const std::string &getPattern() const { return pattern_; }
    inline unsigned getOptions() const { return options_; }
    inline bool utf8Enabled() const { return options_ & ENABLE_UTF8; }
    inline bool caseInsensitive() const { return options_ & CASE_INSENSITIVE; }

    /** \brief Searches "subject" for the first match that starts at or after "subject_start_offset".
     *  \param match_flags  Or'ed together values of type enum MatchFlag.  Pass SKIP_UTF8_CHECK only if "subject" has
     *                      already been accepted by an earlier call.
     *  \note  In the case of a successful match, "start_pos" and "end_pos" will point to the first and last+1
     *         character of the matched part of "subject" respectively.
     */
    MatchResult match(const std::string &subject, const size_t subject_start_offset = 0, size_t * const start_pos = nullptr,
                      size_t * const end_pos = nullptr, const unsigned match_flags = 0) const;

    // The returned MatchResult would refer to a destroyed subject.
    MatchResult match(std::string &&subject, const size_t subject_start_offset = 0, size_t * const start_pos = nullptr,
                      size_t * const end_pos = nullptr, const unsigned match_flags = 0) const = delete;
    MatchResult match(const char * const subject, const size_t subject_start_offset = 0, size_t * const start_pos = nullptr,
                      size_t * const end_pos = nullptr, const unsigned match_flags = 0) const = delete;

    /** \return The numbers of all capture groups named "group_name" in ascending order.  There can be more than one if
     *          the pattern uses (?J).  An empty vector means that there is no such group.
     */
    std::vector<unsigned> getGroupNumbers(const std::string &group_name) const;

    /** \brief Thin wrapper around pcre_fullinfo(3).
     *  \return PCRE's return code, 0 on success and negative on failure.
     */
    int getInfo(const int what, void * const where) const;
};
