/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Artur Kedzierski
 *  \author  Dr. Gordon W. Paynter
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2024 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include "Compiler.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment,
                              const DupeInsertionBehaviour dupe_insertion_behaviour)
{
    // Handle comment-only lines first:
    if (variable_name.empty() and value.empty()) {
        entries_.emplace_back("", "", comment);
        return;
    }

    if (dupe_insertion_behaviour == ABORT_ON_DUPLICATE_NAME and unlikely(hasEntry(variable_name)))
        throw std::runtime_error("in IniFile::Section::insert: duplicate variable name \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");

    replace(variable_name, value, comment);
}


void IniFile::Section::replace(const std::string &variable_name, const std::string &value, const std::string &comment) {
    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value, comment);
    else {
        existing_entry->value_ = value;
        existing_entry->comment_ = comment;
    }
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    return existing_entry->value_;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    bool retval;
    if (not StringUtil::ToBool(existing_entry->value_, &retval))
        LOG_ERROR("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name + "\" (bad value is \""
                  + existing_entry->value_ + "\")!");

    return retval;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name) {
    processFile(ini_file_name_);
}


std::string IniFile::getCurrentLocation() const {
    return "line " + std::to_string(include_file_infos_.top().current_lineno_) + " in file \"" + getCurrentFile() + "\"";
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on " + getCurrentLocation() + "!");

    current_section_name_ = line.substr(1, line.length() - 2);
    StringUtil::Trim(" \t", &current_section_name_);
    if (current_section_name_.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on " + getCurrentLocation() + "!");

    if (sectionIsDefined(current_section_name_))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + current_section_name_ + "\" on "
                                 + getCurrentLocation() + "!");
    sections_.emplace_back(current_section_name_);
}


void IniFile::processInclude(const std::string &line) {
    if (unlikely(line.find('=') != std::string::npos))
        throw std::runtime_error("in IniFile::processInclude: unexpected '=' on " + getCurrentLocation() + "!");

    std::string include_filename(line.substr(__builtin_strlen("include")));
    StringUtil::Trim(" \t", &include_filename);
    if (include_filename[0] == '"') {
        if (include_filename.length() < 3 or include_filename[include_filename.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processInclude: garbled include file name on " + getCurrentLocation() + "!");
        include_filename = include_filename.substr(1, include_filename.length() - 2);
    }

    if (include_filename[0] != '/') {
        const auto last_slash(getCurrentFile().rfind('/'));
        if (last_slash != std::string::npos)
            include_filename = getCurrentFile().substr(0, last_slash + 1) + include_filename;
    }

    processFile(include_filename);
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens, underscores and periods.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not StringUtil::IsAsciiLetter(*ch))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not StringUtil::IsAlphanumeric(*ch) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


// Moves a trailing comment, starting at an unescaped hash mark outside of double quotes, from "line" to "comment".
void StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"' and (character == line->begin() or *(character - 1) != '\\'))
            inside_string_literal = not inside_string_literal;
        else if (*character == '#') {
            if (inside_string_literal or (character != line->begin() and *(character - 1) == '\\'))
                continue;

            size_t comment_start_pos(std::distance(line->begin(), character));
            while (comment_start_pos > 0 and (*line)[comment_start_pos - 1] == ' ')
                --comment_start_pos;
            *comment = line->substr(comment_start_pos);
            line->resize(comment_start_pos);
            return;
        }
    }
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // A bare name is shorthand for "name = true".
        const std::string trimmed_line(StringUtil::TrimWhite(line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + trimmed_line + "\" on "
                                     + getCurrentLocation() + "!");

        sections_.back().insert(trimmed_line, "true", comment);
        return;
    }

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (variable_name.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable name on " + getCurrentLocation() + "!");
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on "
                                 + getCurrentLocation() + "!");

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);
    if (value.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable value on " + getCurrentLocation() + "!");

    if (value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on " + getCurrentLocation() + "!");

        value = value.substr(1, value.length() - 2);
        try {
            TextUtil::CStyleUnescape(&value);
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape on " + getCurrentLocation() + "! ("
                                     + std::string(x.what()) + ")");
        }
    }

    try {
        sections_.back().insert(variable_name, value, comment);
    } catch (const std::runtime_error &x) {
        throw std::runtime_error(std::string(x.what()) + " (" + getCurrentLocation() + ")");
    }
}


void IniFile::processFile(const std::string &filename) {
    std::ifstream ini_file(filename.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::processFile: can't open \"" + filename + "\"! (" + std::string(std::strerror(errno)) + ")");

    include_file_infos_.push(IncludeFileInfo(filename));

    std::string physical_line;
    while (std::getline(ini_file, physical_line)) {
        ++getCurrentLineNo();
        std::string line(StringUtil::Trim(physical_line, " \t\r"));

        // Join lines ending in a backslash with their successors:
        while (not line.empty() and line[line.length() - 1] == '\\') {
            line = StringUtil::Trim(line.substr(0, line.length() - 1), " \t");
            if (not std::getline(ini_file, physical_line))
                throw std::runtime_error("in IniFile::processFile: continuation line expected after " + getCurrentLocation() + "!");
            ++getCurrentLineNo();
            line += StringUtil::Trim(physical_line, " \t\r");
        }

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty()) {
            if (sections_.empty())
                sections_.emplace_back("");
            sections_.back().insert("", "", comment);
            continue;
        }

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else if (line.length() > 7 and StringUtil::StartsWith(line, "include") and (line[7] == ' ' or line[7] == '\t'))
            processInclude(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line, comment);
        }
    }

    include_file_infos_.pop();
}


const IniFile::Section &IniFile::getSectionOrDie(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\" in \"" + ini_file_name_ + "\"! (variable: \"" + variable_name + "\")");

    return *section;
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrDie(section_name, variable_name).getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const auto section(getSection(section_name));
    return section == sections_.cend() ? default_value : section->getString(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrDie(section_name, variable_name).getBool(variable_name);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const auto section(getSection(section_name));
    return section == sections_.cend() ? default_value : section->getBool(variable_name, default_value);
}
