/** \file   ParserConfig.h
 *  \brief  Settings and command-line handling for regex_to_records.
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


#include <string>
#include <vector>
#include "IniFile.h"


namespace RegexRecords {


// The section of the config file that holds the settings of a ParserConfig.
extern const std::string PARSER_CONFIG_SECTION;


struct ParserConfig {
    std::string pattern_;
    bool include_all_groups_;
    bool case_insensitive_;
    bool multiline_;
    bool utf8_;

public:
    ParserConfig(): include_all_groups_(true), case_insensitive_(false), multiline_(false), utf8_(true) { }

    /** \brief Reads the settings from the PARSER_CONFIG_SECTION of "ini_file", keys that are not set keep their
     *         current values.
     *  \throws std::runtime_error if the section or its "pattern" is missing.
     */
    void loadFromIniFile(const IniFile &ini_file);

    // \return Or'ed together RegexMatcher::Option values.
    unsigned getOptions() const;
};


/** \brief Builds a ParserConfig from command-line arguments, without the program name.
 *
 *  Leading arguments that start with "--" are flags.  "--" ends the flags, so that a regex or a payload can itself
 *  start with "--".  With "--config=path" the settings are loaded from "path" and all remaining arguments are
 *  payloads, o/w the first remaining argument is the regex.  Flags take precedence over the config file.
 *
 *  \return False if an unknown flag was given or if there is no regex.
 *  \throws std::runtime_error if the config file can't be loaded.
 */
bool ParseCommandLine(const std::vector<std::string> &args, ParserConfig * const config, std::vector<std::string> * const payloads);


} // namespace RegexRecords
