/** \file   ParserConfig.cc
 *  \brief  Implementation of ParserConfig and the command-line handling.
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
#include "ParserConfig.h"
#include <stdexcept>
#include "RegexMatcher.h"
#include "StringUtil.h"


namespace RegexRecords {


const std::string PARSER_CONFIG_SECTION("Parser");


void ParserConfig::loadFromIniFile(const IniFile &ini_file) {
    if (not ini_file.sectionIsDefined(PARSER_CONFIG_SECTION))
        throw std::runtime_error("missing section \"" + PARSER_CONFIG_SECTION + "\" in \"" + ini_file.getFilename() + "\"!");

    pattern_ = ini_file.getString(PARSER_CONFIG_SECTION, "pattern", "");
    if (pattern_.empty())
        throw std::runtime_error("missing or empty \"pattern\" in section \"" + PARSER_CONFIG_SECTION + "\" of \""
                                 + ini_file.getFilename() + "\"!");

    include_all_groups_ = ini_file.getBool(PARSER_CONFIG_SECTION, "include_all_groups", include_all_groups_);
    case_insensitive_   = ini_file.getBool(PARSER_CONFIG_SECTION, "case_insensitive", case_insensitive_);
    multiline_          = ini_file.getBool(PARSER_CONFIG_SECTION, "multiline", multiline_);
    utf8_               = ini_file.getBool(PARSER_CONFIG_SECTION, "utf8", utf8_);
}


unsigned ParserConfig::getOptions() const {
    unsigned options(0);
    if (utf8_)
        options |= RegexMatcher::ENABLE_UTF8;
    if (case_insensitive_)
        options |= RegexMatcher::CASE_INSENSITIVE;
    if (multiline_)
        options |= RegexMatcher::MULTILINE;
    return options;
}


bool ParseCommandLine(const std::vector<std::string> &args, ParserConfig * const config, std::vector<std::string> * const payloads) {
    std::string config_filename;
    bool named_groups_only(false), case_insensitive(false), multiline(false), no_utf8(false);

    auto arg(args.cbegin());
    for (/* Intentionally empty! */; arg != args.cend() and StringUtil::StartsWith(*arg, "--"); ++arg) {
        if (*arg == "--") {
            ++arg;
            break;
        }

        if (StringUtil::StartsWith(*arg, "--config="))
            config_filename = arg->substr(__builtin_strlen("--config="));
        else if (*arg == "--named-groups-only")
            named_groups_only = true;
        else if (*arg == "--case-insensitive")
            case_insensitive = true;
        else if (*arg == "--multiline")
            multiline = true;
        else if (*arg == "--no-utf8")
            no_utf8 = true;
        else
            return false;
    }

    if (not config_filename.empty())
        config->loadFromIniFile(IniFile(config_filename));
    else {
        if (arg == args.cend())
            return false;
        config->pattern_ = *arg++;
    }

    if (named_groups_only)
        config->include_all_groups_ = false;
    if (case_insensitive)
        config->case_insensitive_ = true;
    if (multiline)
        config->multiline_ = true;
    if (no_utf8)
        config->utf8_ = false;

    payloads->assign(arg, args.cend());
    return true;
}


} // namespace RegexRecords
