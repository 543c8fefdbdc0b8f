/** \file   regex_to_records.cc
 *  \brief  Turns text into JSON records, one record per match of a regular expression.
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
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include "Main.h"
#include "ParserConfig.h"
#include "RegexRecordParser.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config=path] [--named-groups-only] [--case-insensitive] [--multiline] [--no-utf8] [--] [regex] [payload1 .. payloadN]\n"
            "With --config the regex and the options are taken from the \"Parser\" section of the given file and all\n"
            "remaining arguments are payloads.  Flags override the settings in the file.  \"--\" ends the flags.\n"
            "If no payloads have been provided on the command-line, each line read from stdin is a payload.");
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    RegexRecords::ParserConfig config;
    std::vector<std::string> payloads;
    if (not RegexRecords::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc), &config, &payloads))
        Usage();

    const RegexRecords::Parser parser(config.pattern_, config.include_all_groups_, config.getOptions());

    RegexRecords::ExtractionStats stats;
    if (not payloads.empty()) {
        for (const auto &payload : payloads)
            RegexRecords::ProcessPayload(parser, payload, std::cout, &stats);
    } else
        RegexRecords::ProcessPayloads(parser, std::cin, std::cout, &stats);

    LOG_INFO(stats.toString());

    return EXIT_SUCCESS;
}
