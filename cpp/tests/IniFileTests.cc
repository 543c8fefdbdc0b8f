/** \brief Test cases for IniFile
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
#include <fstream>
#include <stdexcept>
#include <cstdio>
#include <unistd.h>
#include "IniFile.h"
#include "UnitTest.h"


namespace {


// \return The path of a freshly written scratch file.
std::string WriteScratchFile(const std::string &name, const std::string &contents) {
    const std::string path("/tmp/IniFileTests_" + std::to_string(::getpid()) + "_" + name);
    std::ofstream scratch_file(path);
    scratch_file << contents;
    return path;
}


} // unnamed namespace


TEST(ParserSection) {
    const std::string path(WriteScratchFile("parser.conf",
                                            "# regex_to_records settings\n"
                                            "[Parser]\n"
                                            "pattern = (?<alpha>[a-z]+) ([0-9]+)   # trailing comment\n"
                                            "include_all_groups = no\n"
                                            "case_insensitive = On\n"
                                            "\n"
                                            "[Other]\n"
                                            "flag\n"));
    const IniFile ini_file(path);
    CHECK_EQ(ini_file.getFilename(), path);
    CHECK_TRUE(ini_file.sectionIsDefined("Parser"));
    CHECK_TRUE(ini_file.sectionIsDefined("Other"));
    CHECK_FALSE(ini_file.sectionIsDefined("Missing"));

    CHECK_EQ(ini_file.getString("Parser", "pattern"), "(?<alpha>[a-z]+) ([0-9]+)");
    CHECK_FALSE(ini_file.getBool("Parser", "include_all_groups"));
    CHECK_TRUE(ini_file.getBool("Parser", "case_insensitive"));
    CHECK_TRUE(ini_file.getBool("Other", "flag"));

    CHECK_TRUE(ini_file.getBool("Parser", "utf8", true));
    CHECK_EQ(ini_file.getString("Parser", "missing", "fallback"), "fallback");
    CHECK_EQ(ini_file.getString("Missing", "missing", "fallback"), "fallback");
    CHECK_FALSE(ini_file.getBool("Missing", "missing", false));
    CHECK_FALSE(ini_file.getSection("Parser")->hasEntry("multiline"));

    CHECK_EQ(std::remove(path.c_str()), 0);
}


TEST(QuotedValues) {
    const std::string path(WriteScratchFile("quoted.conf",
                                            "[Parser]\n"
                                            "pattern = \"\\\\d+\\t\\\"#\\\"\"\n"
                                            "escaped_hash = a\\#b\n"));
    const IniFile ini_file(path);
    CHECK_EQ(ini_file.getString("Parser", "pattern"), "\\d+\t\"#\"");
    CHECK_EQ(ini_file.getString("Parser", "escaped_hash"), "a\\#b");
    CHECK_EQ(std::remove(path.c_str()), 0);
}


TEST(ContinuationLines) {
    const std::string path(WriteScratchFile("continued.conf",
                                            "[Parser]\n"
                                            "pattern = (?<year>[0-9]{4})- \\\n"
                                            "          (?<month>[0-9]{2})\n"));
    const IniFile ini_file(path);
    CHECK_EQ(ini_file.getString("Parser", "pattern"), "(?<year>[0-9]{4})-(?<month>[0-9]{2})");
    CHECK_EQ(std::remove(path.c_str()), 0);
}


TEST(Include) {
    const std::string included_path(WriteScratchFile("included.conf", "[Shared]\nutf8 = false\n"));
    const std::string path(WriteScratchFile("including.conf", "include \"" + included_path + "\"\n[Parser]\npattern = x\n"));
    const IniFile ini_file(path);
    CHECK_FALSE(ini_file.getBool("Shared", "utf8"));
    CHECK_EQ(ini_file.getString("Parser", "pattern"), "x");
    CHECK_EQ(std::remove(path.c_str()), 0);
    CHECK_EQ(std::remove(included_path.c_str()), 0);
}


TEST(SyntaxErrors) {
    CHECK_THROWS(IniFile("/nonexistent/regex_records.conf"), std::runtime_error);

    const std::string bad_header_path(WriteScratchFile("bad_header.conf", "[Parser\npattern = x\n"));
    CHECK_THROWS(IniFile(bad_header_path), std::runtime_error);
    CHECK_EQ(std::remove(bad_header_path.c_str()), 0);

    const std::string duplicate_path(WriteScratchFile("duplicate.conf", "[Parser]\npattern = x\npattern = y\n"));
    CHECK_THROWS(IniFile(duplicate_path), std::runtime_error);
    CHECK_EQ(std::remove(duplicate_path.c_str()), 0);

    const std::string bad_name_path(WriteScratchFile("bad_name.conf", "[Parser]\n1pattern = x\n"));
    CHECK_THROWS(IniFile(bad_name_path), std::runtime_error);
    CHECK_EQ(std::remove(bad_name_path.c_str()), 0);

    const std::string bad_quote_path(WriteScratchFile("bad_quote.conf", "[Parser]\npattern = \"x\n"));
    CHECK_THROWS(IniFile(bad_quote_path), std::runtime_error);
    CHECK_EQ(std::remove(bad_quote_path.c_str()), 0);

    const std::string bad_escape_path(WriteScratchFile("bad_escape.conf", "[Parser]\npattern = \"\\d\"\n"));
    CHECK_THROWS(IniFile(bad_escape_path), std::runtime_error);
    CHECK_EQ(std::remove(bad_escape_path.c_str()), 0);
}


TEST(SectionEditing) {
    IniFile::Section section("Parser");
    section.insert("pattern", "x");
    CHECK_THROWS(section.insert("pattern", "y"), std::runtime_error);
    section.insert("pattern", "y", "", IniFile::Section::OVERWRITE_EXISTING_VALUE);
    CHECK_EQ(section.getString("pattern"), "y");
    section.replace("pattern", "z");
    CHECK_EQ(section.getString("pattern"), "z");
    CHECK_EQ(section.size(), 1u);
    CHECK_FALSE(section.hasEntry("utf8"));
    CHECK_FALSE(section.getBool("utf8", false));
}


TEST_MAIN(IniFile)
