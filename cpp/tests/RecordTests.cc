/** \brief Test cases for Record
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
#include <stdexcept>
#include "JSON.h"
#include "Record.h"
#include "UnitTest.h"


using RegexRecords::Record;


namespace {


Record MakeRecord() {
    std::vector<Record::Field> fields;
    fields.emplace_back("alpha", std::string("abc"));
    fields.emplace_back("0", std::string("abc 123"));
    fields.emplace_back("1", std::nullopt);
    fields.emplace_back("2", std::string(""));
    return Record(std::move(fields));
}


} // unnamed namespace


TEST(Empty) {
    const Record record;
    CHECK_TRUE(record.empty());
    CHECK_EQ(record.size(), 0u);
    CHECK_EQ(record.toString(), "{}");
}


TEST(Lookup) {
    const Record record(MakeRecord());
    CHECK_EQ(record.size(), 4u);
    CHECK_TRUE(record.hasField("alpha"));
    CHECK_FALSE(record.hasField("beta"));
    CHECK_EQ(*record.getValue("alpha"), "abc");
    CHECK_FALSE(record.getValue("1").has_value());
    CHECK_TRUE(record.getValue("2").has_value());
    CHECK_EQ(*record.getValue("2"), "");
    CHECK_THROWS(record.getValue("beta"), std::out_of_range);
}


TEST(FieldOrder) {
    const Record record(MakeRecord());
    const std::vector<std::string> expected_names{ "alpha", "0", "1", "2" };
    CHECK_TRUE(record.getFieldNames() == expected_names);
    CHECK_EQ(record.begin()->name_, "alpha");
}


TEST(Equality) {
    CHECK_TRUE(MakeRecord() == MakeRecord());

    std::vector<Record::Field> fields;
    fields.emplace_back("alpha", std::string("abc"));
    const Record other(std::move(fields));
    CHECK_TRUE(MakeRecord() != other);
}


TEST(ToString) {
    CHECK_EQ(MakeRecord().toString(), "{\"alpha\":\"abc\",\"0\":\"abc 123\",\"1\":null,\"2\":\"\"}");
}


TEST(Escaping) {
    std::vector<Record::Field> fields;
    fields.emplace_back("q\"uote", std::string("line1\nline2\t\\"));
    const Record record(std::move(fields));
    CHECK_EQ(record.toString(), "{\"q\\\"uote\":\"line1\\nline2\\t\\\\\"}");

    CHECK_EQ(JSON::EscapeString(std::string(1, '\x01')), "\\u0001");
    CHECK_EQ(JSON::EscapeString("a/b"), "a/b");
    CHECK_EQ(JSON::ToStringOrNull(std::nullopt), "null");
    CHECK_EQ(JSON::ToStringOrNull(std::string("x")), "\"x\"");
}


TEST_MAIN(Record)
