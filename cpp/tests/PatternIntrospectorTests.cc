/** \brief Test cases for the PatternIntrospector implementations
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
#include "PatternIntrospector.h"
#include "UnitTest.h"


using RegexRecords::FixedPatternIntrospector;
using RegexRecords::GroupMetadata;
using RegexRecords::IntrospectionError;
using RegexRecords::PcrePatternIntrospector;


TEST(NoGroups) {
    const PcrePatternIntrospector introspector;
    const RegexMatcher pattern("[a-z]+");
    CHECK_TRUE(introspector.extractGroupNames(pattern).empty());
    CHECK_EQ(introspector.extractGroupCount(pattern), 1u);
}


TEST(UnnamedGroups) {
    const PcrePatternIntrospector introspector;
    const RegexMatcher pattern("([a-z]+) ([0-9]+)");
    CHECK_TRUE(introspector.extractGroupNames(pattern).empty());
    CHECK_EQ(introspector.extractGroupCount(pattern), 3u);
}


TEST(NamedGroups) {
    const PcrePatternIntrospector introspector;
    const RegexMatcher pattern("(?<alpha>[a-z]+) (?<digits>[0-9]+) (x)");
    const auto group_names(introspector.extractGroupNames(pattern));
    CHECK_EQ(group_names.size(), 2u);
    CHECK_EQ(group_names.count("alpha"), 1u);
    CHECK_EQ(group_names.count("digits"), 1u);
    CHECK_EQ(introspector.extractGroupCount(pattern), 4u);
}


TEST(PythonStyleNames) {
    const PcrePatternIntrospector introspector;
    const RegexMatcher pattern("(?P<word>\\w+)");
    const auto group_names(introspector.extractGroupNames(pattern));
    CHECK_EQ(group_names.size(), 1u);
    CHECK_EQ(*group_names.begin(), "word");
}


TEST(NonCapturingGroups) {
    const PcrePatternIntrospector introspector;
    const RegexMatcher pattern("(?:a|b)(c)");
    CHECK_EQ(introspector.extractGroupCount(pattern), 2u);
}


TEST(Introspect) {
    const PcrePatternIntrospector introspector;
    const GroupMetadata metadata(introspector.introspect(RegexMatcher("(?<alpha>[a-z]+) ([0-9]+)")));
    CHECK_TRUE(metadata.hasNamedGroups());
    CHECK_EQ(metadata.group_count_, 3u);
    CHECK_EQ(metadata.toString(), "names: {alpha}, count: 3");
}


TEST(DefaultMetadata) {
    const GroupMetadata metadata;
    CHECK_FALSE(metadata.hasNamedGroups());
    CHECK_EQ(metadata.group_count_, 1u);
}


TEST(FixedIntrospector) {
    const FixedPatternIntrospector introspector({ "first", "second" }, 3);
    const RegexMatcher pattern("anything");
    CHECK_EQ(introspector.extractGroupNames(pattern).size(), 2u);
    CHECK_EQ(introspector.extractGroupCount(pattern), 3u);

    const FixedPatternIntrospector broken_introspector({}, 0);
    CHECK_THROWS(broken_introspector.extractGroupCount(pattern), IntrospectionError);
    CHECK_THROWS(broken_introspector.introspect(pattern), IntrospectionError);
}


TEST_MAIN(PatternIntrospector)
