/** \brief Test cases for TextUtil
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
#include "TextUtil.h"
#include "UnitTest.h"


TEST(NextUTF8CodePointOffset) {
    const std::string s("a\xC3\xA4\xE2\x82\xAC" "b"); // a, ä, €, b
    CHECK_EQ(TextUtil::NextUTF8CodePointOffset(s, 0), 1u);
    CHECK_EQ(TextUtil::NextUTF8CodePointOffset(s, 1), 3u);
    CHECK_EQ(TextUtil::NextUTF8CodePointOffset(s, 3), 6u);
    CHECK_EQ(TextUtil::NextUTF8CodePointOffset(s, 6), 7u);
    CHECK_EQ(TextUtil::NextUTF8CodePointOffset(s, 7), 8u);
    CHECK_EQ(TextUtil::NextUTF8CodePointOffset("", 0), 1u);

    // A stray continuation byte must not stall us.
    CHECK_EQ(TextUtil::NextUTF8CodePointOffset("\x82\x82x", 0), 2u);
}


TEST(CStyleUnescape) {
    CHECK_EQ(TextUtil::CStyleUnescape("a\\tb\\nc"), "a\tb\nc");
    CHECK_EQ(TextUtil::CStyleUnescape("\\\\d+ \\\"x\\\" \\#"), "\\d+ \"x\" #");
    CHECK_EQ(TextUtil::CStyleUnescape("\\101\\x42\\x4a"), "ABJ");
    CHECK_EQ(TextUtil::CStyleUnescape("\\0"), std::string(1, '\0'));

    std::string s("x\\ty");
    CHECK_EQ(TextUtil::CStyleUnescape(&s), "x\ty");
    CHECK_EQ(s, "x\ty");

    CHECK_THROWS(TextUtil::CStyleUnescape("\\d"), std::runtime_error);
    CHECK_THROWS(TextUtil::CStyleUnescape("dangling\\"), std::runtime_error);
    CHECK_THROWS(TextUtil::CStyleUnescape("\\xZZ"), std::runtime_error);
}


TEST_MAIN(TextUtil)
