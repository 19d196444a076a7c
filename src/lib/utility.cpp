/*
# Copyright (c) 2021 Reed A. Cartwright <racartwright@gmail.com>
#
# This file is part of the Ultimate Source Code Project.
#
# Permission is hereby granted, free of charge, to any person obtaining a copy
# of this software and associated documentation files (the "Software"), to deal
# in the Software without restriction, including without limitation the rights
# to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
# copies of the Software, and to permit persons to whom the Software is
# furnished to do so, subject to the following conditions:
#
# The above copyright notice and this permission notice shall be included in all
# copies or substantial portions of the Software.
#
# THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
# IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
# FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
# AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
# LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
# OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
# SOFTWARE.
*/

#include "unit_testing.hpp"

#include <fairbn/utility.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

std::string fairbn::utility::trim_field(std::string str) {
    using boost::algorithm::trim;
    using boost::algorithm::starts_with;

    constexpr char bom[] = "\xEF\xBB\xBF";
    if(starts_with(str, bom)) {
        str.erase(0, sizeof(bom)-1);
    }
    trim(str);
    return str;
}

std::optional<std::pair<std::string, std::string>>
fairbn::utility::split_assignment(std::string_view text) {
    auto pos = text.find('=');
    if(pos == std::string_view::npos || pos == 0) {
        return std::nullopt;
    }
    return std::make_pair(trim_field(std::string{text.substr(0, pos)}),
        trim_field(std::string{text.substr(pos+1)}));
}

// LCOV_EXCL_START
TEST_CASE("[libfairbn] utility::trim_field") {
    using fairbn::utility::trim_field;

    CHECK(trim_field("Work") == "Work");
    CHECK(trim_field("  Work\t") == "Work");
    CHECK(trim_field("\xEF\xBB\xBFWork") == "Work");
    CHECK(trim_field("\xEF\xBB\xBF Work ") == "Work");
    CHECK(trim_field("") == "");
    CHECK(trim_field("Self-emp") == "Self-emp");
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] utility::split_assignment") {
    using fairbn::utility::split_assignment;

    auto a = split_assignment("Work=Private");
    REQUIRE(a.has_value());
    CHECK(a->first == "Work");
    CHECK(a->second == "Private");

    auto b = split_assignment("Salary=>=50K");
    REQUIRE(b.has_value());
    CHECK(b->first == "Salary");
    CHECK(b->second == ">=50K");

    auto c = split_assignment(" Gender = Female ");
    REQUIRE(c.has_value());
    CHECK(c->first == "Gender");
    CHECK(c->second == "Female");

    CHECK(split_assignment("Work") == std::nullopt);
    CHECK(split_assignment("=Private") == std::nullopt);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] utility::make_csv_tokenizer") {
    using fairbn::utility::make_csv_tokenizer;

    std::string line = "Private,\"Bachelors, Hons\",,>=50K";
    auto tokens = make_csv_tokenizer(line);
    std::vector<std::string> fields(tokens.begin(), tokens.end());
    std::vector<std::string> expected = {"Private", "Bachelors, Hons", "", ">=50K"};
    CHECK_EQ_RANGES(fields, expected);

    // backslashes are kept verbatim
    line = "C:\\data\\adult,\"a\\b\",x\\";
    auto raw = make_csv_tokenizer(line);
    fields.assign(raw.begin(), raw.end());
    expected = {"C:\\data\\adult", "a\\b", "x\\"};
    CHECK_EQ_RANGES(fields, expected);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] utility::find_index") {
    using fairbn::utility::find_index;

    std::vector<std::string> domain = {"<50K", ">=50K"};
    CHECK(find_index(domain, std::string{"<50K"}) == 0u);
    CHECK(find_index(domain, std::string{">=50K"}) == 1u);
    CHECK(find_index(domain, std::string{"50K"}) == std::nullopt);
}
// LCOV_EXCL_STOP
