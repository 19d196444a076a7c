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

#include <fairbn/variable.hpp>
#include <fairbn/utility.hpp>

#include <boost/container/flat_set.hpp>

fairbn::Variable::Variable(std::string name, domain_t domain) {
    if(name.empty()) {
        throw std::invalid_argument("A variable must have a non-empty name.");
    }
    if(domain.empty()) {
        throw std::invalid_argument("Variable '" + name + "' has an empty domain.");
    }
    boost::container::flat_set<std::string> seen;
    for(auto && label : domain) {
        if(!seen.insert(label).second) {
            throw std::invalid_argument("Variable '" + name
                + "' has a duplicate label in its domain: '" + label + "'.");
        }
    }
    data_ = std::make_shared<const data_t>(data_t{std::move(name), std::move(domain)});
}

std::optional<std::size_t> fairbn::Variable::IndexOf(const std::string &label) const {
    return utility::find_index(data_->domain, label);
}

std::ostream& fairbn::operator<<(std::ostream &os, const Variable &var) {
    os << var.name() << " {";
    for(std::size_t i = 0; i < var.size(); ++i) {
        os << ((i == 0) ? "" : ", ") << var.Label(i);
    }
    return os << "}";
}

// LCOV_EXCL_START
TEST_CASE("[libfairbn] Variable::Variable") {
    using fairbn::Variable;

    Variable salary{"Salary", {"<50K", ">=50K"}};
    CHECK(salary.name() == "Salary");
    CHECK(salary.size() == 2);
    CHECK(salary.Label(0) == "<50K");
    CHECK(salary.Label(1) == ">=50K");

    CHECK_THROWS_AS(Variable("", {"a"}), std::invalid_argument);
    CHECK_THROWS_AS(Variable("Work", {}), std::invalid_argument);
    CHECK_THROWS_AS(Variable("Work", {"Private", "Self", "Private"}), std::invalid_argument);
    CHECK_THROWS_AS(salary.Label(2), std::out_of_range);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] Variable::IndexOf") {
    using fairbn::Variable;

    Variable work{"Work", {"Not Working", "Government", "Private", "Self-emp"}};
    CHECK(work.IndexOf("Not Working") == 0u);
    CHECK(work.IndexOf("Private") == 2u);
    CHECK(work.IndexOf("Self-emp") == 3u);
    CHECK(work.IndexOf("Self") == std::nullopt);
    CHECK(work.IndexOf("") == std::nullopt);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] Variable equality is by name") {
    using fairbn::Variable;

    Variable a{"Gender", {"Male", "Female"}};
    Variable b{"Gender", {"Female", "Male"}};
    Variable c{"Race", {"Male", "Female"}};
    Variable d = a;

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a == d);
    CHECK(&a.domain() == &d.domain());
    CHECK(a < c);

    std::ostringstream os;
    os << a;
    CHECK(os.str() == "Gender {Male, Female}");
}
// LCOV_EXCL_STOP
