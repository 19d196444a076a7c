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

#include <fairbn/network.hpp>

#include <optional>

using fairbn::BayesianNetwork;
using fairbn::Factor;
using fairbn::Variable;

BayesianNetwork::BayesianNetwork(std::string name, variables_t variables,
    factors_t factors, const std::string &class_name) :
    name_{std::move(name)}, variables_{std::move(variables)} {

    for(variables_t::size_type i = 0; i < variables_.size(); ++i) {
        auto ret = names_.emplace(variables_[i].name(), i);
        if(!ret.second) {
            throw std::invalid_argument("The name of a variable in the network is not unique: '"
                + variables_[i].name() + "'.");
        }
    }

    auto it = names_.find(class_name);
    if(it == names_.end()) {
        throw UnknownVariable("The class variable '" + class_name
            + "' is not a variable of the network.");
    }
    class_pos_ = it->second;

    // Assign each factor to the variable leading its scope
    std::vector<std::optional<Factor>> slots(variables_.size());
    for(auto && factor : factors) {
        if(factor.dimension() == 0) {
            throw std::invalid_argument("A conditional probability table must have a non-empty scope.");
        }
        for(auto && v : factor.scope()) {
            auto pos = LookupVariablePosition(v.name());
            if(pos == variables_.size()) {
                throw UnknownVariable("A conditional probability table refers to variable '"
                    + v.name() + "' which is not in the network.");
            }
            if(variables_[pos].domain() != v.domain()) {
                throw std::invalid_argument("A conditional probability table uses a different domain for variable '"
                    + v.name() + "' than the network.");
            }
        }
        auto pos = LookupVariablePosition(factor.scope().front().name());
        if(slots[pos]) {
            throw std::invalid_argument("Variable '" + variables_[pos].name()
                + "' has more than one conditional probability table.");
        }
        slots[pos] = std::move(factor);
    }
    factors_.reserve(slots.size());
    for(std::size_t i = 0; i < slots.size(); ++i) {
        if(!slots[i]) {
            throw std::invalid_argument("Variable '" + variables_[i].name()
                + "' has no conditional probability table.");
        }
        factors_.push_back(std::move(*slots[i]));
    }
}

const Variable& BayesianNetwork::GetVariable(const std::string &name) const {
    const Variable *var = LookupVariable(name);
    if(var == nullptr) {
        throw UnknownVariable("Variable '" + name + "' is not in the network.");
    }
    return *var;
}

const Factor& BayesianNetwork::GetFactor(const std::string &name) const {
    auto pos = LookupVariablePosition(name);
    if(pos == variables_.size()) {
        throw UnknownVariable("Variable '" + name + "' is not in the network.");
    }
    return factors_[pos];
}

void BayesianNetwork::Print(std::ostream &os) const {
    os << "## " << name_ << "\n";
    os << "## class: " << class_variable().name() << "\n";
    for(auto && var : variables_) {
        os << "## variable: " << var << "\n";
    }
    for(auto && factor : factors_) {
        factor.Print(os);
    }
}

// LCOV_EXCL_START
TEST_CASE("[libfairbn] BayesianNetwork::BayesianNetwork") {
    Variable salary{"Salary", {"<50K", ">=50K"}};
    Variable work{"Work", {"Private", "Self"}};
    Variable gender{"Gender", {"Male", "Female"}};

    Factor prior = Factor::Create({salary}, {0.75, 0.25}, "Salary");
    Factor work_cpt = Factor::Create({work, salary}, {0.6, 0.2, 0.4, 0.8}, "Work,Salary");
    Factor gender_cpt = Factor::Create({gender, salary}, {0.5, 0.7, 0.5, 0.3}, "Gender,Salary");

    BayesianNetwork bn{"test", {salary, work, gender}, {gender_cpt, prior, work_cpt}, "Salary"};

    CHECK(bn.name() == "test");
    CHECK(bn.NumberOfVariables() == 3);
    CHECK(bn.class_variable() == salary);
    REQUIRE(bn.factors().size() == 3);
    CHECK(bn.factors()[0].name() == "Salary");
    CHECK(bn.factors()[1].name() == "Work,Salary");
    CHECK(bn.factors()[2].name() == "Gender,Salary");

    CHECK(bn.LookupVariablePosition("Work") == 1);
    CHECK(bn.LookupVariablePosition("Race") == 3);
    REQUIRE(bn.LookupVariable("Gender") != nullptr);
    CHECK(bn.LookupVariable("Gender")->size() == 2);
    CHECK(bn.LookupVariable("Race") == nullptr);
    CHECK(bn.GetVariable("Salary") == salary);
    CHECK(bn.GetFactor("Work").name() == "Work,Salary");
    CHECK_THROWS_AS(bn.GetVariable("Race"), fairbn::UnknownVariable);
    CHECK_THROWS_AS(bn.GetFactor("Race"), fairbn::UnknownVariable);

    // wrong class
    CHECK_THROWS_AS(BayesianNetwork("x", {salary, work}, {prior, work_cpt}, "Race"),
        fairbn::UnknownVariable);
    // duplicate variable
    CHECK_THROWS_AS(BayesianNetwork("x", {salary, work, salary}, {prior, work_cpt}, "Salary"),
        std::invalid_argument);
    // missing table
    CHECK_THROWS_AS(BayesianNetwork("x", {salary, work}, {prior}, "Salary"),
        std::invalid_argument);
    // two tables for one variable
    CHECK_THROWS_AS(BayesianNetwork("x", {salary, work}, {prior, work_cpt, prior}, "Salary"),
        std::invalid_argument);
    // table refers to an unknown variable
    CHECK_THROWS_AS(BayesianNetwork("x", {salary, work}, {prior, work_cpt, gender_cpt}, "Salary"),
        fairbn::UnknownVariable);
    // table uses a different domain
    Variable other_work{"Work", {"Private", "Self", "Government"}};
    CHECK_THROWS_AS(BayesianNetwork("x", {salary, other_work}, {prior, work_cpt}, "Salary"),
        std::invalid_argument);
    // scalar table
    CHECK_THROWS_AS(BayesianNetwork("x", {salary}, {prior, Factor::Scalar(1.0)}, "Salary"),
        std::invalid_argument);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] BayesianNetwork::Print") {
    Variable salary{"Salary", {"<50K", ">=50K"}};
    Factor prior = Factor::Create({salary}, {0.75, 0.25}, "Salary");
    BayesianNetwork bn{"tiny", {salary}, {prior}, "Salary"};

    std::ostringstream os;
    bn.Print(os);
    CHECK(os.str() ==
        "## tiny\n"
        "## class: Salary\n"
        "## variable: Salary {<50K, >=50K}\n"
        "# Salary\n"
        "<50K\t0.75\n"
        ">=50K\t0.25\n");
}
// LCOV_EXCL_STOP
