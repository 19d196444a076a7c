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

#include <fairbn/naive_bayes.hpp>

#include <cmath>

#include <boost/container/flat_set.hpp>

#include <xtensor/xmath.hpp>
#include <xtensor/xoperation.hpp>

using fairbn::BayesianNetwork;
using fairbn::Dataset;
using fairbn::Factor;
using fairbn::Variable;
using fairbn::table_t;

const fairbn::domain_map_t& fairbn::salary_domains() {
    static const domain_map_t domains = {
        {"Work", {"Not Working", "Government", "Private", "Self-emp"}},
        {"Education", {"<Gr12", "HS-Graduate", "Associate", "Professional",
            "Bachelors", "Masters", "Doctorate"}},
        {"Occupation", {"Admin", "Military", "Manual Labour", "Office Labour",
            "Service", "Professional"}},
        {"MaritalStatus", {"Not-Married", "Married", "Separated", "Widowed"}},
        {"Relationship", {"Wife", "Own-child", "Husband", "Not-in-family",
            "Other-relative", "Unmarried"}},
        {"Race", {"White", "Black", "Asian-Pac-Islander", "Amer-Indian-Eskimo", "Other"}},
        {"Gender", {"Male", "Female"}},
        {"Country", {"North-America", "South-America", "Europe", "Asia",
            "Middle-East", "Carribean"}},
        {"Salary", {"<50K", ">=50K"}}
    };
    return domains;
}

static
Variable make_variable(const Dataset &data, std::size_t col,
    const fairbn::NaiveBayesOptions &options) {
    const auto &name = data.attributes()[col];
    auto it = options.domains.find(name);
    if(it != options.domains.end()) {
        return {name, it->second};
    }
    boost::container::flat_set<std::string> observed;
    for(auto && row : data.rows()) {
        observed.insert(row[col]);
    }
    return {name, Variable::domain_t(observed.begin(), observed.end())};
}

BayesianNetwork fairbn::build_naive_bayes(const Dataset &data, const std::string &class_name,
    const NaiveBayesOptions &options) {
    if(data.NumberOfRows() == 0) {
        throw EmptyDataset("Cannot build a naive Bayes network from a dataset with no rows.");
    }
    auto class_col = data.AttributeIndex(class_name);
    if(!class_col) {
        throw MissingClassColumn("The class attribute '" + class_name
            + "' is not an attribute of the dataset.");
    }
    const double k = options.pseudocount;
    if(!std::isfinite(k) || k < 0.0) {
        throw std::invalid_argument("The pseudocount must be a non-negative number.");
    }

    const std::size_t num_attributes = data.attributes().size();
    BayesianNetwork::variables_t variables;
    for(std::size_t col = 0; col < num_attributes; ++col) {
        variables.push_back(make_variable(data, col, options));
    }
    const Variable &klass = variables[*class_col];

    // Translate every observation into a domain position
    std::vector<std::vector<std::size_t>> positions(data.NumberOfRows(),
        std::vector<std::size_t>(num_attributes));
    for(std::size_t r = 0; r < data.NumberOfRows(); ++r) {
        const auto &row = data.GetRow(r);
        for(std::size_t col = 0; col < num_attributes; ++col) {
            auto pos = variables[col].IndexOf(row[col]);
            if(!pos) {
                throw InvalidEvidence("Row " + std::to_string(r+1) + " has value '"
                    + row[col] + "' for attribute '" + variables[col].name()
                    + "' which is not in its domain.");
            }
            positions[r][col] = *pos;
        }
    }

    // N(c) and N(x,c)
    table_t class_counts(shape_t{klass.size()}, 0.0);
    std::vector<table_t> joint_counts;
    for(std::size_t col = 0; col < num_attributes; ++col) {
        joint_counts.emplace_back(shape_t{variables[col].size(), klass.size()}, 0.0);
    }
    for(auto && pos : positions) {
        auto c = pos[*class_col];
        class_counts(c) += 1.0;
        for(std::size_t col = 0; col < num_attributes; ++col) {
            joint_counts[col](pos[col], c) += 1.0;
        }
    }

    BayesianNetwork::factors_t factors;
    table_t prior = class_counts / static_cast<double>(data.NumberOfRows());
    factors.emplace_back(Factor::scope_t{klass}, std::move(prior), class_name);

    for(std::size_t col = 0; col < num_attributes; ++col) {
        if(col == *class_col) {
            continue;
        }
        const Variable &var = variables[col];
        table_t denom = class_counts + k * static_cast<double>(var.size());
        table_t cpt = xt::where(denom > 0.0, (joint_counts[col] + k) / denom, 0.0);
        factors.emplace_back(Factor::scope_t{var, klass}, std::move(cpt),
            var.name() + "," + class_name);
    }

    return BayesianNetwork{class_name + " Naive Bayes", std::move(variables),
        std::move(factors), class_name};
}

BayesianNetwork fairbn::build_naive_bayes(const std::vector<Dataset::record_t> &records,
    const std::string &class_name, const NaiveBayesOptions &options) {
    if(records.empty()) {
        throw EmptyDataset("Cannot build a naive Bayes network from a dataset with no rows.");
    }
    for(std::size_t i = 0; i < records.size(); ++i) {
        if(records[i].count(class_name) == 0) {
            throw MissingClassColumn("Record " + std::to_string(i+1)
                + " has no value for the class attribute '" + class_name + "'.");
        }
    }
    return build_naive_bayes(Dataset::from_records(records), class_name, options);
}

// LCOV_EXCL_START
namespace {
std::vector<Dataset::record_t> work_salary_records() {
    return {
        {{"Work", "Private"}, {"Salary", "<50K"}},
        {{"Work", "Private"}, {"Salary", ">=50K"}},
        {{"Work", "Self"}, {"Salary", "<50K"}}
    };
}
} // namespace

TEST_CASE("[libfairbn] build_naive_bayes() counts with add-one smoothing") {
    auto bn = fairbn::build_naive_bayes(work_salary_records(), "Salary");

    CHECK(bn.name() == "Salary Naive Bayes");
    CHECK(bn.class_variable().name() == "Salary");
    REQUIRE(bn.NumberOfVariables() == 2);

    const auto &salary = bn.GetVariable("Salary");
    std::vector<std::string> expected_domain = {"<50K", ">=50K"};
    CHECK_EQ_RANGES(salary.domain(), expected_domain);
    expected_domain = {"Private", "Self"};
    CHECK_EQ_RANGES(bn.GetVariable("Work").domain(), expected_domain);

    const auto &prior = bn.GetFactor("Salary");
    CHECK(prior.name() == "Salary");
    REQUIRE(prior.dimension() == 1);
    std::vector<double> expected = {2.0/3.0, 1.0/3.0};
    CHECK_APPROX_RANGES(prior.values(), expected);

    const auto &work = bn.GetFactor("Work");
    CHECK(work.name() == "Work,Salary");
    REQUIRE(work.dimension() == 2);
    CHECK(work.scope()[0].name() == "Work");
    CHECK(work.scope()[1].name() == "Salary");
    expected = {0.5, 2.0/3.0, 0.5, 1.0/3.0};
    CHECK_APPROX_RANGES(work.values(), expected);
}

TEST_CASE("[libfairbn] build_naive_bayes() without smoothing") {
    fairbn::NaiveBayesOptions options;
    options.pseudocount = 0.0;
    auto bn = fairbn::build_naive_bayes(work_salary_records(), "Salary", options);

    std::vector<double> expected = {0.5, 1.0, 0.5, 0.0};
    CHECK_APPROX_RANGES(bn.GetFactor("Work").values(), expected);
}

TEST_CASE("[libfairbn] build_naive_bayes() with explicit domains") {
    fairbn::NaiveBayesOptions options;
    options.domains["Work"] = {"Self", "Private", "Government"};
    options.domains["Salary"] = {">=50K", "<50K"};

    auto bn = fairbn::build_naive_bayes(work_salary_records(), "Salary", options);
    std::vector<double> expected = {1.0/3.0, 2.0/3.0};
    CHECK_APPROX_RANGES(bn.GetFactor("Salary").values(), expected);
    // rows: Self, Private, Government; columns: >=50K, <50K
    expected = {1.0/4.0, 2.0/5.0, 2.0/4.0, 2.0/5.0, 1.0/4.0, 1.0/5.0};
    CHECK_APPROX_RANGES(bn.GetFactor("Work").values(), expected);

    options.pseudocount = 0.0;
    bn = fairbn::build_naive_bayes(work_salary_records(), "Salary", options);
    expected = {0.0, 0.5, 1.0, 0.5, 0.0, 0.0};
    CHECK_APPROX_RANGES(bn.GetFactor("Work").values(), expected);

    // a class value that never occurs
    options.domains["Salary"] = {"<50K", ">=50K", "unknown"};
    bn = fairbn::build_naive_bayes(work_salary_records(), "Salary", options);
    expected = {2.0/3.0, 1.0/3.0, 0.0};
    CHECK_APPROX_RANGES(bn.GetFactor("Salary").values(), expected);
    CHECK(bn.GetFactor("Work").Value({"Government", "unknown"}) == 0.0);

    options.domains["Work"] = {"Private", "Government"};
    CHECK_THROWS_AS(fairbn::build_naive_bayes(work_salary_records(), "Salary", options),
        fairbn::InvalidEvidence);
}

TEST_CASE("[libfairbn] build_naive_bayes() produces valid conditional distributions") {
    Dataset data = Dataset::parse_csv_text(
        "Work,Education,Gender,Salary\n"
        "Private,Bachelors,Male,>=50K\n"
        "Private,HS-Graduate,Female,<50K\n"
        "Self-emp,Masters,Male,>=50K\n"
        "Government,HS-Graduate,Male,<50K\n"
        "Private,<Gr12,Female,<50K\n"
        "Government,Doctorate,Female,>=50K\n"
    );
    for(double k : {0.0, 1.0, 0.5}) {
        fairbn::NaiveBayesOptions options;
        options.pseudocount = k;
        auto bn = fairbn::build_naive_bayes(data, "Salary", options);
        REQUIRE(bn.NumberOfVariables() == 4);
        CHECK(bn.class_variable().name() == "Salary");
        CHECK(bn.GetFactor("Salary").Sum() == doctest::Approx(1.0).epsilon(1e-9));
        for(auto && factor : bn.factors()) {
            if(factor.dimension() != 2) {
                continue;
            }
            CHECK(factor.scope()[1] == bn.class_variable());
            auto marginal = fairbn::sum_out(factor, factor.scope()[0]);
            for(auto x : marginal.values()) {
                CHECK(x == doctest::Approx(1.0).epsilon(1e-9));
            }
        }
    }
    auto bn = fairbn::build_naive_bayes(data, "Salary");
    CHECK(bn.GetFactor("Gender").Value({"Female", "<50K"}) == doctest::Approx(3.0/5.0));
    CHECK(bn.GetFactor("Education").Value({"Masters", "<50K"}) == doctest::Approx(1.0/8.0));
}

TEST_CASE("[libfairbn] build_naive_bayes() rejects invalid input") {
    using fairbn::build_naive_bayes;

    CHECK_THROWS_AS(build_naive_bayes(std::vector<Dataset::record_t>{}, "Salary"),
        fairbn::EmptyDataset);
    CHECK_THROWS_AS(build_naive_bayes(Dataset{{"Work", "Salary"}}, "Salary"),
        fairbn::EmptyDataset);

    auto records = work_salary_records();
    CHECK_THROWS_AS(build_naive_bayes(records, "Income"), fairbn::MissingClassColumn);
    records.push_back({{"Work", "Self"}});
    CHECK_THROWS_AS(build_naive_bayes(records, "Salary"), fairbn::MissingClassColumn);

    Dataset data = Dataset::from_records(work_salary_records());
    CHECK_THROWS_AS(build_naive_bayes(data, "Income"), fairbn::MissingClassColumn);

    fairbn::NaiveBayesOptions options;
    options.pseudocount = -1.0;
    CHECK_THROWS_AS(build_naive_bayes(data, "Salary", options), std::invalid_argument);
}

TEST_CASE("[libfairbn] salary_domains") {
    const auto &domains = fairbn::salary_domains();
    CHECK(domains.size() == 9);
    std::vector<std::string> expected = {"<50K", ">=50K"};
    CHECK_EQ_RANGES(domains.at("Salary"), expected);
    expected = {"Male", "Female"};
    CHECK_EQ_RANGES(domains.at("Gender"), expected);
    CHECK(domains.at("Education").size() == 7);
}
// LCOV_EXCL_STOP
