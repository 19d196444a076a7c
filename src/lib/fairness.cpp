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

#include <fairbn/fairness.hpp>
#include <fairbn/elimination.hpp>
#include <fairbn/naive_bayes.hpp>

using fairbn::BayesianNetwork;
using fairbn::Dataset;
using fairbn::FairnessOptions;
using fairbn::FairnessReport;

double fairbn::FairnessReport::question(int q) const {
    if(q < 1 || q > 6) {
        throw std::out_of_range("Fairness questions are numbered 1 to 6; got "
            + std::to_string(q) + ".");
    }
    return percentages[q-1];
}

static
std::size_t require_attribute(const Dataset &data, const std::string &name,
    const char *role) {
    auto pos = data.AttributeIndex(name);
    if(!pos) {
        throw std::invalid_argument(std::string{"The "} + role + " attribute '"
            + name + "' is not an attribute of the test data.");
    }
    return *pos;
}

// P(class = positive | evidence). Evidence of probability zero leaves the
// prediction undefined; it counts as 0.
static
double positive_probability(const BayesianNetwork &bn, const std::string &class_name,
    const fairbn::evidence_t &evidence, const fairbn::Factor::assignment_t &positive) {
    try {
        return fairbn::infer(bn, class_name, evidence).Value(positive);
    } catch(const fairbn::DegenerateDistribution &) {
        return 0.0;
    }
}

static
double percent(std::size_t count, std::size_t total) {
    return (total == 0) ? 0.0 : 100.0*count/total;
}

FairnessReport fairbn::evaluate_fairness(const BayesianNetwork &bn, const Dataset &data,
    const FairnessOptions &options) {
    auto class_col = data.AttributeIndex(options.class_attribute);
    if(!class_col) {
        throw MissingClassColumn("The class attribute '" + options.class_attribute
            + "' is not an attribute of the test data.");
    }
    if(options.sensitive_attribute == options.class_attribute) {
        throw std::invalid_argument("The sensitive attribute '" + options.sensitive_attribute
            + "' cannot also be the class attribute.");
    }
    for(auto && name : options.evidence_attributes) {
        if(name == options.sensitive_attribute || name == options.class_attribute) {
            throw std::invalid_argument("The evidence attributes cannot include the "
                + std::string{(name == options.class_attribute) ? "class" : "sensitive"}
                + " attribute '" + name + "'.");
        }
    }
    auto sensitive_col = require_attribute(data, options.sensitive_attribute, "sensitive");
    std::vector<std::size_t> evidence_cols;
    for(auto && name : options.evidence_attributes) {
        evidence_cols.push_back(require_attribute(data, name, "evidence"));
    }

    const Variable &klass = bn.GetVariable(options.class_attribute);
    if(!klass.IndexOf(options.positive_label)) {
        throw std::invalid_argument("The positive label '" + options.positive_label
            + "' is not in the domain of '" + klass.name() + "'.");
    }
    const Factor::assignment_t positive = {options.positive_label};

    std::array<std::size_t, 2> separated{};
    std::array<std::size_t, 2> correct{};
    FairnessReport report;

    for(auto && row : data.rows()) {
        const auto &group = row[sensitive_col];
        std::size_t g;
        if(group == options.groups[0]) {
            g = 0;
        } else if(group == options.groups[1]) {
            g = 1;
        } else {
            continue;
        }
        evidence_t evidence;
        for(std::size_t i = 0; i < evidence_cols.size(); ++i) {
            evidence.emplace(options.evidence_attributes[i], row[evidence_cols[i]]);
        }
        double p = positive_probability(bn, klass.name(), evidence, positive);
        evidence.emplace(options.sensitive_attribute, group);
        double p_g = positive_probability(bn, klass.name(), evidence, positive);

        report.group_rows[g] += 1;
        if(p > p_g) {
            separated[g] += 1;
        }
        if(p > options.threshold) {
            report.positive_rows[g] += 1;
            if(row[*class_col] == options.positive_label) {
                correct[g] += 1;
            }
        }
    }

    for(std::size_t g = 0; g < 2; ++g) {
        report.percentages[g] = percent(report.positive_rows[g], report.group_rows[g]);
        report.percentages[2+g] = percent(separated[g], report.group_rows[g]);
        report.percentages[4+g] = percent(correct[g], report.positive_rows[g]);
    }
    return report;
}

// LCOV_EXCL_START
namespace {
BayesianNetwork fairness_network() {
    using fairbn::Factor;
    using fairbn::Variable;
    Variable salary{"Salary", {"<50K", ">=50K"}};
    Variable work{"Work", {"Private", "Self"}};
    Variable gender{"Gender", {"Female", "Male"}};
    return {"fairness", {work, gender, salary}, {
        Factor::Create({salary}, {0.5, 0.5}),
        Factor::Create({work, salary}, {0.75, 0.25, 0.25, 0.75}),
        Factor::Create({gender, salary}, {0.75, 0.25, 0.25, 0.75})
    }, "Salary"};
}

// P(>=50K|Self) = 0.75 and P(>=50K|Private) = 0.25
// P(>=50K|Self,Female) = 0.5 and P(>=50K|Self,Male) = 0.9
// P(>=50K|Private,Female) = 0.1 and P(>=50K|Private,Male) = 0.5
const char fairness_csv[] =
    "Work,Gender,Salary\n"
    "Self,Female,>=50K\n"
    "Self,Female,<50K\n"
    "Private,Female,<50K\n"
    "Private,Female,>=50K\n"
    "Self,Male,>=50K\n"
    "Private,Male,<50K\n"
    "Self,Male,>=50K\n"
    "Private,Nonbinary,<50K\n";

FairnessOptions work_only() {
    FairnessOptions options;
    options.evidence_attributes = {"Work"};
    return options;
}
} // namespace

TEST_CASE("[libfairbn] evaluate_fairness()") {
    auto bn = fairness_network();
    auto data = Dataset::parse_csv_text(fairness_csv);

    auto report = fairbn::evaluate_fairness(bn, data, work_only());
    CHECK(report.group_rows[0] == 4);
    CHECK(report.group_rows[1] == 3);
    CHECK(report.positive_rows[0] == 2);
    CHECK(report.positive_rows[1] == 2);

    CHECK(report.question(1) == doctest::Approx(50.0));
    CHECK(report.question(2) == doctest::Approx(200.0/3.0));
    CHECK(report.question(3) == doctest::Approx(100.0));
    CHECK(report.question(4) == doctest::Approx(0.0));
    CHECK(report.question(5) == doctest::Approx(50.0));
    CHECK(report.question(6) == doctest::Approx(100.0));

    CHECK_THROWS_AS(report.question(0), std::out_of_range);
    CHECK_THROWS_AS(report.question(7), std::out_of_range);
}

TEST_CASE("[libfairbn] evaluate_fairness() with empty denominators") {
    auto bn = fairness_network();
    auto data = Dataset::parse_csv_text(fairness_csv);

    auto options = work_only();
    options.threshold = 0.8;
    auto report = fairbn::evaluate_fairness(bn, data, options);
    CHECK(report.question(1) == 0.0);
    CHECK(report.question(2) == 0.0);
    CHECK(report.question(5) == 0.0);
    CHECK(report.question(6) == 0.0);
    CHECK(report.question(3) == doctest::Approx(100.0));

    options = work_only();
    options.groups = {{"Male", "Other"}};
    report = fairbn::evaluate_fairness(bn, data, options);
    CHECK(report.group_rows[1] == 0);
    CHECK(report.question(1) == doctest::Approx(200.0/3.0));
    CHECK(report.question(2) == 0.0);
    CHECK(report.question(4) == 0.0);
    CHECK(report.question(6) == 0.0);
}

TEST_CASE("[libfairbn] evaluate_fairness() requires its attributes") {
    auto bn = fairness_network();
    auto options = work_only();

    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text("Work,Gender\nSelf,Male\n"), options),
        fairbn::MissingClassColumn);
    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text("Work,Salary\nSelf,<50K\n"), options),
        std::invalid_argument);
    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text("Gender,Salary\nMale,<50K\n"), options),
        std::invalid_argument);

    options.positive_label = ">100K";
    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text(fairness_csv), options), std::invalid_argument);

    // evidence outside the trained domains
    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text("Work,Gender,Salary\nRetired,Male,<50K\n"), work_only()),
        fairbn::InvalidEvidence);

    // the sensitive and class attributes cannot be evidence
    options = work_only();
    options.evidence_attributes = {"Work", "Gender"};
    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text(fairness_csv), options), std::invalid_argument);
    options.evidence_attributes = {"Work", "Salary"};
    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text(fairness_csv), options), std::invalid_argument);
    options = work_only();
    options.sensitive_attribute = "Salary";
    options.groups = {{"<50K", ">=50K"}};
    CHECK_THROWS_AS(fairbn::evaluate_fairness(bn,
        Dataset::parse_csv_text(fairness_csv), options), std::invalid_argument);
}

namespace {
std::vector<Dataset::record_t> fairness_training_records() {
    return {
        {{"Work", "Self"}, {"Gender", "Male"}, {"Salary", ">=50K"}},
        {{"Work", "Private"}, {"Gender", "Female"}, {"Salary", "<50K"}}
    };
}

fairbn::NaiveBayesOptions fairness_training_options(double pseudocount) {
    fairbn::NaiveBayesOptions options;
    options.pseudocount = pseudocount;
    options.domains["Work"] = {"Private", "Self", "Government"};
    options.domains["Gender"] = {"Female", "Male"};
    options.domains["Salary"] = {"<50K", ">=50K"};
    return options;
}
} // namespace

TEST_CASE("[libfairbn] evaluate_fairness() with values unseen in training") {
    // Government is in the domain of Work but never occurs in training
    auto bn = fairbn::build_naive_bayes(fairness_training_records(), "Salary",
        fairness_training_options(1.0));
    auto data = Dataset::parse_csv_text(
        "Work,Gender,Salary\n"
        "Government,Female,<50K\n"
        "Self,Male,>=50K\n");

    FairnessReport report;
    REQUIRE_NOTHROW(report = fairbn::evaluate_fairness(bn, data, work_only()));
    CHECK(report.group_rows[0] == 1);
    CHECK(report.group_rows[1] == 1);
    // P(>=50K|Government) = 0.5
    CHECK(report.question(1) == 0.0);
    CHECK(report.question(2) == doctest::Approx(100.0));
    CHECK(report.question(6) == doctest::Approx(100.0));
}

TEST_CASE("[libfairbn] evaluate_fairness() counts evidence of probability zero as 0") {
    // Without smoothing, P(Government|c) = 0 and P(Female|>=50K) = 0
    auto bn = fairbn::build_naive_bayes(fairness_training_records(), "Salary",
        fairness_training_options(0.0));
    auto data = Dataset::parse_csv_text(
        "Work,Gender,Salary\n"
        "Self,Male,>=50K\n"
        "Government,Male,<50K\n"
        "Private,Female,<50K\n"
        "Self,Female,>=50K\n");
    CHECK_THROWS_AS(fairbn::infer(bn, "Salary", {{"Work", "Government"}}),
        fairbn::DegenerateDistribution);

    FairnessReport report;
    REQUIRE_NOTHROW(report = fairbn::evaluate_fairness(bn, data, work_only()));
    CHECK(report.group_rows[0] == 2);
    CHECK(report.group_rows[1] == 2);
    CHECK(report.positive_rows[0] == 1);
    CHECK(report.positive_rows[1] == 1);

    CHECK(report.question(1) == doctest::Approx(50.0));
    CHECK(report.question(2) == doctest::Approx(50.0));
    // Self,Female: P(>=50K|Self) = 1 but P(>=50K|Self,Female) is undefined
    CHECK(report.question(3) == doctest::Approx(50.0));
    CHECK(report.question(4) == 0.0);
    CHECK(report.question(5) == doctest::Approx(100.0));
    CHECK(report.question(6) == doctest::Approx(100.0));
}
// LCOV_EXCL_STOP
