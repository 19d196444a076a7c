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

#ifndef FAIRBN_FAIRNESS_HPP
#define FAIRBN_FAIRNESS_HPP

#include <fairbn/dataset.hpp>
#include <fairbn/network.hpp>

#include <array>
#include <string>
#include <vector>

namespace fairbn {

struct FairnessOptions {
    std::string class_attribute{"Salary"};
    std::string positive_label{">=50K"};
    std::string sensitive_attribute{"Gender"};
    std::array<std::string, 2> groups{{"Female", "Male"}};
    std::vector<std::string> evidence_attributes{"Work", "Education",
        "Occupation", "Relationship"};
    // a row is predicted positive if its posterior exceeds the threshold
    double threshold{0.5};
};

// Percentages in [0,100] for the six fairness questions. Questions come in
// pairs, one per group:
//
//   1,2  demographic parity: rows predicted positive
//   3,4  separation: rows where P(+|E) > P(+|E,sensitive)
//   5,6  sufficiency: rows predicted positive that are truly positive
//
// A percentage with an empty denominator is 0. A posterior conditioned on
// evidence of probability zero is taken as 0.
struct FairnessReport {
    std::array<double, 6> percentages{};
    // rows in each group
    std::array<std::size_t, 2> group_rows{};
    // rows in each group predicted positive
    std::array<std::size_t, 2> positive_rows{};

    // Throws std::out_of_range unless 1 <= q <= 6
    double question(int q) const;
};

// Throws MissingClassColumn if `data` lacks the class attribute and
// std::invalid_argument if it lacks the sensitive or an evidence attribute,
// or if the sensitive or class attribute is listed as evidence.
FairnessReport evaluate_fairness(const BayesianNetwork &bn, const Dataset &data,
    const FairnessOptions &options = {});

} // namespace fairbn

#endif // FAIRBN_FAIRNESS_HPP
