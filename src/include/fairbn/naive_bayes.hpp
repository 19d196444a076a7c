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

#ifndef FAIRBN_NAIVE_BAYES_HPP
#define FAIRBN_NAIVE_BAYES_HPP

#include <fairbn/dataset.hpp>
#include <fairbn/network.hpp>

#include <map>
#include <string>
#include <vector>

namespace fairbn {

using domain_map_t = std::map<std::string, Variable::domain_t>;

struct NaiveBayesOptions {
    // Added to every (value, class) count. 1 is Laplace smoothing; 0 builds
    // the maximum-likelihood tables.
    double pseudocount{1.0};

    // Explicit ordered domains. Attributes not listed here use the sorted
    // set of values observed in the data.
    domain_map_t domains{};
};

// Domains of the UCI Adult salary data, in their customary order.
const domain_map_t& salary_domains();

// Builds a naive Bayes network over every attribute of `data`:
//
//   P(class = c)      = N(c) / N
//   P(X = x | class = c) = (N(x,c) + k) / (N(c) + k*|X|)
//
// where k is the pseudocount. A class value that never occurs has an
// all-zero column when k = 0.
//
// Throws EmptyDataset if there are no rows, MissingClassColumn if
// `class_name` is not an attribute, and InvalidEvidence if an observed value
// lies outside an explicit domain.
BayesianNetwork build_naive_bayes(const Dataset &data, const std::string &class_name,
    const NaiveBayesOptions &options = {});

// Throws MissingClassColumn if any record lacks `class_name`.
BayesianNetwork build_naive_bayes(const std::vector<Dataset::record_t> &records,
    const std::string &class_name, const NaiveBayesOptions &options = {});

} // namespace fairbn

#endif // FAIRBN_NAIVE_BAYES_HPP
