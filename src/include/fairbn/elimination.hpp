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

#ifndef FAIRBN_ELIMINATION_HPP
#define FAIRBN_ELIMINATION_HPP

#include <fairbn/factor.hpp>
#include <fairbn/network.hpp>

#include <string>
#include <vector>

#include <boost/container/flat_map.hpp>

namespace fairbn {

// observed label for each named variable
using evidence_t = boost::container::flat_map<std::string, std::string>;

using elimination_order_t = std::vector<std::string>;

// Variables that must be summed out to answer a query: every variable other
// than the query that is still mentioned after the evidence is applied.
// Listed in declaration order.
elimination_order_t declaration_order(const BayesianNetwork &bn,
    const std::string &query, const evidence_t &evidence);

// The same variables ordered by the greedy min-fill heuristic on the
// interaction graph of the restricted factors. Ties go to the variable
// declared first.
elimination_order_t min_fill_order(const BayesianNetwork &bn,
    const std::string &query, const evidence_t &evidence);

// Posterior distribution P(query | evidence) by variable elimination.
//
// Throws UnknownVariable if `query` is not in the network, InvalidEvidence
// if the evidence names an unknown variable, the query itself, or a label
// outside a domain, and DegenerateDistribution if the evidence has zero
// probability.
Factor infer(const BayesianNetwork &bn, const std::string &query,
    const evidence_t &evidence);

// As above with an explicit elimination order. `order` must list exactly
// the variables of declaration_order(); otherwise InvalidVariable is thrown.
Factor infer(const BayesianNetwork &bn, const std::string &query,
    const evidence_t &evidence, const elimination_order_t &order);

// Most probable label of the class variable. Ties go to the label that
// comes first in the domain.
std::string predict(const BayesianNetwork &bn, const evidence_t &evidence);

std::string predict(const BayesianNetwork &bn, const std::string &query,
    const evidence_t &evidence);

} // namespace fairbn

#endif // FAIRBN_ELIMINATION_HPP
