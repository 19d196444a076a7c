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

#include <fairbn/elimination.hpp>
#include <fairbn/naive_bayes.hpp>

#include <algorithm>
#include <set>
#include <utility>

#include <boost/graph/adjacency_list.hpp>
#include <boost/heap/d_ary_heap.hpp>
#include <boost/range/iterator_range.hpp>

using fairbn::BayesianNetwork;
using fairbn::Factor;
using fairbn::Variable;
using fairbn::evidence_t;
using fairbn::elimination_order_t;
using fairbn::table_t;

namespace {

// A query with its evidence applied to every CPT of the network
struct reduced_query_t {
    const Variable *query;
    std::vector<Factor> factors;
    // network positions of the variables that must be summed out
    std::vector<std::size_t> hidden;
};

reduced_query_t reduce_query(const BayesianNetwork &bn, const std::string &query,
    const evidence_t &evidence) {
    using namespace fairbn;

    reduced_query_t ret;
    ret.query = &bn.GetVariable(query);

    std::vector<const Variable*> observed;
    for(auto && [name, label] : evidence) {
        if(name == query) {
            throw InvalidEvidence("The query variable '" + query
                + "' cannot also be observed.");
        }
        const Variable *var = bn.LookupVariable(name);
        if(var == nullptr) {
            throw InvalidEvidence("Evidence names '" + name
                + "' which is not a variable of the network.");
        }
        if(!var->IndexOf(label)) {
            throw InvalidEvidence("Evidence '" + name + "=" + label
                + "' uses a value outside the domain of '" + name + "'.");
        }
        observed.push_back(var);
    }

    for(auto && cpt : bn.factors()) {
        Factor f = cpt;
        for(auto *var : observed) {
            if(f.Contains(*var)) {
                f = restrict(f, *var, evidence.at(var->name()));
            }
        }
        ret.factors.push_back(std::move(f));
    }

    std::vector<bool> mentioned(bn.NumberOfVariables(), false);
    for(auto && f : ret.factors) {
        for(auto && var : f.scope()) {
            mentioned[bn.LookupVariablePosition(var.name())] = true;
        }
    }
    for(std::size_t i = 0; i < mentioned.size(); ++i) {
        if(mentioned[i] && bn.variables()[i] != *ret.query) {
            ret.hidden.push_back(i);
        }
    }
    return ret;
}

std::string posterior_name(const std::string &query, const evidence_t &evidence) {
    std::string ret = "P(" + query;
    const char *sep = " | ";
    for(auto && [name, label] : evidence) {
        ret += sep + name + "=" + label;
        sep = ", ";
    }
    return ret + ")";
}

Factor eliminate(const BayesianNetwork &bn, reduced_query_t reduced,
    const std::string &name, const std::vector<std::size_t> &order) {
    using namespace fairbn;

    std::vector<Factor> factors = std::move(reduced.factors);
    for(auto pos : order) {
        const Variable &var = bn.variables()[pos];
        std::vector<Factor> gathered;
        std::vector<Factor> rest;
        for(auto && f : factors) {
            if(f.Contains(var)) {
                gathered.push_back(std::move(f));
            } else {
                rest.push_back(std::move(f));
            }
        }
        if(!gathered.empty()) {
            rest.push_back(sum_out(multiply(gathered), var));
        }
        factors = std::move(rest);
    }

    // Every remaining factor has scope [query] or is a scalar
    Factor result = multiply(factors);
    if(!result.Contains(*reduced.query)) {
        result = multiply(Factor::Unit({*reduced.query}), result);
    }
    return normalize(Factor{result.scope(), result.values(), name});
}

} // namespace

elimination_order_t fairbn::declaration_order(const BayesianNetwork &bn,
    const std::string &query, const evidence_t &evidence) {
    auto reduced = reduce_query(bn, query, evidence);
    elimination_order_t ret;
    for(auto pos : reduced.hidden) {
        ret.push_back(bn.variables()[pos].name());
    }
    return ret;
}

elimination_order_t fairbn::min_fill_order(const BayesianNetwork &bn,
    const std::string &query, const evidence_t &evidence) {
    using LocalGraph = boost::adjacency_list<boost::setS, boost::vecS, boost::undirectedS>;
    using vertex_t = LocalGraph::vertex_descriptor;

    auto reduced = reduce_query(bn, query, evidence);

    // Interaction graph: the scope of every factor is a clique
    LocalGraph local_graph(bn.NumberOfVariables());
    for(auto && f : reduced.factors) {
        const auto &scope = f.scope();
        for(auto it = scope.begin(); it != scope.end(); ++it) {
            for(auto jt = std::next(it); jt != scope.end(); ++jt) {
                add_edge(bn.LookupVariablePosition(it->name()),
                    bn.LookupVariablePosition(jt->name()), local_graph);
            }
        }
    }

    auto neighbors = [](vertex_t v, const LocalGraph &g) {
        return boost::make_iterator_range(adjacent_vertices(v, g));
    };

    auto fill_in_count = [&](vertex_t v, const LocalGraph &g) {
        int fill = 0;
        auto adj_range = neighbors(v, g);
        for(auto it = std::begin(adj_range); it != std::end(adj_range); ++it) {
            for(auto jt = std::next(it); jt != std::end(adj_range); ++jt) {
                fill += !edge(*it, *jt, g).second;
            }
        }
        return fill;
    };

    // max heap: negate fill and position so that the smallest fill and then
    // the earliest declared variable come first
    using heap_value_t = std::pair<int, int>;
    using heap_t = boost::heap::d_ary_heap<heap_value_t,
        boost::heap::arity<2>, boost::heap::mutable_<true>>;

    heap_t priority_queue;
    std::vector<heap_t::handle_type> handles(bn.NumberOfVariables());
    std::vector<bool> queued(bn.NumberOfVariables(), false);

    for(auto v : reduced.hidden) {
        handles[v] = priority_queue.push({-fill_in_count(v, local_graph),
            -static_cast<int>(v)});
        queued[v] = true;
    }

    elimination_order_t ret;
    while(!priority_queue.empty()) {
        auto v = static_cast<vertex_t>(-priority_queue.top().second);
        priority_queue.pop();
        queued[v] = false;
        ret.push_back(bn.variables()[v].name());

        std::vector<vertex_t> clique(neighbors(v, local_graph).begin(),
            neighbors(v, local_graph).end());
        clear_vertex(v, local_graph);

        // link up neighbors
        std::set<vertex_t> dirty_vertices;
        for(auto it = clique.begin(); it != clique.end(); ++it) {
            for(auto jt = std::next(it); jt != clique.end(); ++jt) {
                add_edge(*it, *jt, local_graph);
            }
            dirty_vertices.insert(*it);
            for(auto n : neighbors(*it, local_graph)) {
                dirty_vertices.insert(n);
            }
        }
        for(auto w : dirty_vertices) {
            if(!queued[w]) {
                continue;
            }
            (*handles[w]).first = -fill_in_count(w, local_graph);
            priority_queue.update(handles[w]);
        }
    }
    return ret;
}

Factor fairbn::infer(const BayesianNetwork &bn, const std::string &query,
    const evidence_t &evidence) {
    auto reduced = reduce_query(bn, query, evidence);
    auto order = reduced.hidden;
    return eliminate(bn, std::move(reduced), posterior_name(query, evidence), order);
}

Factor fairbn::infer(const BayesianNetwork &bn, const std::string &query,
    const evidence_t &evidence, const elimination_order_t &order) {
    auto reduced = reduce_query(bn, query, evidence);

    std::vector<std::size_t> positions;
    for(auto && name : order) {
        auto pos = bn.LookupVariablePosition(name);
        if(!std::binary_search(reduced.hidden.begin(), reduced.hidden.end(), pos)) {
            throw InvalidVariable("'" + name
                + "' is not a variable that must be eliminated to answer the query.");
        }
        if(std::find(positions.begin(), positions.end(), pos) != positions.end()) {
            throw InvalidVariable("'" + name + "' appears more than once in the elimination order.");
        }
        positions.push_back(pos);
    }
    if(positions.size() != reduced.hidden.size()) {
        throw InvalidVariable("The elimination order does not list every variable "
            "that must be eliminated to answer the query.");
    }
    return eliminate(bn, std::move(reduced), posterior_name(query, evidence), positions);
}

std::string fairbn::predict(const BayesianNetwork &bn, const std::string &query,
    const evidence_t &evidence) {
    Factor posterior = infer(bn, query, evidence);
    return posterior.scope()[0].Label(arg_max(posterior));
}

std::string fairbn::predict(const BayesianNetwork &bn, const evidence_t &evidence) {
    return predict(bn, bn.class_variable().name(), evidence);
}

// LCOV_EXCL_START
namespace {
// A -> B -> C
BayesianNetwork chain_network() {
    Variable a{"A", {"a0", "a1"}};
    Variable b{"B", {"b0", "b1"}};
    Variable c{"C", {"c0", "c1"}};
    BayesianNetwork::factors_t factors = {
        Factor::Create({c, b}, {0.6, 0.3, 0.4, 0.7}, "C|B"),
        Factor::Create({a}, {0.3, 0.7}, "A"),
        Factor::Create({b, a}, {0.9, 0.2, 0.1, 0.8}, "B|A")
    };
    return {"chain", {a, b, c}, factors, "A"};
}

BayesianNetwork work_salary_network(double pseudocount = 1.0) {
    std::vector<fairbn::Dataset::record_t> records = {
        {{"Work", "Private"}, {"Salary", "<50K"}},
        {{"Work", "Private"}, {"Salary", ">=50K"}},
        {{"Work", "Self"}, {"Salary", "<50K"}}
    };
    fairbn::NaiveBayesOptions options;
    options.pseudocount = pseudocount;
    options.domains["Work"] = {"Private", "Self", "Government"};
    options.domains["Salary"] = {"<50K", ">=50K"};
    return fairbn::build_naive_bayes(records, "Salary", options);
}

BayesianNetwork census_network() {
    const char csv[] =
        "Work,Education,Gender,Salary\n"
        "Private,Bachelors,Male,>=50K\n"
        "Private,HS-Graduate,Female,<50K\n"
        "Self,Masters,Male,>=50K\n"
        "Government,HS-Graduate,Male,<50K\n"
        "Private,Bachelors,Female,<50K\n"
        "Government,Masters,Female,>=50K\n"
        "Self,HS-Graduate,Male,<50K\n";
    return fairbn::build_naive_bayes(fairbn::Dataset::parse_csv_text(csv), "Salary");
}
} // namespace

TEST_CASE("[libfairbn] infer() with no evidence returns the class prior") {
    auto bn = work_salary_network();
    Factor posterior = fairbn::infer(bn, "Salary", {});

    REQUIRE(posterior.dimension() == 1);
    CHECK(posterior.scope()[0].name() == "Salary");
    CHECK(posterior.name() == "P(Salary)");
    CHECK(posterior.Sum() == doctest::Approx(1.0));
    std::vector<double> expected = {2.0/3.0, 1.0/3.0};
    CHECK_APPROX_RANGES(posterior.values(), expected);
    CHECK(posterior.Value({"<50K"}) > posterior.Value({">=50K"}));
    CHECK(fairbn::predict(bn, {}) == "<50K");
}

TEST_CASE("[libfairbn] infer() conditions on evidence") {
    auto bn = work_salary_network();
    Factor posterior = fairbn::infer(bn, "Salary", {{"Work", "Self"}});

    CHECK(posterior.name() == "P(Salary | Work=Self)");
    // 2/3 * 2/5 versus 1/3 * 1/4
    std::vector<double> expected = {16.0/21.0, 5.0/21.0};
    CHECK_APPROX_RANGES(posterior.values(), expected);
    CHECK(posterior.Value({"<50K"}) != doctest::Approx(2.0/3.0));

    posterior = fairbn::infer(bn, "Work", {{"Salary", ">=50K"}});
    CHECK(posterior.scope()[0].name() == "Work");
    expected = {2.0/4.0, 1.0/4.0, 1.0/4.0};
    CHECK_APPROX_RANGES(posterior.values(), expected);
}

TEST_CASE("[libfairbn] infer() on a chain network") {
    auto bn = chain_network();

    Factor posterior = fairbn::infer(bn, "C", {});
    std::vector<double> expected = {0.423, 0.577};
    CHECK_APPROX_RANGES(posterior.values(), expected);

    posterior = fairbn::infer(bn, "A", {{"C", "c1"}});
    expected = {0.129/0.577, 0.448/0.577};
    CHECK_APPROX_RANGES(posterior.values(), expected);

    posterior = fairbn::infer(bn, "B", {{"A", "a1"}, {"C", "c0"}});
    // 0.2*0.6 versus 0.8*0.3
    expected = {0.12/0.36, 0.24/0.36};
    CHECK_APPROX_RANGES(posterior.values(), expected);
}

TEST_CASE("[libfairbn] infer() does not depend on the elimination order") {
    auto chain = chain_network();
    auto base = fairbn::infer(chain, "C", {});
    auto reordered = fairbn::infer(chain, "C", {}, {"B", "A"});
    CHECK_APPROX_RANGES(reordered.values(), base.values());

    auto bn = census_network();
    std::vector<std::pair<std::string, evidence_t>> queries = {
        {"Salary", {}},
        {"Salary", {{"Work", "Private"}}},
        {"Work", {{"Gender", "Female"}}},
        {"Education", {{"Work", "Self"}, {"Gender", "Male"}}}
    };
    for(auto && q : queries) {
        const std::string &query = q.first;
        const evidence_t &evidence = q.second;
        CAPTURE(query);
        auto expected = fairbn::infer(bn, query, evidence);
        auto order = fairbn::declaration_order(bn, query, evidence);

        auto reversed = order;
        std::reverse(reversed.begin(), reversed.end());
        auto result = fairbn::infer(bn, query, evidence, reversed);
        CHECK_APPROX_RANGES(result.values(), expected.values());

        result = fairbn::infer(bn, query, evidence, fairbn::min_fill_order(bn, query, evidence));
        CHECK_APPROX_RANGES(result.values(), expected.values());
    }
}

TEST_CASE("[libfairbn] declaration_order() and min_fill_order()") {
    auto bn = chain_network();

    elimination_order_t expected = {"B", "C"};
    CHECK_EQ_RANGES(fairbn::declaration_order(bn, "A", {}), expected);
    expected = {"C", "B"};
    CHECK_EQ_RANGES(fairbn::min_fill_order(bn, "A", {}), expected);

    expected = {"A", "B"};
    CHECK_EQ_RANGES(fairbn::declaration_order(bn, "C", {}), expected);
    CHECK_EQ_RANGES(fairbn::min_fill_order(bn, "C", {}), expected);

    // observed variables are not eliminated
    expected = {"B"};
    CHECK_EQ_RANGES(fairbn::declaration_order(bn, "A", {{"C", "c0"}}), expected);
    CHECK_EQ_RANGES(fairbn::min_fill_order(bn, "A", {{"C", "c0"}}), expected);

    auto census = census_network();
    expected = {"Work", "Education", "Gender"};
    CHECK_EQ_RANGES(fairbn::declaration_order(census, "Salary", {}), expected);
    CHECK_EQ_RANGES(fairbn::min_fill_order(census, "Salary", {}), expected);
    // leaves have no fill; the class variable connects the others
    expected = {"Education", "Gender", "Salary"};
    CHECK_EQ_RANGES(fairbn::min_fill_order(census, "Work", {}), expected);
}

TEST_CASE("[libfairbn] infer() rejects a bad elimination order") {
    auto bn = chain_network();
    CHECK_THROWS_AS(fairbn::infer(bn, "A", {}, {"B"}), fairbn::InvalidVariable);
    CHECK_THROWS_AS(fairbn::infer(bn, "A", {}, {"B", "C", "B"}), fairbn::InvalidVariable);
    CHECK_THROWS_AS(fairbn::infer(bn, "A", {}, {"A", "B", "C"}), fairbn::InvalidVariable);
    CHECK_THROWS_AS(fairbn::infer(bn, "A", {}, {"B", "D"}), fairbn::InvalidVariable);
    CHECK_THROWS_AS(fairbn::infer(bn, "A", {{"C", "c0"}}, {"B", "C"}), fairbn::InvalidVariable);
    CHECK_NOTHROW(fairbn::infer(bn, "A", {{"C", "c0"}}, {"B"}));
}

TEST_CASE("[libfairbn] infer() rejects invalid queries and evidence") {
    auto bn = work_salary_network();
    CHECK_THROWS_AS(fairbn::infer(bn, "Gender", {}), fairbn::UnknownVariable);
    CHECK_THROWS_AS(fairbn::infer(bn, "Salary", {{"Gender", "Male"}}), fairbn::InvalidEvidence);
    CHECK_THROWS_AS(fairbn::infer(bn, "Salary", {{"Work", "Retired"}}), fairbn::InvalidEvidence);
    CHECK_THROWS_AS(fairbn::infer(bn, "Salary", {{"Salary", "<50K"}}), fairbn::InvalidEvidence);
    CHECK_THROWS_AS(fairbn::predict(bn, {{"Salary", "<50K"}}), fairbn::InvalidEvidence);
    CHECK_THROWS_AS(fairbn::predict(bn, "Gender", {}), fairbn::UnknownVariable);
}

TEST_CASE("[libfairbn] infer() with evidence of probability zero") {
    // Government never occurs in the training data
    auto smoothed = work_salary_network(1.0);
    Factor posterior = fairbn::infer(smoothed, "Salary", {{"Work", "Government"}});
    // 2/3 * 1/5 versus 1/3 * 1/4
    std::vector<double> expected = {8.0/13.0, 5.0/13.0};
    CHECK_APPROX_RANGES(posterior.values(), expected);

    auto unsmoothed = work_salary_network(0.0);
    CHECK_THROWS_AS(fairbn::infer(unsmoothed, "Salary", {{"Work", "Government"}}),
        fairbn::DegenerateDistribution);
    CHECK_THROWS_AS(fairbn::predict(unsmoothed, {{"Work", "Government"}}),
        fairbn::DegenerateDistribution);
    CHECK_NOTHROW(fairbn::infer(unsmoothed, "Salary", {{"Work", "Private"}}));
}

TEST_CASE("[libfairbn] predict() breaks ties by domain order") {
    Variable salary{"Salary", {"<50K", ">=50K"}};
    Variable work{"Work", {"Private", "Self"}};
    BayesianNetwork bn{"tie", {salary, work}, {
        Factor::Create({salary}, {0.25, 0.75}),
        Factor::Create({work, salary}, {0.25, 0.75, 0.75, 0.25})
    }, "Salary"};

    // 0.25*0.75 versus 0.75*0.25
    Factor posterior = fairbn::infer(bn, "Salary", {{"Work", "Self"}});
    std::vector<double> expected = {0.5, 0.5};
    CHECK_APPROX_RANGES(posterior.values(), expected);
    CHECK(fairbn::predict(bn, {{"Work", "Self"}}) == "<50K");
    CHECK(fairbn::predict(bn, {}) == ">=50K");

    Variable reversed{"Salary", {">=50K", "<50K"}};
    BayesianNetwork bn2{"tie", {reversed, work}, {
        Factor::Create({reversed}, {0.75, 0.25}),
        Factor::Create({work, reversed}, {0.75, 0.25, 0.25, 0.75})
    }, "Salary"};
    CHECK(fairbn::predict(bn2, {{"Work", "Self"}}) == ">=50K");
}

TEST_CASE("[libfairbn] infer() leaves the network unchanged") {
    auto bn = census_network();
    std::vector<table_t> before;
    for(auto && f : bn.factors()) {
        before.push_back(f.values());
    }
    fairbn::infer(bn, "Salary", {{"Work", "Self"}, {"Education", "Masters"}});
    fairbn::infer(bn, "Gender", {{"Salary", "<50K"}}, {"Work", "Education"});
    REQUIRE(before.size() == bn.factors().size());
    for(std::size_t i = 0; i < before.size(); ++i) {
        CHECK(bn.factors()[i].values() == before[i]);
    }
}
// LCOV_EXCL_STOP
