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

#include <fairbn/factor.hpp>

#include <algorithm>
#include <array>

#include <xtensor/xmath.hpp>
#include <xtensor/xmanipulation.hpp>
#include <xtensor/xstrided_view.hpp>

using fairbn::Factor;
using fairbn::Variable;
using fairbn::table_t;
using fairbn::shape_t;
using fairbn::value_t;

fairbn::shape_t fairbn::make_shape(const Factor::scope_t &scope) {
    shape_t ret(scope.size());
    std::transform(scope.begin(), scope.end(), ret.begin(),
        [](const Variable &v) { return v.size(); });
    return ret;
}

Factor::Factor(scope_t scope, std::string name) :
    Factor(scope, table_t(make_shape(scope), value_t{0}), std::move(name)) {
}

Factor::Factor(scope_t scope, table_t values, std::string name) :
    scope_{std::move(scope)}, values_{std::move(values)}, name_{std::move(name)} {
    for(auto it = scope_.begin(); it != scope_.end(); ++it) {
        if(std::find(std::next(it), scope_.end(), *it) != scope_.end()) {
            throw std::invalid_argument("Variable '" + it->name()
                + "' appears more than once in the scope of a factor.");
        }
    }
    if(values_.dimension() != scope_.size()) {
        throw std::invalid_argument("Factor table has "
            + std::to_string(values_.dimension()) + " axes but its scope has "
            + std::to_string(scope_.size()) + " variables.");
    }
    for(std::size_t i = 0; i < scope_.size(); ++i) {
        if(values_.shape()[i] != scope_[i].size()) {
            throw std::invalid_argument("Factor table axis for variable '"
                + scope_[i].name() + "' does not match the size of its domain.");
        }
    }
    for(auto x : values_) {
        if(!(x >= 0.0)) {
            throw std::invalid_argument("Factor values must be non-negative.");
        }
    }
}

Factor Factor::Create(scope_t scope, const std::vector<value_t> &values, std::string name) {
    table_t table(make_shape(scope), value_t{0});
    if(values.size() != table.size()) {
        throw std::invalid_argument("Factor requires " + std::to_string(table.size())
            + " values but " + std::to_string(values.size()) + " were given.");
    }
    std::copy(values.begin(), values.end(), table.data());
    return Factor(std::move(scope), std::move(table), std::move(name));
}

Factor Factor::Unit(scope_t scope) {
    auto shape = make_shape(scope);
    return Factor(std::move(scope), table_t(shape, value_t{1}));
}

Factor Factor::Scalar(value_t value) {
    return Factor({}, table_t(shape_t{}, value));
}

std::optional<std::size_t> Factor::AxisOf(const std::string &name) const {
    for(std::size_t i = 0; i < scope_.size(); ++i) {
        if(scope_[i].name() == name) {
            return i;
        }
    }
    return std::nullopt;
}

value_t Factor::Value(const assignment_t &labels) const {
    if(labels.size() != scope_.size()) {
        throw std::invalid_argument("Assignment has " + std::to_string(labels.size())
            + " labels but the factor scope has " + std::to_string(scope_.size())
            + " variables.");
    }
    std::vector<std::size_t> index(scope_.size());
    for(std::size_t i = 0; i < scope_.size(); ++i) {
        auto pos = scope_[i].IndexOf(labels[i]);
        if(!pos) {
            throw InvalidEvidence("Label '" + labels[i]
                + "' is not in the domain of variable '" + scope_[i].name() + "'.");
        }
        index[i] = *pos;
    }
    return values_.element(index.begin(), index.end());
}

value_t Factor::Sum() const {
    return xt::sum(values_)();
}

void Factor::Print(std::ostream &os) const {
    if(!name_.empty()) {
        os << "# " << name_ << "\n";
    }
    const auto &shape = values_.shape();
    std::vector<std::size_t> index(scope_.size());
    for(std::size_t k = 0; k < values_.size(); ++k) {
        // unravel k in row-major order
        std::size_t rem = k;
        for(std::size_t i = scope_.size(); i-- > 0;) {
            index[i] = rem % shape[i];
            rem /= shape[i];
        }
        for(std::size_t i = 0; i < scope_.size(); ++i) {
            os << scope_[i].Label(index[i]) << '\t';
        }
        os << values_.data()[k] << '\n';
    }
}

Factor fairbn::restrict(const Factor &factor, const Variable &variable, const std::string &value) {
    auto axis = factor.AxisOf(variable);
    if(!axis) {
        throw InvalidEvidence("Cannot restrict on variable '" + variable.name()
            + "': it is not in the scope of the factor.");
    }
    const Variable &var = factor.scope()[*axis];
    auto pos = var.IndexOf(value);
    if(!pos) {
        throw InvalidEvidence("Cannot restrict on variable '" + var.name()
            + "': '" + value + "' is not in its domain.");
    }

    xt::xstrided_slice_vector slices(factor.dimension(), xt::all());
    slices[*axis] = static_cast<std::ptrdiff_t>(*pos);
    table_t values = xt::strided_view(factor.values(), slices);

    Factor::scope_t scope = factor.scope();
    scope.erase(scope.begin() + *axis);
    return Factor(std::move(scope), std::move(values), factor.name());
}

Factor fairbn::multiply(const Factor &a, const Factor &b) {
    Factor::scope_t scope = a.scope();
    for(auto && v : b.scope()) {
        if(auto axis = a.AxisOf(v)) {
            if(a.scope()[*axis].domain() != v.domain()) {
                throw InvalidVariable("Cannot multiply factors: variable '"
                    + v.name() + "' has different domains.");
            }
        } else {
            scope.push_back(v);
        }
    }

    // pad a with unit axes for the variables that only b has
    shape_t a_shape(scope.size(), 1);
    std::copy(a.values().shape().begin(), a.values().shape().end(), a_shape.begin());
    table_t a_ext = a.values();
    a_ext.reshape(a_shape);

    // put b's axes in result order and insert unit axes where b is silent
    std::vector<std::size_t> permutation;
    shape_t b_shape(scope.size(), 1);
    for(std::size_t i = 0; i < scope.size(); ++i) {
        if(auto axis = b.AxisOf(scope[i])) {
            permutation.push_back(*axis);
            b_shape[i] = scope[i].size();
        }
    }
    table_t b_ext = (permutation.size() > 1) ?
        table_t(xt::transpose(b.values(), permutation)) : b.values();
    b_ext.reshape(b_shape);

    table_t values = a_ext * b_ext;
    return Factor(std::move(scope), std::move(values));
}

Factor fairbn::multiply(const std::vector<Factor> &factors) {
    if(factors.empty()) {
        return Factor::Scalar(1.0);
    }
    Factor ret = factors.front();
    for(auto it = std::next(factors.begin()); it != factors.end(); ++it) {
        ret = multiply(ret, *it);
    }
    return ret;
}

Factor fairbn::sum_out(const Factor &factor, const Variable &variable) {
    auto axis = factor.AxisOf(variable);
    if(!axis) {
        throw InvalidVariable("Cannot sum out variable '" + variable.name()
            + "': it is not in the scope of the factor.");
    }
    std::array<std::size_t, 1> axes = {*axis};
    table_t values = xt::sum(factor.values(), axes);

    Factor::scope_t scope = factor.scope();
    scope.erase(scope.begin() + *axis);
    return Factor(std::move(scope), std::move(values), factor.name());
}

Factor fairbn::normalize(const Factor &factor) {
    value_t total = factor.Sum();
    if(!(total > 0.0)) {
        throw DegenerateDistribution("Cannot normalize a factor with zero total mass; "
            "the evidence has probability zero under the model.");
    }
    table_t values = factor.values() / total;
    return Factor(factor.scope(), std::move(values), factor.name());
}

Factor fairbn::permute(const Factor &factor, const Factor::scope_t &order) {
    if(order.size() != factor.dimension()) {
        throw InvalidVariable("Cannot permute factor: the new order has "
            + std::to_string(order.size()) + " variables but the scope has "
            + std::to_string(factor.dimension()) + ".");
    }
    std::vector<std::size_t> permutation;
    for(auto && v : order) {
        auto axis = factor.AxisOf(v);
        if(!axis) {
            throw InvalidVariable("Cannot permute factor: variable '" + v.name()
                + "' is not in its scope.");
        }
        if(std::find(permutation.begin(), permutation.end(), *axis) != permutation.end()) {
            throw InvalidVariable("Cannot permute factor: variable '" + v.name()
                + "' is listed more than once.");
        }
        permutation.push_back(*axis);
    }
    Factor::scope_t scope;
    for(auto axis : permutation) {
        scope.push_back(factor.scope()[axis]);
    }
    table_t values = (permutation.size() > 1) ?
        table_t(xt::transpose(factor.values(), permutation)) : factor.values();
    return Factor(std::move(scope), std::move(values), factor.name());
}

std::size_t fairbn::arg_max(const Factor &factor) {
    if(factor.dimension() != 1) {
        throw std::invalid_argument("arg_max requires a factor over exactly one variable.");
    }
    const auto &values = factor.values();
    std::size_t best = 0;
    for(std::size_t i = 1; i < values.size(); ++i) {
        if(values(i) > values(best)) {
            best = i;
        }
    }
    return best;
}

// LCOV_EXCL_START
namespace {
struct factor_fixture_t {
    Variable A{"A", {"a0", "a1"}};
    Variable B{"B", {"b0", "b1", "b2"}};
    Variable C{"C", {"c0", "c1"}};

    // f(a,b) and g(b,c) both hold 1..6 in row-major order
    Factor f_ab = Factor::Create({A, B}, {1, 2, 3, 4, 5, 6}, "f");
    Factor g_bc = Factor::Create({B, C}, {1, 2, 3, 4, 5, 6}, "g");
};

std::vector<std::string> scope_names(const Factor &f) {
    std::vector<std::string> ret;
    for(auto && v : f.scope()) {
        ret.push_back(v.name());
    }
    return ret;
}
} // namespace

TEST_CASE("[libfairbn] Factor::Factor") {
    factor_fixture_t fix;
    using fairbn::table_t;

    Factor zero({fix.A, fix.B});
    CHECK(zero.dimension() == 2);
    CHECK(zero.size() == 6);
    CHECK(zero.Sum() == 0.0);

    CHECK(fix.f_ab.name() == "f");
    CHECK(fix.f_ab.Value({"a0", "b0"}) == 1.0);
    CHECK(fix.f_ab.Value({"a0", "b2"}) == 3.0);
    CHECK(fix.f_ab.Value({"a1", "b0"}) == 4.0);
    CHECK(fix.f_ab.Value({"a1", "b2"}) == 6.0);
    CHECK(fix.f_ab.Sum() == 21.0);
    CHECK(fix.f_ab.AxisOf(fix.B) == 1u);
    CHECK(fix.f_ab.AxisOf("C") == std::nullopt);
    CHECK(fix.f_ab.Contains(fix.A));
    CHECK_FALSE(fix.f_ab.Contains(fix.C));

    CHECK_THROWS_AS(fix.f_ab.Value({"a0"}), std::invalid_argument);
    CHECK_THROWS_AS(fix.f_ab.Value({"a0", "b9"}), fairbn::InvalidEvidence);

    CHECK_THROWS_AS(Factor::Create({fix.A, fix.B}, {1, 2, 3}), std::invalid_argument);
    CHECK_THROWS_AS(Factor::Create({fix.A}, {1, -2}), std::invalid_argument);
    CHECK_THROWS_AS(Factor::Create({fix.A, fix.A}, {1, 2, 3, 4}), std::invalid_argument);
    CHECK_THROWS_AS(Factor({fix.A}, table_t(fairbn::shape_t{3}, 1.0)), std::invalid_argument);
    CHECK_THROWS_AS(Factor({fix.A, fix.B}, table_t(fairbn::shape_t{2}, 1.0)), std::invalid_argument);

    Factor unit = Factor::Unit({fix.A, fix.C});
    CHECK(unit.Sum() == 4.0);

    Factor scalar = Factor::Scalar(2.5);
    CHECK(scalar.dimension() == 0);
    CHECK(scalar.size() == 1);
    CHECK(scalar.Value({}) == 2.5);
}

TEST_CASE("[libfairbn] restrict") {
    factor_fixture_t fix;
    using fairbn::restrict;

    Factor r = restrict(fix.f_ab, fix.B, "b1");
    CHECK(r.name() == "f");
    std::vector<std::string> expected_scope = {"A"};
    CHECK_EQ_RANGES(scope_names(r), expected_scope);
    std::vector<double> expected = {2, 5};
    CHECK_APPROX_RANGES(r.values(), expected);

    Factor s = restrict(fix.f_ab, fix.A, "a1");
    expected_scope = {"B"};
    CHECK_EQ_RANGES(scope_names(s), expected_scope);
    expected = {4, 5, 6};
    CHECK_APPROX_RANGES(s.values(), expected);

    Factor t = restrict(s, fix.B, "b2");
    CHECK(t.dimension() == 0);
    CHECK(t.Value({}) == 6.0);

    // input is unchanged
    CHECK(fix.f_ab.dimension() == 2);
    CHECK(fix.f_ab.Sum() == 21.0);

    CHECK_THROWS_AS(restrict(fix.f_ab, fix.C, "c0"), fairbn::InvalidEvidence);
    CHECK_THROWS_AS(restrict(fix.f_ab, fix.A, "a2"), fairbn::InvalidEvidence);
    // a restricted variable leaves the scope, so restricting again fails
    CHECK_THROWS_AS(restrict(r, fix.B, "b1"), fairbn::InvalidEvidence);
}

TEST_CASE("[libfairbn] multiply") {
    factor_fixture_t fix;
    using fairbn::multiply;

    Factor ab_bc = multiply(fix.f_ab, fix.g_bc);
    std::vector<std::string> expected_scope = {"A", "B", "C"};
    CHECK_EQ_RANGES(scope_names(ab_bc), expected_scope);
    std::vector<double> expected = {1, 2, 6, 8, 15, 18, 4, 8, 15, 20, 30, 36};
    CHECK_APPROX_RANGES(ab_bc.values(), expected);

    Factor bc_ab = multiply(fix.g_bc, fix.f_ab);
    expected_scope = {"B", "C", "A"};
    CHECK_EQ_RANGES(scope_names(bc_ab), expected_scope);
    expected = {1, 4, 2, 8, 6, 15, 8, 20, 15, 30, 18, 36};
    CHECK_APPROX_RANGES(bc_ab.values(), expected);

    // shared variables in a different order
    Factor g_ba = Factor::Create({fix.B, fix.A}, {1, 2, 3, 4, 5, 6});
    Factor ab_ba = multiply(fix.f_ab, g_ba);
    expected_scope = {"A", "B"};
    CHECK_EQ_RANGES(scope_names(ab_ba), expected_scope);
    expected = {1, 6, 15, 8, 20, 36};
    CHECK_APPROX_RANGES(ab_ba.values(), expected);

    // scalars scale elementwise
    Factor twice = multiply(Factor::Scalar(2.0), fix.f_ab);
    CHECK_EQ_RANGES(scope_names(twice), expected_scope);
    expected = {2, 4, 6, 8, 10, 12};
    CHECK_APPROX_RANGES(twice.values(), expected);
    Factor half = multiply(fix.f_ab, Factor::Scalar(0.5));
    expected = {0.5, 1, 1.5, 2, 2.5, 3};
    CHECK_APPROX_RANGES(half.values(), expected);

    Factor unit = multiply(fix.f_ab, Factor::Unit({fix.B}));
    expected = {1, 2, 3, 4, 5, 6};
    CHECK_APPROX_RANGES(unit.values(), expected);

    CHECK(multiply(std::vector<Factor>{}).Value({}) == 1.0);
    Factor three = multiply(std::vector<Factor>{fix.f_ab, fix.g_bc, Factor::Scalar(2.0)});
    CHECK(three.Value({"a1", "b2", "c1"}) == doctest::Approx(72.0));

    Variable other_b{"B", {"x", "y"}};
    CHECK_THROWS_AS(multiply(fix.f_ab, Factor::Unit({other_b})), fairbn::InvalidVariable);
}

TEST_CASE("[libfairbn] sum_out") {
    factor_fixture_t fix;
    using fairbn::sum_out;

    Factor b = sum_out(fix.f_ab, fix.A);
    std::vector<std::string> expected_scope = {"B"};
    CHECK_EQ_RANGES(scope_names(b), expected_scope);
    std::vector<double> expected = {5, 7, 9};
    CHECK_APPROX_RANGES(b.values(), expected);

    Factor a = sum_out(fix.f_ab, fix.B);
    expected = {6, 15};
    CHECK_APPROX_RANGES(a.values(), expected);

    Factor total = sum_out(a, fix.A);
    CHECK(total.dimension() == 0);
    CHECK(total.Value({}) == doctest::Approx(21.0));

    CHECK_THROWS_AS(sum_out(fix.f_ab, fix.C), fairbn::InvalidVariable);
    CHECK_THROWS_AS(sum_out(a, fix.B), fairbn::InvalidVariable);
}

TEST_CASE("[libfairbn] normalize") {
    factor_fixture_t fix;
    using fairbn::normalize;

    Factor n = normalize(fix.f_ab);
    CHECK(n.Sum() == doctest::Approx(1.0).epsilon(1e-9));
    CHECK(n.Value({"a1", "b2"}) == doctest::Approx(6.0/21.0));
    CHECK(fix.f_ab.Sum() == 21.0);

    Factor s = normalize(Factor::Scalar(0.25));
    CHECK(s.Value({}) == doctest::Approx(1.0));

    CHECK_THROWS_AS(normalize(Factor({fix.A, fix.B})), fairbn::DegenerateDistribution);
    CHECK_THROWS_AS(normalize(Factor::Scalar(0.0)), fairbn::DegenerateDistribution);
}

TEST_CASE("[libfairbn] marginals of a product do not depend on operand order") {
    factor_fixture_t fix;
    using fairbn::multiply;
    using fairbn::sum_out;
    using fairbn::permute;

    Factor lhs = sum_out(multiply(fix.f_ab, fix.g_bc), fix.B);
    Factor rhs = sum_out(multiply(fix.g_bc, fix.f_ab), fix.B);

    std::vector<std::string> expected_scope = {"A", "C"};
    CHECK_EQ_RANGES(scope_names(lhs), expected_scope);
    expected_scope = {"C", "A"};
    CHECK_EQ_RANGES(scope_names(rhs), expected_scope);

    Factor::scope_t canonical = {fix.A, fix.C};
    Factor rhs_canonical = permute(rhs, canonical);
    std::vector<double> expected = {22, 28, 49, 64};
    CHECK_APPROX_RANGES(lhs.values(), expected);
    CHECK_APPROX_RANGES(rhs_canonical.values(), expected);

    CHECK_THROWS_AS(permute(rhs, {fix.A}), fairbn::InvalidVariable);
    CHECK_THROWS_AS(permute(rhs, {fix.A, fix.A}), fairbn::InvalidVariable);
    CHECK_THROWS_AS(permute(rhs, {fix.A, fix.B}), fairbn::InvalidVariable);
}

TEST_CASE("[libfairbn] arg_max") {
    factor_fixture_t fix;
    using fairbn::arg_max;

    CHECK(arg_max(Factor::Create({fix.B}, {0.2, 0.5, 0.3})) == 1);
    CHECK(arg_max(Factor::Create({fix.B}, {0.4, 0.2, 0.4})) == 0);
    CHECK(arg_max(Factor::Create({fix.A}, {0.5, 0.5})) == 0);
    CHECK(arg_max(Factor::Create({fix.A}, {0.1, 0.9})) == 1);
    CHECK_THROWS_AS(arg_max(fix.f_ab), std::invalid_argument);
}

TEST_CASE("[libfairbn] Factor::Print") {
    factor_fixture_t fix;

    std::ostringstream os;
    Factor::Create({fix.A}, {0.25, 0.75}, "P(A)").Print(os);
    CHECK(os.str() == "# P(A)\na0\t0.25\na1\t0.75\n");

    os.str("");
    fairbn::restrict(fix.f_ab, fix.A, "a0").Print(os);
    CHECK(os.str() == "# f\nb0\t1\nb1\t2\nb2\t3\n");
}
// LCOV_EXCL_STOP
