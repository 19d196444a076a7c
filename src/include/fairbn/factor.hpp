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

#ifndef FAIRBN_FACTOR_HPP
#define FAIRBN_FACTOR_HPP

#include <fairbn/error.hpp>
#include <fairbn/variable.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <boost/container/small_vector.hpp>

#include <xtensor/xarray.hpp>

namespace fairbn {

using value_t = double;
using table_t = xt::xarray<value_t>;
using shape_t = table_t::shape_type;

// A non-negative table over the cross-product of the domains of an ordered
// scope of variables.
//
// Axis i of the table corresponds to scope[i] and position j along that
// axis to the j-th label of its domain. Tables are stored row-major, so the
// last variable of the scope varies fastest. A factor with an empty scope
// holds exactly one scalar.
//
// Factors are values: no operation modifies its inputs.
class Factor {
public:
    using scope_t = boost::container::small_vector<Variable, 4>;
    using assignment_t = std::vector<std::string>;

    // all-zero table
    explicit Factor(scope_t scope, std::string name = {});

    Factor(scope_t scope, table_t values, std::string name = {});

    // construct from values in row-major order
    static Factor Create(scope_t scope, const std::vector<value_t> &values,
        std::string name = {});

    // all-one table; the identity of multiply
    static Factor Unit(scope_t scope);

    static Factor Scalar(value_t value);

    const scope_t& scope() const { return scope_; }
    const table_t& values() const { return values_; }
    const std::string& name() const { return name_; }

    std::size_t dimension() const { return scope_.size(); }
    std::size_t size() const { return values_.size(); }

    std::optional<std::size_t> AxisOf(const std::string &name) const;
    std::optional<std::size_t> AxisOf(const Variable &var) const {
        return AxisOf(var.name());
    }

    bool Contains(const Variable &var) const { return AxisOf(var).has_value(); }

    // value at an assignment with one label per scope variable, in scope order
    value_t Value(const assignment_t &labels) const;

    value_t Sum() const;

    // One line per assignment: labels followed by the value, tab separated.
    void Print(std::ostream &os) const;

private:
    scope_t scope_;
    table_t values_;
    std::string name_;
};

shape_t make_shape(const Factor::scope_t &scope);

// Slice of `factor` where `variable` takes `value`; `variable` is dropped
// from the scope. Throws InvalidEvidence if `variable` is not in scope or
// `value` is not in its domain.
Factor restrict(const Factor &factor, const Variable &variable, const std::string &value);

// Pointwise product over the union of scopes. The result scope is a's scope
// followed by the variables of b's scope that are not in a's, in b's order.
Factor multiply(const Factor &a, const Factor &b);

// Left fold of the binary product. The empty product is the scalar 1.
Factor multiply(const std::vector<Factor> &factors);

// Throws InvalidVariable if `variable` is not in scope.
Factor sum_out(const Factor &factor, const Variable &variable);

// Throws DegenerateDistribution if the total mass is zero.
Factor normalize(const Factor &factor);

// Reorders the axes of `factor` to follow `order`, which must be a
// permutation of its scope.
Factor permute(const Factor &factor, const Factor::scope_t &order);

// Position of the largest value of a one-variable factor. Ties resolve to
// the earliest position.
std::size_t arg_max(const Factor &factor);

} // namespace fairbn

#endif // FAIRBN_FACTOR_HPP
