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

#ifndef FAIRBN_NETWORK_HPP
#define FAIRBN_NETWORK_HPP

#include <fairbn/error.hpp>
#include <fairbn/factor.hpp>
#include <fairbn/variable.hpp>

#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace fairbn {

// A discrete Bayesian network: variables in declaration order and one
// conditional probability table per variable. The CPT of X has scope
// [X, parents(X)...]. One variable is designated as the class variable.
//
// Networks are immutable after construction and may be shared between
// threads.
class BayesianNetwork {
public:
    using variables_t = std::vector<Variable>;
    using factors_t = std::vector<Factor>;

    // `factors` may be given in any order; each is assigned to the variable
    // that leads its scope.
    BayesianNetwork(std::string name, variables_t variables, factors_t factors,
        const std::string &class_name);

    const std::string& name() const { return name_; }

    const variables_t& variables() const { return variables_; }

    // factors()[i] is the CPT of variables()[i]
    const factors_t& factors() const { return factors_; }

    const Variable& class_variable() const { return variables_[class_pos_]; }

    std::size_t NumberOfVariables() const { return variables_.size(); }

    std::size_t LookupVariablePosition(const std::string &name) const {
        auto it = names_.find(name);
        if(it == names_.end()) {
            return names_.size();
        }
        return it->second;
    }

    const Variable* LookupVariable(const std::string &name) const {
        auto it = names_.find(name);
        if(it == names_.end()) {
            return nullptr;
        }
        return &variables_[it->second];
    }

    // Throws UnknownVariable
    const Variable& GetVariable(const std::string &name) const;

    // Throws UnknownVariable
    const Factor& GetFactor(const std::string &name) const;

    void Print(std::ostream &os) const;

private:
    std::string name_;
    variables_t variables_;
    factors_t factors_;
    std::size_t class_pos_;
    std::unordered_map<std::string, variables_t::size_type> names_;
};

} // namespace fairbn

#endif // FAIRBN_NETWORK_HPP
