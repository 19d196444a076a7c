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

#ifndef FAIRBN_VARIABLE_HPP
#define FAIRBN_VARIABLE_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fairbn {

// A named discrete random variable with an ordered domain of outcome labels.
//
// Variables are immutable handles. Copies share the same name and domain,
// so factors can hold variables by value without duplicating domains.
// Two variables are equal iff their names are equal.
class Variable {
public:
    using domain_t = std::vector<std::string>;

    Variable(std::string name, domain_t domain);

    const std::string& name() const { return data_->name; }
    const domain_t& domain() const { return data_->domain; }

    // cardinality of the domain
    std::size_t size() const { return data_->domain.size(); }

    std::optional<std::size_t> IndexOf(const std::string &label) const;

    const std::string& Label(std::size_t pos) const {
        return data_->domain.at(pos);
    }

    friend bool operator==(const Variable &lhs, const Variable &rhs) {
        return lhs.name() == rhs.name();
    }
    friend bool operator!=(const Variable &lhs, const Variable &rhs) {
        return !(lhs == rhs);
    }
    friend bool operator<(const Variable &lhs, const Variable &rhs) {
        return lhs.name() < rhs.name();
    }

private:
    struct data_t {
        std::string name;
        domain_t domain;
    };
    std::shared_ptr<const data_t> data_;
};

std::ostream& operator<<(std::ostream &os, const Variable &var);

} // namespace fairbn

#endif // FAIRBN_VARIABLE_HPP
