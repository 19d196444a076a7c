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

#ifndef FAIRBN_ERROR_HPP
#define FAIRBN_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fairbn {

// Input errors: malformed evidence, bad variable references, bad training data.
// None of these are recoverable by retrying the call.
class Error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Evidence names an unknown variable, assigns the query variable, or uses
// a label outside the variable's domain.
class InvalidEvidence : public Error {
public:
    using Error::Error;
};

// A factor operation names a variable that is not in the factor's scope.
class InvalidVariable : public Error {
public:
    using Error::Error;
};

// A query names a variable that is not in the network.
class UnknownVariable : public Error {
public:
    using Error::Error;
};

class EmptyDataset : public Error {
public:
    using Error::Error;
};

class MissingClassColumn : public Error {
public:
    using Error::Error;
};

// Normalization of a factor with zero total mass, i.e. the evidence has
// probability zero under the model.
class DegenerateDistribution : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace fairbn

#endif // FAIRBN_ERROR_HPP
