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

#ifndef FAIRBN_SUBCOMMAND_HPP
#define FAIRBN_SUBCOMMAND_HPP

#include <cstdlib>
#include <iostream>
#include <string>

#include <fairbn/fairbn.hpp>
#include <fairbn/elimination.hpp>
#include <fairbn/naive_bayes.hpp>
#include <fairbn/utility.hpp>

namespace fairbn {
namespace subcommand {

inline
int check_version_number() {
    if(fairbn::version_number_check_equal(FAIRBN_VERSION_INTEGER) == false) {
        std::cerr << "ERROR: Version mismatch between headers (v" FAIRBN_VERSION
                  << ") and library (v" << fairbn::version_string() << ").\n";
        std::cerr << "       fairbn linked against wrong version of library.\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

#define FAIRBN_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN() \
    do { \
        auto check = fairbn::subcommand::check_version_number(); \
        if(check != EXIT_SUCCESS) { \
            return check; \
        } \
    } while(false) \
/*spacer*/

// Parses ATTR=VALUE assignments into evidence.
// Throws std::invalid_argument on a malformed or repeated assignment.
inline
evidence_t parse_evidence(const std::vector<std::string> &assignments) {
    evidence_t evidence;
    for(auto && text : assignments) {
        auto pair = utility::split_assignment(text);
        if(!pair) {
            throw std::invalid_argument("Unable to parse evidence '" + text
                + "'; expected ATTR=VALUE.");
        }
        if(!evidence.emplace(pair->first, pair->second).second) {
            throw std::invalid_argument("Evidence for '" + pair->first
                + "' is given more than once.");
        }
    }
    return evidence;
}

// Naive Bayes options shared by the programs that train a model. Attributes
// use the Adult census domains unless `observed_domains` is set.
inline
NaiveBayesOptions training_options(double pseudocount, bool observed_domains) {
    NaiveBayesOptions options;
    options.pseudocount = pseudocount;
    if(!observed_domains) {
        options.domains = fairbn::salary_domains();
    }
    return options;
}

namespace string_literals {

inline
std::string operator"" _opt(const char* p, std::size_t n) {
    using namespace std::string_literals;

    // setup long argument
    std::string ret = "--"s;
    ret.append(p, n);

    // replace underscores with dashes
    for(auto &&s : ret) {
        if(s == '_') {
            s = '-';
        }
    }

    return ret;
}
} // namespace string_literals

} // namespace subcommand
} // namespace fairbn

#endif // FAIRBN_SUBCOMMAND_HPP
