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

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <fairbn/fairbn.hpp>
#include <fairbn/dataset.hpp>
#include <fairbn/fairness.hpp>
#include <fairbn/naive_bayes.hpp>

#include <CLI/CLI.hpp>

#include "subcommand.hpp"

using namespace std::string_literals;

namespace {
struct args_t {
    std::filesystem::path train{"adult-train.csv"};
    std::filesystem::path test{"adult-test.csv"};

    std::string class_attribute{"Salary"};
    std::string positive_label{">=50K"};
    std::string sensitive_attribute{"Gender"};
    std::vector<std::string> groups{"Female", "Male"};
    std::vector<std::string> evidence{"Work", "Education", "Occupation", "Relationship"};

    double threshold{0.5};
    double pseudocount{1.0};
    bool observed_domains{false};
    bool quiet{false};
} args;
}  // anon namespace

int main(int argc, char *argv[]) {
    FAIRBN_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN();

    using namespace fairbn::subcommand::string_literals;

    CLI::App app{"fairbn fairness v" FAIRBN_VERSION};
    app.set_config("--config");

    #define ADD_OPTION_(name, desc) app.add_option(#name##_opt, args.name, desc)->capture_default_str()

    ADD_OPTION_(train, "Training data (CSV)")->check(CLI::ExistingFile);
    ADD_OPTION_(test, "Test data (CSV)")->check(CLI::ExistingFile);
    ADD_OPTION_(class_attribute, "Class attribute");
    ADD_OPTION_(positive_label, "Positive label of the class attribute");
    ADD_OPTION_(sensitive_attribute, "Sensitive attribute");
    ADD_OPTION_(groups, "The two groups of the sensitive attribute")->expected(2);
    ADD_OPTION_(evidence, "Evidence attributes");
    ADD_OPTION_(threshold, "Posterior above which a row is predicted positive");
    ADD_OPTION_(pseudocount, "Pseudocount added to every count")
        ->check(CLI::NonNegativeNumber);
    #undef ADD_OPTION_

    app.add_flag("--observed-domains", args.observed_domains,
        "Use the values observed in training as domains instead of the Adult census domains");
    app.add_flag("-q,--quiet", args.quiet, "Suppress progress messages");

    CLI11_PARSE(app, argc, argv);

    try {
        auto train = fairbn::Dataset::parse_csv_file(args.train);
        if(!args.quiet) {
            std::cout << "# Training on " << train.NumberOfRows() << " rows from "
                      << args.train << "\n";
        }
        auto bn = fairbn::build_naive_bayes(train, args.class_attribute,
            fairbn::subcommand::training_options(args.pseudocount, args.observed_domains));

        auto test = fairbn::Dataset::parse_csv_file(args.test);
        if(!args.quiet) {
            std::cout << "# Evaluating " << test.NumberOfRows() << " rows from "
                      << args.test << "\n";
        }

        fairbn::FairnessOptions options;
        options.class_attribute = args.class_attribute;
        options.positive_label = args.positive_label;
        options.sensitive_attribute = args.sensitive_attribute;
        options.groups = {{args.groups.at(0), args.groups.at(1)}};
        options.evidence_attributes = args.evidence;
        options.threshold = args.threshold;

        auto report = fairbn::evaluate_fairness(bn, test, options);
        if(!args.quiet) {
            for(std::size_t g = 0; g < 2; ++g) {
                std::cout << "# " << options.groups[g] << ": "
                          << report.group_rows[g] << " rows, "
                          << report.positive_rows[g] << " predicted "
                          << options.positive_label << "\n";
            }
        }
        std::cout << std::fixed << std::setprecision(2);
        for(int q = 1; q <= 6; ++q) {
            std::cout << "Q" << q << ": " << report.question(q) << "\n";
        }
    } catch(std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
