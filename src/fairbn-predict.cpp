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
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <fairbn/fairbn.hpp>
#include <fairbn/dataset.hpp>
#include <fairbn/elimination.hpp>
#include <fairbn/naive_bayes.hpp>

#include <CLI/CLI.hpp>

#include "subcommand.hpp"

using namespace std::string_literals;

namespace {
enum struct Order {
    Declaration, MinFill
};

const std::map<std::string, Order> ORDER_MAP = {
    {"declaration", Order::Declaration},
    {"min-fill", Order::MinFill}
};

struct args_t {
    std::filesystem::path train{"adult-train.csv"};

    std::string class_attribute{"Salary"};
    std::string query{};
    std::vector<std::string> evidence{};

    Order order{Order::Declaration};
    double pseudocount{1.0};
    bool observed_domains{false};
    bool print_model{false};
    bool quiet{false};
} args;
}  // anon namespace

int main(int argc, char *argv[]) {
    FAIRBN_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN();

    using namespace fairbn::subcommand::string_literals;

    CLI::App app{"fairbn predict v" FAIRBN_VERSION};
    app.set_config("--config");

    #define ADD_OPTION_(name, desc) app.add_option(#name##_opt, args.name, desc)

    ADD_OPTION_(train, "Training data (CSV)")->capture_default_str()
        ->check(CLI::ExistingFile);
    ADD_OPTION_(class_attribute, "Class attribute")->capture_default_str();
    ADD_OPTION_(query, "Query variable (default: the class attribute)");
    ADD_OPTION_(pseudocount, "Pseudocount added to every count")->capture_default_str()
        ->check(CLI::NonNegativeNumber);
    ADD_OPTION_(order, "Elimination order")
        ->transform(CLI::CheckedTransformer(ORDER_MAP, CLI::ignore_case));
    #undef ADD_OPTION_

    app.add_option("-e,--evidence", args.evidence, "Observed value as ATTR=VALUE");
    app.add_flag("--observed-domains", args.observed_domains,
        "Use the values observed in training as domains instead of the Adult census domains");
    app.add_flag("--print-model", args.print_model, "Print the trained network");
    app.add_flag("-q,--quiet", args.quiet, "Suppress progress messages");

    CLI11_PARSE(app, argc, argv);

    try {
        auto evidence = fairbn::subcommand::parse_evidence(args.evidence);

        auto train = fairbn::Dataset::parse_csv_file(args.train);
        if(!args.quiet) {
            std::cout << "# Training on " << train.NumberOfRows() << " rows from "
                      << args.train << "\n";
        }
        auto bn = fairbn::build_naive_bayes(train, args.class_attribute,
            fairbn::subcommand::training_options(args.pseudocount, args.observed_domains));
        if(args.print_model) {
            bn.Print(std::cout);
        }

        std::string query = args.query.empty() ? args.class_attribute : args.query;
        fairbn::elimination_order_t order;
        if(args.order == Order::MinFill) {
            order = fairbn::min_fill_order(bn, query, evidence);
        } else {
            order = fairbn::declaration_order(bn, query, evidence);
        }
        auto posterior = fairbn::infer(bn, query, evidence, order);
        posterior.Print(std::cout);

        std::cout << "prediction\t"
                  << posterior.scope()[0].Label(fairbn::arg_max(posterior)) << "\n";
    } catch(std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
