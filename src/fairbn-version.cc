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
#include <iostream>

#include <fairbn/fairbn.hpp>

#include <boost/version.hpp>
#include <xtensor/xtensor_config.hpp>

#include "subcommand.hpp"

int main(int argc, char *argv[]) {
    FAIRBN_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN();

    std::cout << "fairbn v" << fairbn::version_string() << "\n";
    std::cout << "    xtensor " << XTENSOR_VERSION_MAJOR << "."
              << XTENSOR_VERSION_MINOR << "." << XTENSOR_VERSION_PATCH << "\n";
    std::cout << "    Boost " << BOOST_VERSION / 100000 << "."
              << BOOST_VERSION / 100 % 1000 << "." << BOOST_VERSION % 100 << std::endl;
    return EXIT_SUCCESS;
}
