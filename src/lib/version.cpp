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

#include <doctest/doctest.h>

#include <fairbn/fairbn.hpp>

#include <cstring>

// FAIRBN_VERSION_INTEGER packs the version as MMMmmmPPPP
static_assert(FAIRBN_VERSION_MINOR < 1000 && FAIRBN_VERSION_PATCH < 10000,  // NOLINT
              "FAIRBN_VERSION_INTEGER cannot encode this version.");

namespace {
constexpr int library_version_integer = FAIRBN_VERSION_INTEGER;
constexpr char library_version[] = FAIRBN_VERSION;
}

int fairbn::version_integer() { return library_version_integer; }

const char* fairbn::version_string() { return library_version; }

bool fairbn::version_number_check_equal(int version_int) {
    return version_int == library_version_integer;
}

// LCOV_EXCL_START
TEST_CASE("[libfairbn] the library version matches the headers") {
    CHECK(fairbn::version_integer() == FAIRBN_VERSION_INTEGER);
    CHECK(std::strcmp(fairbn::version_string(), FAIRBN_VERSION) == 0);
    CHECK(fairbn::version_number_check_equal(FAIRBN_VERSION_INTEGER));
    CHECK_FALSE(fairbn::version_number_check_equal(FAIRBN_VERSION_INTEGER + 1));
    CHECK(fairbn::version_integer() / 10000000 == FAIRBN_VERSION_MAJOR);
    CHECK(fairbn::version_integer() / 10000 % 1000 == FAIRBN_VERSION_MINOR);
    CHECK(fairbn::version_integer() % 10000 == FAIRBN_VERSION_PATCH);
}
// LCOV_EXCL_STOP
