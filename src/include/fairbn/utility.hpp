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

#ifndef FAIRBN_UTILITY_HPP
#define FAIRBN_UTILITY_HPP

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/tokenizer.hpp>
#include <boost/range/iterator.hpp>
#include <boost/range/distance.hpp>
#include <boost/range/algorithm/find.hpp>
#include <boost/range/as_literal.hpp>
#include <boost/range/size.hpp>

namespace fairbn {
namespace utility {

// Key search functions
template<typename Range, typename Value>
inline
std::size_t find_position(const Range& r, const Value& v) {
    return boost::distance(boost::find<boost::return_begin_found>(r, v));
}

template<typename Range, typename Value>
inline
std::optional<std::size_t> find_index(const Range& r, const Value& v) {
    auto pos = find_position(r, v);
    if(pos == static_cast<std::size_t>(boost::size(r))) {
        return std::nullopt;
    }
    return pos;
}

// Tokenization Functions
namespace detail {
    using token_function = boost::char_separator<char>;
    template<typename Range>
    using char_tokenizer = boost::tokenizer<token_function, typename boost::range_iterator<const Range>::type>;

    using csv_function = boost::escaped_list_separator<char>;
    template<typename Range>
    using csv_tokenizer = boost::tokenizer<csv_function, typename boost::range_iterator<const Range>::type>;
};

template<typename Range>
inline
detail::char_tokenizer<Range>
make_tokenizer(const Range& text, const char *sep = "\t", const char *eol = "\n") {
    detail::token_function f(sep, eol, boost::keep_empty_tokens);
    return {boost::as_literal(text),f};
}

// Splits one line of comma separated values. Fields may be quoted with '"'
// to protect commas. There is no escape character, so '\' is an ordinary
// character, and a doubled quote inside a quoted field is dropped rather
// than read as a literal quote.
template<typename Range>
inline
detail::csv_tokenizer<Range>
make_csv_tokenizer(const Range& line) {
    detail::csv_function f(std::string{}, std::string{","}, std::string{"\""});
    return {boost::as_literal(line),f};
}

// Removes surrounding whitespace and a leading UTF-8 byte-order mark
std::string trim_field(std::string str);

// Splits "key=value" at the first '='. Returns nullopt if there is no '='
// or the key is empty.
std::optional<std::pair<std::string, std::string>> split_assignment(std::string_view text);

template<typename X, typename T = std::char_traits<X>, typename A = std::allocator<X>>
inline
std::optional<std::basic_string<X,T,A>> slurp(std::basic_ifstream<X,T>& input) {
    std::basic_string<X,T,A> ret;
    if(!input) {
        return std::nullopt;
    }
    input.seekg(0, std::ios::end);
    ret.resize(input.tellg());
    input.seekg(0, std::ios::beg);
    input.read(&ret[0], ret.size());
    return ret;
}

inline std::optional<std::string> slurp(const std::filesystem::path& path, std::ios_base::openmode mode = std::ios_base::in) {
    std::ifstream in{path,mode};
    return slurp(in);
}

} // namespace utility
} // namespace fairbn

#endif // FAIRBN_UTILITY_HPP
