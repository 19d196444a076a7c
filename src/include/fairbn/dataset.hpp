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

#ifndef FAIRBN_DATASET_HPP
#define FAIRBN_DATASET_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include <vector>

#include <boost/container/flat_map.hpp>

#include <fairbn/utility.hpp>

namespace fairbn {

// A table of discrete observations. Each row holds one string value per
// attribute, in attribute order.
class Dataset {
public:
    using row_t = std::vector<std::string>;
    using record_t = boost::container::flat_map<std::string, std::string>;

    Dataset() = default;

    explicit Dataset(std::vector<std::string> attributes);

    // The first non-blank line is the header.
    template<typename Range>
    static Dataset parse_csv_text(const Range &text);

    static Dataset parse_csv_file(const std::filesystem::path &path);

    static Dataset parse_csv_table(const std::vector<row_t> &table);

    // Attributes appear in order of first appearance across the records.
    // Every record must carry every attribute.
    static Dataset from_records(const std::vector<record_t> &records);

    void AddRow(row_t row);

    const std::vector<std::string>& attributes() const { return attributes_; }

    const std::vector<row_t>& rows() const { return rows_; }

    const row_t& GetRow(std::size_t pos) const { return rows_.at(pos); }

    std::size_t NumberOfRows() const { return rows_.size(); }

    std::optional<std::size_t> AttributeIndex(const std::string &name) const {
        auto it = index_.find(name);
        if(it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Throws std::invalid_argument if `name` is not an attribute.
    const std::string& Value(std::size_t row, const std::string &name) const;

private:
    std::vector<std::string> attributes_;
    std::vector<row_t> rows_;
    std::unordered_map<std::string, std::size_t> index_;
};

template<typename Range>
Dataset Dataset::parse_csv_text(const Range &text) {
    // Rows are separated by newlines. Blank lines are kept so that error
    // messages can report line numbers.
    auto lines = utility::make_tokenizer(text, "\n", "");

    std::vector<row_t> table;
    table.reserve(64);
    for(auto && line : lines) {
        auto &row = table.emplace_back();
        std::string buffer{line};
        if(!buffer.empty() && buffer.back() == '\r') {
            buffer.pop_back();
        }
        if(utility::trim_field(buffer).empty()) {
            continue;
        }
        auto fields = utility::make_csv_tokenizer(buffer);
        for(auto && field : fields) {
            row.push_back(field);
        }
    }
    return parse_csv_table(table);
}

} // namespace fairbn

#endif // FAIRBN_DATASET_HPP
