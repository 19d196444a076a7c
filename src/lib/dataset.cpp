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

#include "unit_testing.hpp"

#include <fairbn/dataset.hpp>

#include <algorithm>
#include <fstream>

namespace fairbn {

Dataset::Dataset(std::vector<std::string> attributes) : attributes_{std::move(attributes)} {
    for(std::size_t i = 0; i < attributes_.size(); ++i) {
        if(attributes_[i].empty()) {
            throw std::invalid_argument("Attribute " + std::to_string(i+1)
                + " of the dataset has an empty name.");
        }
        auto ret = index_.emplace(attributes_[i], i);
        if(!ret.second) {
            throw std::invalid_argument("The name of an attribute of the dataset is not unique: '"
                + attributes_[i] + "'.");
        }
    }
}

void Dataset::AddRow(row_t row) {
    if(row.size() != attributes_.size()) {
        throw std::invalid_argument("Row " + std::to_string(rows_.size()+1) + " has "
            + std::to_string(row.size()) + " value(s) instead of "
            + std::to_string(attributes_.size()) + ".");
    }
    rows_.push_back(std::move(row));
}

const std::string& Dataset::Value(std::size_t row, const std::string &name) const {
    auto pos = AttributeIndex(name);
    if(!pos) {
        throw std::invalid_argument("'" + name + "' is not an attribute of the dataset.");
    }
    return rows_.at(row)[*pos];
}

Dataset Dataset::parse_csv_table(const std::vector<row_t> &table) {
    using utility::trim_field;

    auto it = std::find_if(table.begin(), table.end(),
        [](const row_t &row) { return !row.empty(); });
    if(it == table.end()) {
        throw std::invalid_argument("CSV parsing failed; missing header line.");
    }
    std::vector<std::string> header;
    for(auto && field : *it) {
        header.push_back(trim_field(field));
    }
    Dataset ret{std::move(header)};

    for(++it; it != table.end(); ++it) {
        if(it->empty()) {
            continue;
        }
        auto line_num = std::distance(table.begin(), it) + 1;
        if(it->size() != ret.attributes().size()) {
            throw std::invalid_argument("CSV parsing failed. Line "
                + std::to_string(line_num) + " has "
                + std::to_string(it->size()) + " field(s) instead of "
                + std::to_string(ret.attributes().size()) + ".");
        }
        ret.AddRow(*it);
    }
    return ret;
}

Dataset Dataset::parse_csv_file(const std::filesystem::path &path) {
    auto text = utility::slurp(path);
    if(!text) {
        throw std::runtime_error("Unable to open CSV file '" + path.string() + "'.");
    }
    return parse_csv_text(*text);
}

Dataset Dataset::from_records(const std::vector<record_t> &records) {
    std::vector<std::string> attributes;
    for(auto && record : records) {
        for(auto && [key, value] : record) {
            if(std::find(attributes.begin(), attributes.end(), key) == attributes.end()) {
                attributes.push_back(key);
            }
        }
    }
    Dataset ret{attributes};
    for(std::size_t i = 0; i < records.size(); ++i) {
        row_t row;
        row.reserve(attributes.size());
        for(auto && name : attributes) {
            auto it = records[i].find(name);
            if(it == records[i].end()) {
                throw std::invalid_argument("Record " + std::to_string(i+1)
                    + " is missing attribute '" + name + "'.");
            }
            row.push_back(it->second);
        }
        ret.AddRow(std::move(row));
    }
    return ret;
}

// LCOV_EXCL_START
TEST_CASE("[libfairbn] Dataset::parse_csv_text") {
    const char csv[] =
        "\xEF\xBB\xBFWork, Education ,Salary\r\n"
        "Private,Bachelors,<50K\r\n"
        "\r\n"
        "Self-emp,\"Masters, Hons\",>=50K\n"
        "Government,HS-Graduate,<50K\n"
    ;
    Dataset data;
    REQUIRE_NOTHROW(data = Dataset::parse_csv_text(csv));

    std::vector<std::string> expected = {"Work", "Education", "Salary"};
    CHECK_EQ_RANGES(data.attributes(), expected);
    REQUIRE(data.NumberOfRows() == 3);

    expected = {"Private", "Bachelors", "<50K"};
    CHECK_EQ_RANGES(data.GetRow(0), expected);
    expected = {"Self-emp", "Masters, Hons", ">=50K"};
    CHECK_EQ_RANGES(data.GetRow(1), expected);
    CHECK(data.Value(2, "Education") == "HS-Graduate");
    CHECK(data.Value(2, "Salary") == "<50K");

    CHECK(data.AttributeIndex("Salary") == 2u);
    CHECK(data.AttributeIndex("Gender") == std::nullopt);
    CHECK_THROWS_AS(data.Value(0, "Gender"), std::invalid_argument);
    CHECK_THROWS_AS(data.Value(3, "Work"), std::out_of_range);

    CHECK_THROWS_AS(Dataset::parse_csv_text(""), std::invalid_argument);
    CHECK_THROWS_AS(Dataset::parse_csv_text("\n\n"), std::invalid_argument);
    CHECK_THROWS_AS(Dataset::parse_csv_text("Work,Salary\nPrivate\n"), std::invalid_argument);
    CHECK_THROWS_AS(Dataset::parse_csv_text("Work,Salary\nPrivate,<50K,x\n"), std::invalid_argument);
    CHECK_THROWS_AS(Dataset::parse_csv_text("Work,Work\nPrivate,Self\n"), std::invalid_argument);
    CHECK_THROWS_AS(Dataset::parse_csv_text("Work,,Salary\n"), std::invalid_argument);
    CHECK_THROWS_AS(Dataset::parse_csv_text("Work,Salary\n\"Private,<50K\n"), std::invalid_argument);

    Dataset header_only = Dataset::parse_csv_text("Work,Salary\n");
    CHECK(header_only.NumberOfRows() == 0);
    CHECK(header_only.attributes().size() == 2);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] Dataset::parse_csv_file") {
    auto path = std::filesystem::temp_directory_path() / "fairbn_dataset_test.csv";
    {
        std::ofstream out{path};
        out << "Work,Salary\nPrivate,<50K\nSelf,>=50K\n";
    }
    Dataset data = Dataset::parse_csv_file(path);
    CHECK(data.NumberOfRows() == 2);
    CHECK(data.Value(1, "Work") == "Self");
    std::filesystem::remove(path);

    CHECK_THROWS_AS(Dataset::parse_csv_file(path), std::runtime_error);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] Dataset::from_records") {
    std::vector<Dataset::record_t> records = {
        {{"Work", "Private"}, {"Salary", "<50K"}},
        {{"Work", "Private"}, {"Salary", ">=50K"}},
        {{"Work", "Self"}, {"Salary", "<50K"}}
    };
    Dataset data = Dataset::from_records(records);
    // keys of a record are sorted
    std::vector<std::string> expected = {"Salary", "Work"};
    CHECK_EQ_RANGES(data.attributes(), expected);
    REQUIRE(data.NumberOfRows() == 3);
    CHECK(data.Value(0, "Work") == "Private");
    CHECK(data.Value(1, "Salary") == ">=50K");
    CHECK(data.Value(2, "Work") == "Self");

    records.push_back({{"Salary", "<50K"}});
    CHECK_THROWS_AS(Dataset::from_records(records), std::invalid_argument);

    CHECK(Dataset::from_records({}).NumberOfRows() == 0);
}
// LCOV_EXCL_STOP

// LCOV_EXCL_START
TEST_CASE("[libfairbn] Dataset::AddRow") {
    Dataset data{{"Work", "Salary"}};
    CHECK_NOTHROW(data.AddRow({"Private", "<50K"}));
    CHECK_THROWS_AS(data.AddRow({"Private"}), std::invalid_argument);
    CHECK(data.NumberOfRows() == 1);
    CHECK_THROWS_AS(Dataset({"Work", "Work"}), std::invalid_argument);
}
// LCOV_EXCL_STOP

} // namespace fairbn
