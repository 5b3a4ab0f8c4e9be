#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace kraken {

using CsvRow = std::vector<std::string>;

class CsvError : public std::runtime_error {
public:
    explicit CsvError(const std::string& message, std::size_t record = 0)
        : std::runtime_error(message), record_(record) {}

    [[nodiscard]] std::size_t record() const noexcept { return record_; }

private:
    std::size_t record_;
};

// Streaming reader for comma separated files with double-quote escaping.
// Quoted fields may contain commas, doubled quotes and line breaks.
class CsvReader {
public:
    explicit CsvReader(std::istream& input);

    // Reads the next record; returns false at end of input.
    bool read_row(CsvRow& row);

    // Number of records returned so far.
    std::size_t records_read() const { return records_read_; }

private:
    std::istream& input_;
    std::size_t records_read_ = 0;
};

// Maps trimmed, lower-cased header names to column indices.
class CsvHeader {
public:
    explicit CsvHeader(const CsvRow& header);

    std::optional<std::size_t> index_of(const std::string& name) const;
    bool contains(const std::string& name) const { return index_of(name).has_value(); }
    std::size_t size() const { return size_; }

private:
    std::unordered_map<std::string, std::size_t> columns_;
    std::size_t size_ = 0;
};

std::string csv_escape(const std::string& field);

void write_csv_row(std::ostream& output, const CsvRow& row);

} // namespace kraken
