#include "kraken/csv.hpp"

#include "kraken/util.hpp"

#include <stdexcept>

namespace kraken {
namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

} // namespace

CsvReader::CsvReader(std::istream& input)
    : input_(input) {}

bool CsvReader::read_row(CsvRow& row) {
    row.clear();

    std::string field;
    bool in_quotes = false;
    bool field_started = false;
    bool any_input = false;

    char ch = 0;
    while (input_.get(ch)) {
        any_input = true;
        if (in_quotes) {
            if (ch == '"') {
                if (input_.peek() == '"') {
                    input_.get(ch);
                    field.push_back('"');
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(ch);
            }
            continue;
        }

        const bool after_bom = records_read_ == 0 && row.empty() && field == kUtf8Bom;
        if (ch == '"' && (!field_started || after_bom)) {
            in_quotes = true;
            field_started = true;
            field.clear();
        } else if (ch == ',') {
            row.push_back(std::move(field));
            field.clear();
            field_started = false;
        } else if (ch == '\r') {
            if (input_.peek() == '\n') {
                input_.get(ch);
            }
            break;
        } else if (ch == '\n') {
            break;
        } else {
            field.push_back(ch);
            field_started = true;
        }
    }

    if (in_quotes) {
        throw CsvError("Unterminated quoted field in record " + std::to_string(records_read_ + 1),
                       records_read_ + 1);
    }
    if (!any_input) {
        return false;
    }

    row.push_back(std::move(field));
    ++records_read_;
    return true;
}

CsvHeader::CsvHeader(const CsvRow& header)
    : size_(header.size()) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        // First occurrence wins when a header name is repeated.
        columns_.emplace(normalize_column_name(header[i]), i);
    }
}

std::optional<std::size_t> CsvHeader::index_of(const std::string& name) const {
    const auto it = columns_.find(normalize_column_name(name));
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped.push_back('"');
    for (char c : field) {
        if (c == '"') {
            escaped.push_back('"');
        }
        escaped.push_back(c);
    }
    escaped.push_back('"');
    return escaped;
}

void write_csv_row(std::ostream& output, const CsvRow& row) {
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i != 0) {
            output << ',';
        }
        output << csv_escape(row[i]);
    }
    output << '\n';
}

} // namespace kraken
