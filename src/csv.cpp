/**
 * @file csv.cpp
 * @brief Square and long-format CSV writers.
 */

#include <emmemtx/csv.hpp>

#include <charconv>
#include <cmath>

namespace emmemtx {

namespace {

// FLT_MAX has 39 integer digits
constexpr std::size_t VALUE_CHARS = 64;

void append_label(std::string& line, std::uint32_t label) {
    char text[16];
    auto result = std::to_chars(text, text + sizeof(text), label);
    line.append(text, result.ptr);
}

void flush_line(std::ostream& out, std::string& line) {
    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!out) {
        throw IoException("Failed to write CSV output");
    }
    line.clear();
}

std::span<const float> checked_row(const Matrix& matrix, std::size_t row) {
    auto values = matrix.get_row(row);
    if (!values) {
        throw ConsistencyException("Invalid row index " + std::to_string(row) + " of " +
                                   std::to_string(matrix.rows()));
    }
    return *values;
}

void finish(std::ostream& out) {
    out.flush();
    if (!out) {
        throw IoException("Failed to flush CSV output");
    }
}

} // namespace

void append_value(std::string& line, float value) {
    if (std::isnan(value)) {
        line.append("NaN");
        return;
    }
    if (std::isinf(value)) {
        line.append(value < 0 ? "-inf" : "inf");
        return;
    }

    char text[VALUE_CHARS];
    auto result = std::to_chars(text, text + sizeof(text), value, std::chars_format::fixed,
                                CSV_DECIMALS);
    line.append(text, result.ptr);
}

std::string format_value(float value) {
    std::string text;
    append_value(text, value);
    return text;
}

void Matrix::write_csv_square(std::ostream& out) const {
    const auto& col_ids = column_labels();
    const auto& row_ids = row_labels();

    std::string line = "Row\\Col";
    for (auto label : col_ids) {
        line.push_back(',');
        append_label(line, label);
    }
    line.push_back('\n');
    flush_line(out, line);

    for (std::size_t row = 0; row < row_ids.size(); ++row) {
        append_label(line, row_ids[row]);
        for (float value : checked_row(*this, row)) {
            line.push_back(',');
            append_value(line, value);
        }
        line.push_back('\n');
        flush_line(out, line);
    }

    finish(out);
}

void Matrix::write_csv_column(std::ostream& out) const {
    const auto& col_ids = column_labels();
    const auto& row_ids = row_labels();

    std::string line = "Origin,Destination,Value\n";
    flush_line(out, line);

    for (std::size_t row = 0; row < row_ids.size(); ++row) {
        auto values = checked_row(*this, row);
        for (std::size_t col = 0; col < col_ids.size(); ++col) {
            append_label(line, row_ids[row]);
            line.push_back(',');
            append_label(line, col_ids[col]);
            line.push_back(',');
            append_value(line, values[col]);
            line.push_back('\n');
        }
        // One write per matrix row keeps the buffer bounded by the column count
        flush_line(out, line);
    }

    finish(out);
}

void write_csv(const Matrix& matrix, std::ostream& out, CsvLayout layout) {
    switch (layout) {
    case CsvLayout::Square:
        matrix.write_csv_square(out);
        break;
    case CsvLayout::Column:
        matrix.write_csv_column(out);
        break;
    }
}

} // namespace emmemtx
