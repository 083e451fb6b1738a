/**
 * @file csv.hpp
 * @brief CSV serialization of a Matrix.
 *
 * Two layouts are available:
 * - Square: one line per row, one column per column label.
 * - Column: one "origin,destination,value" line per cell, row-major.
 *
 * Values are written fixed-point with CSV_DECIMALS digits after the point.
 */

#ifndef EMMEMTX_CSV_HPP
#define EMMEMTX_CSV_HPP

#include "matrix.hpp"

#include <ostream>
#include <string>

namespace emmemtx {

/**
 * @brief Output layout.
 */
enum class CsvLayout { Square, Column };

/**
 * @brief Append a value with exactly CSV_DECIMALS decimals.
 *
 * NaN is written as "NaN" and infinities as "inf" / "-inf".
 */
void append_value(std::string& line, float value);

/**
 * @brief Format a single value.
 * @see append_value()
 */
[[nodiscard]] std::string format_value(float value);

/**
 * @brief Write a matrix in the given layout.
 *
 * The stream is flushed before returning.
 *
 * @throws IoException if the stream fails
 */
void write_csv(const Matrix& matrix, std::ostream& out, CsvLayout layout);

} // namespace emmemtx

#endif // EMMEMTX_CSV_HPP
