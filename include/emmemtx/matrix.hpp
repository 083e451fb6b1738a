/**
 * @file matrix.hpp
 * @brief EMME binary matrix decoding.
 *
 * File layout (little-endian, 32-bit fields):
 *
 *     magic | version | data type | dimensions | length[0] | length[1]
 *     index[0] (length[0] x u32) | index[1] (length[1] x u32)
 *     payload (length[0] * length[1] x f32, row-major)
 *
 * index[0] labels the columns and index[1] the rows. The format itself does
 * not say which array is which axis; if a producer meant the opposite, every
 * CSV written from it comes out transposed.
 */

#ifndef EMMEMTX_MATRIX_HPP
#define EMMEMTX_MATRIX_HPP

#include "config.hpp"
#include "error.hpp"
#include "reader.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace emmemtx {

/**
 * @brief Payload type tag stored in the header.
 *
 * Only Float32 payloads are decoded; other tags are read as float32.
 */
enum class DataType : std::uint32_t { Float32 = 1, Float64 = 2, Int32 = 3, Int64 = 4 };

/**
 * @brief Fixed-size header preceding the index arrays.
 */
struct Header {
    std::uint32_t version = 0;
    std::uint32_t data_type = static_cast<std::uint32_t>(DataType::Float32);
    std::uint32_t dimensions = MATRIX_DIMENSIONS;
    std::array<std::uint32_t, MATRIX_DIMENSIONS> index_lengths{};
};

/**
 * @brief Read and validate the header.
 *
 * @param reader Reader positioned at the start of the file
 * @return Header with both index lengths
 * @throws InvalidHeaderException if the magic number is wrong
 * @throws InvalidDimensionsException if the dimension count is not 2
 * @throws UnexpectedEofException if the header is truncated
 */
Header read_header(Reader& reader);

/**
 * @brief Dense row-major float matrix with row and column labels.
 *
 * Immutable once constructed.
 */
class Matrix {
public:
    using Indexes = std::array<std::vector<std::uint32_t>, MATRIX_DIMENSIONS>;

    /**
     * @brief Construct from labels and payload.
     *
     * @param indexes Column labels (indexes[0]) and row labels (indexes[1])
     * @param data Row-major payload of rows * cols values
     * @param header Header fields to keep with the matrix
     * @throws InvalidArgumentException if data does not hold rows * cols values
     */
    Matrix(Indexes indexes, std::vector<float> data, Header header = Header{});

    /**
     * @brief Decode a whole matrix from a reader.
     *
     * @throws EmmeException subclasses for malformed or truncated input
     */
    static Matrix from_reader(Reader& reader);

    /**
     * @brief Decode an EMME .mtx or .mtx.gz file.
     *
     * @param path File path; a ".gz" suffix selects gzip decompression
     */
    static Matrix from_emme_file(const std::string& path);

    /**
     * @brief Values of one row.
     *
     * @param row Row position (not label)
     * @return The row's cols() values, or std::nullopt if row >= rows()
     */
    [[nodiscard]] std::optional<std::span<const float>> get_row(std::size_t row) const noexcept;

    /**
     * @brief Write the square layout: "Row\Col" header, one line per row.
     *
     * @throws ConsistencyException if a row lookup fails
     * @throws IoException if the stream fails
     */
    void write_csv_square(std::ostream& out) const;

    /**
     * @brief Write the long layout: one "origin,destination,value" per cell.
     *
     * @throws ConsistencyException if a row lookup fails
     * @throws IoException if the stream fails
     */
    void write_csv_column(std::ostream& out) const;

    [[nodiscard]] std::size_t rows() const noexcept {
        return rows_;
    }

    [[nodiscard]] std::size_t cols() const noexcept {
        return cols_;
    }

    [[nodiscard]] const std::vector<float>& data() const noexcept {
        return data_;
    }

    [[nodiscard]] const Indexes& indexes() const noexcept {
        return indexes_;
    }

    [[nodiscard]] const std::vector<std::uint32_t>& column_labels() const noexcept {
        return indexes_[0];
    }

    [[nodiscard]] const std::vector<std::uint32_t>& row_labels() const noexcept {
        return indexes_[1];
    }

    [[nodiscard]] const Header& header() const noexcept {
        return header_;
    }

private:
    std::vector<float> data_;
    std::size_t rows_;
    std::size_t cols_;
    Indexes indexes_;
    Header header_;
};

} // namespace emmemtx

#endif // EMMEMTX_MATRIX_HPP
