/**
 * @file matrix.cpp
 * @brief EMME header and payload decoding.
 */

#include <emmemtx/matrix.hpp>

#include <cstdio>
#include <limits>

namespace emmemtx {

namespace {

std::string hex32(std::uint32_t value) {
    char text[16];
    std::snprintf(text, sizeof(text), "0x%08X", static_cast<unsigned int>(value));
    return text;
}

} // namespace

Header read_header(Reader& reader) {
    std::uint32_t magic = reader.read_u32_le();
    if (magic != EMME_MAGIC) {
        throw InvalidHeaderException("Invalid header: magic number " + hex32(magic) +
                                     ", expected " + hex32(EMME_MAGIC));
    }

    Header header;
    header.version = reader.read_u32_le();
    // float32 = 1, float64 = 2, int32 = 3, int64 = 4; payload is read as float32
    header.data_type = reader.read_u32_le();
    header.dimensions = reader.read_u32_le();

    if (header.dimensions != MATRIX_DIMENSIONS) {
        throw InvalidDimensionsException("Invalid dimensions: " +
                                         std::to_string(header.dimensions) + ", expected " +
                                         std::to_string(MATRIX_DIMENSIONS));
    }

    for (auto& length : header.index_lengths) {
        length = reader.read_u32_le();
    }

    return header;
}

Matrix::Matrix(Indexes indexes, std::vector<float> data, Header header)
    : data_(std::move(data)), rows_(indexes[1].size()), cols_(indexes[0].size()),
      indexes_(std::move(indexes)), header_(header) {
    if (cols_ != 0 && rows_ > std::numeric_limits<std::size_t>::max() / cols_) {
        throw InvalidArgumentException("Matrix shape overflows the addressable size");
    }
    if (data_.size() != rows_ * cols_) {
        throw InvalidArgumentException("Payload holds " + std::to_string(data_.size()) +
                                       " values, expected " + std::to_string(rows_) + " x " +
                                       std::to_string(cols_));
    }
    header_.index_lengths = {static_cast<std::uint32_t>(cols_), static_cast<std::uint32_t>(rows_)};
}

Matrix Matrix::from_reader(Reader& reader) {
    Header header = read_header(reader);

    Indexes indexes;
    for (std::size_t axis = 0; axis < MATRIX_DIMENSIONS; ++axis) {
        indexes[axis] = reader.read_into_vector<std::uint32_t>(header.index_lengths[axis]);
    }

    // Both lengths are 32-bit, so the product needs 64 bits
    std::uint64_t size = static_cast<std::uint64_t>(header.index_lengths[0]) *
                         static_cast<std::uint64_t>(header.index_lengths[1]);
    if (size > std::numeric_limits<std::size_t>::max()) {
        throw InvalidDataException("Payload of " + std::to_string(size) +
                                   " values exceeds the addressable size");
    }

    std::vector<float> data = reader.read_into_vector<float>(static_cast<std::size_t>(size));

    return Matrix(std::move(indexes), std::move(data), header);
}

Matrix Matrix::from_emme_file(const std::string& path) {
    Reader reader = Reader::open(path);
    return from_reader(reader);
}

std::optional<std::span<const float>> Matrix::get_row(std::size_t row) const noexcept {
    if (row >= rows_) {
        return std::nullopt;
    }
    return std::span<const float>(data_.data() + row * cols_, cols_);
}

} // namespace emmemtx
