/**
 * @file test_helpers.hpp
 * @brief Shared fixtures: EMME byte images, gzip, temporary directories.
 */

#ifndef EMMEMTX_TEST_HELPERS_HPP
#define EMMEMTX_TEST_HELPERS_HPP

#include <emmemtx/emmemtx.hpp>

#include <zlib.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixtures {

using Bytes = std::vector<std::uint8_t>;

inline void put_u32(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 16U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>((value >> 24U) & 0xFFU));
}

inline void put_f32(Bytes& out, float value) {
    std::uint32_t raw = 0;
    std::memcpy(&raw, &value, sizeof(raw));
    put_u32(out, raw);
}

/**
 * @brief Header fields that tests may want to corrupt.
 */
struct ImageOptions {
    std::uint32_t magic = emmemtx::EMME_MAGIC;
    std::uint32_t version = 1;
    std::uint32_t data_type = static_cast<std::uint32_t>(emmemtx::DataType::Float32);
    std::uint32_t dimensions = emmemtx::MATRIX_DIMENSIONS;
};

/**
 * @brief Encode an EMME matrix image.
 *
 * @param columns First index array (column labels)
 * @param rows Second index array (row labels)
 * @param payload Row-major values
 */
inline Bytes build_emme(const std::vector<std::uint32_t>& columns,
                        const std::vector<std::uint32_t>& rows,
                        const std::vector<float>& payload, const ImageOptions& options = {}) {
    Bytes out;
    put_u32(out, options.magic);
    put_u32(out, options.version);
    put_u32(out, options.data_type);
    put_u32(out, options.dimensions);
    put_u32(out, static_cast<std::uint32_t>(columns.size()));
    put_u32(out, static_cast<std::uint32_t>(rows.size()));
    for (auto label : columns) {
        put_u32(out, label);
    }
    for (auto label : rows) {
        put_u32(out, label);
    }
    for (float value : payload) {
        put_f32(out, value);
    }
    return out;
}

/**
 * @brief The 2x2 example: rows [10, 20], columns [100, 200], values 1..4.
 */
inline Bytes sample_image() {
    return build_emme({100, 200}, {10, 20}, {1.0F, 2.0F, 3.0F, 4.0F});
}

/**
 * @brief Compress bytes into a single gzip member.
 */
inline Bytes gzip(const Bytes& input) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) !=
        Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    Bytes output(deflateBound(&strm, static_cast<uLong>(input.size())));
    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = output.data();
    strm.avail_out = static_cast<uInt>(output.size());

    int status = deflate(&strm, Z_FINISH);
    output.resize(strm.total_out);
    deflateEnd(&strm);
    if (status != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    return output;
}

inline std::unique_ptr<std::istream> stream_of(const Bytes& bytes) {
    return std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end()),
                                                std::ios::in | std::ios::binary);
}

inline emmemtx::Reader plain_reader(const Bytes& bytes) {
    return emmemtx::Reader::from_stream(stream_of(bytes), emmemtx::Compression::None);
}

inline emmemtx::Reader gzip_reader(const Bytes& bytes) {
    return emmemtx::Reader::from_stream(stream_of(gzip(bytes)), emmemtx::Compression::Gzip);
}

/**
 * @brief Bytes 0, 1, 2, ... wrapping at 256.
 */
inline Bytes counting_bytes(std::size_t size) {
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>(i & 0xFFU);
    }
    return out;
}

inline void write_file(const std::filesystem::path& path, const Bytes& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream text;
    text << file.rdbuf();
    return text.str();
}

/**
 * @brief Temporary directory removed with everything in it.
 */
class TempDir {
public:
    TempDir() {
        std::random_device device;
        std::uniform_int_distribution<std::uint64_t> dist;
        path_ = std::filesystem::temp_directory_path() /
                ("emmemtx-test-" + std::to_string(dist(device)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept {
        return path_;
    }

    std::filesystem::path operator/(const std::string& name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

} // namespace fixtures

#endif // EMMEMTX_TEST_HELPERS_HPP
