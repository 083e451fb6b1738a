/**
 * @file reader.hpp
 * @brief Byte reader over plain or gzip-compressed input.
 *
 * The reader hides whether the file on disk is compressed. The variant is
 * picked once, from the file name, and everything downstream reads through
 * the same interface.
 */

#ifndef EMMEMTX_READER_HPP
#define EMMEMTX_READER_HPP

#include "config.hpp"
#include "error.hpp"

#include <zlib.h>

#include <algorithm>
#include <bit>
#include <cstring>
#include <istream>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace emmemtx {

/**
 * @brief Compression of an input source.
 */
enum class Compression { None, Gzip };

/**
 * @brief Reference point for Reader::seek().
 */
enum class SeekOrigin { Begin, Current, End };

/**
 * @brief Select the compression for a path from its suffix.
 *
 * @param path File name or path
 * @return Compression::Gzip if the path ends in ".gz", else Compression::None
 */
[[nodiscard]] Compression compression_for(std::string_view path) noexcept;

namespace detail {

/**
 * @brief Convert a value read as little-endian bytes to host order.
 */
template <typename T> inline T from_little_endian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little || sizeof(T) == 1) {
        return value;
    } else {
        unsigned char bytes[sizeof(T)];
        std::memcpy(bytes, &value, sizeof(T));
        std::reverse(bytes, bytes + sizeof(T));
        std::memcpy(&value, bytes, sizeof(T));
        return value;
    }
}

/// Calls inflateEnd() before releasing the stream.
struct InflateDeleter {
    void operator()(z_stream* stream) const noexcept;
};

} // namespace detail

/**
 * @brief Buffered uncompressed byte source.
 */
class PlainSource {
public:
    explicit PlainSource(std::unique_ptr<std::istream> stream);

    std::size_t read(std::uint8_t* buffer, std::size_t size);
    std::uint64_t seek(std::int64_t offset, SeekOrigin origin);

    [[nodiscard]] std::uint64_t position() const noexcept {
        return position_;
    }

private:
    std::unique_ptr<std::istream> stream_;
    std::uint64_t position_ = 0;
};

/**
 * @brief Gzip-decompressing byte source.
 *
 * Inflates a single gzip member from the wrapped stream. The z_stream lives
 * on the heap because zlib keeps a back pointer to it.
 */
class GzipSource {
public:
    explicit GzipSource(std::unique_ptr<std::istream> stream);

    std::size_t read(std::uint8_t* buffer, std::size_t size);

    /**
     * @brief Skip forward by discarding decompressed bytes.
     *
     * Only SeekOrigin::Current with a non-negative offset is possible.
     *
     * @throws UnsupportedSeekException for Begin, End or a negative offset
     * @throws UnexpectedEofException if the stream ends before the target
     */
    std::uint64_t seek(std::int64_t offset, SeekOrigin origin);

    [[nodiscard]] std::uint64_t position() const noexcept {
        return position_;
    }

private:
    void refill();

    std::unique_ptr<std::istream> stream_;
    std::unique_ptr<z_stream, detail::InflateDeleter> inflater_;
    std::vector<std::uint8_t> in_buffer_;
    std::uint64_t position_ = 0;
    bool finished_ = false;
};

/**
 * @brief Reader over either a plain or a gzip source.
 *
 * Integers and arrays are decoded as little-endian regardless of the host.
 */
class Reader {
public:
    /**
     * @brief Open a file, decompressing if its name ends in ".gz".
     *
     * @param path File path
     * @throws IoException if the file cannot be opened
     */
    static Reader open(const std::string& path);

    /**
     * @brief Wrap an already open stream.
     *
     * @param stream Source stream (binary)
     * @param compression How to interpret the bytes of the stream
     */
    static Reader from_stream(std::unique_ptr<std::istream> stream, Compression compression);

    /**
     * @brief Read up to size bytes.
     *
     * @return Number of bytes read, 0 at end of stream
     */
    std::size_t read(std::uint8_t* buffer, std::size_t size);

    /**
     * @brief Read exactly size bytes.
     *
     * @throws UnexpectedEofException if fewer bytes remain
     */
    void read_exact(std::uint8_t* buffer, std::size_t size);

    /**
     * @brief Read one little-endian 32-bit unsigned integer.
     */
    std::uint32_t read_u32_le();

    /**
     * @brief Read count little-endian values of type T.
     *
     * The result is only returned once all count * sizeof(T) bytes have been
     * read. Storage grows in chunks of at most READ_CHUNK_BYTES so a bogus
     * count in a truncated file fails before allocating the full amount.
     *
     * @tparam T Trivially copyable element type of size 1, 2, 4 or 8
     * @param count Number of elements
     * @throws UnexpectedEofException on a short read
     * @throws InvalidDataException if count * sizeof(T) overflows
     */
    template <typename T> std::vector<T> read_into_vector(std::size_t count) {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
        static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                      "T must be a fixed-width scalar");

        if (count > std::numeric_limits<std::size_t>::max() / sizeof(T)) {
            throw InvalidDataException("Element count " + std::to_string(count) +
                                       " overflows the addressable size");
        }

        constexpr std::size_t chunk_elements =
            READ_CHUNK_BYTES / sizeof(T) > 0 ? READ_CHUNK_BYTES / sizeof(T) : 1;

        std::vector<T> values;
        std::size_t filled = 0;
        while (filled < count) {
            std::size_t chunk = std::min(count - filled, chunk_elements);
            values.resize(filled + chunk);
            read_exact(reinterpret_cast<std::uint8_t*>(values.data() + filled),
                       chunk * sizeof(T));
            filled += chunk;
        }

        if constexpr (std::endian::native != std::endian::little && sizeof(T) > 1) {
            for (auto& value : values) {
                value = detail::from_little_endian(value);
            }
        }

        return values;
    }

    /**
     * @brief Move the read position.
     *
     * @return New position (decompressed bytes for gzip sources)
     * @throws UnsupportedSeekException for seeks a gzip source cannot do
     */
    std::uint64_t seek(std::int64_t offset, SeekOrigin origin);

    /**
     * @brief Bytes consumed so far.
     */
    [[nodiscard]] std::uint64_t position() const noexcept;

    [[nodiscard]] Compression compression() const noexcept {
        return std::holds_alternative<GzipSource>(source_) ? Compression::Gzip
                                                           : Compression::None;
    }

private:
    explicit Reader(std::variant<PlainSource, GzipSource> source)
        : source_(std::move(source)) {}

    std::variant<PlainSource, GzipSource> source_;
};

} // namespace emmemtx

#endif // EMMEMTX_READER_HPP
