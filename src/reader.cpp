/**
 * @file reader.cpp
 * @brief Plain and gzip byte sources behind Reader.
 */

#include <emmemtx/reader.hpp>

#include <array>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace emmemtx {

namespace {

// 15 window bits plus 16 selects gzip framing in inflateInit2().
constexpr int GZIP_WINDOW_BITS = 15 + 16;

std::streamsize clamp_to_streamsize(std::size_t size) noexcept {
    constexpr auto max_size = static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max());
    return static_cast<std::streamsize>(size < max_size ? size : max_size);
}

} // namespace

Compression compression_for(std::string_view path) noexcept {
    return path.ends_with(GZIP_SUFFIX) ? Compression::Gzip : Compression::None;
}

void detail::InflateDeleter::operator()(z_stream* stream) const noexcept {
    inflateEnd(stream);
    delete stream;
}

// ============================================================================
// PlainSource
// ============================================================================

PlainSource::PlainSource(std::unique_ptr<std::istream> stream) : stream_(std::move(stream)) {
    if (!stream_) {
        throw InvalidArgumentException("Input stream is null");
    }
}

std::size_t PlainSource::read(std::uint8_t* buffer, std::size_t size) {
    if (size == 0) {
        return 0;
    }

    stream_->read(reinterpret_cast<char*>(buffer), clamp_to_streamsize(size));
    auto count = static_cast<std::size_t>(stream_->gcount());
    if (stream_->bad()) {
        throw IoException("Read failed on input stream");
    }
    if (stream_->fail()) {
        // End of stream: keep the stream usable for later seeks
        stream_->clear();
    }

    position_ += count;
    return count;
}

std::uint64_t PlainSource::seek(std::int64_t offset, SeekOrigin origin) {
    std::ios_base::seekdir dir = std::ios_base::beg;
    switch (origin) {
    case SeekOrigin::Begin:
        dir = std::ios_base::beg;
        break;
    case SeekOrigin::Current:
        dir = std::ios_base::cur;
        break;
    case SeekOrigin::End:
        dir = std::ios_base::end;
        break;
    }

    stream_->clear();
    stream_->seekg(static_cast<std::streamoff>(offset), dir);
    if (stream_->fail()) {
        stream_->clear();
        throw IoException("Seek to offset " + std::to_string(offset) + " failed");
    }

    std::streampos pos = stream_->tellg();
    if (pos < 0) {
        throw IoException("Cannot determine stream position after seek");
    }

    position_ = static_cast<std::uint64_t>(static_cast<std::streamoff>(pos));
    return position_;
}

// ============================================================================
// GzipSource
// ============================================================================

GzipSource::GzipSource(std::unique_ptr<std::istream> stream)
    : stream_(std::move(stream)), in_buffer_(GZIP_BUFFER_SIZE) {
    if (!stream_) {
        throw InvalidArgumentException("Input stream is null");
    }

    auto inflater = std::make_unique<z_stream>();
    int status = inflateInit2(inflater.get(), GZIP_WINDOW_BITS);
    if (status != Z_OK) {
        throw InvalidDataException(std::string("Cannot initialise gzip decoder: ") +
                                   zError(status));
    }
    inflater_.reset(inflater.release());
}

void GzipSource::refill() {
    stream_->read(reinterpret_cast<char*>(in_buffer_.data()),
                  static_cast<std::streamsize>(in_buffer_.size()));
    auto count = static_cast<std::size_t>(stream_->gcount());
    if (stream_->bad()) {
        throw IoException("Read failed on compressed input stream");
    }
    if (stream_->fail()) {
        stream_->clear();
    }

    inflater_->next_in = in_buffer_.data();
    inflater_->avail_in = static_cast<uInt>(count);
}

std::size_t GzipSource::read(std::uint8_t* buffer, std::size_t size) {
    if (size == 0 || finished_) {
        return 0;
    }

    constexpr auto max_request = static_cast<std::size_t>(std::numeric_limits<uInt>::max());
    std::size_t request = size < max_request ? size : max_request;

    inflater_->next_out = buffer;
    inflater_->avail_out = static_cast<uInt>(request);

    // Inflate until at least one byte comes out or the member ends
    while (inflater_->avail_out == request) {
        if (inflater_->avail_in == 0) {
            refill();
            if (inflater_->avail_in == 0) {
                throw UnexpectedEofException("Gzip stream is truncated");
            }
        }

        int status = inflate(inflater_.get(), Z_NO_FLUSH);
        if (status == Z_STREAM_END) {
            finished_ = true;
            break;
        }
        if (status != Z_OK && status != Z_BUF_ERROR) {
            const char* reason = inflater_->msg != nullptr ? inflater_->msg : zError(status);
            throw InvalidDataException(std::string("Corrupt gzip stream: ") + reason);
        }
    }

    std::size_t produced = request - inflater_->avail_out;
    position_ += produced;
    return produced;
}

std::uint64_t GzipSource::seek(std::int64_t offset, SeekOrigin origin) {
    if (origin == SeekOrigin::Begin) {
        throw UnsupportedSeekException("Cannot seek to an absolute position in a gzip stream");
    }
    if (origin == SeekOrigin::End) {
        throw UnsupportedSeekException("Cannot seek from the end of a gzip stream");
    }
    if (offset < 0) {
        throw UnsupportedSeekException("Cannot seek backward in a gzip stream");
    }

    std::array<std::uint8_t, SKIP_BUFFER_SIZE> discard;
    auto remaining = static_cast<std::uint64_t>(offset);
    while (remaining > 0) {
        auto want = static_cast<std::size_t>(
            remaining < discard.size() ? remaining : discard.size());
        std::size_t got = read(discard.data(), want);
        if (got == 0) {
            throw UnexpectedEofException("Gzip stream ended " + std::to_string(remaining) +
                                         " bytes before the seek target");
        }
        remaining -= got;
    }

    return position_;
}

// ============================================================================
// Reader
// ============================================================================

Reader Reader::open(const std::string& path) {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        std::error_code reason(errno, std::generic_category());
        throw IoException("Cannot open file " + path + ": " + reason.message());
    }

    return from_stream(std::move(file), compression_for(path));
}

Reader Reader::from_stream(std::unique_ptr<std::istream> stream, Compression compression) {
    if (compression == Compression::Gzip) {
        return Reader(std::variant<PlainSource, GzipSource>(std::in_place_type<GzipSource>,
                                                            std::move(stream)));
    }
    return Reader(
        std::variant<PlainSource, GzipSource>(std::in_place_type<PlainSource>, std::move(stream)));
}

std::size_t Reader::read(std::uint8_t* buffer, std::size_t size) {
    return std::visit([&](auto& source) { return source.read(buffer, size); }, source_);
}

void Reader::read_exact(std::uint8_t* buffer, std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
        std::size_t count = read(buffer + total, size - total);
        if (count == 0) {
            throw UnexpectedEofException("Unexpected end of data: needed " +
                                         std::to_string(size) + " bytes, got " +
                                         std::to_string(total));
        }
        total += count;
    }
}

std::uint32_t Reader::read_u32_le() {
    std::uint8_t bytes[4];
    read_exact(bytes, sizeof(bytes));
    return static_cast<std::uint32_t>(bytes[0]) | (static_cast<std::uint32_t>(bytes[1]) << 8U) |
           (static_cast<std::uint32_t>(bytes[2]) << 16U) |
           (static_cast<std::uint32_t>(bytes[3]) << 24U);
}

std::uint64_t Reader::seek(std::int64_t offset, SeekOrigin origin) {
    return std::visit([&](auto& source) { return source.seek(offset, origin); }, source_);
}

std::uint64_t Reader::position() const noexcept {
    return std::visit([](const auto& source) { return source.position(); }, source_);
}

} // namespace emmemtx
