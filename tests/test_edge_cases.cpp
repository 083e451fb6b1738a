/**
 * @file test_edge_cases.cpp
 * @brief Boundary conditions across reader, decoder and writers.
 */

#include <catch2/catch_test_macros.hpp>

#include "test_helpers.hpp"

#include <thread>

using namespace emmemtx;
using namespace fixtures;

// ============================================================================
// Sizes around internal buffer boundaries
// ============================================================================

TEST_CASE("Payload larger than one read chunk", "[edge][matrix]") {
    // 600 x 500 floats is well over READ_CHUNK_BYTES
    std::vector<std::uint32_t> columns(600);
    std::vector<std::uint32_t> rows(500);
    for (std::uint32_t i = 0; i < columns.size(); ++i) {
        columns[i] = i + 1;
    }
    for (std::uint32_t i = 0; i < rows.size(); ++i) {
        rows[i] = 10000 + i;
    }
    std::vector<float> payload(columns.size() * rows.size());
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<float>(i % 1013);
    }
    REQUIRE(payload.size() * sizeof(float) > READ_CHUNK_BYTES);

    Bytes image = build_emme(columns, rows, payload);

    SECTION("plain") {
        Reader reader = plain_reader(image);
        Matrix matrix = Matrix::from_reader(reader);
        REQUIRE(matrix.data() == payload);
        REQUIRE((*matrix.get_row(499))[599] == payload.back());
    }

    SECTION("gzip") {
        Reader reader = gzip_reader(image);
        Matrix matrix = Matrix::from_reader(reader);
        REQUIRE(matrix.data() == payload);
    }

    SECTION("truncated by one byte") {
        image.pop_back();
        Reader reader = gzip_reader(image);
        REQUIRE_THROWS_AS(Matrix::from_reader(reader), UnexpectedEofException);
    }
}

TEST_CASE("Header lengths larger than the file", "[edge][matrix]") {
    Bytes image;
    put_u32(image, EMME_MAGIC);
    put_u32(image, 1);
    put_u32(image, 1);
    put_u32(image, 2);
    put_u32(image, 0xFFFFFFFFU);
    put_u32(image, 0xFFFFFFFFU);
    put_u32(image, 1);

    Reader reader = plain_reader(image);
    REQUIRE_THROWS_AS(Matrix::from_reader(reader), UnexpectedEofException);
}

// ============================================================================
// Skipping before decoding
// ============================================================================

TEST_CASE("Decode after a forward skip", "[edge][seek]") {
    Bytes prefixed = counting_bytes(SKIP_BUFFER_SIZE + 1);
    Bytes image = sample_image();
    prefixed.insert(prefixed.end(), image.begin(), image.end());

    SECTION("gzip") {
        Reader reader = gzip_reader(prefixed);
        reader.seek(static_cast<std::int64_t>(SKIP_BUFFER_SIZE + 1), SeekOrigin::Current);
        Matrix matrix = Matrix::from_reader(reader);
        REQUIRE(matrix.data() == std::vector<float>{1, 2, 3, 4});
    }

    SECTION("plain") {
        Reader reader = plain_reader(prefixed);
        reader.seek(static_cast<std::int64_t>(SKIP_BUFFER_SIZE + 1), SeekOrigin::Begin);
        Matrix matrix = Matrix::from_reader(reader);
        REQUIRE(matrix.row_labels() == std::vector<std::uint32_t>{10, 20});
    }
}

// ============================================================================
// Independent decodes on separate threads
// ============================================================================

TEST_CASE("Concurrent decodes do not interfere", "[edge][parallel]") {
    constexpr int THREADS = 8;
    std::vector<Bytes> images;
    for (int t = 0; t < THREADS; ++t) {
        auto base = static_cast<float>(t * 10);
        images.push_back(build_emme({1, 2}, {3, 4}, {base, base + 1, base + 2, base + 3}));
    }

    std::vector<std::string> outputs(THREADS);
    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < THREADS; ++t) {
            workers.emplace_back([&, t]() {
                Reader reader = gzip_reader(images[t]);
                Matrix matrix = Matrix::from_reader(reader);
                std::ostringstream out;
                write_csv(matrix, out, CsvLayout::Column);
                outputs[t] = out.str();
            });
        }
    }

    for (int t = 0; t < THREADS; ++t) {
        Reader reader = plain_reader(images[t]);
        std::ostringstream expected;
        write_csv(Matrix::from_reader(reader), expected, CsvLayout::Column);
        REQUIRE(outputs[t] == expected.str());
    }
}

// ============================================================================
// Error codes
// ============================================================================

TEST_CASE("Error codes and messages", "[edge][error]") {
    REQUIRE(std::string(error_string(Error::InvalidHeader)) == "Invalid header");
    REQUIRE(std::string(error_string(Error::InvalidDimensions)) == "Invalid dimensions");

    InvalidHeaderException header("bad magic");
    REQUIRE(header.code() == Error::InvalidHeader);
    REQUIRE(std::string(header.what()) == "bad magic");

    UnsupportedSeekException seek("no");
    REQUIRE(seek.code() == Error::UnsupportedSeek);

    ConsistencyException consistency("row");
    REQUIRE(consistency.code() == Error::Consistency);
}
