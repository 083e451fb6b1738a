/**
 * @file bench.cpp
 * @brief Performance benchmarks for emmemtx decoding and CSV output.
 *
 * Builds a synthetic zone matrix in memory and measures decode throughput
 * for plain and gzip input and write throughput for both CSV layouts.
 *
 * Usage:
 *   ./build/bench                 # 20 iterations, 1000 zones
 *   ./build/bench 50 2500         # custom iteration and zone count
 */

#include <emmemtx/emmemtx.hpp>

#include <zlib.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace emmemtx;

static constexpr int DEFAULT_ITERATIONS = 20;
static constexpr std::size_t DEFAULT_ZONES = 1000;

static void put_u32(std::string& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFFU));
    }
}

static std::string build_matrix(std::size_t zones) {
    std::string bytes;
    put_u32(bytes, EMME_MAGIC);
    put_u32(bytes, 1);
    put_u32(bytes, static_cast<std::uint32_t>(DataType::Float32));
    put_u32(bytes, MATRIX_DIMENSIONS);
    put_u32(bytes, static_cast<std::uint32_t>(zones));
    put_u32(bytes, static_cast<std::uint32_t>(zones));
    for (int axis = 0; axis < 2; ++axis) {
        for (std::size_t i = 0; i < zones; ++i) {
            put_u32(bytes, static_cast<std::uint32_t>(1000 + i));
        }
    }
    for (std::size_t i = 0; i < zones * zones; ++i) {
        float value = static_cast<float>(i % 977) * 0.37F;
        std::uint32_t raw = 0;
        std::memcpy(&raw, &value, sizeof(raw));
        put_u32(bytes, raw);
    }
    return bytes;
}

static bool gzip(const std::string& input, std::string& output) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    output.resize(deflateBound(&strm, static_cast<uLong>(input.size())));
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = reinterpret_cast<Bytef*>(output.data());
    strm.avail_out = static_cast<uInt>(output.size());

    int status = deflate(&strm, Z_FINISH);
    output.resize(strm.total_out);
    deflateEnd(&strm);
    return status == Z_STREAM_END;
}

static void report(const char* name, double total_us, int iterations, std::size_t bytes) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(bytes) / per_iter_us;

    std::printf("%-20s %10.1f µs/iter  %8.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, bytes);
}

static void bench_decode(const char* name, const std::string& bytes, Compression compression,
                         std::size_t logical_bytes, int iterations) {
    auto decode = [&]() {
        Reader reader =
            Reader::from_stream(std::make_unique<std::istringstream>(bytes), compression);
        return Matrix::from_reader(reader);
    };

    // Warmup run
    Matrix warm = decode();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        Matrix matrix = decode();
        if (matrix.rows() != warm.rows()) {
            std::printf("%-20s FAIL (shape changed)\n", name);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           logical_bytes);
}

static void bench_write(const char* name, const Matrix& matrix, CsvLayout layout,
                        int iterations) {
    std::size_t output_size = 0;

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        std::ostringstream out;
        write_csv(matrix, out, layout);
        output_size = out.view().size();
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           output_size);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;
    std::size_t zones = DEFAULT_ZONES;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }
    if (argc >= 3) {
        int requested = std::atoi(argv[2]);
        if (requested > 0) {
            zones = static_cast<std::size_t>(requested);
        }
    }

    std::printf("emmemtx Benchmarks\n");
    std::printf("==================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Zones: %zu (%zu cells)\n\n", zones, zones * zones);

    std::string plain = build_matrix(zones);
    std::string compressed;
    if (!gzip(plain, compressed)) {
        std::printf("Could not gzip the synthetic matrix\n");
        return 1;
    }

    try {
        std::printf("Decode:\n");
        bench_decode("plain", plain, Compression::None, plain.size(), iterations);
        bench_decode("gzip", compressed, Compression::Gzip, plain.size(), iterations);

        Reader reader =
            Reader::from_stream(std::make_unique<std::istringstream>(plain), Compression::None);
        Matrix matrix = Matrix::from_reader(reader);

        std::printf("\nCSV output:\n");
        bench_write("square", matrix, CsvLayout::Square, iterations);
        bench_write("column", matrix, CsvLayout::Column, iterations);
    } catch (const EmmeException& e) {
        std::printf("Benchmark failed: %s (%s)\n", e.what(), error_string(e.code()));
        return 1;
    }

    return 0;
}
