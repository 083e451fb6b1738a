/**
 * @file converter.cpp
 * @brief Input gathering and per-file conversion.
 */

#include <emmemtx/converter.hpp>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <system_error>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace fs = std::filesystem;

namespace emmemtx {

bool is_matrix_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }

    std::string extension = path.extension().string();
    if (extension == std::string(".") + MATRIX_SUFFIX) {
        return true;
    }
    if (extension == GZIP_SUFFIX) {
        // "a.mtx.gz" and "amtx.gz" both qualify
        return path.stem().string().ends_with(MATRIX_SUFFIX);
    }
    return false;
}

fs::path output_path_for(const fs::path& input) {
    fs::path output = input;
    output += CSV_SUFFIX;
    return output;
}

void collect_matrix_files(const fs::path& directory, std::vector<fs::path>& files) {
    std::error_code ec;
    std::vector<fs::path> entries;
    for (auto it = fs::directory_iterator(directory, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        std::fprintf(stderr, "Error reading directory %s: %s\n", directory.string().c_str(),
                     ec.message().c_str());
        return;
    }

    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        // Symlinked directories are not followed, so cycles cannot recurse forever
        if (fs::symlink_status(entry, ec).type() == fs::file_type::directory) {
            collect_matrix_files(entry, files);
        } else if (is_matrix_file(entry)) {
            files.push_back(entry);
        }
    }
}

std::vector<fs::path> gather_files(const std::vector<std::string>& args) {
    std::vector<fs::path> files;
    if (args.empty()) {
        return files;
    }

    bool walk_all = args.front().ends_with('*');

    for (const auto& arg : args) {
        if (walk_all) {
            std::string directory = arg;
            while (!directory.empty() && directory.back() == '*') {
                directory.pop_back();
            }
            if (directory.empty()) {
                directory = ".";
            }
            std::printf("Exploring directory recursively: %s\n", directory.c_str());
            collect_matrix_files(directory, files);
            continue;
        }

        fs::path path(arg);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            std::fprintf(stderr, "File %s does not exist\n", arg.c_str());
            continue;
        }

        if (fs::is_directory(path, ec)) {
            collect_matrix_files(path, files);
        } else {
            files.push_back(path);
        }
    }

    return files;
}

void convert_file(const fs::path& input, CsvLayout layout) {
    Matrix matrix = Matrix::from_emme_file(input.string());

    fs::path output_path = output_path_for(input);
    std::vector<char> buffer(OUTPUT_BUFFER_SIZE);
    std::ofstream out;
    out.rdbuf()->pubsetbuf(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    out.open(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::error_code reason(errno, std::generic_category());
        throw IoException("Cannot create output file " + output_path.string() + ": " +
                          reason.message());
    }

    write_csv(matrix, out, layout);

    out.close();
    if (out.fail()) {
        throw IoException("Failed to close output file " + output_path.string());
    }
}

ConvertSummary convert_files(const std::vector<fs::path>& files, const ConvertOptions& options) {
    ConvertSummary summary;
    if (files.empty()) {
        return summary;
    }

    int threads = options.threads > 0 ? static_cast<int>(options.threads)
                                      : tbb::task_arena::automatic;

    std::atomic<std::size_t> converted{0};
    std::atomic<std::size_t> failed{0};

    auto convert_one = [&](std::size_t i) {
        try {
            convert_file(files[i], options.layout);
            converted.fetch_add(1);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "Error processing file %s: %s\n", files[i].string().c_str(),
                         e.what());
            failed.fetch_add(1);
        }
    };

    // Grain size 1: one file per task, so a large file never holds up small ones
    tbb::task_arena arena(threads);
    arena.execute([&]() {
        tbb::parallel_for(tbb::blocked_range<std::size_t>(0, files.size(), 1),
                          [&](const tbb::blocked_range<std::size_t>& range) {
                              for (std::size_t i = range.begin(); i != range.end(); ++i) {
                                  convert_one(i);
                              }
                          });
    });

    summary.converted = converted.load();
    summary.failed = failed.load();
    return summary;
}

} // namespace emmemtx
