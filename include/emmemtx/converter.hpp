/**
 * @file converter.hpp
 * @brief File-level conversion of EMME matrices to CSV.
 *
 * Gathers input files from paths and directories and converts each one to
 * "<input>.csv". Files are independent, so convert_files() spreads them over
 * worker threads; a failing file is reported and the rest still run.
 */

#ifndef EMMEMTX_CONVERTER_HPP
#define EMMEMTX_CONVERTER_HPP

#include "csv.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace emmemtx {

/**
 * @brief Options for convert_files().
 */
struct ConvertOptions {
    CsvLayout layout = CsvLayout::Square;
    std::size_t threads = 0; ///< 0 = hardware concurrency
};

/**
 * @brief Outcome of convert_files().
 */
struct ConvertSummary {
    std::size_t converted = 0;
    std::size_t failed = 0;
};

/**
 * @brief Check whether a directory entry names an EMME matrix.
 *
 * Matches "*.mtx" and "*mtx.gz" regular files.
 */
[[nodiscard]] bool is_matrix_file(const std::filesystem::path& path);

/**
 * @brief Output path for an input: the input path with ".csv" appended.
 */
[[nodiscard]] std::filesystem::path output_path_for(const std::filesystem::path& input);

/**
 * @brief Append every matrix file below a directory, in sorted order.
 *
 * Unreadable directories are reported on stderr and skipped.
 */
void collect_matrix_files(const std::filesystem::path& directory,
                          std::vector<std::filesystem::path>& files);

/**
 * @brief Expand command line arguments into input files.
 *
 * When the first argument ends in '*', every argument is a directory (with
 * the '*' stripped) to walk recursively. Otherwise each argument is either a
 * file, taken as given, or a directory to walk. Missing paths are reported
 * and skipped.
 */
std::vector<std::filesystem::path> gather_files(const std::vector<std::string>& args);

/**
 * @brief Convert one matrix file to CSV next to it.
 *
 * @throws EmmeException subclasses on decode or write failure
 */
void convert_file(const std::filesystem::path& input, CsvLayout layout);

/**
 * @brief Convert many files, one task per file.
 *
 * Failures are logged with the offending path and counted.
 */
ConvertSummary convert_files(const std::vector<std::filesystem::path>& files,
                             const ConvertOptions& options);

} // namespace emmemtx

#endif // EMMEMTX_CONVERTER_HPP
