/**
 * @file emmemtx.hpp
 * @brief High-level emmemtx API.
 *
 * Decodes EMME binary matrix files (.mtx, optionally gzip-compressed) and
 * writes them out as CSV.
 *
 * Typical use:
 *
 *     auto matrix = emmemtx::Matrix::from_emme_file("demand.mtx.gz");
 *     std::ofstream out("demand.mtx.gz.csv");
 *     emmemtx::write_csv(matrix, out, emmemtx::CsvLayout::Column);
 */

#ifndef EMMEMTX_HPP
#define EMMEMTX_HPP

#include "config.hpp"
#include "converter.hpp"
#include "csv.hpp"
#include "error.hpp"
#include "matrix.hpp"
#include "reader.hpp"

namespace emmemtx {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace emmemtx

#endif // EMMEMTX_HPP
