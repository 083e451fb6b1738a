/**
 * @file config.hpp
 * @brief emmemtx compile-time configuration.
 *
 * Format constants of the EMME binary matrix file and the buffer sizes used
 * while decoding it.
 */

#ifndef EMMEMTX_CONFIG_HPP
#define EMMEMTX_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace emmemtx {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup format EMME Matrix Format
 * @{
 */

/// Magic number opening every EMME matrix file
inline constexpr std::uint32_t EMME_MAGIC = 0xC4D4F1B2U;

/// Only two-dimensional matrices are supported
inline constexpr std::uint32_t MATRIX_DIMENSIONS = 2U;

/// Bytes of magic, version, data type and dimension count
inline constexpr std::size_t HEADER_BYTES = 16U;

/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Size of the discard buffer used for forward skips on gzip sources
inline constexpr std::size_t SKIP_BUFFER_SIZE = 4096U;

/// Compressed bytes pulled from the underlying file per inflate round
#ifndef EMMEMTX_GZIP_BUFFER_SIZE
#define EMMEMTX_GZIP_BUFFER_SIZE 65536U
#endif

inline constexpr std::size_t GZIP_BUFFER_SIZE = EMMEMTX_GZIP_BUFFER_SIZE;

/// Upper bound on bytes allocated ahead of data actually read by bulk reads
#ifndef EMMEMTX_READ_CHUNK_BYTES
#define EMMEMTX_READ_CHUNK_BYTES 1048576U
#endif

inline constexpr std::size_t READ_CHUNK_BYTES = EMMEMTX_READ_CHUNK_BYTES;

/// Stream buffer of each CSV output file
#ifndef EMMEMTX_OUTPUT_BUFFER_SIZE
#define EMMEMTX_OUTPUT_BUFFER_SIZE 65536U
#endif

inline constexpr std::size_t OUTPUT_BUFFER_SIZE = EMMEMTX_OUTPUT_BUFFER_SIZE;

/// Digits after the decimal point in CSV output
inline constexpr int CSV_DECIMALS = 5;

inline constexpr const char* GZIP_SUFFIX = ".gz";
inline constexpr const char* CSV_SUFFIX = ".csv";
inline constexpr const char* MATRIX_SUFFIX = "mtx";

/** @} */

} // namespace emmemtx

#endif // EMMEMTX_CONFIG_HPP
