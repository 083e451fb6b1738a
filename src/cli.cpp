/**
 * @file cli.cpp
 * @brief mtx2csv command line interface.
 *
 * Converts EMME binary matrix files to CSV, one "<input>.csv" per input,
 * processing files in parallel.
 */

#include <emmemtx/emmemtx.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <strings.h>
#include <vector>

using namespace emmemtx;

static void print_version() {
    std::printf("mtx2csv %s (emmemtx)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("EMME matrix to CSV converter (v%s)\n", version());
    std::printf("==================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [-c] [-j <threads>] <input.mtx[.gz] | dir | dir*> ...\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -c             Long format output (Origin,Destination,Value)\n");
    std::printf("  -j <threads>   Worker threads (default: hardware concurrency)\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Inputs:\n");
    std::printf("  file           Converted as given (.gz is decompressed)\n");
    std::printf("  dir            Searched recursively for *.mtx and *.mtx.gz\n");
    std::printf("  dir*           When the first input ends in '*', every input is a\n");
    std::printf("                 directory searched recursively\n\n");
    std::printf("Output:\n");
    std::printf("  <input>.csv, square (Row\\Col) unless -c is given\n\n");
    std::printf("Examples:\n");
    std::printf("  %s demand.mtx                # square CSV\n", prog_name);
    std::printf("  %s -c matrices/              # long format for a directory tree\n\n",
                prog_name);
}

int main(int argc, char** argv) {
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    ConvertOptions options;
    int arg_offset = 1;

    while (arg_offset < argc) {
        if (strcasecmp(argv[arg_offset], "-c") == 0) {
            options.layout = CsvLayout::Column;
            ++arg_offset;
        } else if (std::strcmp(argv[arg_offset], "-j") == 0) {
            if (arg_offset + 1 >= argc) {
                std::fprintf(stderr, "Error: -j requires a thread count\n");
                return 1;
            }
            int threads = std::atoi(argv[arg_offset + 1]);
            if (threads <= 0) {
                std::fprintf(stderr, "Error: thread count must be positive\n");
                return 1;
            }
            options.threads = static_cast<std::size_t>(threads);
            arg_offset += 2;
        } else {
            break;
        }
    }

    if (arg_offset >= argc) {
        std::fprintf(stderr, "Error: no input files given\n");
        std::fprintf(stderr, "Usage: %s [-c] [-j <threads>] <input.mtx[.gz] | dir | dir*> ...\n",
                     argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + arg_offset, argv + argc);
    auto files = gather_files(args);
    if (files.empty()) {
        std::fprintf(stderr, "No files found\n");
        return 1;
    }

    ConvertSummary summary = convert_files(files, options);

    std::printf("Converted %zu file(s), %zu failed\n", summary.converted, summary.failed);

    return summary.failed == 0 ? 0 : 1;
}
