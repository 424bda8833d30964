#include "SplitMergeCli.hpp"
#include <getopt.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <stdexcept>
#include <string>
#include "ChunkNaming.hpp"
#include "FileSplitterMerger.hpp"
#include "Manifest.hpp"

namespace fs = std::filesystem;

namespace {

const char* const kUsage =
    "Usage: splitmerge <command> [options]\n"
    "commands:\n"
    "  split <input_file>      split a file into chunks and write a manifest\n"
    "  merge <manifest_file>   merge the chunks listed by a manifest\n"
    "  inspect <manifest_file> show a manifest and the default merge output\n"
    "split options:\n"
    "  --output-dir/-o  STR  directory to save chunks (default: input file directory)\n"
    "  --chunk-size/-s  INT  chunk size in MB (default: 10)\n"
    "merge options:\n"
    "  --output-file/-o STR  path for the merged output file\n"
    "common options:\n"
    "  --progress/-p         print progress after every chunk\n"
    "  --help/-h             print this help information\n";

struct CliOptions {
    std::string command;
    std::string input;
    std::optional<std::string> output;
    std::uint64_t chunkSizeMb = 10;
    bool progress = false;
};

std::uint64_t parseChunkSize(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Chunk size must be a positive integer number of MB: " + value);
    }
    std::uint64_t size = std::stoull(value);
    if (size == 0) {
        throw std::invalid_argument("Chunk size must be a positive integer number of MB: " + value);
    }
    return size;
}

// Returns nullopt after printing usage when there is nothing to run; `help` tells help apart from misuse.
std::optional<CliOptions> parseOptions(int argc, char** argv, std::ostream& out, std::ostream& err, bool& help) {
    if (argc < 2) {
        err << kUsage;
        return std::nullopt;
    }
    CliOptions options;
    options.command = argv[1];
    if (options.command == "-h" || options.command == "--help") {
        out << kUsage;
        help = true;
        return std::nullopt;
    }

    // Parse the options following the command; argv[1] takes the place of the program name
    int sub_argc = argc - 1;
    char** sub_argv = argv + 1;
    // glibc only resets its internal scan state when optind is 0
#ifdef __GLIBC__
    optind = 0;
#else
    optind = 1;
#endif
    const char* opt_index = "ho:s:p";
    struct option opts[] = {{"help", no_argument, nullptr, 'h'},
                            {"output-dir", required_argument, nullptr, 'o'},
                            {"output-file", required_argument, nullptr, 'o'},
                            {"chunk-size", required_argument, nullptr, 's'},
                            {"progress", no_argument, nullptr, 'p'},
                            {nullptr, 0, nullptr, 0}};
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, opt_index, opts, nullptr)) != -1) {
        switch (c) {
        case 'h':
            out << kUsage;
            help = true;
            return std::nullopt;
        case 'o':
            options.output = optarg;
            break;
        case 's':
            options.chunkSizeMb = parseChunkSize(optarg);
            break;
        case 'p':
            options.progress = true;
            break;
        default:
            err << kUsage;
            return std::nullopt;
        }
    }

    if (options.command != "split" && options.command != "merge" && options.command != "inspect") {
        err << "Unknown command: " << options.command << "\n" << kUsage;
        return std::nullopt;
    }
    if (optind >= sub_argc) {
        err << "Please specify the " << (options.command == "split" ? "input file" : "manifest file") << "\n"
                  << kUsage;
        return std::nullopt;
    }
    options.input = sub_argv[optind];
    return options;
}

FileSplitterMerger::ProgressCallback progressPrinter(bool enabled, std::ostream& out) {
    if (!enabled) return nullptr;
    return [&out](double percent) {
        out << "Progress: " << std::fixed << std::setprecision(1) << percent << "%" << std::endl;
    };
}

int runSplit(const CliOptions& options, std::ostream& out) {
    auto splitter = FileSplitterMerger::withChunkSizeMb(options.chunkSizeMb);
    std::optional<fs::path> outputDir;
    if (options.output) outputDir = fs::path(*options.output);

    auto chunks = splitter.split(options.input, outputDir, progressPrinter(options.progress, out));
    fs::path targetDir = outputDir ? *outputDir : containing_directory(options.input);
    out << "Split complete: Created " << chunks.size() << " chunks and a manifest file in "
              << targetDir.string() << std::endl;
    return EXIT_SUCCESS;
}

int runMerge(const CliOptions& options, std::ostream& out) {
    FileSplitterMerger merger;
    std::optional<fs::path> outputFile;
    if (options.output) outputFile = fs::path(*options.output);

    fs::path merged = merger.merge(options.input, outputFile, progressPrinter(options.progress, out));
    out << "Merge complete: File saved as " << merged.string() << std::endl;
    return EXIT_SUCCESS;
}

int runInspect(const CliOptions& options, std::ostream& out) {
    Manifest manifest = read_manifest(options.input);
    write_manifest(out, manifest);
    out << "default_output_file: "
              << (containing_directory(options.input) / merged_file_name(manifest.originalFile)).string()
              << std::endl;
    return EXIT_SUCCESS;
}

} // namespace

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err) {
    try {
        bool help = false;
        auto options = parseOptions(argc, argv, out, err, help);
        if (!options) {
            return help ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        if (options->command == "split") return runSplit(*options, out);
        if (options->command == "merge") return runMerge(*options, out);
        return runInspect(*options, out);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
