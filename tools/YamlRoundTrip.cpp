#include "ry/core/Error.hpp"
#include "ry/core/Logger.hpp"
#include "ry/yaml/JsonBridge.hpp"
#include "ry/yaml/Yaml.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

struct Options {
    std::filesystem::path input;
    std::optional<std::filesystem::path> output;
    int indentWidth = ry::yaml::kDefaultIndentWidth;
    bool json = false;
};

void PrintUsage() {
    fmt::print("Usage: YamlRoundTrip <input.yaml> [--indent N] [--json] [--output <path>]\n");
}

bool ParseArguments(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--json") {
            options.json = true;
        } else if (arg == "--indent" && i + 1 < argc) {
            try {
                options.indentWidth = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                fmt::print(stderr, "Error: invalid indent width '{}'.\n", argv[i]);
                return false;
            }
        } else if (arg == "--output" && i + 1 < argc) {
            options.output = std::filesystem::path(argv[++i]);
        } else if (!arg.empty() && arg.front() == '-') {
            fmt::print(stderr, "Error: unknown option '{}'.\n", arg);
            return false;
        } else if (options.input.empty()) {
            options.input = std::filesystem::path(arg);
        } else {
            fmt::print(stderr, "Error: unexpected argument '{}'.\n", arg);
            return false;
        }
    }
    return !options.input.empty();
}

} // namespace

int main(int argc, char** argv) {
    ry::core::Logger::ConfigureFromEnvironment();

    Options options;
    if (!ParseArguments(argc, argv, options)) {
        PrintUsage();
        return EXIT_FAILURE;
    }

    try {
        const ry::yaml::Value document = ry::yaml::LoadFile(options.input);
        ry::core::Logger::Info("Loaded '{}' ({})", options.input.string(),
                               ry::yaml::ValueTypeName(document.Type()));

        if (options.json) {
            fmt::print("{}\n", ry::yaml::ToJson(document).dump(options.indentWidth));
            return EXIT_SUCCESS;
        }

        if (options.output) {
            ry::yaml::DumpFile(document, *options.output, options.indentWidth);
            ry::core::Logger::Info("Wrote '{}'", options.output->string());
        } else {
            fmt::print("{}\n", ry::yaml::Dump(document, options.indentWidth));
        }
    } catch (const ry::core::IoError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
