#include "ry/yaml/Yaml.hpp"

#include "ry/core/Error.hpp"
#include "ry/core/Logger.hpp"
#include "ry/yaml/Parser.hpp"
#include "ry/yaml/Scanner.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace ry::yaml {

namespace {

std::error_code LastErrorOr(std::errc fallback) {
    if (errno != 0) {
        return std::error_code(errno, std::generic_category());
    }
    return std::make_error_code(fallback);
}

[[noreturn]] void ThrowIoError(std::string_view operation, const std::filesystem::path& path, std::error_code code) {
    core::Logger::Error("[Yaml] Failed to {} '{}': {}", operation, path.string(), code.message());
    throw core::IoError(operation, path, code);
}

} // namespace

Value Load(std::string_view text) {
    Scanner scanner(text);
    Parser parser(scanner.Scan());
    return parser.Parse();
}

Value Loads(std::string_view text) {
    return Load(text);
}

std::string Dump(const Value& value, int indentWidth) {
    Dumper dumper(indentWidth);
    return dumper.Dump(value);
}

std::string Dumps(const Value& value, int indentWidth) {
    return Dump(value, indentWidth);
}

Value LoadFile(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        ThrowIoError("open", path, LastErrorOr(std::errc::no_such_file_or_directory));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        ThrowIoError("read", path, LastErrorOr(std::errc::io_error));
    }

    const std::string source = buffer.str();
    core::Logger::Debug("[Yaml] Read {} byte(s) from '{}'", source.size(), path.string());
    return Load(source);
}

void DumpFile(const Value& value, const std::filesystem::path& path, int indentWidth) {
    const std::string text = Dump(value, indentWidth);

    errno = 0;
    std::ofstream file(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file) {
        ThrowIoError("create", path, LastErrorOr(std::errc::permission_denied));
    }

    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.flush();
    if (!file) {
        ThrowIoError("write", path, LastErrorOr(std::errc::io_error));
    }
    core::Logger::Debug("[Yaml] Wrote {} byte(s) to '{}'", text.size(), path.string());
}

} // namespace ry::yaml
