/**
 * @file json_file.cpp
 * @brief JSON document file I/O
 */

#include "ecv/json_file.hpp"

#include "ecv/canonical_json.hpp"

#include <fstream>
#include <string>
#include <system_error>

namespace ecv::common {

namespace fs = std::filesystem;

ecv::Result<nlohmann::json> read_json_file(const fs::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

ecv::VoidResult write_canonical_json_file(const fs::path& path, const nlohmann::json& payload)
{
    auto canonical = canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    std::error_code ec;
    if (const auto parent = path.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to create directory " + parent.string() + ": " + ec.message()));
        }
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return std::unexpected(
                Error::make("IOError", "Failed to open output file: " + tmp.string()));
        }
        out << *canonical << "\n";
        if (!out) {
            return std::unexpected(
                Error::make("IOError", "Failed to write output file: " + tmp.string()));
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        return std::unexpected(
            Error::make("IOError", "Failed to replace " + path.string() + ": " + ec.message()));
    }
    return {};
}

}  // namespace ecv::common
