#include "JsonFile.hpp"
#include "Errors.hpp"

#include <fstream>

namespace axiom {

void write_json_atomic(const std::filesystem::path& path, const nlohmann::json& data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StorageFailure("Cannot create directory " +
                path.parent_path().string() + ": " + ec.message());
        }
    }

    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream f(tmp_path);
        if (!f.is_open()) {
            throw StorageFailure("Cannot open " + tmp_path.string() + " for writing");
        }
        f << data.dump(2);
        if (!f) {
            throw StorageFailure("Failed writing " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        throw StorageFailure("Cannot move " + tmp_path.string() + " to " +
            path.string() + ": " + ec.message());
    }
}

nlohmann::json read_json_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw StorageFailure("Cannot open " + path.string());
    }
    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw StorageFailure("Cannot parse " + path.string() + ": " + e.what());
    }
}

} // namespace axiom
