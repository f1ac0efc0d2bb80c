#include "core/state/JsonFileIo.h"

#include <fstream>
#include <system_error>

#include "common/Logger.h"

namespace tugofwar {
namespace core {

std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& file_path) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Cannot open {}", file_path.string());
        return std::nullopt;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Malformed JSON in {}: {}", file_path.string(), e.what());
        return std::nullopt;
    }
}

bool writeJsonFileAtomic(const std::filesystem::path& file_path, const nlohmann::json& doc) {
    std::error_code ec;
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            LOG_WARN("Cannot create {}: {}", file_path.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << doc.dump(2);
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path, ec);
    if (!ec) {
        return true;
    }

    // rename can fail across mount points; fall back to copy + remove
    ec.clear();
    std::filesystem::copy_file(tmp_path, file_path, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_WARN("Cannot replace {}: {}", file_path.string(), ec.message());
        return false;
    }
    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace tugofwar
