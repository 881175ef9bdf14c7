#include "core/state/ModelStateStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace microtrend {
namespace core {

ModelStateStoreJson::ModelStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::optional<ModelStateSnapshot> ModelStateStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json raw;
        in >> raw;

        ModelStateSnapshot snapshot;
        snapshot.schema_version = raw.value("schema_version", 1);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
        snapshot.state.weights = raw.value("weights", std::vector<double>{});
        snapshot.state.bias = raw.value("bias", 0.0);
        snapshot.refit_count = raw.value("refit_count", static_cast<std::uint64_t>(0));
        snapshot.model_mode = raw.value("model_mode", std::string("baseline"));
        return snapshot;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Model state unreadable ({}): {}", file_path_.string(), e.what());
        return std::nullopt;
    }
}

bool ModelStateStoreJson::save(const ModelStateSnapshot& snapshot) {
    nlohmann::json raw;
    raw["schema_version"] = snapshot.schema_version;
    raw["saved_at_ms"] = snapshot.saved_at_ms;
    raw["weights"] = snapshot.state.weights;
    raw["bias"] = snapshot.state.bias;
    raw["refit_count"] = snapshot.refit_count;
    raw["model_mode"] = snapshot.model_mode;

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out.good()) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // rename over an existing file can fail on some filesystems; copy instead
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace microtrend
