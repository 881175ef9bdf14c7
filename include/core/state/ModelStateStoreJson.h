#pragma once

#include <filesystem>
#include <optional>

#include "core/contracts/IModelStateStore.h"

namespace microtrend {
namespace core {

class ModelStateStoreJson : public IModelStateStore {
public:
    explicit ModelStateStoreJson(std::filesystem::path file_path);

    std::optional<ModelStateSnapshot> load() override;
    bool save(const ModelStateSnapshot& snapshot) override;

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace microtrend
