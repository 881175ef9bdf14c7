#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "model/SignalModel.h"

namespace microtrend {
namespace core {

struct ModelStateSnapshot {
    int schema_version = 1;
    long long saved_at_ms = 0;
    model::ModelState state;
    std::uint64_t refit_count = 0;
    std::string model_mode = "baseline";
};

class IModelStateStore {
public:
    virtual ~IModelStateStore() = default;

    virtual std::optional<ModelStateSnapshot> load() = 0;
    virtual bool save(const ModelStateSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace microtrend
