#include "core/state/ModelStateStoreJson.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace microtrend;

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "microtrend_test_state";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    const auto path = dir / "model_state.json";

    {
        core::ModelStateStoreJson store(path);
        assert(!store.load().has_value());
    }

    {
        core::ModelStateStoreJson store(path);

        core::ModelStateSnapshot snapshot;
        snapshot.saved_at_ms = 1700000000000LL;
        snapshot.state.weights = {0.125, -0.5, 0.03125, 2.0};
        snapshot.state.bias = -0.25;
        snapshot.refit_count = 7;

        const bool saved = store.save(snapshot);
        assert(saved);
        assert(std::filesystem::exists(path));

        auto tmp = path;
        tmp += ".tmp";
        assert(!std::filesystem::exists(tmp));

        const auto loaded = store.load();
        assert(loaded.has_value());
        assert(loaded->schema_version == 1);
        assert(loaded->saved_at_ms == 1700000000000LL);
        assert(loaded->state.weights == snapshot.state.weights);
        assert(loaded->state.bias == -0.25);
        assert(loaded->refit_count == 7);
        assert(loaded->model_mode == "baseline");

        // overwrite in place
        snapshot.refit_count = 8;
        const bool saved_again = store.save(snapshot);
        assert(saved_again);
        assert(store.load()->refit_count == 8);
    }

    {
        {
            std::ofstream out(path, std::ios::trunc);
            out << "{ not json";
        }
        core::ModelStateStoreJson store(path);
        assert(!store.load().has_value());
    }

    std::filesystem::remove_all(dir, ec);

    std::cout << "[TEST] ModelStateStore PASSED\n";
    return 0;
}
