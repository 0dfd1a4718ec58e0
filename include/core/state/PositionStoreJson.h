#pragma once

#include <filesystem>

#include "core/state/InMemoryPositionStore.h"

namespace tradeagent {
namespace core {

// Positions, trades and daily rows persisted to a single JSON document.
// Every mutation rewrites the file through a tmp file + rename.
class PositionStoreJson : public InMemoryPositionStore {
public:
    explicit PositionStoreJson(std::filesystem::path file_path);

    bool load();
    bool save() const;

    const std::filesystem::path& path() const { return file_path_; }

protected:
    void onChanged() override;

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace tradeagent
