// File: src/core/load_result.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace engram {

/// Outcome of loading one persisted family
enum class LoadStatus {
    kLoaded,   // read and decoded
    kAbsent,   // nothing stored yet (cold start)
    kCorrupt,  // present but unreadable
};

inline const char* ToString(LoadStatus status) {
    switch (status) {
        case LoadStatus::kLoaded: return "loaded";
        case LoadStatus::kAbsent: return "absent";
        case LoadStatus::kCorrupt: return "corrupt";
        default: return "unknown";
    }
}

/// LoadResult: Value of a load together with why it may be missing
template<typename T>
struct LoadResult {
    LoadStatus status{LoadStatus::kAbsent};
    std::optional<T> value;
    std::string error;

    static LoadResult Loaded(T loaded) {
        LoadResult result;
        result.status = LoadStatus::kLoaded;
        result.value = std::move(loaded);
        return result;
    }

    static LoadResult Absent() { return LoadResult(); }

    static LoadResult Corrupt(std::string message) {
        LoadResult result;
        result.status = LoadStatus::kCorrupt;
        result.error = std::move(message);
        return result;
    }

    bool IsLoaded() const { return status == LoadStatus::kLoaded; }
    bool IsAbsent() const { return status == LoadStatus::kAbsent; }
    bool IsCorrupt() const { return status == LoadStatus::kCorrupt; }
};

} // namespace engram
