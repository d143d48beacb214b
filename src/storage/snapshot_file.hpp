// File: src/storage/snapshot_file.hpp
#pragma once

#include "core/load_result.hpp"
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <system_error>

namespace engram {

// Magic numbers of the binary snapshot families
constexpr uint32_t kCodebookMagic = 0x4B424345;        // "ECBK"
constexpr uint32_t kActivationStatsMagic = 0x54434145; // "EACT"
constexpr uint32_t kMembershipMagic = 0x52424D45;      // "EMBR"
constexpr uint32_t kNeuronBankMagic = 0x4B4E4245;      // "EBNK"

constexpr uint16_t kSnapshotVersion = 1;

/// Write a snapshot to a temporary sibling and rename it over `path`
///
/// The header (magic, version) is written before `writer` runs. A reader
/// never observes a partially written file.
/// @return true on success; failures are logged and leave `path` untouched
bool WriteAtomically(const std::filesystem::path& path,
                     uint32_t magic,
                     uint16_t version,
                     const std::function<void(std::ostream&)>& writer);

/// Check the header of an open snapshot stream
/// @return Empty string when valid, else a description of the problem
std::string CheckSnapshotHeader(std::istream& in, uint32_t magic, uint16_t version);

/// Read a snapshot written by WriteAtomically
///
/// A missing file is kAbsent. A bad header, a short read or an exception
/// thrown by `reader` is kCorrupt.
template<typename T>
LoadResult<T> ReadSnapshot(const std::filesystem::path& path,
                           uint32_t magic,
                           uint16_t version,
                           const std::function<T(std::istream&)>& reader) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return LoadResult<T>::Absent();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return LoadResult<T>::Corrupt("cannot open " + path.string());
    }

    std::string header_error = CheckSnapshotHeader(in, magic, version);
    if (!header_error.empty()) {
        return LoadResult<T>::Corrupt(path.string() + ": " + header_error);
    }

    try {
        return LoadResult<T>::Loaded(reader(in));
    } catch (const std::exception& e) {
        return LoadResult<T>::Corrupt(path.string() + ": " + e.what());
    }
}

} // namespace engram
