// File: src/storage/snapshot_file.cpp
#include "storage/snapshot_file.hpp"
#include "core/types.hpp"
#include <atomic>
#include <iostream>
#include <sstream>
#include <thread>

namespace engram {

namespace {

std::atomic<uint64_t> temp_counter{0};

std::filesystem::path TempPathFor(const std::filesystem::path& path) {
    std::ostringstream suffix;
    suffix << ".tmp." << std::hash<std::thread::id>()(std::this_thread::get_id())
           << "." << temp_counter.fetch_add(1, std::memory_order_relaxed);
    std::filesystem::path temp = path;
    temp += suffix.str();
    return temp;
}

} // namespace

bool WriteAtomically(const std::filesystem::path& path,
                     uint32_t magic,
                     uint16_t version,
                     const std::function<void(std::ostream&)>& writer) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "SnapshotFile: cannot create " << path.parent_path()
                      << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::filesystem::path temp = TempPathFor(path);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "SnapshotFile: cannot open " << temp << std::endl;
            return false;
        }

        try {
            io::WritePod(out, magic);
            io::WritePod(out, version);
            writer(out);
        } catch (const std::exception& e) {
            std::cerr << "SnapshotFile: failed writing " << path << ": " << e.what() << std::endl;
            out.close();
            std::filesystem::remove(temp, ec);
            return false;
        }

        out.flush();
        if (!out) {
            std::cerr << "SnapshotFile: write error on " << temp << std::endl;
            out.close();
            std::filesystem::remove(temp, ec);
            return false;
        }
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::cerr << "SnapshotFile: cannot replace " << path << ": " << ec.message() << std::endl;
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return false;
    }
    return true;
}

std::string CheckSnapshotHeader(std::istream& in, uint32_t magic, uint16_t version) {
    uint32_t found_magic = 0;
    uint16_t found_version = 0;
    in.read(reinterpret_cast<char*>(&found_magic), sizeof(found_magic));
    in.read(reinterpret_cast<char*>(&found_version), sizeof(found_version));
    if (!in) {
        return "truncated header";
    }
    if (found_magic != magic) {
        return "bad magic";
    }
    if (found_version != version) {
        return "unsupported version " + std::to_string(found_version);
    }
    return std::string();
}

} // namespace engram
