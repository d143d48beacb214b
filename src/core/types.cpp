// File: src/core/types.cpp
#include "core/types.hpp"
#include <iomanip>

namespace engram {

// Timestamp implementations

Timestamp Timestamp::Now() {
    // Truncated to the persisted resolution so a round trip is exact
    auto micros = std::chrono::time_point_cast<Duration>(ClockType::now());
    return Timestamp(std::chrono::time_point_cast<ClockType::duration>(micros));
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

void Timestamp::Serialize(std::ostream& out) const {
    int64_t micros = ToMicros();
    out.write(reinterpret_cast<const char*>(&micros), sizeof(micros));
}

Timestamp Timestamp::Deserialize(std::istream& in) {
    return FromMicros(io::ReadPod<int64_t>(in));
}

double SecondsBetween(const Timestamp& earlier, const Timestamp& later) {
    return static_cast<double>((later - earlier).count()) / 1e6;
}

// ============================================================================
// Binary I/O helpers
// ============================================================================

namespace io {

namespace {
// Upper bound on any persisted length prefix; larger values mean corruption
constexpr uint64_t kMaxLength = 1ull << 32;

uint64_t ReadLength(std::istream& in) {
    uint64_t length = ReadPod<uint64_t>(in);
    if (length > kMaxLength) {
        throw std::runtime_error("Corrupt length prefix: " + std::to_string(length));
    }
    return length;
}
} // namespace

void WriteString(std::ostream& out, const std::string& value) {
    WritePod<uint64_t>(out, value.size());
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
}

std::string ReadString(std::istream& in) {
    uint64_t length = ReadLength(in);
    std::string value(length, '\0');
    in.read(&value[0], static_cast<std::streamsize>(length));
    if (!in) {
        throw std::runtime_error("Truncated string");
    }
    return value;
}

void WriteFloats(std::ostream& out, const std::vector<float>& values) {
    WritePod<uint64_t>(out, values.size());
    out.write(reinterpret_cast<const char*>(values.data()),
              static_cast<std::streamsize>(values.size() * sizeof(float)));
}

std::vector<float> ReadFloats(std::istream& in) {
    uint64_t length = ReadLength(in);
    std::vector<float> values(length);
    in.read(reinterpret_cast<char*>(values.data()),
            static_cast<std::streamsize>(length * sizeof(float)));
    if (!in) {
        throw std::runtime_error("Truncated float array");
    }
    return values;
}

void WriteStringSet(std::ostream& out, const std::set<std::string>& values) {
    WritePod<uint64_t>(out, values.size());
    for (const auto& value : values) {
        WriteString(out, value);
    }
}

std::set<std::string> ReadStringSet(std::istream& in) {
    uint64_t count = ReadLength(in);
    std::set<std::string> values;
    for (uint64_t i = 0; i < count; ++i) {
        values.insert(ReadString(in));
    }
    return values;
}

} // namespace io

} // namespace engram
