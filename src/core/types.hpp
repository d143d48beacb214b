// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <atomic>
#include <chrono>
#include <vector>
#include <set>
#include <map>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace engram {

// Identifier: strongly typed 64-bit id, value 0 is invalid.
// Each Tag gets its own process-wide generator.
template<typename Tag>
class Identifier {
public:
    using ValueType = uint64_t;

    // Default constructor creates invalid ID
    Identifier() : value_(kInvalidID) {}

    explicit Identifier(ValueType value) : value_(value) {}

    // Generate new unique ID (thread-safe)
    static Identifier Generate() {
        return Identifier(next_id_.fetch_add(1, std::memory_order_relaxed));
    }

    // Advance the generator so it never hands out `value` or anything below it.
    // Called for every id restored from storage.
    static void ReserveThrough(ValueType value) {
        ValueType current = next_id_.load(std::memory_order_relaxed);
        while (current <= value &&
               !next_id_.compare_exchange_weak(current, value + 1,
                                               std::memory_order_relaxed)) {
        }
    }

    // Highest value handed out so far (0 when none)
    static ValueType HighWater() {
        return next_id_.load(std::memory_order_relaxed) - 1;
    }

    bool IsValid() const { return value_ != kInvalidID; }

    ValueType value() const { return value_; }

    bool operator==(const Identifier& other) const { return value_ == other.value_; }
    bool operator!=(const Identifier& other) const { return value_ != other.value_; }
    bool operator<(const Identifier& other) const { return value_ < other.value_; }
    bool operator>(const Identifier& other) const { return value_ > other.value_; }

    std::string ToString() const;

    void Serialize(std::ostream& out) const;
    static Identifier Deserialize(std::istream& in);

    struct Hash {
        size_t operator()(const Identifier& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;
    static inline std::atomic<ValueType> next_id_{1};

    ValueType value_;
};

struct ClusterTag { static constexpr const char* kName = "ClusterID"; };
struct NeuronTag { static constexpr const char* kName = "NeuronID"; };
struct FeatureTag { static constexpr const char* kName = "FeatureID"; };

using ClusterID = Identifier<ClusterTag>;
using NeuronID = Identifier<NeuronTag>;
using FeatureID = Identifier<FeatureTag>;

// RegionCode: opaque bucket identifier produced by a RegionQuantizer
using RegionCode = std::string;

// FeatureMap: caller-facing named features
using FeatureMap = std::map<std::string, float>;

// Timestamp: Microsecond-precision wall-clock time point.
// Wall clock so that persisted values stay meaningful across runs.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    static Timestamp Now();

    static Timestamp FromMicros(int64_t micros);

    Timestamp() : time_point_(TimePoint{}) {}

    int64_t ToMicros() const;

    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(time_point_ - std::chrono::duration_cast<ClockType::duration>(d));
    }

    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    std::string ToString() const;

    void Serialize(std::ostream& out) const;
    static Timestamp Deserialize(std::istream& in);

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Seconds elapsed between two timestamps as a double
double SecondsBetween(const Timestamp& earlier, const Timestamp& later);

// ============================================================================
// Binary I/O helpers shared by every persisted family
// ============================================================================

namespace io {

template<typename T>
void WritePod(std::ostream& out, const T& value);

template<typename T>
T ReadPod(std::istream& in);

void WriteString(std::ostream& out, const std::string& value);
std::string ReadString(std::istream& in);

void WriteFloats(std::ostream& out, const std::vector<float>& values);
std::vector<float> ReadFloats(std::istream& in);

void WriteStringSet(std::ostream& out, const std::set<std::string>& values);
std::set<std::string> ReadStringSet(std::istream& in);

} // namespace io

// ============================================================================
// Template definitions
// ============================================================================

template<typename Tag>
std::string Identifier<Tag>::ToString() const {
    if (!IsValid()) {
        return std::string(Tag::kName) + "(INVALID)";
    }
    std::ostringstream oss;
    oss << Tag::kName << "(" << value_ << ")";
    return oss.str();
}

template<typename Tag>
void Identifier<Tag>::Serialize(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(&value_), sizeof(value_));
}

template<typename Tag>
Identifier<Tag> Identifier<Tag>::Deserialize(std::istream& in) {
    ValueType value;
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw std::runtime_error("Truncated identifier");
    }
    return Identifier(value);
}

namespace io {

template<typename T>
void WritePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template<typename T>
T ReadPod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw std::runtime_error("Unexpected end of stream");
    }
    return value;
}

} // namespace io

} // namespace engram

// Hash specialization for std::unordered_map
namespace std {
    template<typename Tag>
    struct hash<engram::Identifier<Tag>> {
        size_t operator()(const engram::Identifier<Tag>& id) const {
            return typename engram::Identifier<Tag>::Hash()(id);
        }
    };
}

