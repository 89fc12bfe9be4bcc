// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <atomic>
#include <chrono>
#include <iosfwd>

namespace clustra {

// ClusterID: Unique identifier for clusters
// Uses 64-bit integer; textual form is "cluster_<16 hex digits>"
class ClusterID {
public:
    using ValueType = uint64_t;

    // Default constructor creates invalid ID
    ClusterID() : value_(kInvalidID) {}

    explicit ClusterID(ValueType value) : value_(value) {}

    // Generate new unique ID (thread-safe)
    static ClusterID Generate();

    // Advance the generator past an id restored from storage (thread-safe)
    static void Reserve(ClusterID id);

    // Parse from textual form; throws std::invalid_argument on malformed input
    static ClusterID Parse(const std::string& str);

    bool IsValid() const { return value_ != kInvalidID; }

    ValueType value() const { return value_; }

    bool operator==(const ClusterID& other) const { return value_ == other.value_; }
    bool operator!=(const ClusterID& other) const { return value_ != other.value_; }
    bool operator<(const ClusterID& other) const { return value_ < other.value_; }
    bool operator>(const ClusterID& other) const { return value_ > other.value_; }
    bool operator<=(const ClusterID& other) const { return value_ <= other.value_; }
    bool operator>=(const ClusterID& other) const { return value_ >= other.value_; }

    std::string ToString() const;

    // 16 hex digits without prefix
    std::string HexDigits() const;

    struct Hash {
        size_t operator()(const ClusterID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;
    static std::atomic<ValueType> next_id_;

    ValueType value_;
};

// ClusterQuality: Derived quality level of a cluster
enum class ClusterQuality : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    EXCELLENT = 3,
};

const char* ToString(ClusterQuality quality);
ClusterQuality ParseClusterQuality(const std::string& str);

// ClusterType: How cluster membership was derived (fixed at creation)
enum class ClusterType : uint8_t {
    CONTENT_BASED = 0,
    BEHAVIOR_BASED = 1,
    HYBRID = 2,
    TEMPORAL = 3,
};

const char* ToString(ClusterType type);
ClusterType ParseClusterType(const std::string& str);

// ClusterStatus: Lifecycle state
enum class ClusterStatus : uint8_t {
    ACTIVE = 0,
    INACTIVE = 1,
    ARCHIVED = 2,
};

const char* ToString(ClusterStatus status);
ClusterStatus ParseClusterStatus(const std::string& str);

// Timestamp: Microsecond-precision wall-clock time point
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates epoch timestamp
    Timestamp() : time_point_(TimePoint{}) {}

    int64_t ToMicros() const;

    // Fractional hours/days between two timestamps (negative if other is later)
    double HoursSince(const Timestamp& other) const;
    double DaysSince(const Timestamp& other) const;

    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    Timestamp operator+(Duration offset) const {
        return Timestamp(std::chrono::time_point_cast<ClockType::duration>(time_point_ + offset));
    }
    Timestamp operator-(Duration offset) const {
        return Timestamp(std::chrono::time_point_cast<ClockType::duration>(time_point_ - offset));
    }

    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    std::string ToString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

std::ostream& operator<<(std::ostream& out, const ClusterID& id);
std::ostream& operator<<(std::ostream& out, const Timestamp& ts);

} // namespace clustra

// Hash specialization for std::unordered_map
namespace std {
    template<>
    struct hash<clustra::ClusterID> {
        size_t operator()(const clustra::ClusterID& id) const {
            return clustra::ClusterID::Hash()(id);
        }
    };
}
