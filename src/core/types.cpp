// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <ostream>

namespace clustra {

namespace {
constexpr const char* kClusterIDPrefix = "cluster_";
constexpr double kMicrosPerHour = 3600.0 * 1e6;
}

// Static member initialization
std::atomic<ClusterID::ValueType> ClusterID::next_id_{1};

ClusterID ClusterID::Generate() {
    // Thread-safe atomic increment
    ValueType new_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    return ClusterID(new_id);
}

void ClusterID::Reserve(ClusterID id) {
    ValueType wanted = id.value_ + 1;
    ValueType current = next_id_.load(std::memory_order_relaxed);
    while (current < wanted &&
           !next_id_.compare_exchange_weak(current, wanted, std::memory_order_relaxed)) {
    }
}

ClusterID ClusterID::Parse(const std::string& str) {
    const std::string prefix(kClusterIDPrefix);
    if (str.size() != prefix.size() + 16 || str.compare(0, prefix.size(), prefix) != 0) {
        throw std::invalid_argument("Malformed ClusterID: " + str);
    }

    ValueType value = 0;
    for (size_t i = prefix.size(); i < str.size(); ++i) {
        char c = str[i];
        ValueType digit;
        if (c >= '0' && c <= '9') digit = static_cast<ValueType>(c - '0');
        else if (c >= 'a' && c <= 'f') digit = static_cast<ValueType>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') digit = static_cast<ValueType>(c - 'A' + 10);
        else throw std::invalid_argument("Malformed ClusterID: " + str);
        value = (value << 4) | digit;
    }

    if (value == kInvalidID) {
        throw std::invalid_argument("ClusterID must not be zero: " + str);
    }
    return ClusterID(value);
}

std::string ClusterID::HexDigits() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << value_;
    return oss.str();
}

std::string ClusterID::ToString() const {
    if (!IsValid()) {
        return "cluster_INVALID";
    }
    return kClusterIDPrefix + HexDigits();
}

// Enum implementations

const char* ToString(ClusterQuality quality) {
    switch (quality) {
        case ClusterQuality::LOW: return "LOW";
        case ClusterQuality::MEDIUM: return "MEDIUM";
        case ClusterQuality::HIGH: return "HIGH";
        case ClusterQuality::EXCELLENT: return "EXCELLENT";
        default: return "UNKNOWN";
    }
}

ClusterQuality ParseClusterQuality(const std::string& str) {
    if (str == "LOW") return ClusterQuality::LOW;
    if (str == "MEDIUM") return ClusterQuality::MEDIUM;
    if (str == "HIGH") return ClusterQuality::HIGH;
    if (str == "EXCELLENT") return ClusterQuality::EXCELLENT;
    throw std::invalid_argument("Unknown ClusterQuality: " + str);
}

const char* ToString(ClusterType type) {
    switch (type) {
        case ClusterType::CONTENT_BASED: return "CONTENT_BASED";
        case ClusterType::BEHAVIOR_BASED: return "BEHAVIOR_BASED";
        case ClusterType::HYBRID: return "HYBRID";
        case ClusterType::TEMPORAL: return "TEMPORAL";
        default: return "UNKNOWN";
    }
}

ClusterType ParseClusterType(const std::string& str) {
    if (str == "CONTENT_BASED") return ClusterType::CONTENT_BASED;
    if (str == "BEHAVIOR_BASED") return ClusterType::BEHAVIOR_BASED;
    if (str == "HYBRID") return ClusterType::HYBRID;
    if (str == "TEMPORAL") return ClusterType::TEMPORAL;
    throw std::invalid_argument("Unknown ClusterType: " + str);
}

const char* ToString(ClusterStatus status) {
    switch (status) {
        case ClusterStatus::ACTIVE: return "ACTIVE";
        case ClusterStatus::INACTIVE: return "INACTIVE";
        case ClusterStatus::ARCHIVED: return "ARCHIVED";
        default: return "UNKNOWN";
    }
}

ClusterStatus ParseClusterStatus(const std::string& str) {
    if (str == "ACTIVE") return ClusterStatus::ACTIVE;
    if (str == "INACTIVE") return ClusterStatus::INACTIVE;
    if (str == "ARCHIVED") return ClusterStatus::ARCHIVED;
    throw std::invalid_argument("Unknown ClusterStatus: " + str);
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

double Timestamp::HoursSince(const Timestamp& other) const {
    return static_cast<double>((*this - other).count()) / kMicrosPerHour;
}

double Timestamp::DaysSince(const Timestamp& other) const {
    return HoursSince(other) / 24.0;
}

std::string Timestamp::ToString() const {
    auto micros = ToMicros();
    auto seconds = micros / 1000000;
    auto remaining_micros = micros % 1000000;
    if (remaining_micros < 0) {
        seconds -= 1;
        remaining_micros += 1000000;
    }

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

std::ostream& operator<<(std::ostream& out, const ClusterID& id) {
    return out << id.ToString();
}

std::ostream& operator<<(std::ostream& out, const Timestamp& ts) {
    return out << ts.ToString();
}

} // namespace clustra
