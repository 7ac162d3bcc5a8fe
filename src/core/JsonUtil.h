#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cloud_audit {
namespace jsonutil {

// RFC 3339 UTC, second precision.
std::string time_to_iso(std::chrono::system_clock::time_point tp);

template <class T>
nlohmann::json optional_value(const std::optional<T>& v) {
    if(!v) return nullptr;
    return nlohmann::json(*v);
}

inline nlohmann::json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if(!tp) return nullptr;
    return time_to_iso(*tp);
}

}
}
