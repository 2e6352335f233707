#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chunkwire::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);

    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);

    // m:ss or h:mm:ss, "--:--" when the estimate is unknown or non-positive.
    static std::string format_eta(double seconds);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_user(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::int64_t to_unix_millis(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

}
