/**
 * @file FetchTypes.cpp
 * @brief Out-of-line helpers for the shared QuadFetch types
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "quadfetch.hpp"
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>

namespace quadfetch {

std::string BoundingBox::to_query_string() const {
    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::setprecision(15)
       << min_x << "," << min_y << "," << max_x << "," << max_y;
    return ss.str();
}

std::string to_string(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::DOWNLOADED: return "downloaded";
        case DownloadStatus::ALREADY_PRESENT: return "already-present";
        case DownloadStatus::FAILED: return "failed";
    }
    return "unknown";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TRANSIENT_NETWORK: return "Transient network error";
        case ErrorKind::PERMANENT_REQUEST: return "Permanent request error";
        case ErrorKind::RETRY_EXHAUSTED: return "Retries exhausted";
        case ErrorKind::CACHE_IO: return "Cache I/O error";
        case ErrorKind::FILESYSTEM: return "Filesystem error";
        case ErrorKind::CONFIGURATION: return "Configuration error";
    }
    return "Error";
}

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
    if (backoff == BackoffMode::CONSTANT || attempt <= 0) {
        return base_delay;
    }
    // Cap the shift; with the default 5 attempts it never exceeds 4
    const int shift = attempt > 16 ? 16 : attempt;
    return base_delay * (1LL << shift);
}

std::string FetchConfig::resolved_cache_file() const {
    if (!cache_file.empty()) {
        return cache_file;
    }
    return (std::filesystem::path(output_directory) / "quad_cache.json").string();
}

} // namespace quadfetch
