/**
 * @file TileDownloader.cpp
 * @brief Implementation of the bounded-concurrency tile downloader
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TileDownloader.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>

namespace quadfetch {

TileDownloader::TileDownloader(RetryingHttpClient& client, int timeout_seconds)
    : client_(client), timeout_seconds_(timeout_seconds), logger_("TileDownloader") {
}

std::string TileDownloader::encode_path_component(const std::string& component,
                                                  bool escape_underscore) {
    static const char hex_digits[] = "0123456789ABCDEF";

    // "%" alone never results from encoding a non-empty string
    if (component.empty()) {
        return "%";
    }
    if (component == "." || component == "..") {
        std::string dots;
        for (std::size_t i = 0; i < component.size(); ++i) {
            dots += "%2E";
        }
        return dots;
    }

    std::string encoded;
    encoded.reserve(component.size());
    for (char c : component) {
        const auto uc = static_cast<unsigned char>(c);
        const bool keep = std::isalnum(uc) || c == '.' || c == '-' || (c == '_' && !escape_underscore);
        if (keep) {
            encoded += c;
        } else {
            encoded += '%';
            encoded += hex_digits[uc >> 4];
            encoded += hex_digits[uc & 0x0F];
        }
    }
    return encoded;
}

std::filesystem::path TileDownloader::destination_path(const TileRecord& record,
                                                       const std::filesystem::path& destination_dir) {
    // '_' separates the two ids, so it is escaped inside them
    return destination_dir /
           (encode_path_component(record.collection_id, true) + "_" +
            encode_path_component(record.tile_id, true) + ".tif");
}

DownloadOutcome TileDownloader::make_outcome(const TileRecord& record,
                                             const std::filesystem::path& path) const {
    DownloadOutcome outcome;
    outcome.collection_id = record.collection_id;
    outcome.tile_id = record.tile_id;
    outcome.url = record.download_url;
    outcome.path = path.string();
    return outcome;
}

DownloadOutcome TileDownloader::download_one(const TileRecord& record,
                                             const std::filesystem::path& destination_dir) {
    const auto final_path = destination_path(record, destination_dir);
    DownloadOutcome outcome = make_outcome(record, final_path);

    if (!is_well_formed_url(record.download_url)) {
        outcome.status = DownloadStatus::FAILED;
        outcome.message = "Malformed download URL: '" + record.download_url + "'";
        logger_.error("Failed to download " + record.collection_id + "/" + record.tile_id + ": " +
                      outcome.message);
        return outcome;
    }

    std::error_code ec;
    if (std::filesystem::exists(final_path, ec)) {
        outcome.status = DownloadStatus::ALREADY_PRESENT;
        logger_.detailed("Already downloaded: " + final_path.string());
        return outcome;
    }

    auto part_path = final_path;
    part_path += ".part";

    try {
        std::filesystem::create_directories(destination_dir);

        std::uintmax_t written = 0;
        {
            std::ofstream file(part_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                throw FetchError(ErrorKind::FILESYSTEM, "Cannot open " + part_path.string());
            }

            client_.stream(record.download_url, timeout_seconds_,
                [&file, &written](const char* data, std::size_t size) {
                    file.write(data, static_cast<std::streamsize>(size));
                    if (!file) {
                        return false;
                    }
                    written += size;
                    return true;
                });

            file.close();
            if (file.fail()) {
                throw FetchError(ErrorKind::FILESYSTEM, "Failed to finish writing " + part_path.string());
            }
        }

        if (written == 0) {
            throw FetchError(ErrorKind::TRANSIENT_NETWORK, "Empty response body");
        }

        std::filesystem::rename(part_path, final_path);

        outcome.status = DownloadStatus::DOWNLOADED;
        outcome.bytes_written = written;
        logger_.info("Downloaded: " + final_path.string());
    } catch (const FetchError& e) {
        outcome.status = DownloadStatus::FAILED;
        outcome.message = e.what();
    } catch (const std::filesystem::filesystem_error& e) {
        outcome.status = DownloadStatus::FAILED;
        outcome.message = std::string("Filesystem error: ") + e.what();
    }

    if (outcome.status == DownloadStatus::FAILED) {
        std::filesystem::remove(part_path, ec);
        logger_.error("Failed to download " + record.collection_id + "/" + record.tile_id +
                      " from " + record.download_url + ": " + outcome.message);
    }
    return outcome;
}

std::vector<DownloadOutcome> TileDownloader::download_all(const std::vector<TileRecord>& records,
                                                          const std::filesystem::path& destination_dir,
                                                          int concurrency) {
    std::vector<DownloadOutcome> outcomes;
    if (records.empty()) {
        return outcomes;
    }
    outcomes.reserve(records.size());

    if (concurrency < 1) {
        logger_.warning("Concurrency " + std::to_string(concurrency) + " is invalid; using 1");
        concurrency = 1;
    }
    const std::size_t total = records.size();
    const std::size_t worker_count = std::min<std::size_t>(static_cast<std::size_t>(concurrency), total);
    const std::size_t progress_step = std::max<std::size_t>(1, total / 10);

    logger_.detailed("Downloading " + std::to_string(total) + " tiles to " +
                     destination_dir.string() + " with " + std::to_string(worker_count) + " workers");

    std::atomic<std::size_t> next_index{0};
    std::atomic<std::size_t> completed{0};
    std::mutex outcomes_mutex;

    auto worker = [&]() {
        for (;;) {
            const std::size_t index = next_index.fetch_add(1);
            if (index >= total) {
                break;
            }

            const TileRecord& record = records[index];
            DownloadOutcome outcome;
            try {
                outcome = download_one(record, destination_dir);
            } catch (const std::exception& e) {
                outcome = make_outcome(record, destination_path(record, destination_dir));
                outcome.status = DownloadStatus::FAILED;
                outcome.message = e.what();
                logger_.error("Failed to download " + record.tile_id + ": " + outcome.message);
            }

            {
                std::lock_guard<std::mutex> lock(outcomes_mutex);
                outcomes.push_back(std::move(outcome));
            }

            const std::size_t done = completed.fetch_add(1) + 1;
            if (done % progress_step == 0 || done == total) {
                logger_.info("Progress: " + std::to_string(done) + "/" + std::to_string(total) +
                             " tiles (" + std::to_string(done * 100 / total) + "%)");
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error& e) {
            logger_.warning("Could not start download worker " + std::to_string(i + 1) + ": " +
                            e.what());
            break;
        }
    }

    if (pool.empty()) {
        worker();  // no threads available: drain the queue on this thread
    }
    for (auto& thread : pool) {
        thread.join();
    }

    return outcomes;
}

} // namespace quadfetch
