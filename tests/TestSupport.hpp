/**
 * @file TestSupport.hpp
 * @brief Shared fixtures: temp directories, quiet logging, scripted HTTP
 */

#pragma once

#include "quadfetch.hpp"
#include "core/HttpClient.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace quadfetch::test {

/**
 * @brief Unique directory under the system temp directory, removed on scope exit
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "quadfetch_test") {
        std::random_device rd;
        std::mt19937_64 rng(rd());
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" + std::to_string(rng()));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Errors only, no console noise from expected failures
 */
inline void quiet_logging() {
    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(LogLevel::ERROR);
    Logger::setConsoleEnabled(false);
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << contents;
}

/**
 * @brief Canned reply for one request
 */
struct ScriptedReply {
    long status = 200;
    std::string body;
    bool transport_error = false;  // throw TRANSIENT_NETWORK instead of replying

    static ScriptedReply ok(std::string body) { return ScriptedReply{200, std::move(body), false}; }
    static ScriptedReply status_only(long status) { return ScriptedReply{status, "", false}; }
    static ScriptedReply network_failure() { return ScriptedReply{0, "", true}; }
};

/**
 * @brief HttpTransport fake driven by per-URL reply queues
 *
 * Replies are matched on "url?k=v&k=v" first, then on the bare URL. Each
 * queue is consumed in order and its last reply repeats. Unknown URLs get
 * a 404. Thread-safe, so it can stand behind concurrent downloads.
 */
class ScriptedTransport : public HttpTransport {
public:
    void add_reply(const std::string& key, ScriptedReply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[key].push_back(std::move(reply));
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    HttpResponse perform(const HttpRequest& request, const ChunkSink& sink) override {
        InFlightGuard guard(*this);

        ScriptedReply reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            reply = next_reply(request);
        }

        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }

        if (reply.transport_error) {
            throw FetchError(ErrorKind::TRANSIENT_NETWORK, "scripted connection reset for " + request.url);
        }

        HttpResponse response;
        response.status_code = reply.status;
        if (sink && is_success_status(reply.status)) {
            // Deliver in two chunks to exercise the streaming path
            const std::size_t half = reply.body.size() / 2;
            if (half > 0 && !sink(reply.body.data(), half)) {
                throw FetchError(ErrorKind::FILESYSTEM, "sink aborted");
            }
            if (reply.body.size() > half && !sink(reply.body.data() + half, reply.body.size() - half)) {
                throw FetchError(ErrorKind::FILESYSTEM, "sink aborted");
            }
        } else {
            response.body = reply.body;
        }
        return response;
    }

    static std::string key_for(const std::string& url, const QueryParams& query) {
        if (query.empty()) {
            return url;
        }
        std::string key = url + "?";
        for (std::size_t i = 0; i < query.size(); ++i) {
            if (i > 0) key += "&";
            key += query[i].first + "=" + query[i].second;
        }
        return key;
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::size_t count_for(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(),
            [&url](const HttpRequest& r) { return r.url == url; }));
    }

    int max_in_flight() const { return max_in_flight_.load(); }

private:
    struct InFlightGuard {
        explicit InFlightGuard(ScriptedTransport& owner) : owner_(owner) {
            const int now = ++owner_.in_flight_;
            int seen = owner_.max_in_flight_.load();
            while (now > seen && !owner_.max_in_flight_.compare_exchange_weak(seen, now)) {
            }
        }
        ~InFlightGuard() { --owner_.in_flight_; }
        ScriptedTransport& owner_;
    };

    ScriptedReply next_reply(const HttpRequest& request) {
        auto it = replies_.find(key_for(request.url, request.query));
        if (it == replies_.end()) {
            it = replies_.find(request.url);
        }
        if (it == replies_.end() || it->second.empty()) {
            return ScriptedReply::status_only(404);
        }
        ScriptedReply reply = it->second.front();
        if (it->second.size() > 1) {
            it->second.pop_front();
        }
        return reply;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<ScriptedReply>> replies_;
    std::vector<HttpRequest> requests_;
    std::chrono::milliseconds delay_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

/**
 * @brief Sleeper that records requested delays instead of waiting
 */
struct RecordingSleeper {
    std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
        std::make_shared<std::vector<std::chrono::milliseconds>>();

    void operator()(std::chrono::milliseconds delay) const { delays->push_back(delay); }
};

} // namespace quadfetch::test
