#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace code_atlas {

struct BuildLog {
    long long timestamp;
    std::string project;
    std::string stage;      // "structure", "dependency", "scope", ...
    size_t node_count;
    size_t edge_count;
    double duration_ms;
    std::string status;     // "ok" or the error message
};

// Recent build telemetry, newest first on read.
class LogManager {
public:
    static constexpr size_t kMaxEntries = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const BuildLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) {
            logs_.pop_front();
        }
    }

    nlohmann::json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"project", it->project},
                {"stage", it->stage},
                {"node_count", it->node_count},
                {"edge_count", it->edge_count},
                {"duration_ms", it->duration_ms},
                {"status", it->status}
            });
        }
        return j_list;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

private:
    LogManager() {}
    std::deque<BuildLog> logs_;
    mutable std::mutex mtx_;
};

} // namespace code_atlas
