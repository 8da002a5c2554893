#pragma once
#include <ctime>
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_qa {

struct InteractionLog {
    long long timestamp;
    std::string endpoint;
    std::vector<std::string> session_ids;
    std::string question;
    std::string answer;
    std::string source;   // AnswerSource name, "generated", "unavailable" or "no_context"
    double duration_ms;
};

// Bounded history of recent requests for the admin telemetry endpoint.
class LogManager {
public:
    static constexpr size_t kMaxEntries = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) {
            logs_.pop_front();
        }
    }

    // Newest first.
    nlohmann::json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"endpoint", it->endpoint},
                {"session_ids", it->session_ids},
                {"question", it->question},
                {"answer", it->answer},
                {"source", it->source},
                {"duration_ms", it->duration_ms}
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
    std::deque<InteractionLog> logs_;
    mutable std::mutex mtx_;
};

} // namespace doc_qa
