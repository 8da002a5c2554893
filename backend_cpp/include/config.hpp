#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_qa {

struct ServiceConfig {
    std::string host = "127.0.0.1";
    int port = 5002;
    int session_timeout_seconds = 3600;
    std::string upload_dir = "uploads";

    size_t chunk_size = 1000;
    size_t chunk_overlap = 100;

    std::string api_base_url = "https://generativelanguage.googleapis.com/v1beta/models/";
    std::string api_key;
    std::string embedding_model = "text-embedding-004";
    std::string generation_model = "gemini-1.5-flash";
    int embedding_dimension = 768;

    int ask_top_k = 4;
    int summarize_top_k = 6;
    int compare_top_k = 4;
    int max_new_tokens_ask = 200;
    int max_new_tokens_summarize = 250;
    int max_new_tokens_compare = 300;

    std::string log_level = "info";

    // Missing keys keep their defaults. Throws ConfigError on wrong types.
    static ServiceConfig from_json(const nlohmann::json& j);

    // Throws ConfigError if a port, timeout, dimension, top_k or token
    // budget is not positive.
    void validate() const;
};

// Looks for config.json in the usual run locations, parses it and applies
// environment overrides. An explicit path must exist.
ServiceConfig load_service_config(const std::optional<std::string>& explicit_path = std::nullopt);

// SESSION_TIMEOUT, UPLOAD_DIR, HF_GENERATION_MODEL, DOCQA_HOST, DOCQA_PORT,
// DOCQA_API_KEY, DOCQA_LOG_LEVEL.
void apply_env_overrides(ServiceConfig& config);

} // namespace doc_qa
