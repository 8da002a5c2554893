#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>
#include <spdlog/spdlog.h>

namespace doc_qa {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        target = j[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

int parse_int_env(const char* name, const char* value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Environment variable ") + name + " is not an integer: " + value);
    }
}

} // namespace

ServiceConfig ServiceConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("Configuration root must be a JSON object");

    ServiceConfig c;
    read_key(j, "host", c.host);
    read_key(j, "port", c.port);
    read_key(j, "session_timeout_seconds", c.session_timeout_seconds);
    read_key(j, "upload_dir", c.upload_dir);
    // Read as signed so negative sizes are rejected instead of wrapping.
    long long chunk_size = static_cast<long long>(c.chunk_size);
    long long chunk_overlap = static_cast<long long>(c.chunk_overlap);
    read_key(j, "chunk_size", chunk_size);
    read_key(j, "chunk_overlap", chunk_overlap);
    if (chunk_size <= 0) throw ConfigError("chunk_size must be positive");
    if (chunk_overlap < 0) throw ConfigError("chunk_overlap must not be negative");
    c.chunk_size = static_cast<size_t>(chunk_size);
    c.chunk_overlap = static_cast<size_t>(chunk_overlap);
    read_key(j, "api_base_url", c.api_base_url);
    read_key(j, "api_key", c.api_key);
    read_key(j, "embedding_model", c.embedding_model);
    read_key(j, "generation_model", c.generation_model);
    read_key(j, "embedding_dimension", c.embedding_dimension);
    read_key(j, "ask_top_k", c.ask_top_k);
    read_key(j, "summarize_top_k", c.summarize_top_k);
    read_key(j, "compare_top_k", c.compare_top_k);
    read_key(j, "max_new_tokens_ask", c.max_new_tokens_ask);
    read_key(j, "max_new_tokens_summarize", c.max_new_tokens_summarize);
    read_key(j, "max_new_tokens_compare", c.max_new_tokens_compare);
    read_key(j, "log_level", c.log_level);

    if (c.chunk_overlap >= c.chunk_size) throw ConfigError("chunk_overlap must be smaller than chunk_size");
    c.validate();
    return c;
}

void ServiceConfig::validate() const {
    const std::pair<const char*, int> positive[] = {
        {"port", port},
        {"session_timeout_seconds", session_timeout_seconds},
        {"embedding_dimension", embedding_dimension},
        {"ask_top_k", ask_top_k},
        {"summarize_top_k", summarize_top_k},
        {"compare_top_k", compare_top_k},
        {"max_new_tokens_ask", max_new_tokens_ask},
        {"max_new_tokens_summarize", max_new_tokens_summarize},
        {"max_new_tokens_compare", max_new_tokens_compare},
    };
    for (const auto& [key, value] : positive) {
        if (value <= 0) throw ConfigError(std::string(key) + " must be positive");
    }
    if (port > 65535) throw ConfigError("port must be at most 65535");
}

void apply_env_overrides(ServiceConfig& config) {
    if (const char* v = std::getenv("SESSION_TIMEOUT")) {
        config.session_timeout_seconds = parse_int_env("SESSION_TIMEOUT", v);
    }
    if (const char* v = std::getenv("UPLOAD_DIR")) config.upload_dir = v;
    if (const char* v = std::getenv("HF_GENERATION_MODEL")) config.generation_model = v;
    if (const char* v = std::getenv("DOCQA_HOST")) config.host = v;
    if (const char* v = std::getenv("DOCQA_PORT")) config.port = parse_int_env("DOCQA_PORT", v);
    if (const char* v = std::getenv("DOCQA_API_KEY")) config.api_key = v;
    if (const char* v = std::getenv("DOCQA_LOG_LEVEL")) config.log_level = v;
}

ServiceConfig load_service_config(const std::optional<std::string>& explicit_path) {
    std::vector<std::string> search_paths;
    if (explicit_path) {
        if (!fs::exists(*explicit_path)) {
            throw ConfigError("Configuration file not found: " + *explicit_path);
        }
        search_paths.push_back(*explicit_path);
    } else {
        search_paths = {"config.json", "../config.json", "build/config.json"};
    }

    ServiceConfig config;
    for (const auto& path : search_paths) {
        std::ifstream f(path);
        if (!f.is_open()) continue;

        json j;
        try {
            j = json::parse(f);
        } catch (const json::parse_error& e) {
            throw ConfigError("Failed to parse " + path + ": " + e.what());
        }
        config = ServiceConfig::from_json(j);
        spdlog::info("Loaded configuration from {}", path);
        break;
    }

    apply_env_overrides(config);
    config.validate();
    return config;
}

} // namespace doc_qa
