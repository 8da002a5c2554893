#include "embedding_service.hpp"
#include "errors.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace doc_qa {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    // Back up to the lead byte of the character that straddles the cut.
    size_t cut = length;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) --cut;
    return str.substr(0, cut);
}

namespace {

constexpr int kMaxRetries = 4;

// Retries quota (429) and overload (503) responses with a growing pause.
template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory) {
    cpr::Response r;
    for (int i = 0; i < kMaxRetries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if (r.status_code == 429 || r.status_code == 503) {
            spdlog::warn("API {} ({}), cooling down (attempt {}/{})",
                         r.status_code, (r.status_code == 429 ? "quota" : "overload"), i + 1, kMaxRetries);
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

} // namespace

GeminiClient::GeminiClient(const ServiceConfig& config)
    : base_url_(config.api_base_url),
      api_key_(config.api_key),
      embedding_model_(config.embedding_model),
      generation_model_(config.generation_model),
      dimension_(config.embedding_dimension) {}

std::string GeminiClient::get_endpoint_url(const std::string& model, const std::string& action) const {
    return base_url_ + model + ":" + action + "?key=" + api_key_;
}

std::vector<float> GeminiClient::embed(const std::string& text) {
    if (api_key_.empty()) {
        throw std::runtime_error("No API key configured for the embedding backend");
    }

    std::string payload = json{
        {"model", "models/" + embedding_model_},
        {"content", {{"parts", {{{"text", text}}}}}}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url(embedding_model_, "embedContent")},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}});
    });

    if (r.status_code != 200) {
        spdlog::error("Embedding API error [{}]: {}", r.status_code, r.text);
        throw std::runtime_error("Failed to generate embedding after retries (HTTP " +
                                 std::to_string(r.status_code) + ")");
    }

    auto response_json = json::parse(r.text);
    return response_json.at("embedding").at("values").get<std::vector<float>>();
}

std::string GeminiClient::generate(const std::string& prompt, int max_tokens) {
    if (api_key_.empty()) {
        throw ModelUnavailable("Generation model unavailable: no API key configured");
    }

    std::string payload = json{
        {"contents", {{{"parts", {{{"text", prompt}}}}}}},
        {"generationConfig", {{"maxOutputTokens", max_tokens}, {"temperature", 0.0}}}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    auto start = std::chrono::steady_clock::now();
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url(generation_model_, "generateContent")},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}});
    });
    double duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (r.status_code != 200) {
        spdlog::error("Generation API error [{}]: {}", r.status_code, r.text);
        throw ModelUnavailable("Generation model unavailable (HTTP " + std::to_string(r.status_code) + ")");
    }

    try {
        auto j = json::parse(r.text);
        const auto& candidates = j.at("candidates");
        if (candidates.empty()) return "";
        spdlog::debug("Generation finished in {:.2f} ms", duration);
        return candidates.at(0).at("content").at("parts").at(0).at("text").get<std::string>();
    } catch (const json::exception& e) {
        throw ModelUnavailable(std::string("Malformed generation response: ") + e.what());
    }
}

std::vector<float> CachingEmbeddingFunction::embed(const std::string& text) {
    if (auto cached = cache_.get(text)) return *cached;
    auto embedding = inner_->embed(text);
    cache_.set(text, embedding);
    return embedding;
}

} // namespace doc_qa
