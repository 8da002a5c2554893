#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "document_service.hpp"
#include "embedding_service.hpp"
#include "errors.hpp"
#include "LogManager.hpp"
#include "request_orchestrator.hpp"
#include "session_store.hpp"

using json = nlohmann::json;

class DocQaServer {
public:
    explicit DocQaServer(doc_qa::ServiceConfig config)
        : config_(std::move(config))
    {
        auto gemini = std::make_shared<doc_qa::GeminiClient>(config_);
        auto embedder = std::make_shared<doc_qa::CachingEmbeddingFunction>(gemini);
        store_ = std::make_shared<doc_qa::SessionStore>(embedder);
        orchestrator_ = std::make_unique<doc_qa::RequestOrchestrator>(
            store_, gemini, std::make_shared<doc_qa::TextDocumentLoader>(), config_);

        if (config_.api_key.empty()) {
            spdlog::warn("No API key configured: uploads and generation will report unavailable");
        }
        setup_routes();
    }

    bool run() {
        spdlog::info("Starting document QA backend on {}:{}", config_.host, config_.port);
        return server_.listen(config_.host, config_.port);
    }

private:
    doc_qa::ServiceConfig config_;
    httplib::Server server_;
    std::shared_ptr<doc_qa::SessionStore> store_;
    std::unique_ptr<doc_qa::RequestOrchestrator> orchestrator_;

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status": "healthy"})", "application/json");
        });
        server_.Get("/readyz", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status": "ready"})", "application/json");
        });
        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status": "ok"})", "application/json");
        });

        server_.Get("/api/admin/telemetry", [this](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"sessions", store_->size()},
                {"logs", doc_qa::LogManager::instance().get_logs_json()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Post("/upload", [this](const httplib::Request& req, httplib::Response& res) {
            handle_upload(req, res);
        });
        server_.Post("/upload/anonymous", [this](const httplib::Request& req, httplib::Response& res) {
            handle_upload(req, res);
        });

        server_.Post("/ask", [this](const httplib::Request& req, httplib::Response& res) {
            handle_json(res, [&]() {
                auto body = json::parse(req.body);
                std::string question = body.value("question", "");
                if (question.empty()) throw std::invalid_argument("question must not be empty");

                auto result = orchestrator_->ask(question, session_ids_of(body));
                json out = {{"answer", result.text}};
                if (result.answer_type) out["answer_type"] = doc_qa::to_string(*result.answer_type);
                if (result.source) out["source"] = doc_qa::to_string(*result.source);
                json sources = json::array();
                for (const auto& chunk : result.context) {
                    json s = chunk.to_json();
                    s.erase("text");
                    sources.push_back(s);
                }
                out["sources"] = sources;
                return respond(res, result, "answer", out);
            });
        });

        server_.Post("/summarize", [this](const httplib::Request& req, httplib::Response& res) {
            handle_json(res, [&]() {
                auto body = json::parse(req.body);
                auto result = orchestrator_->summarize(session_ids_of(body));
                return respond(res, result, "summary", json{{"summary", result.text}});
            });
        });

        server_.Post("/compare", [this](const httplib::Request& req, httplib::Response& res) {
            handle_json(res, [&]() {
                auto body = json::parse(req.body);
                auto result = orchestrator_->compare(session_ids_of(body));
                return respond(res, result, "comparison", json{{"comparison", result.text}});
            });
        });

        server_.Delete("/sessions/:session_id", [this](const httplib::Request& req, httplib::Response& res) {
            orchestrator_->delete_session(req.path_params.at("session_id"));
            res.set_content(json{{"deleted", true}}.dump(), "application/json");
        });
    }

    static std::vector<std::string> session_ids_of(const json& body) {
        if (body.contains("session_ids") && !body["session_ids"].is_null()) {
            return body["session_ids"].get<std::vector<std::string>>();
        }
        return {};
    }

    // Unavailable backends map to 503 with the field set to null.
    static json respond(httplib::Response& res, const doc_qa::QaResponse& result,
                        const std::string& field, json body) {
        if (result.status == doc_qa::ResponseStatus::Unavailable) {
            res.status = 503;
            return json{{field, nullptr}, {"error", result.error.value_or("Service unavailable")}};
        }
        return body;
    }

    template<typename Handler>
    static void handle_json(httplib::Response& res, Handler handler) {
        try {
            json out = handler();
            res.set_content(out.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(json{{"error", std::string("Invalid request: ") + e.what()}}.dump(), "application/json");
        } catch (const std::invalid_argument& e) {
            res.status = 400;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Request failed: {}", e.what());
            res.status = 500;
            res.set_content(json{{"error", "Request failed"}}.dump(), "application/json");
        }
    }

    void handle_upload(const httplib::Request& req, httplib::Response& res) {
        if (!req.has_file("file")) {
            res.status = 400;
            res.set_content(json{{"error", "Missing multipart field 'file'"}}.dump(), "application/json");
            return;
        }
        const auto file = req.get_file_value("file");

        try {
            auto result = orchestrator_->upload(file.filename, file.content);
            if (result.status == doc_qa::ResponseStatus::Unavailable) {
                res.status = 503;
                res.set_content(json{{"error", result.error.value_or("Service unavailable")}}.dump(),
                                "application/json");
                return;
            }
            res.set_content(json{
                {"message", "Document uploaded and processed"},
                {"session_id", result.session_id}
            }.dump(), "application/json");
        } catch (const doc_qa::UnsupportedDocument& e) {
            res.status = 400;
            res.set_content(json{{"error", e.what()}}.dump(-1, ' ', false, json::error_handler_t::replace),
                            "application/json");
        } catch (const doc_qa::EmptyDocument& e) {
            res.status = 400;
            res.set_content(json{{"error", e.what()}}.dump(-1, ' ', false, json::error_handler_t::replace),
                            "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Upload failed for '{}': {}", file.filename, e.what());
            res.status = 500;
            res.set_content(json{{"error", "Upload failed"}}.dump(), "application/json");
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::optional<std::string> config_path;
    if (argc > 1) config_path = argv[1];

    doc_qa::ServiceConfig config;
    try {
        config = doc_qa::load_service_config(config_path);
    } catch (const doc_qa::ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    DocQaServer server(config);
    if (!server.run()) {
        spdlog::critical("Could not bind {}:{}", config.host, config.port);
        return 1;
    }
    return 0;
}
