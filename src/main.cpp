#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "code_atlas/frontend_sink.hpp"
#include "code_atlas/LogManager.hpp"
#include "code_atlas/progressive_loader.hpp"
#include "code_atlas/project_session.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

class GraphAtlasServer {
public:
    GraphAtlasServer(int port = 5002)
        : port_(port),
          server_(),
          loader_(sink_, [this](std::function<void()> job) { boost::asio::post(thread_pool_, std::move(job)); }),
          thread_pool_(4)
    {
        setup_routes();
    }

    void open_project(const std::string& root) {
        auto session = std::make_shared<code_atlas::ProjectSession>(fs::path(root));
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_ = session;
    }

    void run() {
        spdlog::info("🚀 Starting code_atlas graph server on port {}", port_);
        server_.listen("127.0.0.1", port_);
    }

private:
    int port_;
    httplib::Server server_;
    code_atlas::EventQueueSink sink_;
    code_atlas::ProgressiveLoader loader_;
    boost::asio::thread_pool thread_pool_;

    std::mutex session_mutex_;
    std::shared_ptr<code_atlas::ProjectSession> session_;

    static void send_json(httplib::Response& res, const json& body) {
        res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    }

    static void send_error(httplib::Response& res, const std::string& message) {
        res.status = 500;
        send_json(res, json{{"error", message}});
    }

    std::shared_ptr<code_atlas::ProjectSession> require_session() {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (!session_) throw std::runtime_error("No project open.");
        return session_;
    }

    static std::vector<std::string> get_json_list(const json& body, const std::string& key) {
        if (body.contains(key) && !body[key].is_null()) return body[key].get<std::vector<std::string>>();
        return {};
    }

    static json parse_body(const httplib::Request& req) {
        return req.body.empty() ? json::object() : json::parse(req.body);
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/hello", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"message": "Hello from code_atlas!"})", "application/json");
        });

        server_.Get("/api/admin/telemetry", [](const httplib::Request&, httplib::Response& res) {
            send_json(res, json{{"logs", code_atlas::LogManager::instance().get_logs_json()}});
        });

        // PROJECT
        server_.Post("/project/open", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = parse_body(req);
                std::string root = body.value("project_root", "");
                if (root.empty()) throw std::runtime_error("Missing project_root");
                if (!fs::is_directory(root)) throw std::runtime_error("Not a directory: " + root);

                open_project(root);
                auto session = require_session();
                send_json(res, json{
                    {"success", true},
                    {"project_root", session->project_root().string()},
                    {"storage", session->store().storage_dir().string()},
                    {"config", session->config().to_json()}
                });
            } catch (const std::exception& e) {
                spdlog::error("❌ Open project error: {}", e.what());
                send_error(res, e.what());
            }
        });

        server_.Post("/project/clear-cache", [this](const httplib::Request&, httplib::Response& res) {
            try {
                require_session()->clear_cache();
                send_json(res, json{{"success", true}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        // GRAPHS
        server_.Post("/graph/build/:kind", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_build(req, res);
        });

        server_.Post("/graph/load", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_load(req, res);
        });

        server_.Post("/graph/ready", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = parse_body(req);
                loader_.on_page_ready(body.value("generation", uint64_t{0}));
                send_json(res, json{{"success", true}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        server_.Get("/graph/events", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, sink_.drain());
        });

        server_.Get("/graph/static/:kind", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto kind = code_atlas::graph_kind_from_string(req.path_params.at("kind"));
                auto session = require_session();
                fs::path image = session->store().static_image_path(code_atlas::to_string(kind) + "_graph_full");

                std::ifstream f(image, std::ios::binary);
                if (!f) {
                    res.status = 404;
                    send_json(res, json{{"error", "No static image"}});
                    return;
                }
                std::stringstream buffer;
                buffer << f.rdbuf();
                res.set_content(buffer.str(), "image/png");
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        server_.Get("/graph/dependencies", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                std::string file = req.get_param_value("file");
                send_json(res, json{{"files", require_session()->extrapolate_dependencies(file)}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        // SCOPE
        server_.Get("/scope", [this](const httplib::Request&, httplib::Response& res) {
            try {
                send_json(res, json{{"files", require_session()->scope_list()}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        server_.Post("/scope/add", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto added = require_session()->add_to_scope(get_json_list(parse_body(req), "files"));
                send_json(res, json{{"added", added}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        server_.Post("/scope/remove", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                size_t removed = require_session()->remove_from_scope(get_json_list(parse_body(req), "files"));
                send_json(res, json{{"removed", removed}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        server_.Post("/scope/update", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = parse_body(req);
                auto session = require_session();
                session->update_scope(get_json_list(body, "add"), get_json_list(body, "remove"));
                send_json(res, json{{"files", session->scope_list()}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        server_.Post("/scope/clear", [this](const httplib::Request&, httplib::Response& res) {
            try {
                require_session()->clear_scope();
                send_json(res, json{{"success", true}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        // FILES
        server_.Get("/files/search", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                send_json(res, json{{"files", require_session()->search_files(req.get_param_value("q"))}});
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });

        server_.Post("/files/content", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto content = require_session()->files_content(get_json_list(parse_body(req), "files"));
                send_json(res, json(content));
            } catch (const std::exception& e) {
                send_error(res, e.what());
            }
        });
    }

    void handle_build(const httplib::Request& req, httplib::Response& res) {
        try {
            auto kind = code_atlas::graph_kind_from_string(req.path_params.at("kind"));
            auto session = require_session();
            spdlog::info("🔄 Build requested: {} graph for {}", code_atlas::to_string(kind),
                         session->project_root().string());

            boost::asio::post(thread_pool_, [this, session, kind]() {
                auto report = session->build(kind, [this](size_t current, size_t total, const std::string& message) {
                    spdlog::info("  - [{}/{}] {}", current, total, message);
                    sink_.update_build_progress(current, total, message);
                });
                if (report.ok) {
                    spdlog::info("✅ {} build complete: {} nodes, {} edges in {:.0f} ms", report.stage,
                                 report.node_count, report.edge_count, report.duration_ms);
                } else {
                    sink_.show_error("Build failed: " + report.error);
                }
            });

            send_json(res, json{{"success", true}});
        } catch (const std::exception& e) {
            spdlog::error("❌ Build request error: {}", e.what());
            send_error(res, e.what());
        }
    }

    void handle_load(const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = parse_body(req);
            auto kind = code_atlas::graph_kind_from_string(body.value("kind", "dependency"));
            bool full_detail = body.value("full_detail", false);
            auto session = require_session();

            auto decision = session->load_graph(kind, full_detail);
            std::string title = code_atlas::to_string(kind) + " graph";
            title[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(title[0])));

            json response = {{"mode", code_atlas::to_string(decision.mode)}};
            switch (decision.mode) {
                case code_atlas::RenderMode::StaticImage:
                    sink_.show_static_image(decision.static_image_path, title + " (Static)");
                    break;
                case code_atlas::RenderMode::Empty:
                    sink_.show_empty();
                    break;
                case code_atlas::RenderMode::Interactive:
                    response["generation"] = loader_.begin(std::move(decision.graph), title, full_detail,
                                                           code_atlas::LoaderOptions::from_config(session->config()));
                    response["pending"] = loader_.has_pending();
                    break;
            }
            send_json(res, response);
        } catch (const std::exception& e) {
            spdlog::error("❌ Load error: {}", e.what());
            send_error(res, e.what());
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    int port = 5002;
    std::string project_root;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else {
            project_root = arg;
        }
    }

    GraphAtlasServer server(port);
    if (!project_root.empty()) server.open_project(project_root);
    server.run();
    return 0;
}
