#include "api/api_server.hpp"
#include "api/wire.hpp"
#include "core/identity.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

void reply(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void reply_op(httplib::Response& res, const OpResult& result, json extra = json::object()) {
    if (result.success) {
        json body = Wire::ok(result.message);
        body.update(extra);
        reply(res, body);
        return;
    }
    reply(res, Wire::error(result.error), result.not_found ? 404 : 400);
}

json parse_body(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    return json::parse(req.body);
}

// Out-of-range pids name no process
std::optional<pid_t> pid_param(const httplib::Request& req) {
    return Identity::parse_pid(req.matches[1].str());
}

void reply_not_found(httplib::Response& res, const std::string& error) {
    reply(res, Wire::error(error), 404);
}

}  // namespace

struct ApiServer::Impl {
    Supervisor& supervisor;
    httplib::Server server;

    explicit Impl(Supervisor& sup) : supervisor(sup) {}

    void routes();

    // ── Handlers ────────────────────────────────────────────
    void list_services(const httplib::Request&, httplib::Response& res);
    void service_detail(const httplib::Request& req, httplib::Response& res);
    void stop_service(const httplib::Request& req, httplib::Response& res);
    void restart_service(const httplib::Request& req, httplib::Response& res);
    void start_service(const httplib::Request& req, httplib::Response& res);
    void service_auto_restart(const httplib::Request& req, httplib::Response& res);
    void get_auto_restart(const httplib::Request& req, httplib::Response& res);
    void set_auto_restart(const httplib::Request& req, httplib::Response& res);
    void delete_auto_restart(const httplib::Request& req, httplib::Response& res);
    void set_folder(const httplib::Request& req, httplib::Response& res);
    void get_folder(const httplib::Request& req, httplib::Response& res);
    void list_artifacts(const httplib::Request& req, httplib::Response& res);
};

void ApiServer::Impl::routes() {
    using Handler = void (Impl::*)(const httplib::Request&, httplib::Response&);
    auto bind = [this](Handler h) {
        return [this, h](const httplib::Request& req, httplib::Response& res) {
            (this->*h)(req, res);
        };
    };

    server.Get("/api/services", bind(&Impl::list_services));
    server.Post("/api/service/start", bind(&Impl::start_service));
    server.Get(R"(/api/service/(\d+))", bind(&Impl::service_detail));
    server.Post(R"(/api/service/(\d+)/stop)", bind(&Impl::stop_service));
    server.Post(R"(/api/service/(\d+)/restart)", bind(&Impl::restart_service));
    server.Get(R"(/api/service/(\d+)/auto-restart)", bind(&Impl::service_auto_restart));
    server.Get(R"(/api/auto-restart/([^/]+))", bind(&Impl::get_auto_restart));
    server.Post(R"(/api/auto-restart/([^/]+))", bind(&Impl::set_auto_restart));
    server.Delete(R"(/api/auto-restart/([^/]+))", bind(&Impl::delete_auto_restart));
    server.Post("/api/folder/set", bind(&Impl::set_folder));
    server.Get("/api/folder", bind(&Impl::get_folder));
    server.Get("/api/folder/artifacts", bind(&Impl::list_artifacts));

    server.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                    std::exception_ptr ep) {
        std::string what = "Internal error";
        int status = 500;
        try {
            std::rethrow_exception(ep);
        } catch (const json::exception& e) {
            what = std::string("Invalid JSON: ") + e.what();
            status = 400;
        } catch (const std::invalid_argument& e) {
            what = e.what();
            status = 400;
        } catch (const std::exception& e) {
            what = e.what();
        }
        spdlog::error("{} {} failed: {}", req.method, req.path, what);
        reply(res, Wire::error(what), status);
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
    });
}

// ── Services ────────────────────────────────────────────────

void ApiServer::Impl::list_services(const httplib::Request&, httplib::Response& res) {
    json arr = json::array();
    for (const auto& view : supervisor.list_services()) {
        arr.push_back(Wire::service_summary(view));
    }
    json body = Wire::ok();
    body["services"] = arr;
    reply(res, body);
}

void ApiServer::Impl::service_detail(const httplib::Request& req, httplib::Response& res) {
    auto pid = pid_param(req);
    std::optional<ServiceView> view;
    if (pid) view = supervisor.get_service_detail(*pid);
    if (!view) {
        reply(res, Wire::error("Service not found"), 404);
        return;
    }
    json body = Wire::ok();
    body["service"] = Wire::service_detail(*view);
    reply(res, body);
}

void ApiServer::Impl::stop_service(const httplib::Request& req, httplib::Response& res) {
    auto pid = pid_param(req);
    if (!pid) {
        reply_not_found(res, "Process not found or not a supervised artifact");
        return;
    }
    reply_op(res, supervisor.stop_service(*pid));
}

void ApiServer::Impl::restart_service(const httplib::Request& req, httplib::Response& res) {
    auto pid = pid_param(req);
    if (!pid) {
        reply_not_found(res, "Service not found");
        return;
    }
    json body = parse_body(req);
    std::string jar_name = body.is_object() ? body.value("jar_name", "") : "";
    reply_op(res, supervisor.restart_service(*pid, jar_name));
}

void ApiServer::Impl::start_service(const httplib::Request& req, httplib::Response& res) {
    json body = parse_body(req);
    if (!body.is_object()) throw std::invalid_argument("Request body must be a JSON object");

    std::string jar_path = body.value("jar_path", "");
    std::string working_directory;
    if (body.contains("working_directory") && body["working_directory"].is_string()) {
        working_directory = body["working_directory"].get<std::string>();
    }
    std::vector<std::string> args;
    if (body.contains("args")) {
        if (!body["args"].is_array()) throw std::invalid_argument("args must be an array of strings");
        args = body["args"].get<std::vector<std::string>>();
    }

    auto result = supervisor.start_service(jar_path, working_directory, args);
    if (!result.success) {
        reply(res, Wire::error(result.error), 400);
        return;
    }
    json out = Wire::ok("Service started successfully");
    out["pid"] = result.pid;
    reply(res, out);
}

// ── Auto-restart ────────────────────────────────────────────

void ApiServer::Impl::service_auto_restart(const httplib::Request& req, httplib::Response& res) {
    auto pid = pid_param(req);
    if (!pid || (!supervisor.state().runtime.find(*pid) && !supervisor.get_service_detail(*pid))) {
        reply_not_found(res, "Service not found");
        return;
    }
    auto policy = supervisor.get_auto_restart_config(req.matches[1].str());
    json body = Wire::ok();
    body["config"] = Wire::policy(policy, supervisor.phase(policy.logical_name) != RestartPhase::Idle);
    reply(res, body);
}

void ApiServer::Impl::get_auto_restart(const httplib::Request& req, httplib::Response& res) {
    auto policy = supervisor.get_auto_restart_config(req.matches[1].str());
    json body = Wire::ok();
    body["config"] = Wire::policy(policy, supervisor.phase(policy.logical_name) != RestartPhase::Idle);
    reply(res, body);
}

void ApiServer::Impl::set_auto_restart(const httplib::Request& req, httplib::Response& res) {
    std::string name = Identity::logical_name(req.matches[1].str());
    auto policy = Wire::policy_from(parse_body(req), supervisor.get_auto_restart_config(name));
    auto result = supervisor.set_auto_restart_config(name, policy);
    reply_op(res, result, {{"config", Wire::policy(supervisor.get_auto_restart_config(name))}});
}

void ApiServer::Impl::delete_auto_restart(const httplib::Request& req, httplib::Response& res) {
    reply_op(res, supervisor.delete_auto_restart_config(Identity::logical_name(req.matches[1].str())));
}

// ── Folder ──────────────────────────────────────────────────

void ApiServer::Impl::set_folder(const httplib::Request& req, httplib::Response& res) {
    json body = parse_body(req);
    std::string folder = body.is_object() ? body.value("folder_path", "") : "";
    reply_op(res, supervisor.set_folder_path(folder), {{"folder_path", folder}});
}

void ApiServer::Impl::get_folder(const httplib::Request&, httplib::Response& res) {
    json body = Wire::ok();
    auto folder = supervisor.folder_path();
    body["folder_path"] = folder ? json(*folder) : json(nullptr);
    reply(res, body);
}

void ApiServer::Impl::list_artifacts(const httplib::Request& req, httplib::Response& res) {
    std::string folder = req.get_param_value("folder_path");
    auto listed = supervisor.list_artifacts(folder);
    if (!listed.success) {
        reply(res, Wire::error(listed.error), 400);
        return;
    }

    json arr = json::array();
    for (const auto& info : listed.artifacts) arr.push_back(Wire::artifact(info));
    json supported = json::array();
    for (const auto& ext : Identity::platform_extensions()) supported.push_back(ext);

    json body = Wire::ok();
    body["artifacts"] = arr;
    body["folder_path"] = folder.empty() ? supervisor.folder_path().value_or("") : folder;
    body["supported_types"] = supported;
    reply(res, body);
}

// ── ApiServer ───────────────────────────────────────────────

ApiServer::ApiServer(Supervisor& supervisor)
    : impl_(std::make_unique<Impl>(supervisor)) {
    impl_->routes();
}

ApiServer::~ApiServer() {
    stop();
}

int ApiServer::bind(const std::string& host, int port) {
    if (port == 0) {
        return impl_->server.bind_to_any_port(host);
    }
    return impl_->server.bind_to_port(host, port) ? port : -1;
}

bool ApiServer::listen() {
    return impl_->server.listen_after_bind();
}

void ApiServer::stop() {
    if (impl_->server.is_running()) {
        impl_->server.stop();
    }
}

bool ApiServer::is_running() const {
    return impl_->server.is_running();
}
