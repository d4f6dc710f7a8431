#include "api/supervisor_client.hpp"

#include <httplib.h>
#include <cctype>
#include <cstdio>

using json = nlohmann::json;

struct SupervisorClient::Impl {
    std::string host;
    int port;
    int timeout_ms = 5000;

    std::unique_ptr<httplib::Client> make_client() {
        auto cli = std::make_unique<httplib::Client>(host, port);
        time_t sec = timeout_ms / 1000;
        time_t usec = (timeout_ms % 1000) * 1000;
        cli->set_connection_timeout(sec, usec);
        cli->set_read_timeout(sec, usec);
        cli->set_write_timeout(sec, usec);
        return cli;
    }

    ApiResponse unwrap(const httplib::Result& res) {
        ApiResponse out;
        if (!res) {
            out.error = "Cannot reach svcguard daemon at " + host + ":" + std::to_string(port) +
                        " (" + httplib::to_string(res.error()) + ")";
            return out;
        }
        out.status = res->status;
        try {
            out.body = json::parse(res->body);
        } catch (const json::exception& e) {
            out.error = "Malformed response (HTTP " + std::to_string(res->status) + "): " + e.what();
            return out;
        }
        if (!out.body.is_object()) {
            out.error = "Unexpected response (HTTP " + std::to_string(res->status) + ")";
            return out;
        }
        out.success = res->status == 200 && out.body.value("success", false);
        if (!out.success) {
            out.error = out.body.value("error", "HTTP " + std::to_string(res->status));
        }
        return out;
    }

    ApiResponse get(const std::string& path, const httplib::Params& params = {}) {
        auto cli = make_client();
        return unwrap(cli->Get(path, params, httplib::Headers{}));
    }

    ApiResponse post(const std::string& path, const json& body = json::object()) {
        auto cli = make_client();
        return unwrap(cli->Post(path, body.dump(), "application/json"));
    }

    ApiResponse del(const std::string& path) {
        auto cli = make_client();
        return unwrap(cli->Delete(path));
    }
};

SupervisorClient::SupervisorClient(const std::string& host, int port, int timeout_ms)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = host;
    impl_->port = port;
    impl_->timeout_ms = timeout_ms;
}

SupervisorClient::~SupervisorClient() = default;

std::string SupervisorClient::encode_segment(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

// ── Connection test ─────────────────────────────────────────

bool SupervisorClient::test_connection() {
    auto cli = impl_->make_client();
    auto res = cli->Get("/api/folder");
    return res && res->status == 200;
}

// ── Services ────────────────────────────────────────────────

ApiResponse SupervisorClient::list_services() {
    return impl_->get("/api/services");
}

ApiResponse SupervisorClient::get_service(pid_t pid) {
    return impl_->get("/api/service/" + std::to_string(pid));
}

ApiResponse SupervisorClient::stop_service(pid_t pid) {
    return impl_->post("/api/service/" + std::to_string(pid) + "/stop");
}

ApiResponse SupervisorClient::restart_service(pid_t pid, const std::string& jar_name) {
    json body = json::object();
    if (!jar_name.empty()) body["jar_name"] = jar_name;
    return impl_->post("/api/service/" + std::to_string(pid) + "/restart", body);
}

ApiResponse SupervisorClient::start_service(const std::string& artifact_path,
                                            const std::string& working_directory,
                                            const std::vector<std::string>& args) {
    json body;
    body["jar_path"] = artifact_path;
    if (!working_directory.empty()) body["working_directory"] = working_directory;
    if (!args.empty()) body["args"] = args;
    return impl_->post("/api/service/start", body);
}

// ── Auto-restart ────────────────────────────────────────────

ApiResponse SupervisorClient::get_auto_restart(const std::string& name_or_pid) {
    return impl_->get("/api/auto-restart/" + encode_segment(name_or_pid));
}

ApiResponse SupervisorClient::set_auto_restart(const std::string& name, const json& body) {
    return impl_->post("/api/auto-restart/" + encode_segment(name), body);
}

ApiResponse SupervisorClient::delete_auto_restart(const std::string& name) {
    return impl_->del("/api/auto-restart/" + encode_segment(name));
}

// ── Folder ──────────────────────────────────────────────────

ApiResponse SupervisorClient::set_folder(const std::string& folder_path) {
    return impl_->post("/api/folder/set", {{"folder_path", folder_path}});
}

ApiResponse SupervisorClient::list_artifacts(const std::string& folder_path) {
    httplib::Params params;
    if (!folder_path.empty()) params.emplace("folder_path", folder_path);
    return impl_->get("/api/folder/artifacts", params);
}
