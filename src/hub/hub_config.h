#ifndef HUB_CONFIG_H
#define HUB_CONFIG_H

// =============================================================================
// FileBridge Hub: Typed Configuration
// =============================================================================
// Built once from AppConfig (file + CLI overrides) and handed by const
// reference to every component.
// =============================================================================

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <algorithm>
#include <cctype>

#include "hub_common.h"

constexpr const char* DEFAULT_TOKEN = "change_me_to_a_secure_token";

struct HubConfig {
    // Listener
    std::string bind_address = "0.0.0.0";
    int         port         = DEFAULT_PORT;
    std::string ws_path      = "/ws/bridge";
    std::string file_path    = "/v1/files";     // HTTP base path

    // Shared secret: handshake token, HMAC key, HTTP bearer token
    std::string token = DEFAULT_TOKEN;

    // Protocol timing (seconds)
    double heartbeat_interval_s = 15;
    double handshake_timeout_s  = 10;
    double hmac_window_s        = 30;
    double dedup_window_s       = 600;

    size_t max_connections = 16;
    size_t ws_max_size     = 8 * 1024 * 1024;

    // Files
    std::string              upload_dir         = "data/files";
    uint64_t                 upload_max_mb      = 10240;
    std::vector<std::string> allowed_extensions = { "vpk" };
    double                   transfer_timeout_s = 300;
    size_t                   registry_capacity  = 500;
    double                   registry_ttl_s     = 3600;

    std::map<std::string, std::string> server_names;   // server_id -> display name

    // TLS (optional)
    bool        tls_enabled             = false;
    std::string server_crt              = "server.crt";
    std::string server_key              = "server.key";
    std::string ca_path;
    bool        tls_require_client_cert = false;
    std::string crl_path;

    uint64_t upload_max_bytes() const { return upload_max_mb * 1024ULL * 1024ULL; }

    std::string display_name(const std::string& server_id) const {
        auto it = server_names.find(server_id);
        return it != server_names.end() ? it->second : server_id;
    }

    bool extension_allowed(const std::string& ext_lower) const {
        return std::find(allowed_extensions.begin(), allowed_extensions.end(), ext_lower)
            != allowed_extensions.end();
    }

    static HubConfig from_app_config(const AppConfig& conf) {
        HubConfig c;
        c.bind_address = conf.get("bind_address", c.bind_address);
        c.port         = conf.get_int("port", c.port);
        c.ws_path      = normalize_path(conf.get("ws_path", c.ws_path));
        c.file_path    = normalize_path(conf.get("file_path", c.file_path));
        c.token        = conf.get("token", c.token);

        c.heartbeat_interval_s = conf.get_double("heartbeat_interval_s", c.heartbeat_interval_s);
        c.handshake_timeout_s  = conf.get_double("handshake_timeout_s", c.handshake_timeout_s);
        c.hmac_window_s        = conf.get_double("hmac_window_s", c.hmac_window_s);
        c.dedup_window_s       = conf.get_double("dedup_window_s", c.dedup_window_s);
        c.max_connections      = conf.get_size("max_connections", c.max_connections);
        c.ws_max_size          = conf.get_size("ws_max_size", c.ws_max_size);

        c.upload_dir         = conf.get("upload_dir", c.upload_dir);
        c.upload_max_mb      = conf.get_size("upload_max_mb", static_cast<size_t>(c.upload_max_mb));
        c.transfer_timeout_s = conf.get_double("transfer_timeout_s", c.transfer_timeout_s);
        c.registry_capacity  = conf.get_size("registry_capacity", c.registry_capacity);
        c.registry_ttl_s     = conf.get_double("registry_ttl_s", c.registry_ttl_s);

        std::vector<std::string> exts = conf.get_list("allowed_extensions", c.allowed_extensions);
        c.allowed_extensions.clear();
        for (std::string e : exts) {
            e.erase(0, e.find_first_not_of('.'));
            std::transform(e.begin(), e.end(), e.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            if (!e.empty()) c.allowed_extensions.push_back(e);
        }

        c.server_names = conf.get_prefixed("server_name.");

        c.tls_enabled             = conf.get_bool("tls_enabled", c.tls_enabled);
        c.server_crt              = conf.get("server_crt", c.server_crt);
        c.server_key              = conf.get("server_key", c.server_key);
        c.ca_path                 = conf.get("ca_path", c.ca_path);
        c.tls_require_client_cert = conf.get_bool("tls_require_client_cert", c.tls_require_client_cert);
        c.crl_path                = conf.get("crl_path", c.crl_path);

        if (c.heartbeat_interval_s <= 0) c.heartbeat_interval_s = 15;
        if (c.handshake_timeout_s <= 0)  c.handshake_timeout_s = 10;
        if (c.registry_capacity == 0)    c.registry_capacity = 1;
        return c;
    }

private:
    // "/v1/files/" -> "/v1/files", "ws" -> "/ws"
    static std::string normalize_path(std::string p) {
        if (p.empty() || p[0] != '/') p = "/" + p;
        while (p.size() > 1 && p.back() == '/') p.pop_back();
        return p;
    }
};

#endif
