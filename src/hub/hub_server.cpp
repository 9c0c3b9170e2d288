// =============================================================================
// FileBridge Hub: Server Entry Point
// =============================================================================
// One listening port. WebSocket upgrades on ws_path become bridge sessions,
// everything else is served by the HTTP file endpoints. Each accepted socket
// runs as one task on the dynamic thread pool; its stream operations run on
// a strand of the io_context driven by the io threads.
// =============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>

#include "hub_common.h"
#include "crypto_utils.h"
#include "hub_config.h"
#include "bridge_session.h"
#include "bridge_hub.h"
#include "beast_transport.h"

namespace ssl = net::ssl;

// =============================================================================
// GLOBAL CONTROL
// =============================================================================
std::atomic<bool> g_running(true);

void handle_signal(int) {
    g_running = false;
}

static std::unique_ptr<AsyncLogger> logger;

// =============================================================================
// TLS CONTEXT
// =============================================================================
static bool configure_tls(ssl::context& ctx, const HubConfig& cfg) {
    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                  | ssl::context::no_sslv3 | ssl::context::single_dh_use);

    boost::system::error_code ec;
    ctx.use_certificate_chain_file(cfg.server_crt, ec);
    if (ec) {
        logger->log(AsyncLogger::ERROR_LOG, "Failed to load server certificate " + cfg.server_crt + ": " + ec.message());
        return false;
    }
    ctx.use_private_key_file(cfg.server_key, ssl::context::pem, ec);
    if (ec) {
        logger->log(AsyncLogger::ERROR_LOG, "Failed to load server key " + cfg.server_key + ": " + ec.message());
        return false;
    }

    if (!cfg.ca_path.empty()) {
        ctx.load_verify_file(cfg.ca_path, ec);
        if (ec) {
            logger->log(AsyncLogger::ERROR_LOG, "Failed to load CA certificate " + cfg.ca_path + ": " + ec.message());
            return false;
        }
    }
    if (cfg.tls_require_client_cert) {
        if (cfg.ca_path.empty()) {
            logger->log(AsyncLogger::ERROR_LOG, "tls_require_client_cert needs ca_path");
            return false;
        }
        ctx.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
        logger->log(AsyncLogger::INFO, "TLS: client certificates required");
    }

    if (!cfg.crl_path.empty()) {
        std::string err;
        if (load_crl(ctx.native_handle(), cfg.crl_path, err)) logger->log(AsyncLogger::INFO, "CRL loaded: " + cfg.crl_path);
        else logger->log(AsyncLogger::WARN, "CRL load failed: " + err);
    }
    return true;
}

// =============================================================================
// DEFAULT COLLABORATOR: log every bridge event
// =============================================================================
static SessionHandlers make_logging_handlers(const HubConfig& cfg) {
    SessionHandlers h;
    h.on_file.push_back([&cfg](const FileArrival& ev) {
        std::ostringstream ss;
        ss << "[" << cfg.display_name(ev.server_id) << "] file ready: " << ev.file_name
           << " (" << ev.size << " bytes";
        if (!ev.file_id.empty()) ss << ", id=" << ev.file_id;
        if (ev.url) ss << ", url=" << *ev.url;
        if (ev.data) ss << ", inline " << ev.data->size() << " b64 chars";
        ss << ")";
        if (!ev.channel.empty()) ss << " -> " << ev.channel;
        logger->log(AsyncLogger::INFO, ss.str());
    });
    h.on_result.push_back([&cfg](const TransferResult& ev) {
        std::ostringstream ss;
        ss << "[" << cfg.display_name(ev.server_id) << "] ";
        if (ev.extracted && *ev.extracted) {
            ss << "extracted " << ev.file_name << " in " << ev.extract_time.value_or("?") << "s";
        } else if (ev.ok) {
            ss << "downloaded " << ev.file_name << " (" << ev.size_mb << " MB at " << ev.speed << " MB/s)";
        } else {
            ss << "download failed: " << ev.file_name << " (" << ev.err_msg << ")";
        }
        logger->log(ev.ok ? AsyncLogger::INFO : AsyncLogger::WARN, ss.str());
    });
    h.on_upload_start.push_back([&cfg](const UploadStart& ev) {
        logger->log(AsyncLogger::INFO, "[" + cfg.display_name(ev.server_id) + "] uploading " + ev.file_name);
    });
    return h;
}

// =============================================================================
// CONNECTION TASK
// =============================================================================
static void run_connection(tcp::socket sock, BridgeHub& hub, ssl::context* tls) {
    try {
        if (tls) {
            beast::ssl_stream<beast::tcp_stream> stream(std::move(sock), *tls);
            const auto deadline = to_steady(hub.config().handshake_timeout_s);
            boost::system::error_code ec = run_on_strand(stream.get_executor(), [&](auto done) {
                beast::get_lowest_layer(stream).expires_after(deadline);
                stream.async_handshake(ssl::stream_base::server, std::move(done));
            });
            if (ec) {
                logger->log(AsyncLogger::WARN, "TLS handshake failed: " + ec.message());
                return;
            }
            serve_connection(std::move(stream), hub, logger.get());
        } else {
            serve_connection(beast::tcp_stream(std::move(sock)), hub, logger.get());
        }
    } catch (const std::exception& e) {
        logger->log(AsyncLogger::ERROR_LOG, std::string("Connection task failed: ") + e.what());
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    CliArgs cli = parse_hub_cli(argc, argv);
    if (cli.show_help) { print_hub_usage(argv[0]); return 0; }
    if (cli.show_version) { std::cout << "FileBridge Hub v" << HUB_VERSION << "\n"; return 0; }
    if (!cli.unknown.empty()) {
        std::cerr << "Unknown argument: " << cli.unknown.front() << "\n";
        print_hub_usage(argv[0]);
        return 1;
    }

    // -------------------------------------------------------------------------
    // 1. Configuration and logging
    // -------------------------------------------------------------------------
    bool config_found = false;
    AppConfig conf = load_config(cli.config_path, &config_found);
    cli.apply_overrides(conf);
    HubConfig cfg = HubConfig::from_app_config(conf);

    {
        AsyncLogger::Options opts;
        opts.file          = conf.get("log_file", "filebridge.log");
        opts.max_file_size = conf.get_size("log_max_bytes", 10 * 1024 * 1024);
        opts.max_files     = conf.get_int("log_max_files", 5);
        opts.debug         = conf.get_bool("log_debug", false);
        logger = std::make_unique<AsyncLogger>(opts);
    }

    logger->log(AsyncLogger::INFO, std::string("=== FileBridge Hub v") + HUB_VERSION + " starting ===");
    if (config_found) logger->log(AsyncLogger::INFO, "Config loaded from: " + cli.config_path);
    else logger->log(AsyncLogger::WARN, "Config file " + cli.config_path + " not found, using defaults");
    if (cfg.token == DEFAULT_TOKEN)
        logger->log(AsyncLogger::WARN, "token is still the default value; set a private token in the config");

    // -------------------------------------------------------------------------
    // 2. Hub and its registries
    // -------------------------------------------------------------------------
    HubClock clock;
    BridgeHub hub(cfg, make_logging_handlers(cfg), &clock, logger.get());
    {
        std::string err;
        if (!hub.init(err)) {
            logger->log(AsyncLogger::ERROR_LOG, "Storage setup failed: " + err);
            return 1;
        }
    }

    // -------------------------------------------------------------------------
    // 3. TLS (optional)
    // -------------------------------------------------------------------------
    std::unique_ptr<ssl::context> tls;
    if (cfg.tls_enabled) {
        tls = std::make_unique<ssl::context>(ssl::context::tls_server);
        if (!configure_tls(*tls, cfg)) return 1;
        logger->log(AsyncLogger::INFO, "TLS enabled");
    }

    // -------------------------------------------------------------------------
    // 4. Listener
    // -------------------------------------------------------------------------
    net::io_context ioc;
    tcp::acceptor acceptor(ioc);
    try {
        tcp::endpoint endpoint(net::ip::make_address(cfg.bind_address), static_cast<unsigned short>(cfg.port));
        acceptor.open(endpoint.protocol());
        acceptor.set_option(net::socket_base::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen(net::socket_base::max_listen_connections);
        acceptor.non_blocking(true);
    } catch (const boost::system::system_error& e) {
        logger->log(AsyncLogger::ERROR_LOG, "Bind failed on " + cfg.bind_address + ":"
                    + std::to_string(cfg.port) + ": " + e.what());
        return 1;
    }
    logger->log(AsyncLogger::INFO, "Listening on " + cfg.bind_address + ":" + std::to_string(cfg.port)
                + " (ws " + cfg.ws_path + ", files " + cfg.file_path + ")");

    DynamicThreadPool::Config pool_cfg;
    pool_cfg.min_threads          = conf.get_size("pool_min", 4);
    pool_cfg.max_threads          = conf.get_size("pool_max", 64);
    pool_cfg.idle_timeout_seconds = conf.get_int("pool_idle_timeout_s", 30);
    logger->log(AsyncLogger::INFO, "Thread pool: min=" + std::to_string(pool_cfg.min_threads)
                 + " max=" + std::to_string(pool_cfg.max_threads));
    int diag_interval = conf.get_int("diagnostics_interval_s", 60);

    int io_threads = conf.get_int("io_threads", 2);
    if (io_threads < 1) io_threads = 1;
    auto work = net::make_work_guard(ioc);
    std::vector<std::thread> io_pool;
    for (int i = 0; i < io_threads; i++) {
        io_pool.emplace_back([&ioc] {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                logger->log(AsyncLogger::ERROR_LOG, std::string("I/O thread failed: ") + e.what());
            }
        });
    }

    // -------------------------------------------------------------------------
    // 5. Accept loop
    // -------------------------------------------------------------------------
    {
        DynamicThreadPool pool(pool_cfg);

        std::thread diagnostics([&pool, &hub, diag_interval]() {
            int waited = 0;
            while (g_running) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
                if (!g_running || diag_interval <= 0 || ++waited < diag_interval) continue;
                waited = 0;

                std::stringstream ss;
                ss << "Pool: active=" << pool.active_count()
                   << " total=" << pool.total_count()
                   << " pending=" << pool.pending_count()
                   << " | Peers: " << hub.connection_count()
                   << " | Files: " << hub.files().size()
                   << " | Transfers: " << hub.chunks().pending()
                   << " | Dedup: " << hub.dedup().size();
                logger->log(AsyncLogger::INFO, ss.str());
            }
        });

        ssl::context* tls_ctx = tls.get();
        while (g_running) {
            boost::system::error_code ec;
            tcp::socket sock(net::make_strand(ioc));
            acceptor.accept(sock, ec);
            if (ec == net::error::would_block || ec == net::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
            if (ec) {
                logger->log(AsyncLogger::WARN, "Accept failed: " + ec.message());
                continue;
            }
            auto shared = std::make_shared<tcp::socket>(std::move(sock));
            if (!pool.enqueue([shared, &hub, tls_ctx] { run_connection(std::move(*shared), hub, tls_ctx); })) break;
        }

        logger->log(AsyncLogger::INFO, "Shutdown signal received.");
        g_running = false;
        boost::system::error_code ec;
        acceptor.close(ec);
        if (ec) logger->log(AsyncLogger::WARN, "Closing listener: " + ec.message());
        hub.close_all();
        if (diagnostics.joinable()) diagnostics.join();
    }

    // Pool workers are joined; nothing waits on the io_context anymore
    work.reset();
    ioc.stop();
    for (auto& t : io_pool) t.join();

    logger->log(AsyncLogger::INFO, "=== FileBridge Hub exiting ===");
    logger.reset();
    return 0;
}
