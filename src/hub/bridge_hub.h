#ifndef BRIDGE_HUB_H
#define BRIDGE_HUB_H

// =============================================================================
// FileBridge Hub: Composed Root
// =============================================================================
// Owns every registry exactly once and wires them into the session engine
// and the HTTP file service. Collaborators talk to the hub through the
// handler table passed in here plus push_file() / connection_count().
// =============================================================================

#include <cstdint>
#include <memory>
#include <string>

#include "hub_common.h"
#include "bridge_packet.h"
#include "hub_config.h"
#include "dedup_window.h"
#include "connection_registry.h"
#include "file_registry.h"
#include "chunk_assembler.h"
#include "bridge_session.h"
#include "http_files.h"

class BridgeHub {
public:
    BridgeHub(const HubConfig& cfg, SessionHandlers handlers, const HubClock* clock, AsyncLogger* logger)
        : cfg_(cfg),
          clock_(clock),
          logger_(logger),
          conns_(clock, logger),
          dedup_(cfg_.dedup_window_s, clock),
          storage_(cfg_.upload_dir),
          files_(cfg_.registry_capacity, cfg_.registry_ttl_s, clock, logger),
          chunks_(storage_, files_, cfg_.transfer_timeout_s, cfg_.upload_max_bytes(), clock, logger),
          sessions_(cfg_, conns_, dedup_, chunks_, std::move(handlers), clock, logger),
          http_(cfg_, storage_, files_, logger) {}

    BridgeHub(const BridgeHub&) = delete;
    BridgeHub& operator=(const BridgeHub&) = delete;

    // Creates the managed upload directory; call once before serving
    bool init(std::string& err) {
        if (!storage_.ensure(err)) return false;
        hub_log(logger_, AsyncLogger::INFO, "Upload directory: " + storage_.root().string());
        return true;
    }

    void serve_peer(std::shared_ptr<PeerChannel> channel) { sessions_.serve(std::move(channel)); }

    HttpResponse handle_http(const HttpRequest& req) { return http_.handle(req); }

    // Broadcasts a signed incoming_file notice; returns peers reached
    size_t push_file(const std::string& channel, const std::string& file_name,
                     const std::string& url = "", const std::string& file_id = "",
                     int64_t size = 0, const std::string& sha256 = "") {
        BridgePacket pkt = make_file_in_notice(channel, file_name, cfg_.token, url, file_id, size, sha256);
        size_t reached = conns_.broadcast(pkt);
        hub_log(logger_, AsyncLogger::INFO, "Pushed " + file_name + " to " + std::to_string(reached)
            + " server(s)" + (channel.empty() ? "" : " on " + channel));
        return reached;
    }

    size_t connection_count() const { return conns_.count(); }

    // Force-closes every registered peer; their sessions then unwind
    void close_all() {
        for (const auto& conn : conns_.snapshot()) conn->close();
    }

    const HubConfig&    config() const { return cfg_; }
    ConnectionRegistry& connections()  { return conns_; }
    FileRegistry&       files()        { return files_; }
    ChunkAssembler&     chunks()       { return chunks_; }
    DedupWindow&        dedup()        { return dedup_; }
    StorageDir&         storage()      { return storage_; }

private:
    HubConfig           cfg_;
    const HubClock*     clock_;
    AsyncLogger*        logger_;
    ConnectionRegistry  conns_;
    DedupWindow         dedup_;
    StorageDir          storage_;
    FileRegistry        files_;
    ChunkAssembler      chunks_;
    SessionEngine       sessions_;
    HttpFileService     http_;
};

#endif
