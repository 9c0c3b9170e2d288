#ifndef CHUNK_ASSEMBLER_H
#define CHUNK_ASSEMBLER_H

// =============================================================================
// FileBridge Hub: Chunked Transfer Reassembly
// =============================================================================
// A peer uploads one file as N "file_piece" packets, each carrying a base64
// slice plus the transfer's declared metadata. Pieces may arrive in any order
// and may be retried; the file is assembled in index order once the number of
// distinct indices received equals total_chunks.
//
// Completion is judged by COUNT only. Indices outside 0..total_chunks-1 are
// accepted and counted, so a peer sending bogus indices can complete a
// transfer with gaps.
// =============================================================================

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "hub_common.h"
#include "crypto_utils.h"
#include "bridge_packet.h"
#include "file_registry.h"

// =============================================================================
// CHUNK PIECE: one decoded file_piece payload
// =============================================================================
struct ChunkPiece {
    std::string transfer_id;
    std::string file_name;
    int64_t     total_size   = 0;
    std::string sha256;
    int64_t     chunk_index  = 0;
    int64_t     total_chunks = 1;
    std::string data;            // base64
    std::string channel;

    static bool from_payload(const json& p, const std::string& channel,
                             ChunkPiece& out, std::string& err) {
        ChunkPiece c;
        c.channel     = channel;
        c.transfer_id = payload_str(p, "transfer_id");
        c.file_name   = payload_str(p, "file_name");
        c.sha256      = payload_str(p, "sha256");
        c.data        = payload_str(p, "data");
        if (!payload_int(p, "total_size", 0, c.total_size))     { err = "bad total_size"; return false; }
        if (!payload_int(p, "chunk_index", 0, c.chunk_index))   { err = "bad chunk_index"; return false; }
        if (!payload_int(p, "total_chunks", 1, c.total_chunks)) { err = "bad total_chunks"; return false; }
        if (c.total_chunks < 1) { err = "total_chunks must be >= 1"; return false; }
        out = std::move(c);
        return true;
    }
};

// =============================================================================
// CHUNKED TRANSFER: in-flight state for one transfer id
// =============================================================================
struct ChunkedTransfer {
    int64_t     total_chunks;
    std::string file_name;
    int64_t     total_size;
    std::string sha256;
    std::string channel;
    double      created_at;

    std::map<int64_t, std::string> received;   // chunk index -> decoded bytes
    uint64_t    buffered = 0;

    ChunkedTransfer(int64_t chunks, std::string name, int64_t size,
                    std::string hash, std::string chan, double now)
        : total_chunks(chunks), file_name(std::move(name)), total_size(size),
          sha256(std::move(hash)), channel(std::move(chan)), created_at(now) {}

    bool complete() const { return static_cast<int64_t>(received.size()) >= total_chunks; }

    std::string assemble() const {
        std::string out;
        out.reserve(static_cast<size_t>(buffered));
        for (const auto& kv : received) out += kv.second;
        return out;
    }
};

// What the caller must announce after feeding a piece
struct ChunkOutcome {
    bool        started   = false;   // first piece of a new transfer
    bool        completed = false;   // file persisted and registered
    bool        oversized = false;   // transfer discarded for exceeding the size cap
    std::string file_name;
    std::string channel;
    int64_t     declared_size = 0;
    std::string declared_sha256;
    FileRecord  record;
};

// =============================================================================
// CHUNK ASSEMBLER
// =============================================================================
class ChunkAssembler {
public:
    ChunkAssembler(StorageDir& storage, FileRegistry& files, double timeout_sec,
                   uint64_t max_bytes, const HubClock* clock, AsyncLogger* logger)
        : storage_(storage), files_(files), timeout_(timeout_sec),
          max_bytes_(max_bytes), clock_(clock), logger_(logger) {}

    ChunkAssembler(const ChunkAssembler&) = delete;
    ChunkAssembler& operator=(const ChunkAssembler&) = delete;

    ChunkOutcome accept(const ChunkPiece& piece) {
        sweep_stale();

        ChunkOutcome out;
        out.file_name = piece.file_name;
        out.channel   = piece.channel;

        std::unique_ptr<ChunkedTransfer> done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = transfers_.find(piece.transfer_id);
            if (it == transfers_.end()) {
                it = transfers_.emplace(piece.transfer_id, std::make_unique<ChunkedTransfer>(
                        piece.total_chunks, piece.file_name, piece.total_size,
                        piece.sha256, piece.channel, clock_->now())).first;
                out.started = true;
                log(AsyncLogger::INFO, "Chunked upload started: " + piece.file_name
                    + " (" + std::to_string(piece.total_size) + " bytes, "
                    + std::to_string(piece.total_chunks) + " chunks, id=" + piece.transfer_id + ")");
            }

            ChunkedTransfer& xfer = *it->second;
            if (!xfer.received.count(piece.chunk_index)) {
                std::string bytes;
                if (!base64_decode(piece.data, bytes)) {
                    log(AsyncLogger::ERROR_LOG, "Chunk decode failed (" + piece.transfer_id
                        + " #" + std::to_string(piece.chunk_index) + "), dropped");
                } else if (xfer.buffered + bytes.size() > max_bytes_) {
                    log(AsyncLogger::ERROR_LOG, "Chunked upload " + piece.transfer_id
                        + " exceeds " + std::to_string(max_bytes_) + " bytes, discarded");
                    transfers_.erase(it);
                    out.oversized = true;
                    return out;
                } else {
                    xfer.buffered += bytes.size();
                    xfer.received.emplace(piece.chunk_index, std::move(bytes));
                }
            }

            log(AsyncLogger::DEBUG, "Chunk #" + std::to_string(piece.chunk_index) + " of "
                + std::to_string(xfer.total_chunks) + " (" + piece.transfer_id + ")");

            if (!xfer.complete()) return out;
            done = std::move(it->second);
            transfers_.erase(it);
        }

        finish(piece.transfer_id, *done, out);
        return out;
    }

    // Drops every transfer older than the timeout, complete or not
    size_t sweep_stale() {
        std::lock_guard<std::mutex> lock(mutex_);
        double now = clock_->now();
        size_t dropped = 0;
        for (auto it = transfers_.begin(); it != transfers_.end(); ) {
            if (now - it->second->created_at > timeout_) {
                log(AsyncLogger::WARN, "Discarding stale chunked upload: " + it->first);
                it = transfers_.erase(it);
                dropped++;
            } else {
                ++it;
            }
        }
        return dropped;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transfers_.size();
    }

private:
    void finish(const std::string& transfer_id, const ChunkedTransfer& xfer, ChunkOutcome& out) {
        std::string bytes = xfer.assemble();
        log(AsyncLogger::INFO, "Chunked upload complete: " + xfer.file_name
            + " (" + std::to_string(bytes.size()) + " bytes)");

        std::string actual_sha = sha256_hex(bytes);
        if (!xfer.sha256.empty() && actual_sha != xfer.sha256) {
            log(AsyncLogger::WARN, "SHA-256 mismatch for " + transfer_id
                + ": declared=" + xfer.sha256 + " actual=" + actual_sha);
        }

        fs::path dest = storage_.path_for(safe_filename(xfer.file_name));
        std::string err;
        if (!storage_.write_file(dest, bytes, err)) {
            log(AsyncLogger::ERROR_LOG, "Saving chunked upload " + transfer_id + " failed: " + err);
            return;
        }
        log(AsyncLogger::INFO, "File saved: " + dest.string());

        FileRecord rec(transfer_id, xfer.file_name, bytes.size(), actual_sha, dest.string());
        files_.register_file(rec);

        out.completed       = true;
        out.channel         = xfer.channel;
        out.file_name       = xfer.file_name;
        out.declared_size   = xfer.total_size;
        out.declared_sha256 = xfer.sha256;
        out.record          = std::move(rec);
    }

    void log(AsyncLogger::Level level, const std::string& msg) { hub_log(logger_, level, msg); }

    StorageDir&   storage_;
    FileRegistry& files_;
    double        timeout_;
    uint64_t      max_bytes_;
    const HubClock* clock_;
    AsyncLogger*  logger_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<ChunkedTransfer>> transfers_;
};

#endif
