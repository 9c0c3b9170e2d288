#ifndef HTTP_FILES_H
#define HTTP_FILES_H

// =============================================================================
// FileBridge Hub: HTTP File Endpoints
// =============================================================================
// Provides:
//   - HttpRequest / HttpResponse: transport-neutral request and reply
//   - split_target / parse_query / url_decode / parse_multipart
//   - HttpFileService: {base}/upload, {base}/download, {base}/list
//
// Every endpoint requires "Authorization: Bearer <token>" or "?token=".
// A download is one-shot: the file and its registry entry are removed
// once the bytes are handed out.
// =============================================================================

#include <cctype>
#include <cstdint>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "hub_common.h"
#include "crypto_utils.h"
#include "bridge_packet.h"
#include "hub_config.h"
#include "file_registry.h"

// =============================================================================
// REQUEST / RESPONSE
// =============================================================================
struct HttpRequest {
    std::string method;                          // "GET", "POST", ...
    std::string target;                          // path plus optional ?query
    std::map<std::string, std::string> headers;  // lowercase names
    std::string body;
    bool body_too_large = false;                 // transport stopped reading

    std::string header(const std::string& lower_name, const std::string& def = "") const {
        auto it = headers.find(lower_name);
        return it != headers.end() ? it->second : def;
    }
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    static HttpResponse json_reply(int status, const json& j) {
        HttpResponse r;
        r.status = status;
        r.body = dump_json(j);
        return r;
    }

    static HttpResponse error(int status, const std::string& message) {
        return json_reply(status, json{ { "error", message } });
    }
};

// =============================================================================
// TARGET AND QUERY PARSING
// =============================================================================
inline std::string url_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++) {
        char c = in[i];
        if (c == '+') { out += ' '; continue; }
        if (c == '%' && i + 2 < in.size()
            && std::isxdigit(static_cast<unsigned char>(in[i + 1]))
            && std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            i += 2;
            continue;
        }
        out += c;
    }
    return out;
}

inline void split_target(const std::string& target, std::string& path, std::string& query) {
    size_t q = target.find('?');
    path  = target.substr(0, q);
    query = q == std::string::npos ? "" : target.substr(q + 1);
}

// First occurrence of each key wins
inline std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> out;
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string val = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            out.emplace(key, val);
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return out;
}

// =============================================================================
// MULTIPART
// =============================================================================
// Returns the first part whose headers carry a filename parameter. This is
// not a validating parser: anything between delimiters without a header
// block is skipped.
// =============================================================================
inline bool parse_multipart(const std::string& body, const std::string& content_type,
                            std::string& filename, std::string& data) {
    size_t b = content_type.find("boundary=");
    if (b == std::string::npos) return false;
    b += 9;
    size_t b_end = content_type.find_first_of(" \t;", b);
    std::string boundary = content_type.substr(b, b_end == std::string::npos ? std::string::npos : b_end - b);
    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"')
        boundary = boundary.substr(1, boundary.size() - 2);
    if (boundary.empty()) return false;

    const std::string delimiter = "--" + boundary;
    size_t pos = 0;
    while (pos <= body.size()) {
        size_t next = body.find(delimiter, pos);
        std::string part = body.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        pos = next == std::string::npos ? body.size() + 1 : next + delimiter.size();

        if (part.empty() || part == "--\r\n" || part == "--") continue;
        size_t header_end = part.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        std::string headers = part.substr(0, header_end);
        size_t fn = headers.find("filename=");
        if (fn == std::string::npos) continue;

        fn += 9;
        if (fn < headers.size() && headers[fn] == '"') {
            size_t close = headers.find('"', fn + 1);
            if (close == std::string::npos) {
                filename = "unnamed";
            } else {
                filename = headers.substr(fn + 1, close - fn - 1);
            }
        } else {
            size_t end = headers.find_first_of(" \t\r\n", fn);
            filename = headers.substr(fn, end == std::string::npos ? std::string::npos : end - fn);
            if (filename.empty()) filename = "unnamed";
        }

        data = part.substr(header_end + 4);
        if (data.size() >= 2 && data.compare(data.size() - 2, 2, "\r\n") == 0)
            data.resize(data.size() - 2);
        return true;
    }
    return false;
}

// [0-9a-f]{1,32}
inline bool valid_file_id(const std::string& id) {
    if (id.empty() || id.size() > 32) return false;
    for (char c : id) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

// =============================================================================
// FILE SERVICE
// =============================================================================
class HttpFileService {
public:
    HttpFileService(const HubConfig& cfg, StorageDir& storage, FileRegistry& files, AsyncLogger* logger)
        : cfg_(cfg), storage_(storage), files_(files), logger_(logger) {}

    HttpFileService(const HttpFileService&) = delete;
    HttpFileService& operator=(const HttpFileService&) = delete;

    HttpResponse handle(const HttpRequest& req) {
        std::string path, query;
        split_target(req.target, path, query);
        auto params = parse_query(query);
        const std::string& base = cfg_.file_path;

        try {
            if (path == base + "/upload") {
                if (req.method != "POST") return HttpResponse::error(405, "method not allowed");
                return upload(req, params);
            }
            if (path == base + "/download") {
                if (req.method != "GET") return HttpResponse::error(405, "method not allowed");
                return download(req, params);
            }
            if (path == base + "/list") {
                if (req.method != "GET") return HttpResponse::error(405, "method not allowed");
                return list(req, params);
            }
        } catch (const std::exception& e) {
            hub_log(logger_, AsyncLogger::ERROR_LOG, "HTTP " + req.method + " " + path + " failed: " + e.what());
            return HttpResponse::error(500, "internal error");
        }
        return HttpResponse::error(404, "not found");
    }

    bool check_auth(const HttpRequest& req, const std::map<std::string, std::string>& params) const {
        std::string auth = req.header("authorization");
        if (auth.compare(0, 7, "Bearer ") == 0)
            return constant_time_equals(auth.substr(7), cfg_.token);
        auto it = params.find("token");
        if (it != params.end() && !it->second.empty())
            return constant_time_equals(it->second, cfg_.token);
        return false;
    }

private:
    // -------------------------------------------------------------------------
    // POST {base}/upload
    // -------------------------------------------------------------------------
    HttpResponse upload(const HttpRequest& req, const std::map<std::string, std::string>& params) {
        if (!check_auth(req, params)) return HttpResponse::error(401, "unauthorized");

        uint64_t max_bytes = cfg_.upload_max_bytes();
        if (req.body_too_large)
            return HttpResponse::error(413, "file too large: limit " + std::to_string(max_bytes));
        if (req.body.empty()) return HttpResponse::error(400, "empty body");

        std::string filename;
        std::string content;
        std::string ct = req.header("content-type");
        if (ct.find("multipart/form-data") != std::string::npos) {
            if (!parse_multipart(req.body, ct, filename, content))
                return HttpResponse::error(400, "failed to parse multipart");
        } else {
            filename = req.header("x-file-name", "unnamed");
            content  = req.body;
        }
        filename = safe_filename(filename);

        std::string ext = file_extension(filename);
        if (!cfg_.extension_allowed(ext)) {
            json j;
            j["error"]   = "extension not allowed: " + (ext.empty() ? std::string("(none)") : "." + ext);
            j["allowed"] = cfg_.allowed_extensions;
            return HttpResponse::json_reply(403, j);
        }
        if (content.size() > max_bytes) {
            return HttpResponse::error(413, "file too large: " + std::to_string(content.size())
                                       + " > " + std::to_string(max_bytes));
        }

        std::string sha = sha256_hex(content);
        std::string file_id = random_hex_id(8);
        fs::path dest = storage_.path_for(filename);
        std::string err;
        if (!storage_.write_file(dest, content, err)) {
            hub_log(logger_, AsyncLogger::ERROR_LOG, "Upload write failed: " + err);
            return HttpResponse::error(500, "storage write failed");
        }

        files_.register_file(FileRecord(file_id, filename, content.size(), sha, dest.string()));
        hub_log(logger_, AsyncLogger::INFO, "File uploaded: " + filename + " ("
            + std::to_string(content.size()) + " bytes, id=" + file_id + ")");

        json j;
        j["file_id"]   = file_id;
        j["file_name"] = filename;
        j["size"]      = content.size();
        j["sha256"]    = sha;
        return HttpResponse::json_reply(200, j);
    }

    // -------------------------------------------------------------------------
    // GET {base}/download?file_id=
    // -------------------------------------------------------------------------
    HttpResponse download(const HttpRequest& req, const std::map<std::string, std::string>& params) {
        if (!check_auth(req, params)) return HttpResponse::error(401, "unauthorized");

        auto it = params.find("file_id");
        if (it == params.end() || it->second.empty())
            return HttpResponse::error(400, "missing file_id parameter");
        const std::string& file_id = it->second;
        if (!valid_file_id(file_id)) return HttpResponse::error(400, "invalid file_id format");

        auto rec = files_.get(file_id);
        if (!rec) return HttpResponse::error(404, "file not found");

        fs::path path(rec->path);
        if (!storage_.contains(path)) {
            hub_log(logger_, AsyncLogger::WARN, "Download outside storage root refused: " + rec->path);
            return HttpResponse::error(403, "access denied");
        }
        std::error_code ec;
        if (!fs::exists(path, ec)) return HttpResponse::error(404, "file missing on disk");

        std::string bytes, err;
        if (!storage_.read_file(path, bytes, err)) {
            // A concurrent download may have consumed it between the checks
            if (!files_.get(file_id)) return HttpResponse::error(404, "file not found");
            hub_log(logger_, AsyncLogger::ERROR_LOG, "Download read failed: " + err);
            return HttpResponse::error(500, "storage read failed");
        }

        if (!files_.erase(file_id)) return HttpResponse::error(404, "file not found");

        std::string safe_name = safe_filename(rec->file_name);
        fs::remove(path, ec);
        if (ec) {
            hub_log(logger_, AsyncLogger::WARN, "Cleanup of " + path.string() + " failed: " + ec.message());
        } else {
            hub_log(logger_, AsyncLogger::INFO, "File delivered and removed: " + safe_name + " (id=" + file_id + ")");
        }

        HttpResponse r;
        r.status = 200;
        r.content_type = "application/octet-stream";
        r.headers.emplace_back("Content-Disposition", "attachment; filename=\"" + safe_name + "\"");
        r.headers.emplace_back("X-File-SHA256", rec->sha256);
        r.body = std::move(bytes);
        return r;
    }

    // -------------------------------------------------------------------------
    // GET {base}/list
    // -------------------------------------------------------------------------
    HttpResponse list(const HttpRequest& req, const std::map<std::string, std::string>& params) {
        if (!check_auth(req, params)) return HttpResponse::error(401, "unauthorized");

        json files = json::array();
        for (const FileRecord& rec : files_.list()) {
            json entry;
            entry["file_id"]   = rec.file_id;
            entry["file_name"] = rec.file_name;
            entry["size"]      = rec.size;
            entry["sha256"]    = rec.sha256;
            files.push_back(std::move(entry));
        }
        return HttpResponse::json_reply(200, json{ { "files", files } });
    }

    const HubConfig& cfg_;
    StorageDir&      storage_;
    FileRegistry&    files_;
    AsyncLogger*     logger_;
};

#endif
