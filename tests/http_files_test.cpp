#include "http_files.h"
#include "test_support.h"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using testing_support::ManualClock;
using testing_support::make_temp_dir;

namespace {

const std::string kToken = "http-token";

struct Fixture {
    std::filesystem::path dir = make_temp_dir("http");
    HubConfig    cfg;
    ManualClock  clock;
    StorageDir   storage;
    FileRegistry files;
    HttpFileService service;

    Fixture()
        : cfg(make_cfg(dir)),
          storage(cfg.upload_dir),
          files(cfg.registry_capacity, cfg.registry_ttl_s, &clock, nullptr),
          service(cfg, storage, files, nullptr)
    {
        std::string err;
        bool ok = storage.ensure(err);
        assert(ok);
        (void)ok;
    }
    ~Fixture() { std::filesystem::remove_all(dir); }

    static HubConfig make_cfg(const std::filesystem::path& dir) {
        HubConfig c;
        c.token = kToken;
        c.upload_dir = (dir / "files").string();
        c.upload_max_mb = 1;
        c.allowed_extensions = { "vpk", "zip" };
        return c;
    }

    size_t files_on_disk() const {
        size_t n = 0;
        for (const auto& e : std::filesystem::directory_iterator(storage.root())) { (void)e; n++; }
        return n;
    }
};

HttpRequest request(const std::string& method, const std::string& target, bool auth = true) {
    HttpRequest r;
    r.method = method;
    r.target = target;
    if (auth) r.headers["authorization"] = "Bearer " + kToken;
    return r;
}

HttpRequest raw_upload(const std::string& name, const std::string& body) {
    HttpRequest r = request("POST", "/v1/files/upload");
    r.headers["x-file-name"] = name;
    r.body = body;
    return r;
}

std::string header_value(const HttpResponse& r, const std::string& name) {
    for (const auto& h : r.headers) if (h.first == name) return h.second;
    return "";
}

void test_parsing_helpers() {
    assert(url_decode("a%20b+c%2Fd") == "a b c/d");
    assert(url_decode("bad%zz") == "bad%zz");

    std::string path, query;
    split_target("/v1/files/download?file_id=ab&token=t%21", path, query);
    assert(path == "/v1/files/download");
    auto q = parse_query(query);
    assert(q["file_id"] == "ab" && q["token"] == "t!");
    split_target("/plain", path, query);
    assert(path == "/plain" && query.empty());

    assert(valid_file_id("0123456789abcdef"));
    assert(!valid_file_id(""));
    assert(!valid_file_id("ABC"));
    assert(!valid_file_id("../etc"));
    assert(!valid_file_id(std::string(33, 'a')));
}

void test_auth() {
    Fixture fx;
    assert(fx.service.handle(request("GET", "/v1/files/list", false)).status == 401);

    HttpRequest wrong = request("GET", "/v1/files/list", false);
    wrong.headers["authorization"] = "Bearer nope";
    assert(fx.service.handle(wrong).status == 401);

    HttpRequest basic = request("GET", "/v1/files/list", false);
    basic.headers["authorization"] = "Basic " + kToken;
    assert(fx.service.handle(basic).status == 401);

    assert(fx.service.handle(request("GET", "/v1/files/list?token=" + kToken, false)).status == 200);
    assert(fx.service.handle(request("GET", "/v1/files/list?token=", false)).status == 401);
}

void test_routing() {
    Fixture fx;
    HttpResponse r = fx.service.handle(request("GET", "/v1/files/nothing"));
    assert(r.status == 404);
    assert(json::parse(r.body)["error"] == "not found");
    assert(fx.service.handle(request("GET", "/v1/files/upload")).status == 405);
    assert(fx.service.handle(request("POST", "/v1/files/download")).status == 405);
    assert(fx.service.handle(request("DELETE", "/v1/files/list")).status == 405);
}

void test_raw_upload_then_one_shot_download() {
    Fixture fx;
    std::string body = "VPK\x01 content bytes";
    HttpResponse up = fx.service.handle(raw_upload("../../Maps/Custom.VPK", body));
    assert(up.status == 200);
    json meta = json::parse(up.body);
    std::string id = meta["file_id"];
    assert(id.size() == 16);
    assert(meta["file_name"] == "Custom.VPK");
    assert(meta["size"] == body.size());
    assert(meta["sha256"] == sha256_hex(body));
    assert(!meta.contains("path"));
    assert(fx.files.get(id));

    HttpResponse list = fx.service.handle(request("GET", "/v1/files/list"));
    json files = json::parse(list.body)["files"];
    assert(files.size() == 1 && files[0]["file_id"] == id);

    HttpResponse down = fx.service.handle(request("GET", "/v1/files/download?file_id=" + id));
    assert(down.status == 200);
    assert(down.body == body);
    assert(down.content_type == "application/octet-stream");
    assert(header_value(down, "Content-Disposition") == "attachment; filename=\"Custom.VPK\"");
    assert(header_value(down, "X-File-SHA256") == sha256_hex(body));
    assert(!fx.files.get(id));
    assert(fx.files_on_disk() == 0);

    assert(fx.service.handle(request("GET", "/v1/files/download?file_id=" + id)).status == 404);
}

void test_multipart_upload() {
    Fixture fx;
    std::string body =
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"note\"\r\n\r\n"
        "hello\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"pack.zip\"\r\n"
        "Content-Type: application/zip\r\n\r\n"
        "PK\x03\x04zipdata\r\n"
        "--XyZ--\r\n";
    HttpRequest r = request("POST", "/v1/files/upload");
    r.headers["content-type"] = "multipart/form-data; boundary=\"XyZ\"";
    r.body = body;

    HttpResponse up = fx.service.handle(r);
    assert(up.status == 200);
    json meta = json::parse(up.body);
    assert(meta["file_name"] == "pack.zip");
    assert(meta["size"] == 11);

    HttpRequest broken = request("POST", "/v1/files/upload");
    broken.headers["content-type"] = "multipart/form-data; boundary=QQQ";
    broken.body = "no parts here";
    assert(fx.service.handle(broken).status == 400);

    broken.headers["content-type"] = "multipart/form-data";
    assert(fx.service.handle(broken).status == 400);
}

void test_upload_rejections() {
    Fixture fx;

    HttpResponse denied = fx.service.handle(raw_upload("script.sh", "#!/bin/sh"));
    assert(denied.status == 403);
    json j = json::parse(denied.body);
    assert(j["allowed"].size() == 2);
    assert(fx.files_on_disk() == 0);
    assert(fx.files.size() == 0);

    assert(fx.service.handle(raw_upload("noext", "abc")).status == 403);
    assert(fx.service.handle(raw_upload("x.vpk", "")).status == 400);

    HttpRequest unnamed = request("POST", "/v1/files/upload");
    unnamed.body = "abc";
    assert(fx.service.handle(unnamed).status == 403);        // "unnamed" has no extension

    std::string big(1024 * 1024 + 1, 'x');
    assert(fx.service.handle(raw_upload("big.vpk", big)).status == 413);
    assert(fx.files_on_disk() == 0);

    HttpRequest cut = raw_upload("big.vpk", "");
    cut.body_too_large = true;
    assert(fx.service.handle(cut).status == 413);
}

void test_download_validation() {
    Fixture fx;
    assert(fx.service.handle(request("GET", "/v1/files/download")).status == 400);
    assert(fx.service.handle(request("GET", "/v1/files/download?file_id=")).status == 400);
    assert(fx.service.handle(request("GET", "/v1/files/download?file_id=../x")).status == 400);
    assert(fx.service.handle(request("GET", "/v1/files/download?file_id=abcdef")).status == 404);

    // Registry entry pointing outside the managed directory
    fx.files.register_file(FileRecord("0bad", "passwd", 1, "h", "/etc/passwd"));
    assert(fx.service.handle(request("GET", "/v1/files/download?file_id=0bad")).status == 403);

    // Entry whose file vanished from disk
    fx.files.register_file(FileRecord("0cafe", "gone.vpk", 1, "h", fx.storage.path_for("gone.vpk").string()));
    HttpResponse gone = fx.service.handle(request("GET", "/v1/files/download?file_id=0cafe"));
    assert(gone.status == 404);
    assert(json::parse(gone.body)["error"] == "file missing on disk");
}

void test_concurrent_downloads_yield_one_winner() {
    Fixture fx;
    HttpResponse up = fx.service.handle(raw_upload("race.vpk", std::string(4096, 'r')));
    std::string id = json::parse(up.body)["file_id"];

    std::atomic<int> ok{ 0 }, missing{ 0 };
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            int status = fx.service.handle(request("GET", "/v1/files/download?file_id=" + id)).status;
            if (status == 200) ok++;
            else if (status == 404) missing++;
        });
    }
    for (auto& t : threads) t.join();
    assert(ok == 1);
    assert(missing == 7);
}

}  // namespace

int main() {
    test_parsing_helpers();
    test_auth();
    test_routing();
    test_raw_upload_then_one_shot_download();
    test_multipart_upload();
    test_upload_rejections();
    test_download_validation();
    test_concurrent_downloads_yield_one_winner();
    return 0;
}
