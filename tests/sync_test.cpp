#include <catch2/catch_all.hpp>
#include "codec.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "sync.hpp"
#include "test_support.hpp"

static SyncConfig make_cfg(const std::string& passphrase){
    SyncConfig c;
    c.token = "t";
    c.owner = "o";
    c.repo = "r";
    c.data_passphrase = passphrase;
    return c;
}

TEST_CASE("Sync: encrypted push to a new path creates without a version token", "[sync]") {
    TempDir dir;
    write_file(dir.file("tasks.json"), "hello");
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("secret");
    RemoteSynchronizer syncer(cfg, api);

    CHECK(syncer.push(dir.file("tasks.json"), "backups/tasks.json", "Backup tasks.json", "main") == PushOutcome::Pushed);

    // version lookup happens before the write
    REQUIRE(api.requests.size() == 2);
    CHECK(api.requests[0].method == "GET");
    CHECK(api.requests[1].method == "PUT");

    const auto& put = api.last_put();
    CHECK_FALSE(FakeContentsApi::body_field(put, "sha").has_value());
    auto content = FakeContentsApi::body_field(put, "content");
    REQUIRE(content.has_value());
    std::string envelope = base64_decode(*content);
    CHECK(envelope != "hello");
    CHECK(open_envelope(envelope, "secret") == "hello");
}

TEST_CASE("Sync: second push sends the current version token", "[sync]") {
    TempDir dir;
    write_file(dir.file("tasks.json"), "v1");
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("secret");
    RemoteSynchronizer syncer(cfg, api);

    syncer.push(dir.file("tasks.json"), "backups/tasks.json", "m", "main");
    const std::string sha1 = api.objects.at("backups/tasks.json").sha;

    write_file(dir.file("tasks.json"), "v2");
    syncer.push(dir.file("tasks.json"), "backups/tasks.json", "m", "main");

    CHECK(FakeContentsApi::body_field(api.last_put(), "sha") == std::optional<std::string>(sha1));
    CHECK(api.objects.at("backups/tasks.json").sha != sha1);
    CHECK(syncer.fetch_version("backups/tasks.json", "main") == api.objects.at("backups/tasks.json").sha);
}

TEST_CASE("Sync: plain push and pull round-trip replaces the local file", "[sync]") {
    TempDir dir;
    const std::string data = "[{\"id\":1,\"title\":\"write tests\"}]\n";
    write_file(dir.file("tasks.json"), data);
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("");
    RemoteSynchronizer syncer(cfg, api);

    syncer.push(dir.file("tasks.json"), "backups/tasks.json", "m", "main");
    CHECK(base64_decode(api.objects.at("backups/tasks.json").content) == data);

    write_file(dir.file("tasks.json"), "local edits that will be lost");
    syncer.pull("backups/tasks.json", dir.file("tasks.json"), "main");
    CHECK(read_file(dir.file("tasks.json")) == data);
}

TEST_CASE("Sync: encrypted pull decrypts a large wrapped payload", "[sync]") {
    TempDir dir;
    std::string data(5000, '\0');
    for (size_t i = 0; i < data.size(); i++) data[i] = (char)(i % 251);
    write_file(dir.file("tasks.json"), data);
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("secret");
    RemoteSynchronizer syncer(cfg, api);

    syncer.push(dir.file("tasks.json"), "backups/tasks.json", "m", "main");
    syncer.pull("backups/tasks.json", dir.file("restored.json"), "main");
    CHECK(read_file(dir.file("restored.json")) == data);
}

TEST_CASE("Sync: pulling a plain backup with a passphrase set fails and keeps the local file", "[sync]") {
    TempDir dir;
    FakeContentsApi api;
    SyncConfig plain = make_cfg("");
    SyncConfig sealed = make_cfg("secret");
    RemoteSynchronizer plain_sync(plain, api);
    RemoteSynchronizer sealed_sync(sealed, api);

    std::string payload;
    SECTION("short payload") { payload = "hello"; }
    SECTION("payload longer than an envelope header") { payload = std::string(200, 'x'); }

    write_file(dir.file("tasks.json"), payload);
    plain_sync.push(dir.file("tasks.json"), "backups/tasks.json", "m", "main");
    write_file(dir.file("tasks.json"), "current");

    bool rejected = false;
    try {
        sealed_sync.pull("backups/tasks.json", dir.file("tasks.json"), "main");
    } catch (const AuthenticationError&) {
        rejected = true;
    } catch (const FormatError&) {
        rejected = true;
    }
    CHECK(rejected);
    CHECK(read_file(dir.file("tasks.json")) == "current");
}

TEST_CASE("Sync: wrong data passphrase on pull is an authentication failure", "[sync]") {
    TempDir dir;
    write_file(dir.file("tasks.json"), "hello");
    FakeContentsApi api;
    SyncConfig a = make_cfg("secret");
    SyncConfig b = make_cfg("other");
    RemoteSynchronizer(a, api).push(dir.file("tasks.json"), "backups/tasks.json", "m", "main");
    RemoteSynchronizer sb(b, api);
    CHECK_THROWS_AS(sb.pull("backups/tasks.json", dir.file("out.json"), "main"), AuthenticationError);
    CHECK_FALSE(file_exists(dir.file("out.json")));
}

TEST_CASE("Sync: a response without inline content never touches the local file", "[sync]") {
    TempDir dir;
    write_file(dir.file("tasks.json"), "data");
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("");
    RemoteSynchronizer syncer(cfg, api);
    syncer.push(dir.file("tasks.json"), "backups/tasks.json", "m", "main");
    write_file(dir.file("tasks.json"), "current");

    SECTION("file over 1 MB") { api.oversized_files = true; }
    SECTION("symlink") { api.symlinks = true; }

    CHECK_THROWS_AS(syncer.pull("backups/tasks.json", dir.file("tasks.json"), "main"), FormatError);
    CHECK(read_file(dir.file("tasks.json")) == "current");

    auto lines = syncer.restore_all({{dir.file("tasks.json"), "backups/tasks.json", false}});
    REQUIRE(lines.size() == 1);
    CHECK_THAT(lines[0], Catch::Matchers::StartsWith("FAIL: tasks.json: no inline base64 content"));
    CHECK_THAT(lines[0], !Catch::Matchers::ContainsSubstring("encryption setting"));
    CHECK(read_file(dir.file("tasks.json")) == "current");
}

TEST_CASE("Sync: missing credentials fail before any request", "[sync]") {
    TempDir dir;
    write_file(dir.file("tasks.json"), "x");
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("");
    cfg.token.clear();
    RemoteSynchronizer syncer(cfg, api);

    CHECK_THROWS_AS(syncer.push(dir.file("tasks.json"), "p", "m", "main"), MissingCredential);
    CHECK_THROWS_AS(syncer.pull("p", dir.file("tasks.json"), "main"), MissingCredential);
    CHECK(api.requests.empty());
}

TEST_CASE("Sync: missing local files", "[sync]") {
    TempDir dir;
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("");
    RemoteSynchronizer syncer(cfg, api);

    CHECK_THROWS_AS(syncer.push(dir.file("tasks.json"), "p", "m", "main"), LocalFileMissing);
    CHECK(syncer.push(dir.file("tasks_export.csv"), "p", "m", "main", true) == PushOutcome::Skipped);
    CHECK(api.requests.empty());
}

TEST_CASE("Sync: remote failures carry status and body verbatim", "[sync]") {
    TempDir dir;
    write_file(dir.file("tasks.json"), "x");
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("");
    RemoteSynchronizer syncer(cfg, api);

    SECTION("rejected write") {
        api.forced_put_code = 403;
        api.forced_put_body = "{\"message\":\"Resource not accessible by integration\"}";
        try {
            syncer.push(dir.file("tasks.json"), "p", "m", "main");
            FAIL("expected RemoteRequestFailed");
        } catch (const RemoteRequestFailed& e) {
            CHECK(e.code() == 403);
            CHECK(e.body() == api.forced_put_body);
        }
    }
    SECTION("absent object on pull") {
        try {
            syncer.pull("missing.json", dir.file("tasks.json"), "main");
            FAIL("expected RemoteRequestFailed");
        } catch (const RemoteRequestFailed& e) {
            CHECK(e.code() == 404);
            CHECK(e.body() == "{\"message\":\"Not Found\"}");
        }
        CHECK(read_file(dir.file("tasks.json")) == "x");
    }
    SECTION("transport failure") {
        api.unavailable = true;
        CHECK_THROWS_AS(syncer.push(dir.file("tasks.json"), "p", "m", "main"), RemoteUnavailable);
    }
}

TEST_CASE("Sync: default mappings live under the backup prefix", "[sync]") {
    AppConfig app;
    auto files = default_file_mappings(app);
    REQUIRE(files.size() == 2);
    CHECK(files[0].local_path == "tasks.json");
    CHECK(files[0].remote_path == "backups/tasks.json");
    CHECK_FALSE(files[0].optional);
    CHECK(files[1].local_path == "tasks_export.csv");
    CHECK(files[1].remote_path == "backups/tasks_export.csv");
    CHECK(files[1].optional);
}

TEST_CASE("Sync: batch backup and restore report per file and never stop early", "[sync]") {
    TempDir dir;
    FakeContentsApi api;
    SyncConfig cfg = make_cfg("secret");
    RemoteSynchronizer syncer(cfg, api);

    AppConfig app;
    app.task_file = dir.file("tasks.json");
    app.export_file = dir.file("tasks_export.csv");
    auto files = default_file_mappings(app);

    SECTION("missing primary fails, missing export is skipped") {
        auto lines = syncer.backup_all(files);
        REQUIRE(lines.size() == 2);
        CHECK_THAT(lines[0], Catch::Matchers::StartsWith("FAIL: tasks.json"));
        CHECK(lines[1] == "SKIP: tasks_export.csv not found");
        CHECK_FALSE(all_succeeded(lines));
    }

    SECTION("both present") {
        write_file(app.task_file, "[]");
        write_file(app.export_file, "ID,Title\n");
        auto lines = syncer.backup_all(files);
        REQUIRE(lines.size() == 2);
        CHECK(lines[0] == "OK: pushed tasks.json -> backups/tasks.json");
        CHECK(lines[1] == "OK: pushed tasks_export.csv -> backups/tasks_export.csv");
        CHECK(all_succeeded(lines));
        CHECK(api.objects.size() == 2);

        write_file(app.task_file, "changed");
        std::filesystem::remove(app.export_file);
        auto restored = syncer.restore_all(files);
        CHECK(all_succeeded(restored));
        CHECK(read_file(app.task_file) == "[]");
        CHECK(read_file(app.export_file) == "ID,Title\n");
    }

    SECTION("one failing entry does not stop the next") {
        write_file(app.task_file, "[]");
        write_file(app.export_file, "ID,Title\n");
        api.forced_put_code = 500;
        api.forced_put_body = "boom";
        auto lines = syncer.backup_all(files);
        REQUIRE(lines.size() == 2);
        CHECK(lines[0] == "FAIL: tasks.json: HTTP 500: boom");
        CHECK(lines[1] == "FAIL: tasks_export.csv: HTTP 500: boom");
        CHECK(api.count("PUT") == 2);
    }

    SECTION("restore skips an export that was never backed up") {
        write_file(app.task_file, "[]");
        syncer.backup_all(files);
        auto lines = syncer.restore_all(files);
        REQUIRE(lines.size() == 2);
        CHECK_THAT(lines[0], Catch::Matchers::StartsWith("OK: restored tasks.json"));
        CHECK(lines[1] == "SKIP: tasks_export.csv not in backup");
        CHECK(all_succeeded(lines));
    }

    SECTION("restore with the wrong mode explains the likely cause") {
        write_file(app.task_file, "[]");
        SyncConfig plain = make_cfg("");
        RemoteSynchronizer(plain, api).push(app.task_file, files[0].remote_path, "m", "main");
        auto lines = syncer.restore_all({files[0]});
        REQUIRE(lines.size() == 1);
        CHECK_THAT(lines[0], Catch::Matchers::ContainsSubstring("different encryption setting"));
    }
}
