#include <cstdio>
#include <string>
#include <vector>
#include <stdexcept>
#include <curl/curl.h>
#include "config.hpp"
#include "errors.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "prompt.hpp"
#include "secret_store.hpp"
#include "sync.hpp"

static void usage(){
    fprintf(stderr,
        "usage: tosk [--config PATH] <command>\n"
        "  setup               create or unlock the secret store\n"
        "  backup              push the task list (and CSV export) to GitHub\n"
        "  restore             pull them back, replacing the local files\n"
        "  push LOCAL REMOTE   push one file\n"
        "  pull REMOTE LOCAL   pull one file\n");
}

static void print_lines(const std::vector<std::string>& lines){
    for (const auto& l: lines) printf("%s\n", l.c_str());
}

struct CurlGlobal {
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    }
    ~CurlGlobal() { curl_global_cleanup(); }
};

static int run(const std::string& cfgPath, const std::vector<std::string>& args){
    AppConfig app = load_app_config(cfgPath);
    set_log_level(app.log_level);

    const std::string& cmd = args[0];
    bool known = cmd=="setup" || cmd=="backup" || cmd=="restore";
    bool single = (cmd=="push" || cmd=="pull");
    if (!known && !single) { usage(); return 2; }
    if (single && args.size() != 3) { usage(); return 2; }
    if (!single && args.size() != 1) { usage(); return 2; }

    ConsolePrompter prompter;
    SecretStore store(app.store_file, prompter);
    SetupResult setup = store.open_or_setup();
    if (!setup.ok()) {
        fprintf(stderr, "tosk: %s\n", setup.message.c_str());
        return 1;
    }
    if (setup.persisted) printf("Secrets saved to %s\n", store.path().c_str());
    if (cmd=="setup") return 0;

    SyncConfig cfg = make_sync_config(setup.bundle, app);
    CurlGlobal curl;
    CurlTransport transport(cfg.timeout_seconds);
    RemoteSynchronizer syncer(cfg, transport);

    std::vector<std::string> lines;
    if (cmd=="backup") {
        lines = syncer.backup_all(default_file_mappings(app));
    } else if (cmd=="restore") {
        lines = syncer.restore_all(default_file_mappings(app));
    } else if (cmd=="push") {
        FileMapping one{args[1], args[2], false};
        lines = syncer.backup_all(std::vector<FileMapping>{one});
    } else {
        FileMapping one{args[2], args[1], false};
        lines = syncer.restore_all(std::vector<FileMapping>{one});
    }
    print_lines(lines);
    return all_succeeded(lines) ? 0 : 1;
}

int main(int argc, char** argv){
    std::string cfgPath = "tosk.json";
    std::vector<std::string> args;
    for (int i=1;i<argc;i++){
        std::string a = argv[i];
        if (a=="--config") {
            if (i+1 >= argc) { usage(); return 2; }
            cfgPath = argv[++i];
        } else if (a=="-h" || a=="--help") {
            usage(); return 0;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) { usage(); return 2; }

    try {
        return run(cfgPath, args);
    } catch (const std::exception& ex) {
        fprintf(stderr, "tosk: %s\n", ex.what());
        return 1;
    }
}
