#include "core/auth_context.h"
#include "core/endpoint_loader.h"
#include "core/http_client.h"
#include "core/prober.h"
#include "core/scheduler.h"
#include "config/run_config.h"
#include "logging/chain.h"
#include "report/console.h"
#include "report/run_reporter.h"
#include <iostream>
#include <memory>
#include <string>

static const char* kVersion = "1.0.0";

struct CliArgs {
    std::string file;
    long mode = 0;
    AuthCredentials creds;
    std::string config_path;
    std::string log_path;
    long concurrency = -1;
    long retries = -1;
    long timeout = -1;
    bool version = false;
    bool no_color = false;
    bool verbose = false;
};

static void print_banner() {
    std::cout << "authcheck v" << kVersion << "\n"
              << "Authentication Testing Tool\n";
}

static void print_usage() {
    std::cout <<
        "\nUSAGE:\n"
        "  authcheck [options] -f <file_with_endpoints> -mode <1-4>\n"
        "  authcheck verify <audit-log.jsonl>\n"
        "\nOPTIONS:\n"
        "  -f <file>            File containing endpoints (one per line)\n"
        "  -mode <number>       Operation mode (1-4):\n"
        "                         1: Cookies -> No Cookies\n"
        "                         2: Compare Two Cookies\n"
        "                         3: Bearer Token -> No Bearer Token\n"
        "                         4: Compare Two Bearer Tokens\n"
        "  -c1 <cookie>         First cookie header\n"
        "  -c2 <cookie>         Second cookie header (for mode 2)\n"
        "  -t1 <token>          First bearer token\n"
        "  -t2 <token>          Second bearer token (for mode 4)\n"
        "  --config <file>      Run configuration (JSON or YAML)\n"
        "  --concurrency <n>    Worker threads (0 = one per request pair)\n"
        "  --retries <n>        Retries for failed requests\n"
        "  --timeout <seconds>  Per-request timeout\n"
        "  --log <file>         Append a hash-chained audit log\n"
        "  --no-color           Disable ANSI colors\n"
        "  --verbose            Report failed probes and a run summary\n"
        "  -version             Show version information\n";
}

static bool parse_number(const std::string& flag, const std::string& value, long& out) {
    bool valid = false;
    try {
        size_t used = 0;
        out = std::stol(value, &used);
        valid = used == value.size() && out >= 0;
    } catch (const std::exception&) {
        valid = false;
    }
    if (!valid) {
        std::cerr << "Error: invalid value for " << flag << ": " << value << "\n";
    }
    return valid;
}

/**
 * @brief Parse command line flags; accepts both -flag and --flag spellings
 * @return false on an unknown flag or a malformed value
 */
static bool parse_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) a.erase(0, 1);

        if (a == "-version") { args.version = true; continue; }
        if (a == "-no-color") { args.no_color = true; continue; }
        if (a == "-verbose") { args.verbose = true; continue; }

        if (i + 1 >= argc) {
            std::cerr << "Error: unknown or incomplete argument: " << argv[i] << "\n";
            return false;
        }
        std::string v = argv[++i];

        if (a == "-f") args.file = v;
        else if (a == "-c1") args.creds.cookie1 = v;
        else if (a == "-c2") args.creds.cookie2 = v;
        else if (a == "-t1") args.creds.token1 = v;
        else if (a == "-t2") args.creds.token2 = v;
        else if (a == "-config") args.config_path = v;
        else if (a == "-log") args.log_path = v;
        else if (a == "-mode") {
            if (!parse_number(a, v, args.mode)) return false;
        } else if (a == "-concurrency") {
            if (!parse_number(a, v, args.concurrency)) return false;
        } else if (a == "-retries") {
            if (!parse_number(a, v, args.retries)) return false;
        } else if (a == "-timeout") {
            if (!parse_number(a, v, args.timeout)) return false;
        } else {
            std::cerr << "Error: unknown argument: " << argv[i - 1] << "\n";
            return false;
        }
    }
    return true;
}

/**
 * @brief Build the run configuration from the config file and CLI overrides
 * @return false if the resulting configuration is invalid
 */
static bool build_config(const CliArgs& args, config::RunConfig& cfg) {
    if (!args.config_path.empty()) {
        bool ok = false;
        cfg = config::RunConfig::load(args.config_path, ok);
        if (!ok) {
            std::cerr << "Warning: Could not open config file " << args.config_path << ", using defaults\n";
        }
    }

    if (args.concurrency >= 0) cfg.scheduler.concurrency = static_cast<size_t>(args.concurrency);
    if (args.retries >= 0) cfg.retry.retries = static_cast<int>(args.retries);
    if (args.timeout >= 0) cfg.http.timeout_seconds = args.timeout;
    if (args.no_color) cfg.color = false;

    std::string problem = cfg.validate();
    if (!problem.empty()) {
        std::cerr << "Error: invalid configuration: " << problem << "\n";
        return false;
    }
    return true;
}

/**
 * @brief Compare every endpoint of the input file under both contexts
 * @return 0 on completion, 1 if the input cannot be read, 2 on usage errors
 */
static int run_check(const CliArgs& args) {
    AuthMode mode;
    if (!parse_auth_mode(args.mode, mode)) {
        std::cerr << "Error: Invalid mode. Must be 1-4\n";
        return 2;
    }
    std::string cred_error = validate_credentials(mode, args.creds);
    if (!cred_error.empty()) {
        std::cerr << cred_error << "\n";
        return 2;
    }

    config::RunConfig cfg;
    if (!build_config(args, cfg)) {
        return 2;
    }

    EndpointLoader loader(args.file);
    if (!loader.load()) {
        std::cerr << "Error opening file: " << args.file << "\n";
        return 1;
    }
    const auto& endpoints = loader.endpoints();
    auto contexts = make_auth_contexts(mode, args.creds);

    HttpClient client(cfg.http);
    HttpProber http_prober(client);
    RetryingProber prober(http_prober, cfg.retry);
    FanoutScheduler scheduler(prober, cfg.scheduler);

    std::unique_ptr<logging::AuditChain> audit;
    if (!args.log_path.empty()) {
        audit = std::make_unique<logging::AuditChain>(args.log_path, logging::AuditChain::make_run_id());
        if (!audit->is_open()) {
            std::cerr << "Warning: Could not open audit log " << args.log_path << "\n";
            audit.reset();
        } else {
            nlohmann::json start;
            start["mode"] = args.mode;
            start["endpoints"] = endpoints.size();
            start["context_a"] = contexts.first.label;
            start["context_b"] = contexts.second.label;
            start["concurrency"] = cfg.scheduler.concurrency;
            start["retries"] = cfg.retry.retries;
            audit->append("run_start", start);
        }
    }

    report::Console console(std::cout, std::cerr, cfg.color);
    report::RunReporter::Options ropts;
    ropts.verbose = args.verbose;
    report::RunReporter reporter(console, audit.get(), ropts);

    scheduler.run(endpoints, contexts.first, contexts.second, reporter);
    reporter.finish();

    if (audit) {
        const auto& s = reporter.summary();
        nlohmann::json done;
        done["completed"] = s.completed;
        done["skipped"] = s.skipped;
        done["inconclusive"] = s.inconclusive;
        done["findings"] = s.findings;
        audit->append("run_complete", done);
    }
    return 0;
}

/**
 * @brief Verify the hash chain of an audit log
 * @return 0 if intact, 1 if tampered, 2 on usage errors
 */
static int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: authcheck verify <audit-log.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying log: " << log_path << "\n";

    auto result = logging::AuditChain::verify(log_path);
    if (result.intact) {
        std::cout << "Log verified: " << result.entries << " entries, chain intact\n";
        return 0;
    }
    std::cerr << "Verification failed at entry " << result.failed_index << ": " << result.reason << "\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "verify") {
        return cmd_verify(argc, argv);
    }

    CliArgs args;
    if (!parse_args(argc, argv, args)) {
        print_usage();
        return 2;
    }

    if (args.version) {
        print_banner();
        return 0;
    }

    if (args.file.empty() || args.mode == 0) {
        print_banner();
        print_usage();
        return 0;
    }

    try {
        return run_check(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
