// main.cpp - Main entry point
#include <getopt.h>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include "conf/config.hpp"
#include "core/endpoints.hpp"
#include "core/observer.hpp"
#include "core/outage.hpp"
#include "core/reconciler.hpp"
#include "core/session.hpp"
#include "defs.hpp"
#include "mount/backend.hpp"
#include "net/probe.hpp"
#include "net/vpn.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace stablemount;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path log_file;
    bool verbose = false;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: stablemount [OPTIONS] [command] [args...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  reconcile          Run one reconciliation pass (default action)\n";
    std::cout << "  status             Show observed mounts and endpoint reachability\n";
    std::cout << "  config gen         Generate default config file\n";
    std::cout << "  config show        Show current configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -l, --log FILE          Also append log lines to FILE\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExit status is 0 when the share is in place (or another pass\n";
    std::cout << "is already running) and 1 when it could not be mounted.\n";
}

static std::string json_escape(const std::string& s) {
    std::ostringstream o;
    for (char c : s) {
        if (c == '"')
            o << "\\\"";
        else if (c == '\\')
            o << "\\\\";
        else if (c == '\n')
            o << "\\n";
        else if (c == '\t')
            o << "\\t";
        else if ((unsigned char)c < 0x20) {
            char buf[7];
            snprintf(buf, sizeof(buf), "\\u%04x", c);
            o << buf;
        } else
            o << c;
    }
    return o.str();
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"log", required_argument, 0, 'l'},
                                           {"output", required_argument, 0, 'o'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:l:o:vh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'l':
            opts.log_file = optarg;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    if (!opts.config_file.empty()) {
        return Config::from_file(opts.config_file);
    }
    return Config::load_default();
}

static void print_config(const Config& config) {
    std::cout << "{\n";
    std::cout << "  \"mount_point\": \"" << json_escape(config.mount_point.string()) << "\",\n";
    std::cout << "  \"share_name\": \"" << json_escape(config.share_name) << "\",\n";
    std::cout << "  \"local_host_1\": \"" << json_escape(config.local_host_1) << "\",\n";
    std::cout << "  \"local_host_2\": \"" << json_escape(config.local_host_2) << "\",\n";
    std::cout << "  \"vpn_peer\": \"" << json_escape(config.vpn_peer) << "\",\n";
    std::cout << "  \"vpn_fallback_ip\": \"" << json_escape(config.vpn_fallback_ip) << "\",\n";
    std::cout << "  \"port\": " << config.port << ",\n";
    std::cout << "  \"poll_attempts\": " << config.poll_attempts << ",\n";
    std::cout << "  \"poll_interval_ms\": " << config.poll_interval_ms << ",\n";
    std::cout << "  \"lock_file\": \"" << json_escape(config.lock_file.string()) << "\",\n";
    std::cout << "  \"lock_stale_seconds\": " << config.lock_stale_seconds << ",\n";
    std::cout << "  \"outage_marker\": \"" << json_escape(config.outage_marker.string()) << "\",\n";
    std::cout << "  \"mount_command\": \"" << json_escape(config.mount_command) << "\",\n";
    std::cout << "  \"unmount_command\": \"" << json_escape(config.unmount_command) << "\",\n";
    std::cout << "  \"session_restore\": "
              << (config.session_capture_command.empty() ? "false" : "true") << ",\n";
    std::cout << "  \"verbose\": " << (config.verbose ? "true" : "false") << "\n";
    std::cout << "}\n";
}

static void print_status(const Config& config) {
    CommandMountBackend backend(config);
    MountObserver observer(config, backend);
    TcpProber prober(config.port, config.probe_timeout_ms, PROBE_RETRY_EXTRA_MS);
    TailscaleStatus vpn(config.vpn_cli);

    ShareMountSet set = observer.observe();
    std::string state = "idle";
    if (!set.empty())
        state = set.contains(config.mount_point) ? "correct" : "misplaced";

    std::cout << "{\n";
    std::cout << "  \"mount_point\": \"" << json_escape(config.mount_point.string()) << "\",\n";
    std::cout << "  \"state\": \"" << state << "\",\n";
    std::cout << "  \"current_host\": \""
              << json_escape(observer.current_remote_host(config.mount_point)) << "\",\n";

    std::cout << "  \"mounts\": [";
    for (size_t i = 0; i < set.entries.size(); ++i) {
        if (i > 0)
            std::cout << ", ";
        std::cout << "{\"source\": \"" << json_escape(set.entries[i].source)
                  << "\", \"path\": \"" << json_escape(set.entries[i].path.string()) << "\"}";
    }
    std::cout << "],\n";

    std::vector<Endpoint> ranked = rank_endpoints(config, vpn);
    std::cout << "  \"endpoints\": [";
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (i > 0)
            std::cout << ", ";
        std::cout << "{\"label\": \"" << ranked[i].label << "\", \"host\": \""
                  << json_escape(ranked[i].probe_host) << "\", \"kind\": \""
                  << endpoint_kind_to_string(ranked[i].kind) << "\", \"reachable\": "
                  << (prober.reachable(ranked[i].probe_host) ? "true" : "false") << "}";
    }
    std::cout << "],\n";

    OutageNotifier outage(config.outage_marker);
    std::error_code ec;
    std::cout << "  \"outage_reported\": " << (outage.active() ? "true" : "false") << ",\n";
    std::cout << "  \"pass_running\": " << (fs::exists(config.lock_file, ec) ? "true" : "false")
              << "\n";
    std::cout << "}\n";
}

static int reconcile(const Config& config) {
    CommandMountBackend backend(config);
    TcpProber prober(config.port, config.probe_timeout_ms, PROBE_RETRY_EXTRA_MS);
    TailscaleStatus vpn(config.vpn_cli);

    CommandSessionChannel command_channel(config);
    NullSessionChannel null_channel;
    SessionChannel& channel = config.session_capture_command.empty()
                                  ? static_cast<SessionChannel&>(null_channel)
                                  : static_cast<SessionChannel&>(command_channel);

    Reconciler reconciler(config, backend, prober, vpn, channel);
    PassOutcome outcome = run_pass(config, reconciler);
    LOG_DEBUG("Pass finished: " + pass_outcome_to_string(outcome));
    return exit_code_for(outcome);
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        if (cli.command == "config") {
            if (cli.args.empty()) {
                std::cerr << "Usage: stablemount config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "gen") {
                std::string output = cli.output.empty() ? CONFIG_FILENAME : cli.output;
                if (!Config().save_to_file(output)) {
                    std::cerr << "Failed to write config: " << output << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output << "\n";
                return 0;
            } else if (subcmd == "show") {
                print_config(load_config(cli));
                return 0;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            std::cerr << "Available: gen, show\n";
            return 1;
        }

        Config config = load_config(cli);
        config.merge_with_cli(cli.log_file, cli.verbose);
        Logger::getInstance().init(config.verbose, config.log_file);

        if (cli.command.empty() || cli.command == "reconcile") {
            return reconcile(config);
        }
        if (cli.command == "status") {
            print_status(config);
            return 0;
        }

        std::cerr << "Unknown command: " << cli.command << "\n";
        print_help();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal: ") + e.what());
        return 1;
    }
}
