#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "vaudio/virtual_audio_installer.hpp"

#include <cstdio>
#include <getopt.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace {

constexpr const char* kDefaultCorrelationId = "vaudio-cli";

enum class Command {
    None,
    Validate,
    Install,
    State,
};

void PrintUsage(const char* argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-p <provider>] [-i <correlation-id>] (--validate|--install|--state) [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config           JSON configuration file\n"
        "  -p, --provider         vb-cable or blackhole (default: the platform's provider)\n"
        "  -i, --correlation-id   Identifier echoed in the install result\n"
        "      --validate         Check the bundled installer without running it\n"
        "      --install          Install the virtual audio driver\n"
        "      --state            Print the installer runtime state\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv);
}

void PrintJson(const nlohmann::json& j) {
    std::printf("%s\n", j.dump(2).c_str());
    std::fflush(stdout);
}

bool SetCommand(Command& cmd, Command next) {
    if (cmd != Command::None && cmd != next) {
        std::fprintf(stderr, "Only one of --validate, --install, --state may be given\n");
        return false;
    }
    cmd = next;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    std::optional<vaudio::Provider> provider;
    std::string correlation_id = kDefaultCorrelationId;
    Command cmd = Command::None;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"provider", required_argument, nullptr, 'p'},
        {"correlation-id", required_argument, nullptr, 'i'},
        {"validate", no_argument, nullptr, 'V'},
        {"install", no_argument, nullptr, 'I'},
        {"state", no_argument, nullptr, 'S'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:p:i:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'p':
                provider = vaudio::ParseProvider(optarg);
                if (!provider) {
                    std::fprintf(stderr, "Unknown provider: %s\n", optarg);
                    return 2;
                }
                break;

            case 'i':
                correlation_id = optarg;
                break;

            case 'V':
                if (!SetCommand(cmd, Command::Validate)) return 2;
                break;

            case 'I':
                if (!SetCommand(cmd, Command::Install)) return 2;
                break;

            case 'S':
                if (!SetCommand(cmd, Command::State)) return 2;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (cmd == Command::None || optind != argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    vaudio::InstallerOptions opt;
    opt.roots = vaudio::BundleRoots::FromEnvironment();

    if (config_path) {
        vaudio::config::InstallerConfigFromFile cfg;
        if (auto r = cfg.LoadFile(*config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        if (cfg.resources_root) opt.roots.resources_root = *cfg.resources_root;
        if (cfg.app_root) opt.roots.app_root = *cfg.app_root;
        if (cfg.working_dir) opt.roots.working_dir = *cfg.working_dir;
        if (cfg.default_timeout_ms) opt.default_timeout_ms = *cfg.default_timeout_ms;
        if (cfg.log_level) vaudio::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (verbose) {
        vaudio::Logger::Instance().SetLevel(vaudio::LogLevel::Debug);
    }

    if (auto r = vaudio::ConfigureDefaultInstaller(std::move(opt)); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    switch (cmd) {
        case Command::Validate: {
            const auto v = vaudio::ValidateBundledVirtualAudioAssets(provider);
            PrintJson({{"ok", v.ok}, {"message", v.message}});
            return v.ok ? 0 : 1;
        }

        case Command::State:
            PrintJson(vaudio::ToJson(vaudio::GetVirtualAudioInstallerState()));
            return 0;

        case Command::Install: {
            if (!provider) provider = vaudio::GetPreferredProvider();
            if (!provider) {
                PrintJson({{"ok", false},
                           {"message", "No virtual audio installer is supported on this platform."}});
                return 1;
            }
            const auto result = vaudio::InstallVirtualAudioDriver(*provider, correlation_id).get();
            PrintJson(vaudio::ToJson(result));
            return result.Succeeded() ? 0 : 1;
        }

        case Command::None:
            break;
    }
    return 2;
}
