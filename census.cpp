// census.cpp - Directory census browser main program

#include "census_core.h"
#include "census_engine.h"
#include "census_ui.h"

#include <clocale>
#include <iostream>
#include <string>
#include <vector>

#ifndef CENSUS_VERSION
#define CENSUS_VERSION "dev"
#endif
#ifndef BUILD_DATE
#define BUILD_DATE "unknown"
#endif
#ifndef GIT_HASH
#define GIT_HASH "unknown"
#endif

// Function declarations
void print_usage(const char* program_name);
void print_version();

void print_usage(const char* program_name) {
    std::cout << "dircensus " << CENSUS_VERSION << " - Directory file census browser\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] [PATH]\n\n";
    std::cout << "Browse directories with a recursive file count next to every folder.\n";
    std::cout << "Counts are computed in the background while you navigate.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -j, --threads N         Number of counting threads, 0-256 (default: auto)\n";
    std::cout << "  --tick MS               Input wait per loop iteration in ms (default: "
              << DEFAULT_POLL_INTERVAL_MS << ")\n";
    std::cout << "  --log FILE              Write diagnostics to FILE instead of stderr\n";
    std::cout << "  --no-colors             Disable colored output\n";
    std::cout << "  --no-mouse              Disable mouse support\n\n";
    std::cout << "Keys: q quit, Up/Down/k/j move, Enter open, h home.\n";
    std::cout << "If no path is provided, the current directory is used.\n";
}

void print_version() {
    std::cout << "dircensus " << CENSUS_VERSION << "\n";
    std::cout << "Build date: " << BUILD_DATE << "\n";
    std::cout << "Git hash: " << GIT_HASH << "\n";
}

int main(int argc, char* argv[]) {
    std::setlocale(LC_ALL, "");

    Config config;
    std::vector<std::string> args(argv + 1, argv + argc);
    std::vector<std::string> paths;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-j" || arg == "--threads" || arg == "--tick") {
            if (i + 1 >= args.size()) {
                log_error("Missing value for " + arg);
                return 1;
            }
            long value = 0;
            const bool is_tick = arg == "--tick";
            if (!parse_number(arg, args[++i], is_tick ? 1 : 0,
                              is_tick ? MAX_POLL_INTERVAL_MS : static_cast<long>(MAX_THREAD_COUNT), value)) {
                return 1;
            }
            if (is_tick) {
                config.poll_interval_ms = static_cast<int>(value);
            } else {
                config.thread_count = static_cast<size_t>(value);
            }
        } else if (arg == "--log") {
            if (i + 1 >= args.size()) {
                log_error("Missing value for " + arg);
                return 1;
            }
            config.log_path = args[++i];
        } else if (arg == "--no-colors") {
            config.no_colors = true;
        } else if (arg == "--no-mouse") {
            config.no_mouse = true;
        } else if (!arg.empty() && arg[0] != '-') {
            paths.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
            return 1;
        }
    }

    if (paths.size() > 1) {
        log_error("Only one starting directory may be given");
        return 1;
    }

    if (paths.empty()) {
        std::error_code ec;
        config.start_dir = fs::current_path(ec);
        if (ec) {
            log_error("Cannot determine the current directory: " + ec.message());
            return 1;
        }
    } else {
        config.start_dir = paths[0];
    }

    std::error_code ec;
    if (!fs::is_directory(config.start_dir, ec)) {
        log_error("Not a directory: " + config.start_dir.string());
        return 1;
    }

    if (!config.log_path.empty() && !open_log_file(config.log_path)) {
        log_warning("Cannot open log file " + config.log_path.string() + "; using stderr");
    }

    {
        NavigationEngine engine(config.start_dir, config.thread_count);
        InteractiveUI ui(engine, config);
        ui.run();
    }

    close_log_file();
    return 0;
}
