// ============================================================
// client/main.cpp -- hbload entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "loader_app.hpp"
#include "prompter.hpp"
#include "zip_packager.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options] <path> [args...]\n"
        << "\n"
        << "  path            .dol/.elf executable, .zip archive, or an application\n"
        << "                  directory (zipped before sending)\n"
        << "  args            forwarded to the application when it starts\n"
        << "\nOptions (before <path>):\n"
        << "  -e, --endpoint tcp:ADDR  receiver address (default: $WIILOAD)\n"
        << "  -p, --port N             receiver port (default: 4299)\n"
        << "  -y, --yes                zip directories without asking\n"
        << "  -v, --verbose            enable debug logging\n"
        << "  -q, --quiet              warnings and errors only, no progress bar\n"
        << "      --log-file PATH      also append log lines to PATH\n"
        << "  -h, --help               show this help\n"
        << "\nExamples:\n"
        << "  " << prog << " /path/to/boot.dol\n"
        << "  " << prog << " /path/to/boot.elf --some-arg\n"
        << "  " << prog << " /path/to/appname.zip\n"
        << "  " << prog << " -e tcp:192.168.1.106 /path/to/appname/\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;
    platform::ignore_sigpipe();

    LoaderOptions opts;
    bool verbose = false;
    bool quiet   = false;
    std::string log_file;

    int i = 1;
    for (; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--") == 0) {
            ++i;
            break;
        }
        if (a[0] != '-' || a[1] == '\0') break;   // first positional

        if ((std::strcmp(a, "-e") == 0 || std::strcmp(a, "--endpoint") == 0) && i + 1 < argc) {
            opts.endpoint.cli_value = argv[++i];
        } else if ((std::strcmp(a, "-p") == 0 || std::strcmp(a, "--port") == 0) && i + 1 < argc) {
            int port = std::atoi(argv[++i]);
            if (port < 1 || port > 65535) {
                std::cerr << "ERROR: Invalid port: " << argv[i] << "\n";
                return exit_code_of(ExitCode::USAGE);
            }
            opts.port = (u16)port;
        } else if (std::strcmp(a, "-y") == 0 || std::strcmp(a, "--yes") == 0) {
            opts.assume_yes = true;
        } else if (std::strcmp(a, "-v") == 0 || std::strcmp(a, "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(a, "-q") == 0 || std::strcmp(a, "--quiet") == 0) {
            quiet = true;
        } else if (std::strcmp(a, "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
            print_usage(argv[0]);
            return exit_code_of(ExitCode::OK);
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return exit_code_of(ExitCode::USAGE);
        }
    }

    if (i >= argc) {
        print_usage(argv[0]);
        return exit_code_of(ExitCode::USAGE);
    }
    opts.payload_path = argv[i++];
    for (; i < argc; ++i) {
        opts.launch_args.push_back(argv[i]);
    }

    if (verbose) {
        Logger::get().set_level(LogLevel::DEBUG);
    } else if (quiet) {
        Logger::get().set_level(LogLevel::WARN);
    }
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        LOG_WARN("Cannot open log file " + log_file);
    }

    if (const char* env = std::getenv("WIILOAD")) {
        opts.endpoint.env_value = env;
        opts.endpoint.env_set   = true;
    }
    opts.show_progress = !quiet;
    opts.ansi_progress = platform::stdout_is_tty();

    try {
        ConsolePrompter prompter(std::cin, std::cout, platform::stdin_is_tty());
        ZipPackager packager;
        LoaderApp app(opts, prompter, packager, std::cout);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return exit_code_of(ExitCode::FATAL);
    }
}
