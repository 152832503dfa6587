#include "readeof/tail.hpp"
#include <chrono>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <time.h>

namespace {

void usage() {
    std::cerr << "Usage: readeof_tail [-f] [-n lines] [-s poll_ms] [-t idle_ms] [-b bytes] [-e encoding] <path>\n"
              << "  -f           keep printing appended lines until SIGINT/SIGTERM\n"
              << "  -n lines     number of trailing lines (default 10)\n"
              << "  -s poll_ms   follow poll interval (default 1000)\n"
              << "  -t idle_ms   stop following after idle_ms without new data (default 0 = never)\n"
              << "  -b bytes     read chunk size (default 16384)\n"
              << "  -e encoding  utf8, ascii, latin1, utf16le, hex, base64 (default utf8)\n";
}

struct Args {
    std::string path;
    long long   lines  = 10;
    bool        follow = false;
    reof::TailOptions opt;
};

bool parse_args(int argc, char** argv, Args& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        try {
            if (a == "-f") {
                out.follow = true;
            } else if (a == "-n") {
                const char* v = value("-n"); if (!v) return false;
                out.lines = std::stoll(v);
            } else if (a == "-s") {
                const char* v = value("-s"); if (!v) return false;
                out.opt.poll_interval = std::chrono::milliseconds(std::stoll(v));
            } else if (a == "-t") {
                const char* v = value("-t"); if (!v) return false;
                out.opt.inactivity_timeout = std::chrono::milliseconds(std::stoll(v));
            } else if (a == "-b") {
                const char* v = value("-b"); if (!v) return false;
                out.opt.buffer_size = static_cast<std::size_t>(std::stoull(v));
            } else if (a == "-e") {
                const char* v = value("-e"); if (!v) return false;
                out.opt.encoding = reof::parse_encoding(v);
            } else if (a == "--") {
                if (i + 1 < argc) out.path = argv[++i];
            } else if (!a.empty() && a[0] == '-') {
                std::cerr << "unknown option: " << a << "\n";
                return false;
            } else {
                out.path = a;
            }
        } catch (const std::logic_error& e) {
            // std::stoll / std::stoull
            std::cerr << "invalid number for " << a << ": " << e.what() << "\n";
            return false;
        } catch (const reof::TailError& e) {
            std::cerr << e.what() << "\n";
            return false;
        }
    }
    return !out.path.empty();
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        usage();
        return 1;
    }

    if (!args.follow) {
        try {
            std::cout << reof::read_last(args.path, args.lines, args.opt) << std::flush;
        } catch (const reof::TailError& e) {
            std::cerr << "readeof_tail: " << e.what() << "\n";
            return 2;
        }
        return 0;
    }

    // SIGINT/SIGTERM are taken synchronously by a watcher thread and turned into a stop request
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    std::stop_source stop;
    std::jthread watcher([&](std::stop_token self) {
        timespec tick{0, 200'000'000};
        while (!self.stop_requested()) {
            if (sigtimedwait(&set, nullptr, &tick) > 0) {
                stop.request_stop();
                return;
            }
        }
    });

    std::size_t n_lines = 0;
    auto t_start = std::chrono::steady_clock::now();
    try {
        reof::tail_lines(args.path, args.lines, args.opt, stop.get_token(),
                         [&](const std::string& line) {
                             ++n_lines;
                             std::cout << line << '\n' << std::flush;
                         });
    } catch (const reof::TailError& e) {
        std::cerr << "readeof_tail: " << e.what() << "\n";
        return 2;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t_start);
    std::cerr << "readeof_tail: stopped after " << n_lines << " lines, "
              << elapsed.count() << " ms\n";
    return 0;
}
