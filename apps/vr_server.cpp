// SPDX-License-Identifier: Apache-2.0
// Part of Vrushie (VR) project.
// apps/vr_server.cpp

#include "vr/server.hpp"
#include "vr/server_config.hpp"
#include "vr/errors.hpp"
#include "vr/log.hpp"

#include <iostream>
#include <string>
#include <thread>
#include <csignal>
#include <pthread.h>  // pthread_sigmask, pthread_kill
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

static const char* kVersion = "1.0.2";

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Vrushie Server " << kVersion << "\n\n"
      "A simple file server that serves a file once or to a limited number of clients.\n\n"
      "Usage:\n  " << argv0 << " [options] <file>\n\n"
      "Examples:\n"
      "  " << argv0 << " document.pdf                     # serve once to first downloader\n"
      "  " << argv0 << " -n 3 photo.jpg                   # serve to first 3 unique IPs\n"
      "  " << argv0 << " -port 8080 video.mp4             # serve on a specific port\n"
      "  " << argv0 << " -ips \"192.168.1.10,192.168.1.20\" file.zip\n\n"
      "Options:\n"
      "  -port <n>          port to listen on (0 = random available port)\n"
      "  -n <n>             downloads allowed (1 = serve once, >1 = first N unique IPs)\n"
      "  -ips <a,b,...>     only these IPs may download (-n downloads in total, 0 = no limit)\n"
      "  --grace_sec <n>    seconds in-flight transfers get on shutdown (default 10)\n"
      "  --send_timeout_sec <n>  seconds a stalled download may block one write (default 60)\n"
      "  --log_file <path>  append log lines to a file\n"
      "  --quiet 0|1        suppress all console output when 1\n"
      "  -h, --help         show this help\n"
      "  -v, --version      show version\n";
}

// Blocks SIGINT/SIGTERM in every thread and turns them into a manual stop.
class SignalWatcher {
public:
    SignalWatcher() {
        sigemptyset(&_set);
        sigaddset(&_set, SIGINT);
        sigaddset(&_set, SIGTERM);
        sigaddset(&_set, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &_set, nullptr);
    }

    void watch(vr::Server& srv) {
        _thread = std::thread([this, &srv]() {
            int sig = 0;
            if (sigwait(&_set, &sig) == 0 && sig != SIGUSR1) {
                vr::log_line("[INFO] Caught signal " + std::to_string(sig));
                srv.stop();
            }
        });
    }

    ~SignalWatcher() {
        if (_thread.joinable()) {
            pthread_kill(_thread.native_handle(), SIGUSR1);
            _thread.join();
        }
    }

private:
    sigset_t _set;
    std::thread _thread;
};

static bool parse_int(const char* s, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(s, &used);
        return used == std::string(s).size();
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char** argv) {
    vr::ServerConfig cfg;
    int n = 1;
    int port = 0;
    std::string ips;
    std::string file;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help" || a == "-help") { usage(argv[0]); return 0; }
        else if (a == "-v" || a == "--version" || a == "-version") {
            std::cout << "Vrushie Server v" << kVersion << "\n";
            return 0;
        }
        else if ((a == "-port" || a == "--port") && i+1 < argc) {
            if (!parse_int(argv[++i], port) || port < 0 || port > 65535) { usage(argv[0]); return 2; }
        }
        else if ((a == "-n" || a == "--n") && i+1 < argc) {
            if (!parse_int(argv[++i], n)) { usage(argv[0]); return 2; }
        }
        else if ((a == "-ips" || a == "--ips") && i+1 < argc) ips = argv[++i];
        else if ((a == "--file" || a == "-file") && i+1 < argc) file = argv[++i];
        else if (a == "--grace_sec" && i+1 < argc) {
            if (!parse_int(argv[++i], cfg.grace_sec)) { usage(argv[0]); return 2; }
        }
        else if (a == "--send_timeout_sec" && i+1 < argc) {
            if (!parse_int(argv[++i], cfg.send_timeout_sec)) { usage(argv[0]); return 2; }
        }
        else if (a == "--log_file" && i+1 < argc) cfg.log_file = argv[++i];
        else if (a == "--quiet" && i+1 < argc) cfg.quiet = (std::string(argv[++i]) != "0");
        else if (!a.empty() && a[0] != '-' && file.empty()) file = a;
        else { usage(argv[0]); return 2; }
    }

    if (file.empty()) {
        std::cerr << "Error: No file specified\n\n"
                  << "Usage: " << argv[0] << " [options] <file>\n"
                  << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }

    // Apply quiet mode before any logging can occur.
    if (cfg.quiet) {
        make_process_quiet();
    }
    if (!cfg.log_file.empty()) {
        vr::set_log_file(cfg.log_file);
    }

    cfg.port = static_cast<uint16_t>(port);
    cfg.file_path = file;
    cfg.access = vr::make_access_config(n, ips);

    try {
        vr::Server srv(cfg);
        // Before start(): every server thread inherits the blocked mask.
        SignalWatcher signals;
        srv.start();
        signals.watch(srv);
        srv.wait();  // blocking
    } catch (const vr::Error& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        vr::log_line(std::string("[FATAL] ") + e.what());
        std::cerr << "Server Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        vr::log_line(std::string("[FATAL] exception: ") + e.what());
        std::cerr << "Server Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
