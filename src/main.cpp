// =============================================================================
// Scry - Main Entry Point
// =============================================================================
// Headless mirror: connects to one device, drains decoded frames at display
// rate, optionally pushes files, and runs until Ctrl+C.
//
//   scry [-c config.json] [-s serial] [--push FILE]...
// =============================================================================

#include "scry_log.hpp"
#include "config_loader.hpp"
#include "adb_transport.hpp"
#include "device_provider.hpp"
#include "event_bus.hpp"
#include "session_manager.hpp"
#include "video/h264_decoder.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running = false;
}

struct Options {
    std::string config_path = "scry.json";
    std::string serial;
    std::vector<std::string> push_files;
};

void printUsage(const char* argv0) {
    std::fprintf(stderr, "usage: %s [-c config.json] [-s serial] [--push FILE]...\n", argv0);
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "-c") == 0 && has_value) {
            opts.config_path = argv[++i];
        } else if (std::strcmp(arg, "-s") == 0 && has_value) {
            opts.serial = argv[++i];
        } else if (std::strcmp(arg, "--push") == 0 && has_value) {
            opts.push_files.push_back(argv[++i]);
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    scry::config::AppConfig cfg = scry::config::loadConfig(opts.config_path);
    scry::log::setLogLevel(scry::log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty()) scry::log::openLogFile(cfg.log.log_path.c_str());
    SLOG_INFO("main", "Scry starting (config: %s)", opts.config_path.c_str());

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    // A dead adb child must surface as EPIPE on its stdin
    std::signal(SIGPIPE, SIG_IGN);

    int exit_code = 0;
    try {
        scry::AdbTransportOptions transport_opts;
        transport_opts.adb_path = cfg.adb.path;
        transport_opts.busy_timeout_ms = cfg.input.busy_timeout_ms;

        auto provider = std::make_shared<scry::AdbDeviceProvider>(cfg.adb.path);
        auto transport = std::make_shared<scry::AdbTransport>(transport_opts);
        scry::SessionManager session(provider, transport, &scry::video::H264Decoder::create, cfg);

        auto state_sub = scry::bus().subscribe<scry::SessionStateEvent>([](const scry::SessionStateEvent& e) {
            auto state = static_cast<scry::SessionState>(e.state);
            if (state == scry::SessionState::Stopped) g_running = false;
            if (e.failure != 0) {
                std::fprintf(stderr, "session failed (%s): %s\n",
                             scry::failureKindName(static_cast<scry::FailureKind>(e.failure)), e.message.c_str());
                g_running = false;
            }
        });

        auto started = session.start();
        if (started.is_ok() && started.value() == scry::SessionState::AwaitingSelection) {
            auto candidates = session.candidates();
            if (opts.serial.empty()) {
                std::fprintf(stderr, "several devices attached, pick one with -s:\n");
                for (const auto& id : candidates) std::fprintf(stderr, "  %s\n", id.c_str());
                session.stop();
                scry::log::closeLogFile();
                return 2;
            }
            started = session.select(opts.serial);
        }
        if (started.is_err()) {
            SLOG_ERROR("main", "Could not start mirroring: %s", started.error().message.c_str());
            session.stop();
            scry::log::closeLogFile();
            return 1;
        }
        SLOG_INFO("main", "Mirroring %s", session.device().id.c_str());

        std::vector<std::pair<std::string, std::future<scry::Result<void, scry::TransferError>>>> pushes;
        for (const auto& path : opts.push_files) {
            pushes.emplace_back(path, session.pushFile(path));
        }

        // Headless render consumer
        const auto frame_interval = std::chrono::microseconds(1000000 / 60);
        auto window_start = std::chrono::steady_clock::now();
        int frames_in_window = 0;
        while (g_running) {
            auto frame = session.takeLatestFrame();
            if (frame) frames_in_window++;

            auto now = std::chrono::steady_clock::now();
            if (now - window_start >= std::chrono::seconds(5)) {
                double secs = std::chrono::duration<double>(now - window_start).count();
                SLOG_INFO("main", "%.1f fps (%llu decoded, %llu superseded)", frames_in_window / secs,
                          (unsigned long long)session.frames().published(),
                          (unsigned long long)session.frames().dropped());
                window_start = now;
                frames_in_window = 0;
            }

            for (auto& p : pushes) {
                if (!p.second.valid()) continue;
                if (p.second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) continue;
                auto r = p.second.get();
                if (r.is_ok()) {
                    std::fprintf(stderr, "pushed %s\n", p.first.c_str());
                } else {
                    std::fprintf(stderr, "push %s failed (%s): %s\n", p.first.c_str(),
                                 scry::transferReasonName(r.error().reason), r.error().message.c_str());
                }
            }

            std::this_thread::sleep_for(frame_interval);
        }

        if (session.failure() != scry::FailureKind::None) exit_code = 1;
        session.stop();

        // Transfers run on their own threads; wait for them before exiting
        for (auto& p : pushes) {
            if (p.second.valid()) p.second.wait();
        }
    } catch (const std::exception& e) {
        SLOG_FATAL("main", "Unhandled exception: %s", e.what());
        exit_code = 1;
    }

    SLOG_INFO("main", "Scry exiting");
    scry::log::closeLogFile();
    return exit_code;
}
