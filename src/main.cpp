#include "AttendanceController.hpp"
#include "Config.hpp"
#include "PresenceError.hpp"

#include <iostream>
#include <csignal>
#include <execinfo.h>  // For backtrace
#include <atomic>
#include <thread>
#include <chrono>
#include <exception>   // For std::set_terminate
#include <cstdlib>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_NOT_RECORDED = 2;
constexpr int EXIT_CONFLICT = 3;

const char* PRESENCE_VERSION = "1.0.0";

std::atomic<bool> cancel_requested{false};
std::atomic<bool> shutdown_complete{false};

void print_stack_trace() {
    void* frames[64];
    int frame_count = backtrace(frames, 64);
    char** symbols = backtrace_symbols(frames, frame_count);

    std::cerr << "\n📋 Stack trace:" << std::endl;
    if (symbols) {
        for (int i = 0; i < frame_count && i < 20; i++) {
            std::cerr << "  [" << i << "] " << symbols[i] << std::endl;
        }
        if (frame_count > 20) {
            std::cerr << "  ... (" << (frame_count - 20) << " more frames)" << std::endl;
        }
        free(symbols);
    }
}

// Global terminate handler - catches uncaught exceptions from threads
void terminate_handler() {
    std::exception_ptr eptr = std::current_exception();

    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "💥 UNCAUGHT EXCEPTION: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "💥 UNCAUGHT EXCEPTION: Unknown type" << std::endl;
        }
    } else {
        std::cerr << "💥 std::terminate called (no active exception)" << std::endl;
    }

    print_stack_trace();
    std::cerr.flush();
    _exit(EXIT_ERROR);
}

void signal_handler(int signum) {
    // Second signal while an attempt is unwinding: give up
    if (cancel_requested.exchange(true)) {
        _exit(128 + signum);
    }
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--config FILE] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  attend               Liveness check, match and operator confirmation\n"
              << "  enroll <id> <name>   Register a new identity (3 captures)\n"
              << "  health               Check the matching service\n"
              << "\n"
              << "Environment: PRESENCE_GATEWAY_URL, PRESENCE_GATEWAY_TOKEN\n";
}

bool ask_operator(const presence::MatchCandidate& candidate) {
    std::cout << "\n  Identity:   " << candidate.display_name << " (" << candidate.identity_id << ")\n"
              << "  Confidence: " << candidate.confidence * 100.0f << "%\n"
              << "  Distance:   " << candidate.distance << "\n\n"
              << "Is this the correct user? [y/N] " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer) || cancel_requested.load()) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

int run_attend(presence::AttendanceController& controller) {
    presence::AttemptResult result = controller.mark_attendance();

    switch (result.status) {
        case presence::AttemptResult::Status::LIVENESS_FAILED:
            std::cout << "❌ Liveness check failed: " << result.message << std::endl;
            return EXIT_NOT_RECORDED;
        case presence::AttemptResult::Status::NO_MATCH:
            std::cout << "❌ Failed: " << result.message << std::endl;
            return EXIT_NOT_RECORDED;
        case presence::AttemptResult::Status::PENDING_CONFIRMATION:
            break;
    }

    if (!ask_operator(*result.candidate)) {
        controller.reject();
        std::cout << "Attendance cancelled. Please try again." << std::endl;
        return EXIT_NOT_RECORDED;
    }

    presence::AttendanceRecord record = controller.confirm();
    std::cout << "✅ Attendance marked for " << record.display_name << " at " << record.recorded_at
              << " (liveness " << record.liveness_score << ")" << std::endl;
    return EXIT_OK;
}

int report_error(const presence::PresenceError& e) {
    if (e.kind() == presence::ErrorKind::GatewayConflict) {
        switch (e.conflict()) {
            case presence::ConflictKind::DuplicateIdentity:
                std::cerr << "❌ User ID already taken! Registered to " << e.existing_owner() << std::endl;
                break;
            case presence::ConflictKind::DuplicateFace:
                std::cerr << "❌ Face already registered! This face belongs to " << e.existing_owner() << std::endl;
                break;
            default:
                std::cerr << "❌ " << e.what() << std::endl;
                break;
        }
        return EXIT_CONFLICT;
    }

    std::cerr << "❌ " << presence::to_string(e.kind()) << ": " << e.what() << std::endl;
    return EXIT_ERROR;
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate(terminate_handler);

    std::string config_path = presence::DEFAULT_CONFIG_PATH;
    bool explicit_config = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            explicit_config = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_OK;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return EXIT_ERROR;
    }
    const std::string command = args[0];
    if ((command == "attend" && args.size() != 1) ||
        (command == "health" && args.size() != 1) ||
        (command == "enroll" && args.size() != 3) ||
        (command != "attend" && command != "health" && command != "enroll")) {
        print_usage(argv[0]);
        return EXIT_ERROR;
    }

    std::cout << "\n╔════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   Presence Kiosk v" << PRESENCE_VERSION << "                    ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════╝" << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        presence::PresenceConfig config = presence::load_config(config_path, explicit_config);
        presence::HttpGateway gateway(config.gateway);

        if (command == "health") {
            bool ok = gateway.health();
            std::cout << (ok ? "✅ Matching service reachable" : "❌ Matching service unreachable") << std::endl;
            return ok ? EXIT_OK : EXIT_ERROR;
        }

        std::unique_ptr<presence::DescriptorSource> source = presence::create_descriptor_source(config.models);
        presence::CameraConfig camera_config = config.camera;

        presence::AttendanceController controller(
            [camera_config]() { return presence::create_camera(camera_config); },
            *source, gateway, gateway, config.liveness, config.enrollment);

        controller.set_status_callback([](const std::string& status) {
            std::cout << "  » " << status << std::endl;
        });

        // Forward Ctrl+C to the running attempt from a normal thread
        std::thread cancel_watcher([&controller]() {
            while (!shutdown_complete.load()) {
                if (cancel_requested.load()) {
                    controller.cancel();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        int exit_code = EXIT_ERROR;
        try {
            if (command == "attend") {
                exit_code = run_attend(controller);
            } else {
                controller.register_identity(args[1], args[2]);
                std::cout << "✅ Registered " << args[2] << " (" << args[1] << ")" << std::endl;
                exit_code = EXIT_OK;
            }
        } catch (const presence::PresenceError& e) {
            exit_code = report_error(e);
        } catch (const std::exception& e) {
            std::cerr << "❌ " << e.what() << std::endl;
            exit_code = EXIT_ERROR;
        }

        shutdown_complete.store(true);
        cancel_watcher.join();
        return exit_code;
    } catch (const presence::PresenceError& e) {
        return report_error(e);
    }
}
