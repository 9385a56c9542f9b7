#pragma once

#include <atomic>

namespace todod {
namespace runtime {

// Records SIGINT/SIGTERM in a flag the main loop polls
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Test hook
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace todod
