#pragma once

#include <atomic>

namespace tether {
namespace runtime {

// Records SIGINT/SIGTERM so the CLI can stop its servers gracefully.
// The handler itself only sets an atomic flag.
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace tether
