#include <signal.h>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include "OperatorStation.hpp"
#include "apps/core/Config.hpp"

static volatile std::sig_atomic_t g_signal = 0;

static void on_signal(int sig) {
    g_signal = sig;
}

int main(int argc, char** argv) {
    core::OperatorConfig cfg{};
    switch (core::ParseOperatorArgs(argc, argv, cfg)) {
        case core::ParseResult::HELP:  return 0;
        case core::ParseResult::ERROR: return 2;
        default: break;
    }

    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    station::OperatorStation op(cfg);
    if (!op.Start()) {
        std::cerr << "[OPERATOR] startup failed\n";
        op.Stop();
        return 1;
    }

    core::ShutdownCoordinator& shutdown = op.Coordinator();
    while (!shutdown.WaitFor(100)) {
        if (g_signal != 0) {
            shutdown.RequestShutdown(g_signal == SIGINT ? "SIGINT" : "SIGTERM");
        }
    }

    std::cout << "[OPERATOR] shutting down (" << shutdown.Reason() << ")\n";
    op.Stop();
    return 0;
}
