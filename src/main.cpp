#include "commands/CommandHandler.hpp"
#include "core/TransferEngine.hpp"
#include "network/CurlTransport.hpp"
#include <signal.h>
#include <iostream>
#include <vector>

extern "C" void handle_interrupt(int) {
    TransferEngine* engine = CommandHandler::active_engine();
    if (engine) {
        engine->cancel();
    }
}

int main(int argc, char* argv[]) {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    if (argc < 2) {
        CommandHandler::print_usage(argv[0]);
        return 1;
    }

    // First signal cancels cooperatively, a second one terminates as usual
    struct sigaction action {};
    action.sa_handler = handle_interrupt;
    action.sa_flags = SA_RESETHAND;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        std::cerr << "Warning: interrupts will not cancel downloads cleanly" << std::endl;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    try {
        CurlTransport::global_init();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    int status = CommandHandler::execute(command, args);
    CurlTransport::global_cleanup();
    return status;
}
