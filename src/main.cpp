// ============================================================================
// main.cpp — Entry point for the awp_verify tool
// ============================================================================

#include "awp/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        awp::Options opts = awp::parse_args(argc, argv);

        if (opts.help) {
            awp::print_usage(argv[0]);
            return 0;
        }

        return awp::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        awp::print_usage(argv[0]);
        return 1;
    }
}
