#include <iostream>
#include <stdexcept>

#include "config.hpp"
#include "pipeline.hpp"

// ---- Main Function ----
int main(int argc, char* argv[]) {
    RunConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    try {
        return run_pipeline(cfg, std::cout);
    } catch (const std::runtime_error& e) {
        // Pipeline errors and file write failures both end the run
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
