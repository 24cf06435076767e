#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "lanwatch/app.hpp"

namespace {

struct Options {
    std::string config_path{"config/lanwatch.yaml"};
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <lanwatch.yaml>]\n";
}

Options parse_options(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }
    return opt;
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    try {
        options = parse_options(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    return lanwatch::control::run(options.config_path);
}
