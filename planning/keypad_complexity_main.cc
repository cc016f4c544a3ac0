
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "domain/keypad_codes.hh"
#include "fmt/format.h"
#include "planning/keypad_expansion.hh"
#include "planning/press_counter.hh"

namespace keyrelay::planning {

struct RunConfig {
    std::filesystem::path codes_file;
    std::vector<int> depths;
    int num_threads;
    bool show_presses;
    bool verbose;
};

int run(const RunConfig &config) {
    const std::vector<std::string> codes = domain::load_codes(config.codes_file);
    if (config.verbose) {
        fmt::print("Loaded {} codes from {}\n", codes.size(), config.codes_file.string());
    }

    PressCounter counter({.num_threads = config.num_threads});
    for (const int depth : config.depths) {
        const auto t_start = std::chrono::steady_clock::now();
        const PressCount total = counter.total_complexity(codes, depth);
        const auto dt = std::chrono::steady_clock::now() - t_start;

        if (config.verbose) {
            fmt::print("depth {}: computed in {:.3f} ms\n", depth,
                       std::chrono::duration<double, std::milli>(dt).count());
            for (const auto &code : codes) {
                fmt::print("  {}: {} presses, numeric part {}\n", code, counter.count(code, depth),
                           domain::numeric_part(code));
            }
        }

        if (config.show_presses) {
            const ExpansionOptions expansion_options;
            if (depth > expansion_options.max_depth) {
                fmt::print("  skipping literal presses for depth {}, limit is {}\n", depth,
                           expansion_options.max_depth);
            } else {
                for (const auto &code : codes) {
                    fmt::print("  {}: {}\n", code, expand_presses(code, depth, expansion_options));
                }
            }
        }

        fmt::print("depth {}: sum of complexities = {}\n", depth, total);
    }
    return 0;
}

}  // namespace keyrelay::planning

int main(int argc, char **argv) {
    cxxopts::Options options("keypad_complexity",
                             "Minimal physical key presses through a chain of keypad operators");
    // clang-format off
    options.add_options()
      ("codes_file", "File with one numeric keypad code per line", cxxopts::value<std::string>())
      ("depth", "Chain depths to evaluate",
          cxxopts::value<std::vector<int>>()->default_value("3,26"))
      ("num_threads", "Worker threads used to fill each layer, 0 runs on the main thread",
          cxxopts::value<int>()->default_value("0"))
      ("show_presses", "Print a shortest physical press sequence for each code")
      ("verbose", "Print per code press counts and timings")
      ("help", "Print usage");
    // clang-format on
    try {
        auto args = options.parse(argc, argv);
        if (args.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        if (args.count("codes_file") == 0) {
            std::cout << "codes_file is a required option" << std::endl;
            std::exit(1);
        }

        const std::vector<int> depths = args["depth"].as<std::vector<int>>();
        for (const int depth : depths) {
            if (depth < 0) {
                std::cout << "depth must be non-negative, got " << depth << std::endl;
                std::exit(1);
            }
        }
        const int num_threads = args["num_threads"].as<int>();
        if (num_threads < 0) {
            std::cout << "num_threads must be non-negative" << std::endl;
            std::exit(1);
        }

        return keyrelay::planning::run({
            .codes_file = args["codes_file"].as<std::string>(),
            .depths = depths,
            .num_threads = num_threads,
            .show_presses = args.count("show_presses") > 0,
            .verbose = args.count("verbose") > 0,
        });
    } catch (const std::exception &e) {
        std::cout << "keypad_complexity failed: " << e.what() << std::endl;
        return 1;
    }
}
