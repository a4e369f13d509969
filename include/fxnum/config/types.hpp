#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fxnum::config {

// Parameters of the demonstration harness. Defaults reproduce the reference runs.
struct DemoConfig {
    std::vector<std::string> demos;                                    // empty selects every demo
    std::vector<unsigned> basic_resolutions{8, 32, 80, 274};
    unsigned overflow_resolution{20};
    std::vector<unsigned> overflow_integer_bits{4, 8, 16, 32};
    double overflow_step{0.1};
    unsigned speed_iterations{10000};
    std::vector<unsigned> speed_resolutions{16, 32, 64, 128, 256, 512};
    std::vector<unsigned> sqrt_resolutions{4, 8, 12, 24, 48, 128, 512};
    unsigned pi_min_bits{8};
    unsigned pi_max_bits{25};
    unsigned accuracy_max_bits{500};
    unsigned accuracy_step{4};
    bool debug{false};
};

struct ParseResult {
    std::optional<DemoConfig> cfg; // present when valid and ready to run
    std::string config_path{"fxdemo.conf"};
    bool show_only{false};         // true if --help/--version was printed
    bool debug{false};             // true if --debug was passed on CLI
    bool all{false};               // true if --all was passed on CLI
};

} // namespace fxnum::config
