#include <vmplace/io/scenario_generation.hpp>
#include <vmplace/io/scenario_loader.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <string>

namespace {

namespace io = vmplace::io;

struct Config {
    std::string kind{"scenario"};
    std::size_t hosts{io::FIXED_HOST_COUNT};
    std::size_t vms{io::FIXED_VM_COUNT};
    std::size_t records{100};
    std::optional<uint64_t> seed;
    bool fixed{false};
    std::string output_file{"-"};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("vmplace-generate", "Demo and random data generator");

    // clang-format off
    options.add_options()
        ("k,kind", "What to generate: scenario|telemetry (default: scenario)",
            cxxopts::value<std::string>()->default_value("scenario"))
        ("hosts", "Number of hosts (default: 5)", cxxopts::value<std::size_t>()->default_value("5"))
        ("vms", "Number of VMs (default: 3)", cxxopts::value<std::size_t>()->default_value("3"))
        ("records", "Number of telemetry records (default: 100)",
            cxxopts::value<std::size_t>()->default_value("100"))
        ("seed", "Random seed", cxxopts::value<uint64_t>())
        ("fixed", "Emit the built-in demo scenario")
        ("o,output", "Output file (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    config.kind = result["kind"].as<std::string>();
    if (config.kind != "scenario" && config.kind != "telemetry") {
        std::cerr << "Error: --kind must be 'scenario' or 'telemetry'" << std::endl;
        std::exit(64);
    }
    config.hosts = result["hosts"].as<std::size_t>();
    config.vms = result["vms"].as<std::size_t>();
    config.records = result["records"].as<std::size_t>();
    config.fixed = result.count("fixed") != 0U;
    config.output_file = result["output"].as<std::string>();

    if (config.fixed && config.kind != "scenario") {
        std::cerr << "Error: --fixed only applies to --kind scenario" << std::endl;
        std::exit(64);
    }
    if (config.fixed && (config.hosts > io::FIXED_HOST_COUNT || config.vms > io::FIXED_VM_COUNT)) {
        std::cerr << "Error: the demo scenario has " << io::FIXED_HOST_COUNT << " hosts and "
                  << io::FIXED_VM_COUNT << " VMs" << std::endl;
        std::exit(64);
    }

    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint64_t>();
    }

    return config;
}

template<typename WriteFn>
int emit(const std::string& output_file, WriteFn&& write) {
    if (output_file == "-") {
        write(std::cout);
        std::cout << std::endl;
        return 0;
    }

    std::ofstream outfile(output_file);
    if (!outfile) {
        std::cerr << "Error: cannot open file: " << output_file << std::endl;
        return 1;
    }
    write(outfile);
    outfile << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        std::mt19937 rng;
        if (config.seed.has_value()) {
            rng.seed(static_cast<std::mt19937::result_type>(config.seed.value()));
        } else {
            std::random_device rd;
            rng.seed(rd());
        }

        if (config.kind == "telemetry") {
            auto records = io::generate_telemetry(config.records, rng);
            return emit(config.output_file,
                        [&](std::ostream& out) { io::write_telemetry_to_stream(records, out); });
        }

        io::ScenarioData scenario;
        if (config.fixed) {
            scenario.hosts = io::fixed_hosts(config.hosts);
            scenario.vms = io::fixed_vms(config.vms);
        } else {
            scenario = io::generate_scenario(config.hosts, config.vms, rng);
        }
        return emit(config.output_file,
                    [&](std::ostream& out) { io::write_scenario_to_stream(scenario, out); });
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
