#include <vmplace/core/error.hpp>
#include <vmplace/core/host_pool.hpp>
#include <vmplace/core/types.hpp>

#include <vmplace/algo/placement_engine.hpp>

#include <vmplace/io/error.hpp>
#include <vmplace/io/report_writer.hpp>
#include <vmplace/io/scenario_generation.hpp>
#include <vmplace/io/scenario_loader.hpp>
#include <vmplace/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace {

namespace core = vmplace::core;
namespace algo = vmplace::algo;
namespace io = vmplace::io;

struct Config {
    std::string input_file;
    bool fixed{false};
    std::optional<std::size_t> generate_hosts;
    std::optional<std::size_t> generate_vms;
    std::optional<uint64_t> seed;
    core::PlacementWeights weights;
    std::string trace{"none"};
    bool trace_scores{false};
    std::string output_file{"-"};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("vmplace-place", "Greedy weighted VM placement");

    // clang-format off
    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("fixed", "Use the built-in demo scenario")
        ("generate-hosts", "Generate N random hosts", cxxopts::value<std::size_t>())
        ("generate-vms", "Generate M random VMs", cxxopts::value<std::size_t>())
        ("seed", "Random seed for generation", cxxopts::value<uint64_t>())
        ("cpu-weight", "Weight of CPU pressure (default: 0.4)",
            cxxopts::value<double>()->default_value("0.4"))
        ("energy-weight", "Weight of host energy (default: 0.3)",
            cxxopts::value<double>()->default_value("0.3"))
        ("cost-weight", "Weight of host cost (default: 0.3)",
            cxxopts::value<double>()->default_value("0.3"))
        ("t,trace", "Decision trace on stderr: none|json|text (default: none)",
            cxxopts::value<std::string>()->default_value("none"))
        ("trace-scores", "Also trace the score of every feasible host")
        ("o,output", "Report file (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("v,verbose", "Verbose stderr output")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    config.fixed = result.count("fixed") != 0U;
    if (result.count("input") != 0U) {
        config.input_file = result["input"].as<std::string>();
    }
    if (result.count("generate-hosts") != 0U) {
        config.generate_hosts = result["generate-hosts"].as<std::size_t>();
    }
    if (result.count("generate-vms") != 0U) {
        config.generate_vms = result["generate-vms"].as<std::size_t>();
    }
    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint64_t>();
    }

    bool generate = config.generate_hosts.has_value() || config.generate_vms.has_value();
    int sources = (config.input_file.empty() ? 0 : 1) + (config.fixed ? 1 : 0) + (generate ? 1 : 0);
    if (sources != 1) {
        std::cerr << "Error: exactly one of --input, --fixed or --generate-hosts/--generate-vms is required"
                  << std::endl;
        std::exit(64);
    }
    if (generate && (!config.generate_hosts || !config.generate_vms)) {
        std::cerr << "Error: --generate-hosts and --generate-vms go together" << std::endl;
        std::exit(64);
    }

    config.weights.cpu = result["cpu-weight"].as<double>();
    config.weights.energy = result["energy-weight"].as<double>();
    config.weights.cost = result["cost-weight"].as<double>();

    config.trace = result["trace"].as<std::string>();
    if (config.trace != "none" && config.trace != "json" && config.trace != "text") {
        std::cerr << "Error: --trace must be 'none', 'json' or 'text'" << std::endl;
        std::exit(64);
    }
    config.trace_scores = result.count("trace-scores") != 0U;
    config.output_file = result["output"].as<std::string>();
    config.verbose = result.count("verbose") != 0U;

    return config;
}

io::ScenarioData make_scenario(const Config& config) {
    if (config.fixed) {
        return io::fixed_scenario();
    }
    if (!config.input_file.empty()) {
        return io::load_scenario(config.input_file);
    }

    std::mt19937 rng;
    if (config.seed.has_value()) {
        rng.seed(static_cast<std::mt19937::result_type>(config.seed.value()));
    } else {
        std::random_device rd;
        rng.seed(rd());
    }
    return io::generate_scenario(*config.generate_hosts, *config.generate_vms, rng);
}

std::unique_ptr<core::TraceWriter> make_trace_writer(const std::string& kind) {
    if (kind == "json") {
        return std::make_unique<io::JsonTraceWriter>(std::cerr);
    }
    if (kind == "text") {
        return std::make_unique<io::TextualTraceWriter>(std::cerr, false);
    }
    return nullptr;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        auto scenario = make_scenario(config);
        core::HostPool pool = scenario.make_pool();

        if (config.verbose) {
            std::cerr << "Placing " << scenario.vms.size() << " VMs on " << pool.size() << " hosts (cpu "
                      << pool.total_cpu_capacity() << ", ram " << pool.total_ram_capacity() << ")"
                      << std::endl;
        }

        auto trace_writer = make_trace_writer(config.trace);

        algo::PlacementEngine engine;
        engine.set_trace_writer(trace_writer.get());
        engine.set_trace_scores(config.trace_scores);

        auto placements = engine.place_all(pool, scenario.vms, config.weights);

        // Close the JSON trace array before the report is written
        trace_writer.reset();

        if (config.verbose) {
            std::size_t placed = 0;
            for (const auto& p : placements) {
                if (p.result.feasible()) {
                    ++placed;
                } else {
                    std::cerr << "No suitable host for " << p.vm_id << std::endl;
                }
            }
            std::cerr << "Placed " << placed << "/" << placements.size() << " VMs" << std::endl;
        }

        if (config.output_file == "-") {
            io::write_placement_report(placements, pool, config.weights, std::cout);
        } else {
            std::ofstream outfile(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open file: " << config.output_file << std::endl;
                return 1;
            }
            io::write_placement_report(placements, pool, config.weights, outfile);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::InvalidInputError& e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        return 2;
    }
    catch (const core::CapacityError& e) {
        std::cerr << "Capacity error: " << e.what() << std::endl;
        return 4;
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
