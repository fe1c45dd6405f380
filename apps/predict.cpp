#include <vmplace/core/error.hpp>
#include <vmplace/core/types.hpp>

#include <vmplace/algo/model_service.hpp>
#include <vmplace/algo/objective_evaluator.hpp>

#include <vmplace/io/error.hpp>
#include <vmplace/io/model_loader.hpp>
#include <vmplace/io/report_writer.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace core = vmplace::core;
namespace algo = vmplace::algo;
namespace io = vmplace::io;

struct Config {
    std::string model_file;
    std::string request_file;
    std::optional<std::string> vm;
    double cpu{0.0};
    double memory{0.0};
    double network_io{0.0};
    double power{0.0};
    std::optional<double> cost_weight;
    std::optional<double> energy_weight;
    std::optional<double> load_weight;
    bool all{false};
    bool objectives_only{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("vmplace-predict", "Model-assisted placement and proxy objectives");

    // clang-format off
    options.add_options()
        ("m,model", "Model bundle manifest (JSON)", cxxopts::value<std::string>())
        ("r,request", "Telemetry request (JSON)", cxxopts::value<std::string>())
        ("vm", "VM label", cxxopts::value<std::string>())
        ("cpu", "CPU usage (%)", cxxopts::value<double>())
        ("memory", "Memory usage (GB)", cxxopts::value<double>())
        ("network-io", "Network throughput (GB/s)", cxxopts::value<double>())
        ("power", "Power draw (W)", cxxopts::value<double>())
        ("cost-weight", "Weight of normalized cost (default: 0.34)", cxxopts::value<double>())
        ("energy-weight", "Weight of normalized energy (default: 0.33)", cxxopts::value<double>())
        ("load-weight", "Weight of normalized load imbalance (default: 0.33)", cxxopts::value<double>())
        ("all", "Include the prediction of every candidate model")
        ("objectives-only", "Only compute the proxy objectives (no model needed)")
        ("v,verbose", "Verbose stderr output")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    Config config;
    if (result.count("model") != 0U) {
        config.model_file = result["model"].as<std::string>();
    }
    if (result.count("request") != 0U) {
        config.request_file = result["request"].as<std::string>();
    }

    if (result.count("vm") != 0U) {
        if (!config.request_file.empty()) {
            std::cerr << "Error: --request and --vm are mutually exclusive" << std::endl;
            std::exit(64);
        }
        for (const char* name : {"cpu", "memory", "network-io", "power"}) {
            if (result.count(name) == 0U) {
                std::cerr << "Error: --" << name << " is required with --vm" << std::endl;
                std::exit(64);
            }
        }
        config.vm = result["vm"].as<std::string>();
        config.cpu = result["cpu"].as<double>();
        config.memory = result["memory"].as<double>();
        config.network_io = result["network-io"].as<double>();
        config.power = result["power"].as<double>();
    } else if (config.request_file.empty()) {
        std::cerr << "Error: either --request or --vm is required" << std::endl;
        std::exit(64);
    }

    if (result.count("cost-weight") != 0U) {
        config.cost_weight = result["cost-weight"].as<double>();
    }
    if (result.count("energy-weight") != 0U) {
        config.energy_weight = result["energy-weight"].as<double>();
    }
    if (result.count("load-weight") != 0U) {
        config.load_weight = result["load-weight"].as<double>();
    }

    config.all = result.count("all") != 0U;
    config.objectives_only = result.count("objectives-only") != 0U;
    config.verbose = result.count("verbose") != 0U;

    return config;
}

io::TelemetryRequest make_request(const Config& config) {
    io::TelemetryRequest request;
    if (!config.request_file.empty()) {
        request = io::load_telemetry_request(config.request_file);
    } else {
        request.sample = core::make_telemetry_sample(*config.vm, config.cpu, config.memory,
                                                     config.network_io, config.power);
    }

    // Command-line weights override the request file
    if (config.cost_weight) {
        request.weights.cost = *config.cost_weight;
    }
    if (config.energy_weight) {
        request.weights.energy = *config.energy_weight;
    }
    if (config.load_weight) {
        request.weights.load = *config.load_weight;
    }
    return request;
}

} // anonymous namespace

int main(int argc, char** argv) {
    algo::ModelService service;

    try {
        auto config = parse_args(argc, argv);
        auto request = make_request(config);

        if (config.objectives_only) {
            auto objectives = algo::ObjectiveEvaluator::evaluate(request.sample, request.weights);
            io::write_objectives(request.sample, objectives, std::cout);
            return 0;
        }

        if (!config.model_file.empty()) {
            if (config.verbose) {
                std::cerr << "Loading model bundle from: " << config.model_file << std::endl;
            }
            service.initialize(io::load_model_bundle(config.model_file));
        }

        auto recommendation = service.recommend(request.sample, request.weights);

        if (config.verbose) {
            for (const auto& candidate : service.candidates()) {
                std::cerr << (candidate.best ? "* " : "  ") << candidate.model << " r2=" << candidate.quality.r2
                          << " mse=" << candidate.quality.mse << " mae=" << candidate.quality.mae << std::endl;
            }
            if (!recommendation.feature_importance.empty()) {
                std::cerr << "Feature importance:" << std::endl;
                for (const auto& entry : recommendation.feature_importance) {
                    std::cerr << "  " << entry.feature << " " << entry.importance << std::endl;
                }
            }
        }

        std::vector<algo::CandidatePrediction> predictions;
        if (config.all) {
            predictions = service.predict_all(request.sample);
        }
        io::write_recommendation(request.sample, recommendation, predictions, std::cout);

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::UnknownCategoryError& e) {
        std::cerr << "Rejected: " << e.what() << std::endl;
        if (service.is_ready()) {
            std::cerr << "Known VM labels:";
            for (const auto& label : service.vm_labels()) {
                std::cerr << " " << label;
            }
            std::cerr << std::endl;
        }
        return 2;
    }
    catch (const core::InvalidInputError& e) {
        std::cerr << "Rejected: " << e.what() << std::endl;
        return 2;
    }
    catch (const core::PredictorUnavailableError& e) {
        std::cerr << "Predictor unavailable: " << e.what() << " (use --model or --objectives-only)" << std::endl;
        return 3;
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
