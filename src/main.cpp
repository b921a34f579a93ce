#include "../include/config.hpp"
#include "../include/distributed/data_parallel.hpp"
#include "../include/logger.hpp"
#include "../include/optimizer/sgd.hpp"
#include "../include/serialization.hpp"
#include "../include/training/adascale.hpp"
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>

// Synthetic problem: minimize 0.5 * |w - target|^2 from noisy per-sample gradients
struct SimulationOptions {
    std::string config_path = "config/autoscaler_config.json";
    size_t iterations = 500;
    size_t dim = 256;
    float noise_std = 1.0f;
    float learning_rate = 0.1f;
    size_t report_every = 50;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program
              << " [config.json] [--iterations N] [--dim D] [--noise STD] [--lr LR]"
                 " [--report-every N]"
              << std::endl;
}

SimulationOptions parse_args(int argc, char* argv[]) {
    SimulationOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };
        if (arg == "--iterations") {
            options.iterations = std::stoul(next());
        } else if (arg == "--dim") {
            options.dim = std::stoul(next());
        } else if (arg == "--noise") {
            options.noise_std = std::stof(next());
        } else if (arg == "--lr") {
            options.learning_rate = std::stof(next());
        } else if (arg == "--report-every") {
            options.report_every = std::stoul(next());
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            options.config_path = arg;
        }
    }
    if (options.report_every == 0) {
        options.report_every = 1;
    }
    return options;
}

void run_worker(InProcessGroup& group, const AutoScalerConfig& config,
                const SimulationOptions& options) {
    const size_t rank = group.rank();
    Parameter weights("weights", 1, options.dim, 0.0f);
    Matrix target(1, options.dim, 1.0f);

    SGD optimizer(options.learning_rate, 0.9f);
    optimizer.add_param_group(std::vector<Parameter*>{&weights});

    BackwardEngine engine;
    std::unique_ptr<JsonlSummaryWriter> writer;
    if (config.collect_tensorboard && rank == 0) {
        writer = std::make_unique<JsonlSummaryWriter>(config.logs_basedir() + "/summary.jsonl");
    }
    AdaScale adascale(optimizer, engine, config, &group, nullptr, writer.get());
    DataParallelSync sync(engine, group, {&weights});

    const size_t accum = adascale.num_gradients_to_accumulate();
    std::mt19937 gen(static_cast<std::uint32_t>(1234 + rank));
    std::normal_distribution<float> noise(0.0f, options.noise_std);

    if (rank == 0) {
        std::cout << "Simulating " << group.world_size() << " worker(s), accumulation " << accum
                  << ", scale " << adascale.scale() << ", smoothing " << adascale.smoothing()
                  << std::endl;
    }

    double scheduler_steps = 0.0;
    for (size_t iteration = 0; iteration < options.iterations; ++iteration) {
        for (size_t micro = 0; micro < accum; ++micro) {
            Matrix grad = weights.value - target;
            for (size_t j = 0; j < grad.size(); ++j) {
                grad.data()[j] += noise(gen);
            }
            if (config.adjust_gradients_for_accumulation) {
                grad /= static_cast<float>(accum);
            }
            sync.set_require_sync(micro + 1 == accum);
            engine.backward({{&weights, grad}});
        }

        adascale.step();
        scheduler_steps += static_cast<double>(adascale.get_step_increment());
        const double gns = adascale.gns();
        adascale.zero_grad();
        adascale.log_summary(iteration);

        if (rank == 0 && (iteration + 1) % options.report_every == 0) {
            Matrix error = weights.value - target;
            std::cout << "iter " << std::setw(6) << iteration + 1 << "  gain " << std::fixed
                      << std::setprecision(4) << adascale.gain() << "  gns " << std::setprecision(1)
                      << gns << "  scale-invariant steps " << adascale.scale_invariant_steps()
                      << "  |w - target|^2 " << std::setprecision(4) << error.squared_norm()
                      << (adascale.gain_invalid() ? "  (invalid sample)" : "") << std::endl;
            std::cout.unsetf(std::ios::fixed);
        }
    }

    OptimizerStateDict state = adascale.state_dict();
    if (rank == 0) {
        save_checkpoint(config.logs_basedir() + "/checkpoint.bin", state,
                        {{"iterations", options.iterations}, {"scheduler_steps", scheduler_steps}});
        adascale.record_cluster_state();
        std::cout << "Averaged GNS " << adascale.averaged_gns() << ", checkpoint written to "
                  << config.logs_basedir() << std::endl;
    }
}

int main(int argc, char* argv[]) {
    Logger& logger = Logger::getInstance();

    try {
        SimulationOptions options = parse_args(argc, argv);

        AutoScalerConfig config;
        config.load_from_json(options.config_path);
        logger.startLogging(config.logs_basedir() + "/autoscaler.log");

        const size_t world_size = config.world_size == 0 ? 1 : config.world_size;
        InProcessGroup::run(world_size, [&](InProcessGroup& group) {
            run_worker(group, config, options);
        });

        logger.stopLogging();
        return 0;
    } catch (const std::exception& e) {
        logger.log("Error: " + std::string(e.what()), true);
        std::cerr << "Error: " << e.what() << std::endl;
        logger.stopLogging();
        return 1;
    }
}
