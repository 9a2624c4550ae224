#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <map>
#include <Eigen/Dense>

#include "core/Function.hpp"
#include "core/OptimizationRunner.hpp"
#include "spaces/SearchSpace.hpp"
#include "optimizers/OptimizerFactory.hpp"
#include "callbacks/CheckpointCallback.hpp"
#include "math/RandomGenerator.hpp"
#include "utils/ReadOptimizerConfiguration.hpp"
#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

using namespace std;
using namespace metaopt;

// Usage: metaopt_demo [task_file] [optimizer_settings_file]
int main(int argc, char* argv[]) {
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().info("main", "Starting MetaOpt Sphere demo...");

    try {
        TaskConfiguration task;
        if (argc > 1) {
            task = readTaskConfiguration(argv[1]);
        } else {
            task.lower_bound.assign(task.n_variables, -10.0);
            task.upper_bound.assign(task.n_variables, 10.0);
            task.checkpoint_frequency = 10;
        }

        map<string, string> optimizer_settings;
        if (argc > 2) {
            optimizer_settings = readOptimizerSettings(argv[2]);
        }

        LogLevel level = LogLevel::INFO;
        if (!parseLogLevel(task.log_level, level)) {
            THROW_INVALID_PARAM("main", "Unknown log level: " + task.log_level);
        }
        Logger::getInstance().setLogLevel(level);
        if (!task.log_file.empty() && !Logger::getInstance().enableFileLogging(true, task.log_file)) {
            throw FileIOException("main", "Unable to open log file: " + task.log_file);
        }

        unique_ptr<RandomGenerator> rng = task.has_seed ? make_unique<RandomGenerator>(task.seed)
                                                        : make_unique<RandomGenerator>();

        auto space = make_shared<SearchSpace>(task.n_agents, task.n_variables,
                                              task.lower_bound, task.upper_bound,
                                              *rng, task.n_dimensions);
        shared_ptr<Optimizer> optimizer = OptimizerFactory::create(task.algorithm, optimizer_settings);

        Function sphere([](const Eigen::MatrixXd& x) { return x.squaredNorm(); }, {}, 0.0, "Sphere");

        OptimizationRunner runner(space, optimizer, sphere, *rng, task.store_only_best);

        vector<shared_ptr<Callback>> callbacks;
        if (task.checkpoint_frequency > 0) {
            const string checkpoint_dir = FileUtils::joinPaths("output", "checkpoints");
            callbacks.push_back(make_shared<CheckpointCallback>(task.checkpoint_file, task.checkpoint_frequency, checkpoint_dir));
        }

        const History& history = runner.start(task.n_iterations, callbacks);

        const Agent& best = runner.getSpace().getBestAgent();
        cout << "Algorithm:      " << optimizer->getAlgorithm() << endl;
        cout << "Iterations:     " << history.size() << endl;
        cout << "Best fitness:   " << best.getFitness() << endl;
        cout << "Best position:  " << best.getPosition().transpose() << endl;

        FileUtils::writeHistoryCSV(FileUtils::joinPaths("output", "sphere_history.csv"), history);
        Logger::getInstance().info("main", "History written to output/sphere_history.csv");
    }
    catch (const FileIOException& e) {
        Logger::getInstance().fatal("main", "File IO Error: " + std::string(e.what()));
        cerr << "Critical Error: File operation failed. " << e.what() << endl;
        return 1;
    }
    catch (const DataFormatException& e) {
        Logger::getInstance().fatal("main", "Data Format Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid configuration format. " << e.what() << endl;
        return 1;
    }
    catch (const ParameterTypeException& e) {
        Logger::getInstance().fatal("main", "Parameter Type Error: " + std::string(e.what()));
        cerr << "Critical Error: Parameter of the wrong type. " << e.what() << endl;
        return 1;
    }
    catch (const InvalidParameterException& e) {
        Logger::getInstance().fatal("main", "Invalid Parameter Error: " + std::string(e.what()));
        cerr << "Critical Error: Invalid parameter provided. " << e.what() << endl;
        return 1;
    }
    catch (const EvaluationException& e) {
        Logger::getInstance().fatal("main", "Evaluation Error: " + std::string(e.what()));
        cerr << "Critical Error: Objective evaluation failed. " << e.what() << endl;
        return 1;
    }
    catch (const std::exception& e) {
        Logger::getInstance().fatal("main", "Unexpected Error: " + std::string(e.what()));
        cerr << "Critical Error: " << e.what() << endl;
        return 1;
    }

    Logger::getInstance().info("main", "Demo finished.");
    return 0;
}
