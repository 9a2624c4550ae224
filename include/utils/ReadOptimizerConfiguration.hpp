#ifndef READOPTIMIZERCONFIGURATION_HPP
#define READOPTIMIZERCONFIGURATION_HPP

#include <map>
#include <string>
#include <vector>

namespace metaopt {

/**
 * @brief Description of one optimization task, as read by readTaskConfiguration.
 */
struct TaskConfiguration {
    std::string algorithm = "PSO";
    int n_agents = 20;
    int n_variables = 2;
    int n_dimensions = 1;
    std::vector<double> lower_bound;   ///< Filled with -10 per variable when absent.
    std::vector<double> upper_bound;   ///< Filled with 10 per variable when absent.
    int n_iterations = 100;
    bool has_seed = false;             ///< True when the file sets `seed`.
    unsigned int seed = 0;
    bool store_only_best = false;
    int checkpoint_frequency = 0;      ///< 0 disables checkpoints.
    std::string checkpoint_file = "checkpoint.csv";
    std::string log_level = "INFO";
    std::string log_file;              ///< Empty disables file logging.
};

} // namespace metaopt

/**
 * @brief Reads optimizer hyperparameters from a text file.
 *
 * Each non-empty line in the file should contain:
 * <setting_name> <value>
 * Lines starting with '#' are ignored. Values are kept as text so that
 * OptimizerFactory can report values of the wrong type.
 *
 * @param filename Path to the optimizer settings file.
 * @return std::map<std::string, std::string> Map of setting names to raw values.
 *
 * @throws metaopt::FileIOException if the file cannot be opened.
 * @throws metaopt::DataFormatException if a line does not hold exactly a name and a value.
 */
std::map<std::string, std::string> readOptimizerSettings(const std::string &filename);

/**
 * @brief Reads and validates a task description.
 *
 * Same line format as readOptimizerSettings, except that `lower_bound` and
 * `upper_bound` take one value per decision variable.
 *
 * @param filename Path to the task file.
 * @return metaopt::TaskConfiguration The task, with defaults for missing keys.
 *
 * @throws metaopt::FileIOException if the file cannot be opened.
 * @throws metaopt::DataFormatException on malformed lines or unknown keys.
 * @throws metaopt::ParameterTypeException if a value cannot be parsed as the expected type.
 * @throws metaopt::InvalidParameterException if the values are inconsistent
 *         (non-positive counts, bound sizes, unknown log level).
 */
metaopt::TaskConfiguration readTaskConfiguration(const std::string &filename);

/**
 * @brief Parses a floating-point setting value.
 * @throws metaopt::ParameterTypeException naming `name` if `value` is not a number.
 */
double parseDoubleSetting(const std::string &name, const std::string &value);

/**
 * @brief Parses an integer setting value.
 * @throws metaopt::ParameterTypeException naming `name` if `value` is not an integer.
 */
int parseIntSetting(const std::string &name, const std::string &value);

/**
 * @brief Parses a boolean flag: true/false, 1/0, yes/no or on/off.
 * @throws metaopt::ParameterTypeException naming `name` otherwise.
 */
bool parseBoolSetting(const std::string &name, const std::string &value);

#endif // READOPTIMIZERCONFIGURATION_HPP
