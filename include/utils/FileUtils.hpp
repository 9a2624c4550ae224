#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>
#include <vector>
#include "core/Agent.hpp"
#include "core/History.hpp"

/**
 * @namespace FileUtils
 * @brief Contains utilities for file and directory operations used by checkpoints and the demo.
 */
namespace FileUtils {
    /**
     * @brief Ensures the specified directory exists, creating it if necessary.
     * @param path [in] Directory path to check/create
     * @return true if the directory exists or was successfully created, false otherwise
     */
    bool ensureDirectoryExists(const std::string& path);

    /**
     * @brief Joins two path segments using the proper path separator.
     * @param path1 [in] First path segment
     * @param path2 [in] Second path segment
     * @return Combined path as a string
     */
    std::string joinPaths(const std::string& path1, const std::string& path2);

    /**
     * @brief Column names for a flattened position, `x<variable>_<dimension>`.
     */
    std::string positionHeader(int n_variables, int n_dimensions, const std::string& prefix = "x");

    /**
     * @brief Writes the best agent and the population of one iteration as CSV.
     *
     * Columns: role, index, fitness, then the position flattened variable by variable.
     * The best agent is written first with role `best` and index -1.
     *
     * @param filename   [in] Output file, overwritten. Its parent directory is created if missing.
     * @param iteration  [in] Iteration written in the leading comment line.
     * @param best_agent [in] Best agent so far.
     * @param agents     [in] Current population.
     * @throws metaopt::FileIOException if the file cannot be written.
     */
    void writeSpaceSnapshot(const std::string& filename, int iteration,
                            const metaopt::Agent& best_agent,
                            const std::vector<metaopt::Agent>& agents);

    /**
     * @brief Writes one CSV row per history snapshot: iteration, best fitness,
     *        population statistics and the best position.
     * @param filename [in] Output file, overwritten.
     * @param history  [in] History to export.
     * @throws metaopt::FileIOException if the file cannot be written.
     */
    void writeHistoryCSV(const std::string& filename, const metaopt::History& history);
}

#endif
