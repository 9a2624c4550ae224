#ifndef CHECKPOINT_CALLBACK_HPP
#define CHECKPOINT_CALLBACK_HPP

#include "callbacks/PeriodicCallback.hpp"
#include <string>
#include <vector>

namespace metaopt {

/**
 * @class CheckpointCallback
 * @brief Periodically saves the space and the convergence history as CSV.
 *
 * At iteration t it writes `iter_<t>_<file_path>` (best agent and population)
 * and overwrites `history_<file_path>` with every snapshot recorded so far.
 * Both files go to the checkpoint directory.
 */
class CheckpointCallback : public PeriodicCallback {
public:
    /**
     * @param file_path Base file name of the checkpoints, must not be empty.
     * @param frequency Iterations between two checkpoints.
     * @param directory Output directory, created on first write.
     *
     * @throws InvalidParameterException if file_path is empty or frequency <= 0.
     */
    CheckpointCallback(std::string file_path = "checkpoint.csv", int frequency = 1, std::string directory = ".");

    /** @brief Snapshot files written so far, in order. */
    const std::vector<std::string>& getWrittenFiles() const { return written_files_; }

    /** @brief Path of the history file. */
    std::string getHistoryPath() const;

protected:
    void onPeriod(int iteration, const Space& space, const History& history) override;

private:
    std::string file_path_;
    std::string directory_;
    std::vector<std::string> written_files_;
};

} // namespace metaopt

#endif // CHECKPOINT_CALLBACK_HPP
