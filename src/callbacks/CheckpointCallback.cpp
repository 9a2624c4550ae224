#include "callbacks/CheckpointCallback.hpp"
#include "core/Space.hpp"
#include "core/History.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"

#include <string>
#include <utility>

namespace metaopt {

CheckpointCallback::CheckpointCallback(std::string file_path, int frequency, std::string directory)
    : PeriodicCallback(frequency),
      file_path_(std::move(file_path)),
      directory_(std::move(directory)) {
    if (file_path_.empty()) {
        THROW_INVALID_PARAM("CheckpointCallback::CheckpointCallback", "file_path should not be empty");
    }
}

std::string CheckpointCallback::getHistoryPath() const {
    return FileUtils::joinPaths(directory_, "history_" + file_path_);
}

void CheckpointCallback::onPeriod(int iteration, const Space& space, const History& history) {
    const std::string snapshot_path =
        FileUtils::joinPaths(directory_, "iter_" + std::to_string(iteration) + "_" + file_path_);

    FileUtils::writeSpaceSnapshot(snapshot_path, iteration, space.getBestAgent(), space.getAgents());
    FileUtils::writeHistoryCSV(getHistoryPath(), history);
    written_files_.push_back(snapshot_path);

    Logger::getInstance().info("CheckpointCallback", "Checkpoint saved to " + snapshot_path);
}

} // namespace metaopt
