#include "utils/FileUtils.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    try {
        if (!fs::exists(path)) {
            return fs::create_directories(path);
        }
        return true;
    } catch (const fs::filesystem_error& e) {
        metaopt::Logger::getInstance().error("FileUtils::ensureDirectoryExists", std::string("Error creating directory: ") + e.what());
        return false;
    }
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if(path2.empty()){
        return path1;
    }
    std::string rel = path2;
    if (!rel.empty() && rel[0] == '/') {
        rel = rel.substr(1);
    }
    fs::path p = fs::path(path1) / fs::path(rel);
    return p.lexically_normal().string();
}

std::string positionHeader(int n_variables, int n_dimensions, const std::string& prefix) {
    std::ostringstream oss;
    for (int j = 0; j < n_variables; ++j) {
        for (int k = 0; k < n_dimensions; ++k) {
            if (j > 0 || k > 0) oss << ",";
            oss << prefix << j << "_" << k;
        }
    }
    return oss.str();
}

static void writePosition(std::ofstream& file, const Eigen::MatrixXd& position) {
    for (Eigen::Index j = 0; j < position.rows(); ++j) {
        for (Eigen::Index k = 0; k < position.cols(); ++k) {
            file << "," << position(j, k);
        }
    }
}

static std::ofstream openForWriting(const std::string& filename, const std::string& calling_function_name) {
    const fs::path parent = fs::path(filename).parent_path();
    if (!parent.empty() && !ensureDirectoryExists(parent.string())) {
        throw metaopt::FileIOException(calling_function_name, "Unable to create directory: " + parent.string());
    }
    std::ofstream file(filename);
    if (!file.is_open()) {
        metaopt::Logger::getInstance().error(calling_function_name, "Unable to open file for writing: " + filename);
        throw metaopt::FileIOException(calling_function_name, "Unable to open file for writing: " + filename);
    }
    file << std::setprecision(17);
    return file;
}

void writeSpaceSnapshot(const std::string& filename, int iteration,
                        const metaopt::Agent& best_agent,
                        const std::vector<metaopt::Agent>& agents) {
    std::ofstream file = openForWriting(filename, "FileUtils::writeSpaceSnapshot");

    file << "# iteration " << iteration << "\n";
    file << "role,index,fitness," << positionHeader(best_agent.getNumVariables(), best_agent.getNumDimensions()) << "\n";

    file << "best,-1," << best_agent.getFitness();
    writePosition(file, best_agent.getPosition());
    file << "\n";

    for (size_t i = 0; i < agents.size(); ++i) {
        file << "agent," << i << "," << agents[i].getFitness();
        writePosition(file, agents[i].getPosition());
        file << "\n";
    }

    if (!file) {
        throw metaopt::FileIOException("FileUtils::writeSpaceSnapshot", "Error while writing: " + filename);
    }
}

void writeHistoryCSV(const std::string& filename, const metaopt::History& history) {
    std::ofstream file = openForWriting(filename, "FileUtils::writeHistoryCSV");

    file << "iteration,best_fitness,mean_fitness,variance_fitness,min_fitness,max_fitness";
    if (!history.empty()) {
        const Eigen::MatrixXd& first = history.at(0).best_agent.position;
        file << "," << positionHeader(static_cast<int>(first.rows()), static_cast<int>(first.cols()), "best_x");
    }
    file << "\n";

    for (const auto& snapshot : history.getSnapshots()) {
        file << snapshot.iteration << ","
             << snapshot.best_agent.fit << ","
             << snapshot.statistics.mean << ","
             << snapshot.statistics.variance << ","
             << snapshot.statistics.min << ","
             << snapshot.statistics.max;
        writePosition(file, snapshot.best_agent.position);
        file << "\n";
    }

    if (!file) {
        throw metaopt::FileIOException("FileUtils::writeHistoryCSV", "Error while writing: " + filename);
    }
}

} // namespace FileUtils
