#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <sstream>

namespace metaopt {

    inline std::string buildErrorMessage(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << file << ":" << line << " (" << functionName << ")] " << category << ": " << message;
        return oss.str();
    }

/**
 * @brief Base exception for the optimization framework.
 */
class MetaOptException : public std::runtime_error {
public:
    /**
     * @brief Construct a MetaOptException.
     * @param functionName Name of the function where the error occurred.
     * @param message Descriptive error message.
     */
    MetaOptException(const std::string& functionName, const std::string& message)
        : std::runtime_error("[" + functionName + "] " + message),
          functionName_(functionName), file_(""), line_(0) {}
    MetaOptException(const char* file, int line, const std::string& functionName, const std::string& category, const std::string& message)
        : std::runtime_error(buildErrorMessage(file, line, functionName, category, message)),
          functionName_(functionName), file_(file), line_(line) {}

    /**
     * @brief Get the originating function's name.
     * @return const std::string& Function name.
     */
    const std::string& getFunctionName() const noexcept {
        return functionName_;
    }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    std::string functionName_;
    const char* file_;
    int line_;
};

/**
 * @brief Exception for parameter values outside their valid range
 *        (non-positive counts, mismatched bound lengths, hyperparameters out of range).
 */
class InvalidParameterException : public MetaOptException {
public:
    /**
     * @brief Construct an InvalidParameterException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the invalid parameter.
     */
    InvalidParameterException(const std::string& functionName, const std::string& message)
        : MetaOptException(functionName, message) {}
    InvalidParameterException(const char* file, int line, const std::string& functionName, const std::string& message)
        : MetaOptException(file, line, functionName, "InvalidParameter", message) {}
};

/**
 * @brief Exception for parameters of the wrong kind (non-numeric value,
 *        non-boolean flag, missing callable).
 */
class ParameterTypeException : public MetaOptException {
public:
    /**
     * @brief Construct a ParameterTypeException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the expected type.
     */
    ParameterTypeException(const std::string& functionName, const std::string& message)
        : MetaOptException(functionName, message) {}
    ParameterTypeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : MetaOptException(file, line, functionName, "ParameterType", message) {}
};

/**
 * @brief Exception for objective function failures.
 */
class EvaluationException : public MetaOptException {
public:
    /**
     * @brief Construct an EvaluationException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the evaluation error.
     */
    EvaluationException(const std::string& functionName, const std::string& message)
        : MetaOptException(functionName, "Evaluation Error: " + message) {}
};

/**
 * @brief Exception for file input/output errors.
 */
class FileIOException : public MetaOptException {
public:
    /**
     * @brief Construct a FileIOException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the file I/O error.
     */
    FileIOException(const std::string& functionName, const std::string& message)
        : MetaOptException(functionName, "File IO Error: " + message) {}
};

/**
 * @brief Exception for data parsing or format errors.
 */
class DataFormatException : public MetaOptException {
public:
    /**
     * @brief Construct a DataFormatException.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the formatting error.
     */
    DataFormatException(const std::string& functionName, const std::string& message)
        : MetaOptException(functionName, "Data Format Error: " + message) {}
};

/**
 * @brief Exception for out-of-range access.
 */
class OutOfRangeException : public MetaOptException {
public:
    /**
     * @brief Construct an OutOfRangeException.
     * @param file File where the error occurred.
     * @param line Line number where the error occurred.
     * @param functionName Name of the function where the error occurred.
     * @param message Details about the out-of-range access.
     */
    OutOfRangeException(const char* file, int line, const std::string& functionName, const std::string& message)
        : MetaOptException(file, line, functionName, "OutOfRange", message) {}
};

} // namespace metaopt

#define THROW_INVALID_PARAM(func, msg) throw metaopt::InvalidParameterException(__FILE__, __LINE__, func, msg)
#define THROW_TYPE_ERROR(func, msg) throw metaopt::ParameterTypeException(__FILE__, __LINE__, func, msg)
#define THROW_OUT_OF_RANGE(func, msg) throw metaopt::OutOfRangeException(__FILE__, __LINE__, func, msg)

#endif // EXCEPTIONS_HPP
