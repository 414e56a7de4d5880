#pragma once

#include <filesystem>
#include <string>

#include "logger.hpp"

namespace miniiter {

/**
 * @brief Library-wide settings.
 *
 * JSON layout, every key optional:
 * @code
 * { "log": { "dir": "/tmp/x", "stdout": false, "level": "info",
 *            "max_file_size": 1048576, "max_files": 3 } }
 * @endcode
 */
class Options {
public:
    // Logger destination and verbosity
    logger::LogConfig log;

    Options() = default;

    /**
     * @brief Parses options from a JSON document.
     *
     * @throws std::runtime_error on malformed JSON, a wrongly typed field or
     *         an unknown level name
     */
    static Options FromJson(const std::string& text);

    /**
     * @brief Reads and parses a JSON options file.
     *
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static Options FromFile(const std::filesystem::path& path);

    // Hands the logger settings to the process-wide logger
    void Apply() const;
};

/**
 * @brief Maps "debug", "info", "warning" or "error" (any case) to a level.
 *
 * @throws std::runtime_error for any other name
 */
logger::Level ParseLevel(const std::string& name);

} // namespace miniiter
