#include "../include/options.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace miniiter {

logger::Level ParseLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return logger::Level::DEBUG;
    if (lower == "info") return logger::Level::INFO;
    if (lower == "warning" || lower == "warn") return logger::Level::WARNING;
    if (lower == "error") return logger::Level::ERROR;
    throw std::runtime_error("Unknown log level: " + name);
}

Options Options::FromJson(const std::string& text) {
    Options options;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            throw std::runtime_error("Options must be a JSON object");
        }
        if (j.contains("log")) {
            const auto& log_json = j.at("log");
            auto& cfg = options.log;
            if (log_json.contains("dir")) cfg.log_dir = log_json.at("dir").get<std::string>();
            if (log_json.contains("stdout")) cfg.use_stdout = log_json.at("stdout").get<bool>();
            if (log_json.contains("level")) cfg.min_level = ParseLevel(log_json.at("level").get<std::string>());
            if (log_json.contains("max_file_size")) cfg.max_file_size = log_json.at("max_file_size").get<size_t>();
            if (log_json.contains("max_files")) cfg.max_files = log_json.at("max_files").get<size_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid options JSON: ") + e.what());
    }
    return options;
}

Options Options::FromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open options file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    Options options = FromJson(buffer.str());
    LOG_INFO("Loaded options from %s", path.string().c_str());
    return options;
}

void Options::Apply() const {
    logger::Logger::instance().configure(log);
    LOG_INFO("Logger configured: level=%s stdout=%d",
             logger::LevelName(log.min_level), log.use_stdout ? 1 : 0);
}

} // namespace miniiter
