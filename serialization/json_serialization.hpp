#ifndef BREPKIT_SERIALIZATION_JSON_SERIALIZATION_HPP
#define BREPKIT_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace brepkit::json {

// Version of the JSON envelope written by the command line tools
constexpr const char* SERIALIZATION_VERSION = "0.1.0";

// Envelope around a command's JSON output
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;           // Name of the command that produced it
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        j["step"] = step;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!source_file.empty()) j["source_file"] = source_file;
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }

    static SerializedData from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("data")) {
            throw std::runtime_error("Serialized data has no 'data' member");
        }
        SerializedData result;
        result.version = j.value("version", "unknown");
        result.step = j.value("step", "unknown");
        result.timestamp = j.value("timestamp", "");
        result.source_file = j.value("source_file", "");
        if (j.contains("config")) result.config = j["config"];
        if (j.contains("stats")) result.stats = j["stats"];
        result.data = j["data"];
        return result;
    }
};

// Current UTC time in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << text;
    if (!file) {
        throw std::runtime_error("Failed writing file: " + path);
    }
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    write_text_file(path, j.dump(2));
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, data.to_json());
}

}  // namespace brepkit::json

#endif // BREPKIT_SERIALIZATION_JSON_SERIALIZATION_HPP
