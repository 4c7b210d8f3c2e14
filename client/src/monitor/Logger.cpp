#include "monitor/Logger.hpp"

#include <filesystem>
#include <iostream>

// Quotes a CSV field when it contains a separator, quote or newline.
static std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

Logger::Logger(const std::string& filePath) {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(filePath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    // tellp() is 0 right after opening in append mode, so ask the filesystem.
    bool fresh = !std::filesystem::exists(filePath, ec) || std::filesystem::file_size(filePath, ec) == 0;

    file.open(filePath, std::ios::out | std::ios::app);
    if (!file.is_open()) {
        std::cerr << "[Logger] Cannot open call log: " << filePath << "\n";
        return;
    }
    if (fresh) {
        file << "timestamp,"
        "operation,"
        "model_alias,"
        "url,"
        "http_status,"
        "outcome,"
        "confidence,"
        "confidence_source,"
        "latency_ms\n";
    }
}

Logger::~Logger() {
    flush();
    file.close();
}

void Logger::log(const LogEntry& e) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!file.is_open()) return;

    file << e.timestamp << ","
     << e.operation << ","
     << csvField(e.model_alias) << ","
     << csvField(e.url) << ","
     << e.http_status << ","
     << e.outcome << ","
     << e.confidence << ","
     << e.confidence_source << ","
     << e.latency_ms << "\n";

    counter++;
    if (counter % 50 == 0)
        file.flush();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    file.flush();
}
