#pragma once
#include <string>
#include <mutex>
#include <fstream>

// One row per outbound call.
struct LogEntry {
    std::string timestamp;

    std::string operation;   // predict, history, rating, result, entitlements, coupon, one_time
    std::string model_alias;
    std::string url;

    long http_status;
    std::string outcome;     // ok, http_error, network_error, cancelled, unknown_model

    double confidence;
    std::string confidence_source;
    double latency_ms;
};

class Logger {
public:
    Logger(const std::string& filePath);
    ~Logger();

    void log(const LogEntry& e);
    void flush();

    bool isOpen() const { return file.is_open(); }

private:
    std::ofstream file;
    std::mutex mtx;
    int counter = 0;
};
