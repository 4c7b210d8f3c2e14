#pragma once
#include <string>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

class Config {
public:
    std::string model_host           = "http://localhost";
    std::string user_service_url     = "http://localhost:8007";
    std::string billing_service_url  = "http://localhost:8008/api/stripe";
    std::string purchase_service_url = "http://localhost:8010";
    std::string chat_service_url     = "http://localhost:8009";
    long timeout_ms                  = 10000;
    int entitlement_poll_seconds     = 30;
    int worker_threads               = 4;
    std::string call_log             = "data/logs/client_calls.csv";

    Config() = default;

    // Missing or invalid file: keep defaults and report on stderr.
    explicit Config(const std::string& path) {
        try {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot open config file: " + path);
            }

            nlohmann::json j;
            file >> j;
            apply(j);

            std::cout << "[Config] Loaded: " << path
                      << ", model_host=" << model_host
                      << ", timeout_ms=" << timeout_ms
                      << ", poll=" << entitlement_poll_seconds << "s"
                      << "\n";

        } catch (const std::exception& e) {
            std::cerr << "[Config] Error: " << e.what()
                      << " - using defaults" << std::endl;
            *this = Config();
        }
    }

    void apply(const nlohmann::json& j) {
        model_host               = j.value("model_host", model_host);
        user_service_url         = j.value("user_service_url", user_service_url);
        billing_service_url      = j.value("billing_service_url", billing_service_url);
        purchase_service_url     = j.value("purchase_service_url", purchase_service_url);
        chat_service_url         = j.value("chat_service_url", chat_service_url);
        timeout_ms               = j.value("timeout_ms", timeout_ms);
        entitlement_poll_seconds = j.value("entitlement_poll_seconds", entitlement_poll_seconds);
        worker_threads           = j.value("worker_threads", worker_threads);
        call_log                 = j.value("call_log", call_log);

        stripTrailingSlash(model_host);
        stripTrailingSlash(user_service_url);
        stripTrailingSlash(billing_service_url);
        stripTrailingSlash(purchase_service_url);
        stripTrailingSlash(chat_service_url);

        if (timeout_ms <= 0) {
            std::cerr << "[Config] Invalid timeout_ms: " << timeout_ms
                      << ", fallback to 10000\n";
            timeout_ms = 10000;
        }
        if (entitlement_poll_seconds <= 0) {
            std::cerr << "[Config] Invalid entitlement_poll_seconds: " << entitlement_poll_seconds
                      << ", fallback to 30\n";
            entitlement_poll_seconds = 30;
        }
        if (worker_threads <= 0) worker_threads = 1;
    }

private:
    static void stripTrailingSlash(std::string& url) {
        while (!url.empty() && url.back() == '/') url.pop_back();
    }
};
