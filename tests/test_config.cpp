#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include "utils/Config.hpp"

namespace {

std::string writeTemp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path.string();
}

} // namespace

TEST_CASE("Config loads values and keeps defaults for missing keys", "[config]") {
    std::string path = writeTemp("nrl_predict_config_ok.json", R"({
        "model_host": "http://models.internal/",
        "user_service_url": "https://users.example.com",
        "chat_service_url": "http://chat.internal:8009/",
        "timeout_ms": 2500
    })");

    Config cfg(path);
    REQUIRE(cfg.model_host == "http://models.internal");
    REQUIRE(cfg.user_service_url == "https://users.example.com");
    REQUIRE(cfg.chat_service_url == "http://chat.internal:8009");
    REQUIRE(cfg.timeout_ms == 2500);
    REQUIRE(cfg.entitlement_poll_seconds == 30);
    REQUIRE(cfg.worker_threads == 4);

    std::filesystem::remove(path);
}

TEST_CASE("Config falls back to defaults", "[config]") {
    SECTION("Missing file") {
        Config cfg("/nonexistent/dir/client.json");
        REQUIRE(cfg.model_host == "http://localhost");
        REQUIRE(cfg.timeout_ms == 10000);
    }

    SECTION("Invalid JSON") {
        std::string path = writeTemp("nrl_predict_config_bad.json", "{ not json");
        Config cfg(path);
        REQUIRE(cfg.entitlement_poll_seconds == 30);
        std::filesystem::remove(path);
    }

    SECTION("Out-of-range values") {
        std::string path = writeTemp("nrl_predict_config_range.json",
                                     R"({"timeout_ms": -5, "entitlement_poll_seconds": 0, "worker_threads": 0})");
        Config cfg(path);
        REQUIRE(cfg.timeout_ms == 10000);
        REQUIRE(cfg.entitlement_poll_seconds == 30);
        REQUIRE(cfg.worker_threads == 1);
        std::filesystem::remove(path);
    }
}
