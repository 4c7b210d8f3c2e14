#pragma once
#include <chrono>
#include <iostream>
#include <thread>

static inline long long nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// [<ms>ms][TID <id>][TAG] message
#define LOGX(tag, msg)                                        \
    std::cout << "[" << nowMs() << "ms]"                      \
              << "[TID " << std::this_thread::get_id() << "]" \
              << "[" << tag << "] " << msg << std::endl;

#define LOGW(tag, msg)                                        \
    std::cerr << "[" << nowMs() << "ms]"                      \
              << "[TID " << std::this_thread::get_id() << "]" \
              << "[" << tag << "][WARN] " << msg << std::endl;

#define LOGE(tag, msg)                                        \
    std::cerr << "[" << nowMs() << "ms]"                      \
              << "[TID " << std::this_thread::get_id() << "]" \
              << "[" << tag << "][ERROR] " << msg << std::endl;
