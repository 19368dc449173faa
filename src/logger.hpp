#pragma once
#include <chrono>
#include <iostream>
#include <cstdint>
#include <string_view>
#include <cstdlib>   // getenv
#include <iomanip>
#include <string>

namespace logger {
using clock_t = std::chrono::steady_clock;
inline const auto g_t0 = clock_t::now();

inline uint64_t ms_since_start() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(clock_t::now() - g_t0).count();
}
inline bool verbose() {
    const char* v = std::getenv("VERBOSE");
    return v && *v && std::string_view(v) != "0";
}

inline thread_local const char* tlabel = "main";  // set per-thread
} // namespace logger

#define LOG_TO(stream, msg) do { \
    stream << "[" << std::setw(6) << logger::ms_since_start() << " ms] " \
           << logger::tlabel << ": " << msg << std::endl; \
} while(0)

#define LOG_ALWAYS(msg) LOG_TO(std::cout, msg)
#define LOG_ERR(msg) LOG_TO(std::cerr, msg)
#define LOG_DBG(msg) do { if (logger::verbose()) LOG_ALWAYS(msg); } while(0)
