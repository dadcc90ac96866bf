#include "lark/logging.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <system_error>

namespace lark::log {

namespace {

std::atomic<Level> threshold {Level::INFO};
std::mutex sink_mutex;
std::ofstream file_sink;

auto level_name(Level const level) -> char const*
{
    switch (level) {
    case Level::DEBUG: return "DEBUG";
    case Level::INFO: return "INFO";
    case Level::WARNING: return "WARNING";
    case Level::ERROR: return "ERROR";
    default: return "?";
    }
}

} // namespace

auto set_level(Level const level) -> void
{
    threshold = level;
}

auto enabled(Level const level) -> bool
{
    return level >= threshold.load();
}

auto parse_level(std::string_view const name) -> std::optional<Level>
{
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warning") return Level::WARNING;
    if (name == "error") return Level::ERROR;
    return std::nullopt;
}

auto set_file(std::string const& path) -> void
{
    std::lock_guard const lock{sink_mutex};
    file_sink.close();
    if (path.empty()) return;

    file_sink.open(path, std::ios::app);
    if (not file_sink)
    {
        throw std::system_error{errno, std::generic_category(), "failed to open log file " + path};
    }
}

auto write(Level const level, std::string_view const location, std::string_view const message) -> void
{
    auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm;
    gmtime_r(&now, &tm);

    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ") << ' '
       << std::left << std::setw(7) << level_name(level) << ' '
       << location << ": " << message << '\n';
    auto const line = os.str();

    std::lock_guard const lock{sink_mutex};
    std::cerr << line << std::flush;
    if (file_sink.is_open())
    {
        file_sink << line << std::flush;
    }
}

} // namespace lark::log
