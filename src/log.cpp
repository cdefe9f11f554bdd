#include <jsonpatch-cpp/log.hpp>

#include <fmt/ostream.h>

#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>

namespace jsonpatch_cpp::log {

namespace {

std::atomic<Level> g_level{Level::warning};

auto sink_mutex() -> std::mutex& {
    static auto m = std::mutex{};
    return m;
}

auto current_sink() -> Sink& {
    static auto sink = Sink{};
    return sink;
}

// Keep the last 20 characters of __FILE__: enough to identify the source
// without the build machine's directory layout.
auto trim_file_name(const char* file) -> std::string_view {
    auto len = std::strlen(file);
    return (len > 20) ? std::string_view{file + len - 20, 20} : std::string_view{file, len};
}

void write_to_clog(const Record& r) {
    fmt::print(std::clog, "[{}] {}:{} {}\n", to_string_view(r.level), r.file, r.line, r.message);
}

}  // anonymous namespace

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

auto level() noexcept -> Level {
    return g_level.load(std::memory_order_relaxed);
}

void set_sink(Sink sink) {
    auto lock = std::lock_guard{sink_mutex()};
    current_sink() = std::move(sink);
}

void write(Level level, const char* file, int line, std::string_view message) {
    const auto record = Record{level, trim_file_name(file), line, message};
    auto lock = std::unique_lock{sink_mutex()};
    if (!current_sink()) {
        write_to_clog(record);
        return;
    }
    // The sink runs unlocked so it may log or replace itself.
    const auto sink = current_sink();
    lock.unlock();
    sink(record);
}

}  // namespace jsonpatch_cpp::log
