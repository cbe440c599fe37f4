#include "pr.hpp"

#include <cstdlib>
#include <sstream>
#include <strings.h>
#include <thread>

namespace bytesutil {
namespace logger {

std::atomic<LogLevel> g_pr_level{LogLevel::INFO};

namespace {
    std::atomic<FILE*> g_pr_output{nullptr};
}

void pr_set_level(LogLevel level) {
    g_pr_level.store(level, std::memory_order_relaxed);
}

LogLevel pr_get_level() {
    return g_pr_level.load(std::memory_order_relaxed);
}

void pr_set_output(FILE* out) {
    g_pr_output.store(out, std::memory_order_release);
}

FILE* pr_get_output() {
    FILE* out = g_pr_output.load(std::memory_order_acquire);
    return out != nullptr ? out : stdout;
}

namespace {
    bool parse_level_name(const char* text, LogLevel& out) {
        if (text == nullptr || *text == '\0') return false;
        if (strcasecmp(text, "error") == 0) { out = LogLevel::ERROR; return true; }
        if (strcasecmp(text, "warn") == 0 || strcasecmp(text, "warning") == 0) { out = LogLevel::WARN; return true; }
        if (strcasecmp(text, "info") == 0) { out = LogLevel::INFO; return true; }
        if (strcasecmp(text, "debug") == 0) { out = LogLevel::DEBUG; return true; }
        return false;
    }
}

LogLevel pr_parse_level(const char* text, LogLevel fallback) {
    LogLevel level = fallback;
    return parse_level_name(text, level) ? level : fallback;
}

void pr_init_from_env() {
    const char* env = std::getenv("BYTESUTIL_LOG_LEVEL");
    if (env == nullptr) {
        return;
    }
    LogLevel level = pr_get_level();
    if (!parse_level_name(env, level)) {
        BU_WARN("Unrecognized BYTESUTIL_LOG_LEVEL '%s', keeping %s",
                env, pr_level_name(pr_get_level()));
        return;
    }
    pr_set_level(level);
}

const char* pr_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
    }
    return "unknown";
}

std::string thread_id_to_string() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

} // namespace logger
} // namespace bytesutil
