#ifndef BYTESUTIL_LOGGER_PR_HPP
#define BYTESUTIL_LOGGER_PR_HPP

#include <stdio.h>
#include <atomic>
#include <string>

namespace bytesutil {
namespace logger {

// 日志级别：数值越大输出越详细
enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

extern std::atomic<LogLevel> g_pr_level;

// 线程安全的日志级别设置
void pr_set_level(LogLevel level);
LogLevel pr_get_level();

// 输出目标，默认 stdout；传入 nullptr 恢复为 stdout
void pr_set_output(FILE* out);
FILE* pr_get_output();

// 解析 "error" / "warn" / "info" / "debug"（不区分大小写），无法识别时返回 fallback
LogLevel pr_parse_level(const char* text, LogLevel fallback);

// 从环境变量 BYTESUTIL_LOG_LEVEL 读取级别，未设置时保持当前级别
void pr_init_from_env();

const char* pr_level_name(LogLevel level);

// 辅助函数
std::string thread_id_to_string();

// 主日志宏
#define BU_PR_INTERNAL(level, tag, format, ...) \
    do { \
        if (static_cast<int>(level) <= \
            static_cast<int>(bytesutil::logger::g_pr_level.load(std::memory_order_relaxed))) { \
            fprintf(bytesutil::logger::pr_get_output(), \
                    "[%-5s][%s:%d][TID:%s] " format "\n", \
                    tag, __FUNCTION__, __LINE__, \
                    bytesutil::logger::thread_id_to_string().c_str(), ##__VA_ARGS__); \
        } \
    } while (0)

// 具体日志级别宏
#define BU_DEBUG(format, ...) \
    BU_PR_INTERNAL(bytesutil::logger::LogLevel::DEBUG, "DEBUG", format, ##__VA_ARGS__)

#define BU_INFO(format, ...) \
    BU_PR_INTERNAL(bytesutil::logger::LogLevel::INFO, "INFO", format, ##__VA_ARGS__)

#define BU_WARN(format, ...) \
    BU_PR_INTERNAL(bytesutil::logger::LogLevel::WARN, "WARN", format, ##__VA_ARGS__)

#define BU_ERROR(format, ...) \
    BU_PR_INTERNAL(bytesutil::logger::LogLevel::ERROR, "ERROR", format, ##__VA_ARGS__)

} // namespace logger
} // namespace bytesutil

#endif // BYTESUTIL_LOGGER_PR_HPP
