#pragma once

#include <cstdio>
#include <mutex>
#include <string>

//
// thread safe log module
//

class LogUtils {
public:
    enum LogLock {
        LOG_STDOUT,
        LOG_STDERR,
        LOG_RESULT,
        LOG_COUNT
    };

    static void set_debug(bool enabled) noexcept;
    static bool debug_enabled() noexcept;

    // Mirror info/warn/error lines into a result file, empty path closes it
    static void open_result_file(const std::string& path);
    static void close_result_file();
    static FILE* result_file() noexcept;

    static std::mutex& lock(LogLock idx);

    // "[MM/DD HH:MM:SS.uuuuuu] "
    static void print_timestamp(FILE* fp);

private:
    static bool debug_;
    static FILE* result_fp_;
};

#define PFCONVERT_LOG_TO_RESULT(tag, fmt, ...)                              \
    do {                                                                    \
        if (LogUtils::result_file()) {                                      \
            std::lock_guard<std::mutex> result_guard_(                      \
                LogUtils::lock(LogUtils::LOG_RESULT));                      \
            LogUtils::print_timestamp(LogUtils::result_file());             \
            fprintf(LogUtils::result_file(), tag fmt, ##__VA_ARGS__);       \
            fflush(LogUtils::result_file());                                \
        }                                                                   \
    } while (0)

#define debugPrint(fmt, ...)                                                \
    do {                                                                    \
        if (LogUtils::debug_enabled()) {                                    \
            std::lock_guard<std::mutex> log_guard_(                         \
                LogUtils::lock(LogUtils::LOG_STDOUT));                      \
            LogUtils::print_timestamp(stdout);                              \
            fprintf(stdout, "DEBG: ");                                      \
            fprintf(stdout, "%s(%d) ", __FILE__, __LINE__);                 \
            fprintf(stdout, "" fmt, ##__VA_ARGS__);                         \
        }                                                                   \
    } while (0)

#define infoPrint(fmt, ...)                                                 \
    do {                                                                    \
        {                                                                   \
            std::lock_guard<std::mutex> log_guard_(                         \
                LogUtils::lock(LogUtils::LOG_STDOUT));                      \
            LogUtils::print_timestamp(stdout);                              \
            fprintf(stdout, "INFO: " fmt, ##__VA_ARGS__);                   \
        }                                                                   \
        PFCONVERT_LOG_TO_RESULT("INFO: ", fmt, ##__VA_ARGS__);              \
    } while (0)

#define warnPrint(fmt, ...)                                                 \
    do {                                                                    \
        {                                                                   \
            std::lock_guard<std::mutex> log_guard_(                         \
                LogUtils::lock(LogUtils::LOG_STDERR));                      \
            LogUtils::print_timestamp(stderr);                              \
            fprintf(stderr, "\033[33m");                                    \
            fprintf(stderr, "WARN: ");                                      \
            if (LogUtils::debug_enabled()) {                                \
                fprintf(stderr, "%s(%d) ", __FILE__, __LINE__);             \
            }                                                               \
            fprintf(stderr, "" fmt, ##__VA_ARGS__);                         \
            fprintf(stderr, "\033[0m");                                     \
        }                                                                   \
        PFCONVERT_LOG_TO_RESULT("WARN: ", fmt, ##__VA_ARGS__);              \
    } while (0)

#define errorPrint(fmt, ...)                                                \
    do {                                                                    \
        {                                                                   \
            std::lock_guard<std::mutex> log_guard_(                         \
                LogUtils::lock(LogUtils::LOG_STDERR));                      \
            LogUtils::print_timestamp(stderr);                              \
            fprintf(stderr, "\033[31m");                                    \
            fprintf(stderr, "ERROR: ");                                     \
            if (LogUtils::debug_enabled()) {                                \
                fprintf(stderr, "%s(%d) ", __FILE__, __LINE__);             \
            }                                                               \
            fprintf(stderr, "" fmt, ##__VA_ARGS__);                         \
            fprintf(stderr, "\033[0m");                                     \
        }                                                                   \
        PFCONVERT_LOG_TO_RESULT("ERROR: ", fmt, ##__VA_ARGS__);             \
    } while (0)
