#include "LogUtils.h"
#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <sys/time.h>


bool LogUtils::debug_ = false;
FILE* LogUtils::result_fp_ = nullptr;

void LogUtils::set_debug(bool enabled) noexcept {
    debug_ = enabled;
}

bool LogUtils::debug_enabled() noexcept {
    return debug_;
}

std::mutex& LogUtils::lock(LogLock idx) {
    static std::array<std::mutex, LOG_COUNT> locks;
    return locks[idx];
}

void LogUtils::open_result_file(const std::string& path) {
    close_result_file();
    if (path.empty()) {
        return;
    }

    FILE* fp = fopen(path.c_str(), "a");
    if (!fp) {
        throw std::runtime_error("Failed to open log file: " + path + " - " + std::strerror(errno));
    }

    std::lock_guard<std::mutex> guard(lock(LOG_RESULT));
    result_fp_ = fp;
}

void LogUtils::close_result_file() {
    std::lock_guard<std::mutex> guard(lock(LOG_RESULT));
    if (result_fp_) {
        fclose(result_fp_);
        result_fp_ = nullptr;
    }
}

FILE* LogUtils::result_file() noexcept {
    return result_fp_;
}

void LogUtils::print_timestamp(FILE* fp) {
    struct timeval time_secs;
    gettimeofday(&time_secs, nullptr);

    time_t cur_time = time_secs.tv_sec;
    struct tm tm_buf;
    localtime_r(&cur_time, &tm_buf);

    fprintf(fp, "[%02d/%02d %02d:%02d:%02d.%06d] ",
            tm_buf.tm_mon + 1,
            tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
            static_cast<int32_t>(time_secs.tv_usec));
}
