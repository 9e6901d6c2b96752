#pragma once

#if defined(_WIN32) && defined(_MSC_VER)
  #pragma warning(push)
  #pragma warning(disable : 4996) // getenv deprecation
#endif

#include <array>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// Enabled through the environment:
// PSRELAY_DEBUG=1
// PSRELAY_DEBUG_PATH=/tmp/psrelay.log
// PSRELAY_DEBUG_EXCLUDE=ENCODING,PLAN

namespace psrelay {
namespace dev {

// Thread-safe file logger. The file is opened on first use.
class Logger {
public:
    static constexpr size_t kMaxExcludedTags = 16;

    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // If path is empty the previous (or default) path is kept.
    void enable(bool on, std::string path = {}) {
        std::lock_guard<std::mutex> lk(mx_);
        if (!path.empty() && path != path_) {
            close_nolock_();
            path_ = std::move(path);
        }
        enabled_.store(on, std::memory_order_relaxed);
        if (on) {
            open_nolock_();
        } else {
            close_nolock_();
        }
    }

    bool enabled() const noexcept { return enabled_.load(std::memory_order_relaxed); }

    const std::string& path() const noexcept { return path_; }

    void logf(const char* tag, const char* fmt, ...) {
        if (!enabled()) return;
        if (is_excluded_(tag)) return;

        va_list ap;
        va_start(ap, fmt);
        std::string body = vformat_(fmt, ap);
        va_end(ap);

        const std::string ts = timestamp_();
        const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());

        std::lock_guard<std::mutex> lk(mx_);
        if (!fh_) open_nolock_();
        if (!fh_) return;
        std::fprintf(fh_, "[%s] [%s] [tid=%llu] %s\n",
                     ts.c_str(), tag ? tag : "-",
                     static_cast<unsigned long long>(tid), body.c_str());
        std::fflush(fh_);
    }

private:
    Logger() {
        const char* env_on   = std::getenv("PSRELAY_DEBUG");
        const char* env_path = std::getenv("PSRELAY_DEBUG_PATH");
        const char* env_excl = std::getenv("PSRELAY_DEBUG_EXCLUDE");
        parse_excluded_(env_excl);

        if (env_path && *env_path) path_ = env_path;
        if (env_on && *env_on == '1') {
            enabled_.store(true);
            logf("LOGGER", "psrelay debug enabled, path=%s exclude=%s",
                 path_.empty() ? "(default)" : path_.c_str(),
                 env_excl ? env_excl : "(none)");
        }
    }
    ~Logger() { close_nolock_(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string vformat_(const char* fmt, va_list ap) {
        va_list copy;
        va_copy(copy, ap);
        const int need = std::vsnprintf(nullptr, 0, fmt, copy);
        va_end(copy);
        if (need <= 0) return {};
        std::vector<char> buf(static_cast<size_t>(need) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, ap);
        return std::string(buf.data(), static_cast<size_t>(need));
    }

    static std::string timestamp_() {
        auto now    = std::chrono::system_clock::now();
        auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - secs).count();
        std::time_t t = std::chrono::system_clock::to_time_t(secs);
        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif
        char ts[40];
        std::snprintf(ts, sizeof(ts), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec,
                      static_cast<long long>(millis));
        return ts;
    }

    void parse_excluded_(const char* list) {
        excluded_count_ = 0;
        if (!list) return;
        std::string_view rest(list);
        while (!rest.empty() && excluded_count_ < kMaxExcludedTags) {
            const size_t comma = rest.find(',');
            std::string_view item = rest.substr(0, comma);
            if (!item.empty()) excluded_[excluded_count_++] = std::string(item);
            if (comma == std::string_view::npos) break;
            rest.remove_prefix(comma + 1);
        }
    }

    bool is_excluded_(const char* tag) const {
        if (!tag) return false;
        for (size_t i = 0; i < excluded_count_; ++i) {
            if (excluded_[i] == tag) return true;
        }
        return false;
    }

    void open_nolock_() {
        if (fh_) return;
        if (path_.empty()) path_ = "psrelay_debug.log";
#if defined(_WIN32)
        fopen_s(&fh_, path_.c_str(), "ab");
#else
        fh_ = std::fopen(path_.c_str(), "ab");
#endif
        if (fh_) {
            std::fprintf(fh_, "----- psrelay debug start -----\n");
            std::fflush(fh_);
        }
    }

    void close_nolock_() {
        if (fh_) {
            std::fprintf(fh_, "----- psrelay debug stop ------\n");
            std::fclose(fh_);
            fh_ = nullptr;
        }
    }

    std::atomic<bool> enabled_{false};
    std::array<std::string, kMaxExcludedTags> excluded_{};
    size_t excluded_count_{0};
    std::string path_;
    std::mutex mx_;
    std::FILE* fh_{nullptr};
};

}} // namespace psrelay::dev

// Keeps call sites short; arguments are not evaluated while logging is off.
#define PSRELAY_DBG(TAG, FMT, ...) \
    do { if (::psrelay::dev::Logger::instance().enabled()) \
        ::psrelay::dev::Logger::instance().logf(TAG, FMT, ##__VA_ARGS__); } while (0)

#if defined(_WIN32) && defined(_MSC_VER)
  #pragma warning(pop)
#endif
