// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// A dedicated consumer thread writes queued lines to stderr so that neither the
// host tick nor a background coroutine ever waits on terminal I/O. Provides:
//  - Level filtering via FIRETICK_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines via FIRETICK_LOG_JSON presence
//  - Optional app id prefix via FIRETICK_LOG_APP_ID
//  - Optional external sink callback (set_callback), e.g. for an in-game console
//  - fingerprint() to log credentials without leaking them

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace firetick::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {
struct line
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

struct state
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::mutex q_mtx;
    std::condition_variable q_cv;
    std::deque<line> queue;
    std::mutex io_mtx; // guards stderr, app_id and sink
    std::string app_id;
    std::function<void(level, const std::string &)> sink;
    std::thread consumer;
};

inline state &g()
{
    static state s;
    return s;
}

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug" || v == "trace")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

template <typename T>
inline std::string to_text(const T &v)
{
    if constexpr (std::is_same_v<std::decay_t<T>, std::string>)
        return v;
    else if constexpr (std::is_same_v<std::decay_t<T>, const char *> || std::is_same_v<std::decay_t<T>, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<std::decay_t<T>, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_arithmetic_v<T> && !std::is_floating_point_v<T>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        if constexpr (std::is_floating_point_v<T>)
            oss.setf(std::ios::fixed, std::ios::floatfield);
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" with the next argument; surplus arguments are appended
// space-separated, surplus placeholders are left as-is.
template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        std::array<std::string, sizeof...(Args)> values{to_text(args)...};
        std::string out;
        out.reserve(fmt.size() + values.size() * 8);
        size_t pos = 0;
        size_t idx = 0;
        while (idx < values.size()) {
            size_t p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[idx++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; idx < values.size(); ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}

inline void emit(const line &ln)
{
    auto &s = g();
    std::time_t tt = std::chrono::system_clock::to_time_t(ln.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::lock_guard lk(s.io_mtx);
    if (s.json.load(std::memory_order_relaxed)) {
        std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                  << level_name(ln.lv) << '"';
        if (!s.app_id.empty())
            std::cerr << ",\"app\":\"" << s.app_id << '"';
        std::cerr << ",\"msg\":\"";
        for (char c : ln.msg) {
            if (c == '"' || c == '\\')
                std::cerr << '\\' << c;
            else if (c == '\n')
                std::cerr << "\\n";
            else
                std::cerr << c;
        }
        std::cerr << "\"}" << std::endl;
    } else {
        char buf[16];
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
        const char *tag = ln.lv == level::debug ? "D" : ln.lv == level::info ? "I" : ln.lv == level::warn ? "W" : "E";
        if (!s.app_id.empty())
            std::cerr << s.app_id << ' ';
        std::cerr << '[' << tag << ' ' << buf << "] " << ln.msg << std::endl;
    }
    if (s.sink)
        s.sink(ln.lv, ln.msg);
}

inline void consume()
{
    auto &s = g();
    for (;;) {
        std::deque<line> local;
        {
            std::unique_lock lk(s.q_mtx);
            s.q_cv.wait(lk, [&] { return !s.running.load(std::memory_order_acquire) || !s.queue.empty(); });
            if (!s.running.load(std::memory_order_acquire) && s.queue.empty())
                break;
            local.swap(s.queue);
        }
        for (auto &ln : local)
            emit(ln);
    }
}

inline void shutdown()
{
    auto &s = g();
    if (!s.running.exchange(false, std::memory_order_acq_rel))
        return;
    s.q_cv.notify_all();
    if (s.consumer.joinable())
        s.consumer.join();
}

inline void start()
{
    auto &s = g();
    if (s.started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("FIRETICK_LOG_LEVEL"))
        s.min_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("FIRETICK_LOG_JSON"))
        s.json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("FIRETICK_LOG_APP_ID")) {
        std::lock_guard lk(s.io_mtx);
        s.app_id.assign(app);
    }
    s.running.store(true, std::memory_order_release);
    s.consumer = std::thread([] { consume(); });
    std::atexit([] { shutdown(); });
}
} // namespace detail

inline void init()
{
    detail::start();
}

inline void set_level(level lv) noexcept
{
    detail::g().min_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_level(std::string_view name)
{
    set_level(detail::parse_level(name));
}

inline void set_json(bool on) noexcept
{
    detail::g().json.store(on, std::memory_order_relaxed);
}

inline void set_app_id(std::string id)
{
    std::lock_guard lk(detail::g().io_mtx);
    detail::g().app_id = std::move(id);
}

inline void set_callback(std::function<void(level, const std::string &)> cb)
{
    std::lock_guard lk(detail::g().io_mtx);
    detail::g().sink = std::move(cb);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::g().min_level.load(std::memory_order_relaxed);
}

// Short, stable, non-reversible tag for a credential ("tok1abcd..." -> "tok1..(12)").
inline std::string fingerprint(std::string_view secret)
{
    if (secret.empty())
        return "<none>";
    std::string out(secret.substr(0, std::min<size_t>(4, secret.size())));
    out += "..(" + std::to_string(secret.size()) + ")";
    return out;
}

inline void write(level lv, std::string msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto &s = detail::g();
    if (!s.running.load(std::memory_order_acquire)) {
        // consumer already stopped (static destruction); write synchronously
        detail::emit(detail::line{lv, std::move(msg), std::chrono::system_clock::now()});
        return;
    }
    {
        std::lock_guard lk(s.q_mtx);
        s.queue.push_back(detail::line{lv, std::move(msg), std::chrono::system_clock::now()});
    }
    s.q_cv.notify_one();
}

template <typename... Args>
inline void debug(std::string_view fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail::format(fmt, args...));
}

template <typename... Args>
inline void info(std::string_view fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail::format(fmt, args...));
}

template <typename... Args>
inline void warn(std::string_view fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail::format(fmt, args...));
}

template <typename... Args>
inline void error(std::string_view fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail::format(fmt, args...));
}

} // namespace firetick::log
