#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "readeof/decoder.hpp"
#include "readeof/filecursor.hpp"
#include "readeof/scanner.hpp"

namespace reof {

struct ReadOptions {
    Encoding    encoding    = Encoding::Utf8;
    std::size_t buffer_size = kDefaultBufferSize;   // backward chunk / follow read size
};

struct TailOptions : ReadOptions {
    std::chrono::milliseconds poll_interval{1000};

    std::chrono::milliseconds inactivity_timeout{0};  // 0 = follow until stopped
};

// Last `max_lines` lines of `path`, decoded, trailing newline preserved.
// max_lines <= 0 or an empty file give "". Throws TailError.
std::string read_last(const std::string& path, long long max_lines, ReadOptions opt = {});

// Pull-based follower: yields the last `max_lines` lines, then every line
// appended afterwards. Recovers from truncation and from the path being
// replaced; a failed stat/read reopens the path once before giving up.
class LineFollower {
public:
    enum class State { InitialRead, Watching, Stopped, Failed };

    LineFollower(std::string path, long long max_lines,
                 TailOptions opt = {}, std::stop_token stop = {});

    LineFollower(const LineFollower&) = delete;
    LineFollower& operator=(const LineFollower&) = delete;

    // Next line without its '\n'. Blocks across poll intervals; returns
    // std::nullopt once stopped. Rethrows the error that ended the follow.
    std::optional<std::string> next();

    [[nodiscard]] State         state()    const noexcept { return state_; }
    [[nodiscard]] std::uint64_t position() const noexcept { return position_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    void initial_read();
    void watch_cycle();
    void reopen();
    void finish();
    bool wait_poll_interval();
    [[nodiscard]] bool inactive() const;

    std::string      path_;
    long long        max_lines_;
    TailOptions      opt_;
    std::stop_token  stop_;

    State            state_ = State::InitialRead;
    FileCursor       file_;
    std::uint64_t    position_ = 0;
    std::string      remainder_;
    std::deque<std::string> pending_;
    std::vector<std::byte>  buf_;
    bool             need_wait_ = false;
    std::chrono::steady_clock::time_point last_activity_{};

    std::mutex                  wait_mtx_;
    std::condition_variable_any wait_cv_;
};

// Drives a LineFollower, calling on_line for each line until `stop` fires
// (or the inactivity timeout elapses).
void tail_lines(const std::string& path, long long max_lines, TailOptions opt,
                std::stop_token stop,
                const std::function<void(const std::string&)>& on_line);

} // namespace reof
