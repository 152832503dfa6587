#include "readeof/tail.hpp"

#include <algorithm>
#include <span>
#include <string_view>
#include <utility>

namespace reof {
namespace {

    constexpr std::chrono::milliseconds kDefaultPoll{1000};

    inline std::size_t chunk_size(const ReadOptions& opt) {
        return opt.buffer_size > 0 ? opt.buffer_size : kDefaultBufferSize;
    }

    // [start, size) of the last max_lines lines, decoded.
    std::string read_tail_region(FileCursor& file, std::size_t max_lines, const ReadOptions& opt) {
        const std::uint64_t size  = file.size();
        const std::uint64_t start = find_start_offset(file, max_lines, chunk_size(opt));

        std::vector<std::byte> region(static_cast<std::size_t>(size - start));
        if (!region.empty()) file.read_exact(region, start);
        return decode(region, opt.encoding);
    }

    // Queues every non-empty '\n'-separated piece of text except the last,
    // which is returned (possibly empty, possibly a partial line).
    std::string split_lines(std::string_view text, std::deque<std::string>& out) {
        std::size_t start = 0;
        for (;;) {
            const std::size_t nl = text.find('\n', start);
            if (nl == std::string_view::npos) break;
            if (nl > start) out.emplace_back(text.substr(start, nl - start));
            start = nl + 1;
        }
        return std::string(text.substr(start));
    }

}

std::string read_last(const std::string& path, long long max_lines, ReadOptions opt)
{
    FileCursor file = FileCursor::open(path);
    if (max_lines <= 0 || file.size() == 0) return {};
    return read_tail_region(file, static_cast<std::size_t>(max_lines), opt);
}

LineFollower::LineFollower(std::string path, long long max_lines,
                           TailOptions opt, std::stop_token stop)
    : path_(std::move(path))
    , max_lines_(max_lines)
    , opt_(opt)
    , stop_(std::move(stop))
{
    if (opt_.poll_interval.count() <= 0) opt_.poll_interval = kDefaultPoll;
    opt_.buffer_size = chunk_size(opt_);
}

std::optional<std::string> LineFollower::next()
{
    for (;;) {
        if (!pending_.empty()) {
            std::string line = std::move(pending_.front());
            pending_.pop_front();
            return line;
        }

        try {
            switch (state_) {
            case State::InitialRead:
                initial_read();
                state_ = State::Watching;
                break;

            case State::Watching:
                if (need_wait_) {
                    need_wait_ = false;
                    if (!wait_poll_interval()) { finish(); break; }
                }
                if (stop_.stop_requested() || inactive()) { finish(); break; }
                watch_cycle();
                need_wait_ = true;
                break;

            case State::Stopped:
            case State::Failed:
                return std::nullopt;
            }
        } catch (...) {
            state_ = State::Failed;
            file_.close();
            remainder_.clear();
            throw;
        }
    }
}

void LineFollower::initial_read()
{
    file_ = FileCursor::open(path_);
    buf_.resize(opt_.buffer_size);

    if (max_lines_ > 0 && file_.size() > 0) {
        const std::string text = read_tail_region(file_, static_cast<std::size_t>(max_lines_), opt_);
        const std::string last = split_lines(text, pending_);
        if (!last.empty()) pending_.push_back(last);
    }

    position_      = file_.size();
    last_activity_ = std::chrono::steady_clock::now();
}

void LineFollower::watch_cycle()
{
    // rotated: the path now names a different file
    if (file_.replaced_on_disk()) reopen();

    const auto size = file_.try_stat();
    if (!size) { reopen(); return; }

    if (*size < position_) {
        // truncated
        position_ = 0;
        remainder_.clear();
    }

    if (*size > position_) {
        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buf_.size(), *size - position_));

        const auto got = file_.try_read_at(std::span<std::byte>(buf_.data(), want), position_);
        if (!got) { reopen(); return; }

        if (*got > 0) {
            position_     += *got;
            last_activity_ = std::chrono::steady_clock::now();

            std::string text = std::move(remainder_);
            text += decode(std::span<const std::byte>(buf_.data(), *got), opt_.encoding);
            remainder_ = split_lines(text, pending_);
        }
    }
}

void LineFollower::reopen()
{
    file_.close();
    position_ = 0;
    remainder_.clear();
    file_ = FileCursor::open(path_);
}

void LineFollower::finish()
{
    if (!remainder_.empty()) pending_.push_back(std::exchange(remainder_, {}));
    file_.close();
    state_ = State::Stopped;
}

bool LineFollower::wait_poll_interval()
{
    std::unique_lock lock(wait_mtx_);
    // the predicate never turns true: only the timeout or a stop ends the wait
    (void)wait_cv_.wait_for(lock, stop_, opt_.poll_interval, [] { return false; });
    return !stop_.stop_requested();
}

bool LineFollower::inactive() const
{
    if (opt_.inactivity_timeout.count() <= 0) return false;
    return std::chrono::steady_clock::now() - last_activity_ > opt_.inactivity_timeout;
}

void tail_lines(const std::string& path, long long max_lines, TailOptions opt,
                std::stop_token stop,
                const std::function<void(const std::string&)>& on_line)
{
    LineFollower follower(path, max_lines, opt, std::move(stop));
    while (auto line = follower.next()) {
        if (on_line) on_line(*line);
    }
}

} // namespace reof
