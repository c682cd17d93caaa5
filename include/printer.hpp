#ifndef UTIL_PRINTER_HPP
#define UTIL_PRINTER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <iomanip>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>

#include "print.hpp"
#include "thread/affinity.hpp"

namespace util
{

// Asynchronous line logger. Callers format and enqueue; a dedicated thread
// writes the lines in submission order, each prefixed with the time elapsed
// since the printer started.
class printer final
{
public:
    inline explicit printer(int core_id, std::string tag = "") noexcept;
    inline ~printer() noexcept;

    template <typename... Args>
    void print(const std::string& message, const Args&... args) noexcept;

    // Stops accepting lines; everything already queued is still written.
    inline void stop() noexcept;

    printer()                          = delete;
    printer(const printer&)            = delete;
    printer(printer&&)                 = delete;
    printer& operator=(const printer&) = delete;
    printer& operator=(printer&&)      = delete;

private:
    using clock = std::chrono::steady_clock;

    void push(std::string value) noexcept
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push(std::move(value));
        }
        cv_.notify_one();
    }

    inline void flush() noexcept;

    std::queue<std::string> queue_;
    std::mutex              queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool>       running_;
    std::string             tag_;
    clock::time_point       start_;
    std::thread             printer_thread_;
};

printer::printer(int core_id, std::string tag) noexcept
    : running_(true), tag_(std::move(tag)), start_(clock::now())
{
    this->printer_thread_ = std::thread([this, core_id]
    {
        [[maybe_unused]] bool success = use_core(core_id);
        this->flush();
    });
}

printer::~printer() noexcept
{
    this->stop();
    if (this->printer_thread_.joinable()) this->printer_thread_.join();
}

void printer::stop() noexcept
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        this->running_.store(false);
    }
    cv_.notify_all();
}

template <typename... Args>
void printer::print(const std::string& message, const Args&... args) noexcept
{
    if (!this->running_.load(std::memory_order_relaxed)) return;

    const auto elapsed =
        std::chrono::duration<double, std::milli>(clock::now() - start_);

    std::ostringstream oss;
    oss << "[+" << std::fixed << std::setprecision(3) << elapsed.count() << "ms]";
    if (!tag_.empty()) oss << " [" << tag_ << "]";
    oss << ' ' << format(message, args...);

    this->push(oss.str());
}

void printer::flush() noexcept
{
    std::unique_lock<std::mutex> lock(this->queue_mutex_);
    for (;;)
    {
        cv_.wait(lock, [this] { return !queue_.empty() || !this->running_; });

        while (!this->queue_.empty())
        {
            std::string content = std::move(this->queue_.front());
            this->queue_.pop();
            lock.unlock();
            // written raw: the line was formatted by print()
            std::fputs(content.c_str(), stdout);
            std::fputc('\n', stdout);
            lock.lock();
        }

        if (!this->running_)
        {
            std::fflush(stdout);
            return;
        }
    }
}

}  // namespace util

#endif  // UTIL_PRINTER_HPP
