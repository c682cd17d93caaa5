// actor_system.hpp
// Mailboxes and the worker pool that drives them.
// -----------------------------------------------------------
// * Every actor owns one Mailbox (FIFO of envelopes).  A mailbox with
//   pending mail sits at most once in the system's run queue, so at most one
//   worker drains it at a time: per-actor mutual exclusion without locking
//   the actor itself.
// * Delivery between a fixed sender/receiver pair is FIFO because the
//   receiver's queue is FIFO and a sender runs on one worker at a time.
// * A worker processes up to `throughput` messages from a mailbox before
//   handing it back to the run queue, so a busy actor cannot starve others.

#ifndef ABT_ACTOR_ACTOR_SYSTEM_HPP
#define ABT_ACTOR_ACTOR_SYSTEM_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "actor/actor.hpp"
#include "messages.hpp"
#include "printer.hpp"

namespace abt
{

    /*-------------------------------------------------------------------------
     *  struct SystemConfig
     *-------------------------------------------------------------------------
     *  worker_threads – size of the worker pool (must be > 0)
     *  throughput     – messages a worker takes from one mailbox per turn
     *  pin_workers    – pin worker i to core (first_core + i) % cores
     *  trace          – start a util::printer and log lifecycle events
     *  printer_core   – core the printer thread is pinned to
     *-------------------------------------------------------------------------*/
    struct SystemConfig
    {
        std::size_t worker_threads = std::max(2u, std::thread::hardware_concurrency());
        std::size_t throughput = 16;
        bool pin_workers = false;
        int first_core = 0;
        bool trace = false;
        int printer_core = 0;
    };

    struct Envelope
    {
        Message message;
        ActorRef sender;
    };

    /*-------------------------------------------------------------------------
     *  class Mailbox
     *-------------------------------------------------------------------------
     *  Owns the actor object and its pending envelopes.
     *
     *  scheduled_ – true while the mailbox is in the run queue or being
     *               drained by a worker; guards against double scheduling.
     *  closed_    – set when the actor stops; later posts are dead letters.
     *-------------------------------------------------------------------------*/
    class Mailbox : public std::enable_shared_from_this<Mailbox>
    {
    public:
        Mailbox(ActorSystem &system, std::uint64_t id, std::string name) noexcept
            : system_(system), id_(id), name_(std::move(name)) {}

        Mailbox(const Mailbox &) = delete;
        Mailbox &operator=(const Mailbox &) = delete;

        std::uint64_t id() const noexcept { return id_; }
        const std::string &name() const noexcept { return name_; }

        /* Enqueue and schedule.  Returns false, leaving `envelope` untouched,
           when the mailbox is closed. */
        bool post(Envelope &&envelope);

        /* Worker entry point: deliver up to `throughput` envelopes. */
        void run(std::size_t throughput);

        /* Close without running the actor again; used on failure and at
           system shutdown.  Returns the number of envelopes dropped. */
        std::size_t close();

    private:
        friend class ActorSystem;
        friend class ActorRef;

        bool deliver(Envelope &envelope);

        ActorSystem &system_;
        const std::uint64_t id_;
        const std::string name_;

        std::mutex mutex_;
        std::deque<Envelope> queue_;
        bool scheduled_{false};
        bool closed_{false};
        std::unique_ptr<Actor> actor_;
    };

    /*-------------------------------------------------------------------------
     *  class ActorSystem
     *-------------------------------------------------------------------------
     *  Worker pool + registry of live actors.
     *
     *  • spawn<T>(name, args...) constructs T(system, args...) and returns
     *    its ref.  Safe to call from any thread, including from inside an
     *    actor's receive().
     *  • await_idle() blocks until no envelope is queued or being processed.
     *    Tests use it to observe quiescence; actors never call it.
     *  • The registry owns every mailbox until its actor stops.  Dropping
     *    the last ActorRef to an actor does not destroy it; only stop() (and
     *    so Terminate), a failure or shutdown() does.
     *  • shutdown() joins the workers and destroys every remaining actor,
     *    one mailbox at a time.  Parent and child actors may hold refs to
     *    each other while a copy is in progress; closing them breaks those
     *    cycles.
     *-------------------------------------------------------------------------*/
    class ActorSystem
    {
    public:
        explicit ActorSystem(SystemConfig config = SystemConfig());
        ~ActorSystem();

        ActorSystem(const ActorSystem &) = delete;
        ActorSystem &operator=(const ActorSystem &) = delete;

        template <typename T, typename... Args>
        ActorRef spawn(std::string name, Args &&...args)
        {
            auto mailbox = std::make_shared<Mailbox>(
                *this, next_id_.fetch_add(1, std::memory_order_relaxed), std::move(name));
            mailbox->actor_ = std::make_unique<T>(*this, std::forward<Args>(args)...);
            register_mailbox(mailbox);
            return ActorRef(std::move(mailbox));
        }

        bool await_idle(std::chrono::milliseconds timeout);

        void shutdown();

        std::size_t live_actors() const noexcept { return live_.load(); }
        std::size_t dead_letters() const noexcept { return dead_letters_.load(); }
        std::size_t failed_actors() const noexcept { return failed_.load(); }
        const SystemConfig &config() const noexcept { return config_; }

        bool tracing() const noexcept { return printer_ != nullptr; }

        template <typename... Args>
        void log(const std::string &message, const Args &...args) const noexcept
        {
            if (printer_)
                printer_->print(message, args...);
        }

    private:
        friend class Mailbox;
        friend class ActorRef;

        void register_mailbox(std::shared_ptr<Mailbox> mailbox);
        void unregister_mailbox(std::uint64_t id) noexcept;
        void schedule(std::shared_ptr<Mailbox> mailbox);
        void worker_loop(std::size_t index);

        /* bookkeeping hooks called by Mailbox */
        void accepted() noexcept;
        void completed(std::size_t count = 1) noexcept;
        void dead_letter(const Message &message, const std::string &recipient);
        void stopped(const std::string &name, std::size_t dropped);
        void failed(const std::string &name, const char *what);

        SystemConfig config_;
        std::unique_ptr<util::printer> printer_;

        std::atomic<std::uint64_t> next_id_{1};
        std::atomic<std::size_t> live_{0};
        std::atomic<std::size_t> dead_letters_{0};
        std::atomic<std::size_t> failed_{0};

        /* envelopes accepted but not yet fully processed */
        std::atomic<std::size_t> in_flight_{0};
        std::mutex idle_mutex_;
        std::condition_variable idle_cv_;

        std::mutex run_mutex_;
        std::condition_variable run_cv_;
        std::deque<std::shared_ptr<Mailbox>> run_queue_;
        bool stopping_{false};

        std::mutex registry_mutex_;
        std::unordered_map<std::uint64_t, std::shared_ptr<Mailbox>> registry_;
        bool registry_closed_{false};

        std::vector<std::thread> workers_;
    };

} // namespace abt

#endif // ABT_ACTOR_ACTOR_SYSTEM_HPP
