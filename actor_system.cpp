// actor_system.cpp
// Mailbox delivery, the worker pool, dead letters and shutdown.

#include "actor/actor_system.hpp"

#include <cassert>
#include <exception>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "thread/affinity.hpp"

namespace abt
{

    /*===========================================================================
     *  ActorRef / Actor
     *===========================================================================*/
    void ActorRef::tell(Message message, const ActorRef &sender) const
    {
        if (!mailbox_)
        {
            // nobody to deliver to; account it to the sender's system if any
            if (sender.mailbox_)
                sender.mailbox_->system_.dead_letter(message, "nobody");
            return;
        }

        Envelope envelope{std::move(message), sender};
        if (!mailbox_->post(std::move(envelope)))
            mailbox_->system_.dead_letter(envelope.message, mailbox_->name());
    }

    std::uint64_t ActorRef::id() const noexcept
    {
        return mailbox_ ? mailbox_->id() : 0;
    }

    const std::string &ActorRef::name() const noexcept
    {
        static const std::string nobody = "nobody";
        return mailbox_ ? mailbox_->name() : nobody;
    }

    std::ostream &operator<<(std::ostream &os, const ActorRef &ref)
    {
        if (!ref)
            return os << "nobody";
        return os << ref.name() << '#' << ref.id();
    }

    void Actor::send(const ActorRef &to, Message message) const
    {
        to.tell(std::move(message), self());
    }

    /*===========================================================================
     *  Mailbox
     *===========================================================================*/
    bool Mailbox::post(Envelope &&envelope)
    {
        bool schedule_now = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            queue_.push_back(std::move(envelope));
            system_.accepted();
            if (!scheduled_)
            {
                scheduled_ = true;
                schedule_now = true;
            }
        }
        if (schedule_now)
            system_.schedule(shared_from_this());
        return true;
    }

    void Mailbox::run(std::size_t throughput)
    {
        for (std::size_t n = 0; n != throughput; ++n)
        {
            std::optional<Envelope> next;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_ || queue_.empty())
                    break;
                next.emplace(std::move(queue_.front()));
                queue_.pop_front();
            }
            if (!deliver(*next))
                return; // actor stopped, mailbox closed
        }

        bool again = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.empty())
                scheduled_ = false;
            else
                again = true;
        }
        if (again)
            system_.schedule(shared_from_this());
    }

    bool Mailbox::deliver(Envelope &envelope)
    {
        assert(actor_);

        Context context{ActorRef(shared_from_this()), std::move(envelope.sender)};
        bool failed = false;

        actor_->context_ = &context;
        try
        {
            actor_->receive(envelope.message);
        }
        catch (const std::exception &e)
        {
            failed = true;
            system_.failed(name_, e.what());
        }
        actor_->context_ = nullptr;

        if (!failed && !context.stop_requested)
        {
            system_.completed();
            return true;
        }

        // closed before the envelope counts as done, so an idle system never
        // still shows this actor as live
        close();
        system_.completed();
        return false;
    }

    std::size_t Mailbox::close()
    {
        std::deque<Envelope> dropped;
        std::unique_ptr<Actor> actor;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return 0;
            closed_ = true;
            dropped.swap(queue_);
            actor = std::move(actor_);
        }

        const std::size_t count = dropped.size();
        if (actor)
            system_.stopped(name_, count);
        else
            system_.completed(count);
        system_.unregister_mailbox(id_);

        // destroyed outside the lock: the actor may release the last refs to
        // other mailboxes
        dropped.clear();
        actor.reset();
        return count;
    }

    /*===========================================================================
     *  ActorSystem
     *===========================================================================*/
    ActorSystem::ActorSystem(SystemConfig config)
        : config_(config)
    {
        if (config_.worker_threads == 0)
            throw std::invalid_argument("SystemConfig::worker_threads must be positive");
        if (config_.throughput == 0)
            throw std::invalid_argument("SystemConfig::throughput must be positive");

        if (config_.trace)
            printer_ = std::make_unique<util::printer>(config_.printer_core, "abt");

        workers_.reserve(config_.worker_threads);
        for (std::size_t i = 0; i < config_.worker_threads; ++i)
            workers_.emplace_back(&ActorSystem::worker_loop, this, i);

        log("actor system started with {} workers", config_.worker_threads);
    }

    ActorSystem::~ActorSystem()
    {
        shutdown();
        printer_.reset(); // drains pending log lines
    }

    void ActorSystem::register_mailbox(std::shared_ptr<Mailbox> mailbox)
    {
        live_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            if (!registry_closed_)
            {
                const std::uint64_t id = mailbox->id();
                registry_.emplace(id, std::move(mailbox));
                return;
            }
        }
        // spawned after shutdown: the actor never runs
        mailbox->close();
    }

    void ActorSystem::unregister_mailbox(std::uint64_t id) noexcept
    {
        std::shared_ptr<Mailbox> owned;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            auto it = registry_.find(id);
            if (it == registry_.end())
                return;
            owned = std::move(it->second);
            registry_.erase(it);
        }
        // the caller still holds the mailbox; `owned` is never the last ref
    }

    void ActorSystem::schedule(std::shared_ptr<Mailbox> mailbox)
    {
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            if (stopping_)
                return;
            run_queue_.push_back(std::move(mailbox));
        }
        run_cv_.notify_one();
    }

    void ActorSystem::worker_loop(std::size_t index)
    {
        if (config_.pin_workers &&
            !util::use_core(config_.first_core + static_cast<int>(index)))
            log("worker {} could not be pinned", index);

        for (;;)
        {
            std::shared_ptr<Mailbox> mailbox;
            {
                std::unique_lock<std::mutex> lock(run_mutex_);
                run_cv_.wait(lock, [this] { return stopping_ || !run_queue_.empty(); });
                if (stopping_)
                    return;
                mailbox = std::move(run_queue_.front());
                run_queue_.pop_front();
            }
            mailbox->run(config_.throughput);
        }
    }

    void ActorSystem::accepted() noexcept
    {
        in_flight_.fetch_add(1, std::memory_order_relaxed);
    }

    void ActorSystem::completed(std::size_t count) noexcept
    {
        if (count == 0)
            return;
        // acq_rel: a waiter that sees zero also sees every effect of the
        // messages that got it there
        if (in_flight_.fetch_sub(count, std::memory_order_acq_rel) == count)
        {
            std::lock_guard<std::mutex> lock(idle_mutex_);
            idle_cv_.notify_all();
        }
    }

    bool ActorSystem::await_idle(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(idle_mutex_);
        return idle_cv_.wait_for(lock, timeout, [this]
                                 { return in_flight_.load(std::memory_order_acquire) == 0; });
    }

    void ActorSystem::dead_letter(const Message &message, const std::string &recipient)
    {
        dead_letters_.fetch_add(1);
        if (tracing())
        {
            std::ostringstream oss;
            oss << message;
            log("dead letter to {}: {}", recipient, oss.str());
        }
    }

    void ActorSystem::stopped(const std::string &name, std::size_t dropped)
    {
        live_.fetch_sub(1);
        if (dropped != 0)
        {
            dead_letters_.fetch_add(dropped);
            completed(dropped);
            log("{} stopped, {} queued messages dropped", name, dropped);
        }
    }

    void ActorSystem::failed(const std::string &name, const char *what)
    {
        failed_.fetch_add(1);
        log("{} failed and is stopped: {}", name, what);
        if (!tracing())
            util::eprintln("abt: actor {} failed and is stopped: {}", name, what);
    }

    void ActorSystem::shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            if (stopping_)
                return;
            stopping_ = true;
        }
        run_cv_.notify_all();
        for (auto &worker : workers_)
            if (worker.joinable())
                worker.join();
        workers_.clear();

        // hold every surviving mailbox before letting go of the run queue, so
        // each actor is closed (and counted) exactly once
        std::vector<std::shared_ptr<Mailbox>> remaining;
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            registry_closed_ = true;
            remaining.reserve(registry_.size());
            for (auto &entry : registry_)
                remaining.push_back(entry.second);
        }
        {
            std::lock_guard<std::mutex> lock(run_mutex_);
            run_queue_.clear();
        }
        for (auto &mailbox : remaining)
            mailbox->close();
        remaining.clear();

        log("actor system stopped: {} dead letters, {} failed actors",
            dead_letters_.load(), failed_.load());
    }

} // namespace abt
