// reply_probe.hpp
// A client endpoint for driving the set from ordinary threads.
// -----------------------------------------------------------
// The probe spawns a tiny actor whose only job is to move every reply it
// receives into a thread-safe inbox; the owning thread then blocks on that
// inbox with a timeout.  Used by the tests, the stress test and the demo.

#ifndef ABT_REPLY_PROBE_HPP
#define ABT_REPLY_PROBE_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "actor/actor_system.hpp"
#include "messages.hpp"

namespace abt
{

    class ReplyInbox
    {
    public:
        void push(OperationReply reply)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                replies_.push_back(std::move(reply));
                ++received_;
            }
            cv_.notify_all();
        }

        std::optional<OperationReply> pop(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!cv_.wait_for(lock, timeout, [this] { return !replies_.empty(); }))
                return std::nullopt;
            OperationReply reply = std::move(replies_.front());
            replies_.pop_front();
            return reply;
        }

        /* First queued reply carrying `id`; replies with other ids stay queued. */
        std::optional<OperationReply> pop_id(int id, std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto match = replies_.end();
            auto found = [&] {
                match = std::find_if(replies_.begin(), replies_.end(),
                                     [id](const OperationReply &r) { return id_of(r) == id; });
                return match != replies_.end();
            };
            if (!cv_.wait_for(lock, timeout, found))
                return std::nullopt;
            OperationReply reply = std::move(*match);
            replies_.erase(match);
            return reply;
        }

        std::size_t received() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return received_;
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<OperationReply> replies_;
        std::size_t received_{0};
    };

    class ProbeActor final : public Actor
    {
    public:
        ProbeActor(ActorSystem &system, std::shared_ptr<ReplyInbox> inbox) noexcept
            : Actor(system), inbox_(std::move(inbox)) {}

        void receive(const Message &message) override
        {
            if (auto reply = as_reply(message))
                inbox_->push(std::move(*reply));
            else if (message.is<Terminate>())
                stop();
        }

    private:
        std::shared_ptr<ReplyInbox> inbox_;
    };

    class ReplyProbe
    {
    public:
        static constexpr std::chrono::milliseconds kDefaultTimeout{5000};

        explicit ReplyProbe(ActorSystem &system, std::string name = "probe")
            : inbox_(std::make_shared<ReplyInbox>()),
              ref_(system.spawn<ProbeActor>(std::move(name), inbox_))
        {
        }

        ~ReplyProbe() { ref_.tell(Terminate{}); }

        ReplyProbe(const ReplyProbe &) = delete;
        ReplyProbe &operator=(const ReplyProbe &) = delete;

        const ActorRef &ref() const noexcept { return ref_; }

        void insert(const ActorRef &set, int id, int elem) const
        {
            set.tell(Insert{ref_, id, elem}, ref_);
        }
        void contains(const ActorRef &set, int id, int elem) const
        {
            set.tell(Contains{ref_, id, elem}, ref_);
        }
        void remove(const ActorRef &set, int id, int elem) const
        {
            set.tell(Remove{ref_, id, elem}, ref_);
        }

        /* Next reply in arrival order, or nullopt on timeout. */
        std::optional<OperationReply> expect(std::chrono::milliseconds timeout = kDefaultTimeout)
        {
            return inbox_->pop(timeout);
        }

        std::optional<OperationReply> expect_id(int id,
                                                std::chrono::milliseconds timeout = kDefaultTimeout)
        {
            return inbox_->pop_id(id, timeout);
        }

        /* true if nothing arrives within `window` */
        bool expect_no_reply(std::chrono::milliseconds window)
        {
            return !inbox_->pop(window).has_value();
        }

        /* Blocking request/reply helpers for sequential tests.  Each returns
           nullopt if the reply does not arrive, or arrives with another id. */
        std::optional<bool> ask_contains(const ActorRef &set, int id, int elem,
                                         std::chrono::milliseconds timeout = kDefaultTimeout)
        {
            contains(set, id, elem);
            auto reply = expect(timeout);
            if (!reply)
                return std::nullopt;
            auto *result = std::get_if<ContainsResult>(&*reply);
            if (result == nullptr || result->id != id)
                return std::nullopt;
            return result->result;
        }

        bool ask_insert(const ActorRef &set, int id, int elem,
                        std::chrono::milliseconds timeout = kDefaultTimeout)
        {
            insert(set, id, elem);
            return finished(expect(timeout), id);
        }

        bool ask_remove(const ActorRef &set, int id, int elem,
                        std::chrono::milliseconds timeout = kDefaultTimeout)
        {
            remove(set, id, elem);
            return finished(expect(timeout), id);
        }

        std::size_t received() const { return inbox_->received(); }

    private:
        static bool finished(const std::optional<OperationReply> &reply, int id)
        {
            return reply && std::holds_alternative<OperationFinished>(*reply) &&
                   id_of(*reply) == id;
        }

        std::shared_ptr<ReplyInbox> inbox_;
        ActorRef ref_;
    };

} // namespace abt

#endif // ABT_REPLY_PROBE_HPP
