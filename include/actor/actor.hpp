// actor.hpp
// Actor handles and the actor base class.
// -----------------------------------------------------------
// * An ActorRef is the only way to reach an actor: it names the actor's
//   mailbox, never the actor object, so no two actors share mutable state.
// * An Actor is driven by its ActorSystem: receive() is called for one
//   message at a time, never concurrently with itself, on whichever worker
//   thread currently owns the mailbox.

#ifndef ABT_ACTOR_ACTOR_HPP
#define ABT_ACTOR_ACTOR_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace abt
{

    struct Message;      // messages.hpp
    class Mailbox;       // actor_system.hpp
    class ActorSystem;   // actor_system.hpp

    /*-------------------------------------------------------------------------
     *  class ActorRef
     *-------------------------------------------------------------------------
     *  • Copyable, comparable and hashable handle to one actor's mailbox.
     *  • A default-constructed ref names nobody; telling it produces a dead
     *    letter, exactly like telling an actor that has already stopped.
     *  • A ref does not own the actor: the system keeps a running actor
     *    alive with no refs at all, and a stopped actor's object is
     *    destroyed even while refs to it remain.
     *  • Refs must not be told anything once their ActorSystem has been
     *    destroyed; declare them after the system so they go first.
     *-------------------------------------------------------------------------*/
    class ActorRef
    {
    public:
        ActorRef() = default;
        explicit ActorRef(std::shared_ptr<Mailbox> mailbox) noexcept
            : mailbox_(std::move(mailbox)) {}

        /* Enqueue `message` for this actor; `sender` is what the receiver
           sees as sender().  Undeliverable messages become dead letters. */
        void tell(Message message, const ActorRef &sender = ActorRef()) const;

        std::uint64_t id() const noexcept;
        const std::string &name() const noexcept;

        explicit operator bool() const noexcept { return mailbox_ != nullptr; }

        friend bool operator==(const ActorRef &a, const ActorRef &b) noexcept
        {
            return a.mailbox_ == b.mailbox_;
        }
        friend bool operator!=(const ActorRef &a, const ActorRef &b) noexcept
        {
            return !(a == b);
        }

    private:
        friend struct std::hash<ActorRef>;

        std::shared_ptr<Mailbox> mailbox_;
    };

    std::ostream &operator<<(std::ostream &os, const ActorRef &ref);

    /*-------------------------------------------------------------------------
     *  struct Context
     *-------------------------------------------------------------------------
     *  Per-message view handed to an actor while it runs: who it is, who sent
     *  the current message, and whether it asked to stop.  Built by the
     *  mailbox for every delivery, so the actor never stores a ref to itself.
     *-------------------------------------------------------------------------*/
    struct Context
    {
        ActorRef self;
        ActorRef sender;
        bool stop_requested{false};
    };

    /*-------------------------------------------------------------------------
     *  class Actor
     *-------------------------------------------------------------------------
     *  Base of every actor.  Subclasses implement receive(); the helpers
     *  below are only meaningful inside receive().
     *-------------------------------------------------------------------------*/
    class Actor
    {
    public:
        explicit Actor(ActorSystem &system) noexcept : system_(system) {}
        virtual ~Actor() = default;

        Actor(const Actor &) = delete;
        Actor &operator=(const Actor &) = delete;

        virtual void receive(const Message &message) = 0;

    protected:
        const ActorRef &self() const noexcept { return context_->self; }
        const ActorRef &sender() const noexcept { return context_->sender; }
        ActorSystem &system() const noexcept { return system_; }

        /* tell() with this actor as the sender */
        void send(const ActorRef &to, Message message) const;

        /* Stop after the current message; queued messages are dropped. */
        void stop() noexcept { context_->stop_requested = true; }

    private:
        friend class Mailbox;

        ActorSystem &system_;
        Context *context_{nullptr};
    };

} // namespace abt

namespace std
{
    template <>
    struct hash<abt::ActorRef>
    {
        size_t operator()(const abt::ActorRef &ref) const noexcept
        {
            return std::hash<std::shared_ptr<abt::Mailbox>>{}(ref.mailbox_);
        }
    };
} // namespace std

#endif // ABT_ACTOR_ACTOR_HPP
