// messages.hpp
// Every message exchanged by clients, the coordinator and tree nodes.
// -----------------------------------------------------------
// Client contract:
//   Insert / Contains / Remove  →  coordinator
//   OperationFinished / ContainsResult  →  requester (exactly once per op)
//   GC  →  coordinator (no reply)
// Internal:
//   CopyTo / CopyFinished  between nodes during garbage collection
//   Terminate              cascading shutdown of a (sub)tree

#ifndef ABT_MESSAGES_HPP
#define ABT_MESSAGES_HPP

#include <iosfwd>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "actor/actor.hpp"

namespace abt
{

    /*===========================================================================
     *  Operations (client → set)
     *===========================================================================*/
    struct Insert
    {
        ActorRef requester;
        int id;
        int elem;
    };

    struct Contains
    {
        ActorRef requester;
        int id;
        int elem;
    };

    struct Remove
    {
        ActorRef requester;
        int id;
        int elem;
    };

    /*===========================================================================
     *  Replies (set → requester)
     *===========================================================================*/
    struct OperationFinished
    {
        int id;
    };

    struct ContainsResult
    {
        int id;
        bool result;
    };

    /*===========================================================================
     *  Control
     *===========================================================================*/
    struct GC
    {
    };

    struct CopyTo
    {
        ActorRef new_root;
    };

    struct CopyFinished
    {
    };

    struct Terminate
    {
    };

    using Operation = std::variant<Insert, Contains, Remove>;
    using OperationReply = std::variant<OperationFinished, ContainsResult>;

    using MessageBody = std::variant<Insert, Contains, Remove,
                                     OperationFinished, ContainsResult,
                                     GC, CopyTo, CopyFinished, Terminate>;

    /*-------------------------------------------------------------------------
     *  struct Message
     *-------------------------------------------------------------------------
     *  The one type carried by mailboxes.  Implicitly constructible from any
     *  of the alternatives above, and from the Operation / OperationReply
     *  sub-variants.
     *-------------------------------------------------------------------------*/
    struct Message
    {
        MessageBody body;

        template <typename T,
                  typename = std::enable_if_t<
                      std::is_constructible_v<MessageBody, T &&> &&
                      !std::is_same_v<std::decay_t<T>, Message>>>
        Message(T &&alternative) : body(std::forward<T>(alternative)) {}

        Message(const Operation &op);
        Message(const OperationReply &reply);

        template <typename T>
        bool is() const noexcept { return std::holds_alternative<T>(body); }

        template <typename T>
        const T *get_if() const noexcept { return std::get_if<T>(&body); }
    };

    /* Field access shared by all three operations. */
    const ActorRef &requester_of(const Operation &op) noexcept;
    int id_of(const Operation &op) noexcept;
    int elem_of(const Operation &op) noexcept;
    int id_of(const OperationReply &reply) noexcept;

    /* Narrow a message to one family; nullopt when it belongs to another. */
    std::optional<Operation> as_operation(const Message &message);
    std::optional<OperationReply> as_reply(const Message &message);

    inline bool operator==(const OperationFinished &a, const OperationFinished &b) noexcept
    {
        return a.id == b.id;
    }
    inline bool operator==(const ContainsResult &a, const ContainsResult &b) noexcept
    {
        return a.id == b.id && a.result == b.result;
    }

    std::ostream &operator<<(std::ostream &os, const Message &message);
    std::ostream &operator<<(std::ostream &os, const Operation &op);
    std::ostream &operator<<(std::ostream &os, const OperationReply &reply);

} // namespace abt

#endif // ABT_MESSAGES_HPP
