// messages.cpp

#include "messages.hpp"

#include <ostream>

namespace abt
{

    Message::Message(const Operation &op)
        : body(std::visit([](const auto &alternative) -> MessageBody
                          { return alternative; }, op))
    {
    }

    Message::Message(const OperationReply &reply)
        : body(std::visit([](const auto &alternative) -> MessageBody
                          { return alternative; }, reply))
    {
    }

    const ActorRef &requester_of(const Operation &op) noexcept
    {
        return std::visit([](const auto &o) -> const ActorRef & { return o.requester; }, op);
    }

    int id_of(const Operation &op) noexcept
    {
        return std::visit([](const auto &o) { return o.id; }, op);
    }

    int elem_of(const Operation &op) noexcept
    {
        return std::visit([](const auto &o) { return o.elem; }, op);
    }

    int id_of(const OperationReply &reply) noexcept
    {
        return std::visit([](const auto &r) { return r.id; }, reply);
    }

    std::optional<Operation> as_operation(const Message &message)
    {
        if (auto *m = message.get_if<Insert>())
            return Operation(*m);
        if (auto *m = message.get_if<Contains>())
            return Operation(*m);
        if (auto *m = message.get_if<Remove>())
            return Operation(*m);
        return std::nullopt;
    }

    std::optional<OperationReply> as_reply(const Message &message)
    {
        if (auto *m = message.get_if<OperationFinished>())
            return OperationReply(*m);
        if (auto *m = message.get_if<ContainsResult>())
            return OperationReply(*m);
        return std::nullopt;
    }

    std::ostream &operator<<(std::ostream &os, const Operation &op)
    {
        const char *kind = std::holds_alternative<Insert>(op)     ? "Insert"
                           : std::holds_alternative<Contains>(op) ? "Contains"
                                                                  : "Remove";
        return os << kind << "(requester=" << requester_of(op)
                  << ", id=" << id_of(op) << ", elem=" << elem_of(op) << ')';
    }

    std::ostream &operator<<(std::ostream &os, const OperationReply &reply)
    {
        if (auto *r = std::get_if<ContainsResult>(&reply))
            return os << "ContainsResult(id=" << r->id << ", result="
                      << (r->result ? "true" : "false") << ')';
        return os << "OperationFinished(id=" << id_of(reply) << ')';
    }

    std::ostream &operator<<(std::ostream &os, const Message &message)
    {
        if (auto op = as_operation(message))
            return os << *op;
        if (auto reply = as_reply(message))
            return os << *reply;
        if (auto *copy = message.get_if<CopyTo>())
            return os << "CopyTo(" << copy->new_root << ')';
        if (message.is<GC>())
            return os << "GC";
        if (message.is<CopyFinished>())
            return os << "CopyFinished";
        return os << "Terminate";
    }

} // namespace abt
