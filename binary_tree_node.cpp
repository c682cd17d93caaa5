// binary_tree_node.cpp

#include "binary_tree_node.hpp"

#include <cassert>
#include <string>
#include <utility>

#include "actor/actor_system.hpp"

namespace abt
{

    void BinaryTreeNode::receive(const Message &message)
    {
        if (auto *insert = message.get_if<Insert>())
            on_insert(*insert);
        else if (auto *contains = message.get_if<Contains>())
            on_contains(*contains);
        else if (auto *remove = message.get_if<Remove>())
            on_remove(*remove);
        else if (auto *copy = message.get_if<CopyTo>())
        {
            // a subtree is copied once per node lifetime
            if (std::holds_alternative<Normal>(state_))
                start_copy(*copy);
        }
        else if (message.is<CopyFinished>())
            on_copy_finished();
        else if (auto *finished = message.get_if<OperationFinished>())
            on_replicated(*finished);
        else if (message.is<Terminate>())
            terminate();
        // GC and ContainsResult are never addressed to a node
    }

    /*===========================================================================
     *  Operations
     *===========================================================================*/
    void BinaryTreeNode::on_insert(const Insert &op)
    {
        const Step step = evaluate(op.elem);
        if (step == Step::Equal)
        {
            removed_ = false;
            send(op.requester, OperationFinished{op.id});
            return;
        }

        const Position position = side(step);
        if (const ActorRef *next = child(position))
        {
            next->tell(op, sender());
            return;
        }

        // the new child starts live; no need to wait for it before replying
        children_.emplace(position,
                          system().spawn<BinaryTreeNode>("node:" + std::to_string(op.elem),
                                                         op.elem, false));
        send(op.requester, OperationFinished{op.id});
    }

    void BinaryTreeNode::on_contains(const Contains &op)
    {
        const Step step = evaluate(op.elem);
        if (step == Step::Equal)
        {
            send(op.requester, ContainsResult{op.id, !removed_});
            return;
        }

        if (const ActorRef *next = child(side(step)))
            next->tell(op, sender());
        else
            send(op.requester, ContainsResult{op.id, false});
    }

    void BinaryTreeNode::on_remove(const Remove &op)
    {
        const Step step = evaluate(op.elem);
        if (step == Step::Equal)
        {
            removed_ = true;
            send(op.requester, OperationFinished{op.id});
            return;
        }

        // removing an absent element succeeds without change
        if (const ActorRef *next = child(side(step)))
            next->tell(op, sender());
        else
            send(op.requester, OperationFinished{op.id});
    }

    const ActorRef *BinaryTreeNode::child(Position position) const
    {
        auto it = children_.find(position);
        return it == children_.end() ? nullptr : &it->second;
    }

    /*===========================================================================
     *  Copy protocol
     *===========================================================================*/
    void BinaryTreeNode::start_copy(const CopyTo &copy)
    {
        Copying state{sender(), {}, removed_, next_token_++, false};
        for (const auto &entry : children_)
            state.expected.insert(entry.second);
        state.expected.insert(state.parent);

        for (const auto &entry : children_)
            send(entry.second, CopyTo{copy.new_root});

        // a tombstoned element is simply not copied
        if (!state.insert_confirmed)
            send(copy.new_root, Insert{self(), state.token, elem_});

        state_ = std::move(state);

        // a tombstoned leaf has nothing to wait for
        report_if_complete(std::get<Copying>(state_));
    }

    void BinaryTreeNode::on_replicated(const OperationFinished &reply)
    {
        auto *state = std::get_if<Copying>(&state_);
        if (state == nullptr || reply.id != state->token)
            return;

        state->insert_confirmed = true;
        report_if_complete(*state);
    }

    void BinaryTreeNode::on_copy_finished()
    {
        auto *state = std::get_if<Copying>(&state_);
        if (state == nullptr)
            return;

        if (sender() != state->parent)
            state->expected.erase(sender());
        report_if_complete(*state);
    }

    void BinaryTreeNode::report_if_complete(Copying &state)
    {
        if (state.reported || !state.insert_confirmed || state.expected.size() != 1)
            return;

        assert(*state.expected.begin() == state.parent);
        state.reported = true;
        send(state.parent, CopyFinished{});
    }

    void BinaryTreeNode::terminate()
    {
        for (const auto &entry : children_)
            send(entry.second, Terminate{});
        stop();
    }

} // namespace abt
