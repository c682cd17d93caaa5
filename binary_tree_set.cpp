// binary_tree_set.cpp

#include "binary_tree_set.hpp"

#include <string>

#include "actor/actor_system.hpp"
#include "binary_tree_node.hpp"

namespace abt
{

    BinaryTreeSet::BinaryTreeSet(ActorSystem &system)
        : Actor(system), root_(create_root())
    {
    }

    ActorRef BinaryTreeSet::create_root()
    {
        return system().spawn<BinaryTreeNode>("root:" + std::to_string(roots_created_++),
                                              kRootElem, true);
    }

    void BinaryTreeSet::receive(const Message &message)
    {
        if (message.is<Insert>() || message.is<Contains>() || message.is<Remove>())
        {
            // both states: the tree being served is root_
            root_.tell(message, sender());
            return;
        }

        if (message.is<GC>())
        {
            if (std::holds_alternative<Normal>(state_))
                start_gc();
            else
                system().log("gc requested while collecting, ignored");
            return;
        }

        if (message.is<CopyFinished>())
        {
            if (auto *collecting = std::get_if<CollectingGarbage>(&state_))
                finish_gc(*collecting);
            return;
        }

        if (message.is<Terminate>())
            terminate();
    }

    void BinaryTreeSet::start_gc()
    {
        ActorRef new_root = create_root();
        system().log("gc {} started: copying {} into {}", gc_cycles_ + 1, root_, new_root);
        send(root_, CopyTo{new_root});
        state_ = CollectingGarbage{std::move(new_root)};
    }

    void BinaryTreeSet::finish_gc(CollectingGarbage &state)
    {
        ActorRef old_root = std::move(root_);
        root_ = std::move(state.new_root);
        send(old_root, Terminate{});
        state_ = Normal{};
        ++gc_cycles_;
        system().log("gc {} finished: root is now {}", gc_cycles_, root_);
    }

    void BinaryTreeSet::terminate()
    {
        send(root_, Terminate{});
        if (auto *collecting = std::get_if<CollectingGarbage>(&state_))
            send(collecting->new_root, Terminate{});
        stop();
    }

    ActorRef make_tree_set(ActorSystem &system, std::string name)
    {
        return system.spawn<BinaryTreeSet>(std::move(name));
    }

} // namespace abt
