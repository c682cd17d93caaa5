// binary_tree_set.hpp
// The set's coordinator: routes operations to the current root and runs
// garbage collection by copying the live elements into a fresh tree.
// -----------------------------------------------------------
//   Normal                   ops → root;  GC → spawn new root, CopyTo(new)
//   CollectingGarbage(new)   ops → old root;  CopyFinished → root := new,
//                            Terminate → old root, back to Normal
//
// Operations keep flowing to the old tree for the whole collection, so a
// client never waits on GC.  Mutations that land in an already copied part
// of the old tree during that window are not carried over.

#ifndef ABT_BINARY_TREE_SET_HPP
#define ABT_BINARY_TREE_SET_HPP

#include <cstddef>
#include <string>
#include <variant>

#include "actor/actor.hpp"
#include "messages.hpp"

namespace abt
{

    /* Element held by every root.  The root starts tombstoned, so the value
       is a member only once it has been inserted. */
    inline constexpr int kRootElem = 0;

    class BinaryTreeSet final : public Actor
    {
    public:
        explicit BinaryTreeSet(ActorSystem &system);

        void receive(const Message &message) override;

    private:
        struct Normal
        {
        };

        struct CollectingGarbage
        {
            ActorRef new_root;
        };

        ActorRef create_root();
        void start_gc();
        void finish_gc(CollectingGarbage &state);
        void terminate();

        std::size_t roots_created_{0}; // names roots; declared before root_
        ActorRef root_;
        std::variant<Normal, CollectingGarbage> state_;
        std::size_t gc_cycles_{0};
    };

    /* Spawns a coordinator; its ref is the set's only public entry point. */
    ActorRef make_tree_set(ActorSystem &system, std::string name = "tree-set");

} // namespace abt

#endif // ABT_BINARY_TREE_SET_HPP
