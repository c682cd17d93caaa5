// binary_tree_node.hpp
// One element of the set, running as its own actor.
// -----------------------------------------------------------
// * A node owns its element, its tombstone and refs to at most two children.
//   It answers an operation on its own element directly and delegates any
//   other element to the child on that side, creating the child on the first
//   Insert that needs it.  Replies go straight to the requester.
// * During garbage collection the node copies itself (if not tombstoned) into
//   a new tree and reports CopyFinished to its parent once its own copy and
//   every child's copy have been confirmed.

#ifndef ABT_BINARY_TREE_NODE_HPP
#define ABT_BINARY_TREE_NODE_HPP

#include <cstdint>
#include <map>
#include <unordered_set>
#include <variant>

#include "actor/actor.hpp"
#include "messages.hpp"

namespace abt
{

    enum class Position : uint8_t
    {
        Left,
        Right
    };

    /* Result of comparing a target against a node's element. */
    enum class Step : uint8_t
    {
        Equal,
        GoLeft,
        GoRight
    };

    class BinaryTreeNode final : public Actor
    {
    public:
        BinaryTreeNode(ActorSystem &system, int elem, bool initially_removed) noexcept
            : Actor(system), elem_(elem), removed_(initially_removed) {}

        void receive(const Message &message) override;

        Step evaluate(int target) const noexcept
        {
            if (target == elem_)
                return Step::Equal;
            return target > elem_ ? Step::GoRight : Step::GoLeft;
        }

    private:
        /*---------------------------------------------------------------------
         *  Node states
         *---------------------------------------------------------------------
         *  Normal  – serving operations only.
         *  Copying – serving operations while its subtree is copied into a
         *            new tree.
         *      parent           – sender of the CopyTo; who we report to
         *      expected         – children that have not reported
         *                         CopyFinished, plus the parent, which stays
         *                         as the last entry
         *      insert_confirmed – own element is in the new tree (or needs
         *                         no copy because it is tombstoned)
         *      token            – id of our replication Insert
         *      reported         – CopyFinished already sent upward
         *---------------------------------------------------------------------*/
        struct Normal
        {
        };

        struct Copying
        {
            ActorRef parent;
            std::unordered_set<ActorRef> expected;
            bool insert_confirmed;
            int token;
            bool reported;
        };

        void on_insert(const Insert &op);
        void on_contains(const Contains &op);
        void on_remove(const Remove &op);

        void start_copy(const CopyTo &copy);
        void on_copy_finished();
        void on_replicated(const OperationFinished &reply);
        void report_if_complete(Copying &state);
        void terminate();

        const ActorRef *child(Position position) const;

        static Position side(Step step) noexcept
        {
            return step == Step::GoRight ? Position::Right : Position::Left;
        }

        const int elem_;
        bool removed_;
        std::map<Position, ActorRef> children_;
        std::variant<Normal, Copying> state_;
        int next_token_{0};
    };

} // namespace abt

#endif // ABT_BINARY_TREE_NODE_HPP
