//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter_Gc.cpp
/// @brief Cycle collection over the interpreter's scope registry.
///
/// @details The graph has three node types: scopes, user functions and lists.
/// Edges are the shared_ptrs one node holds to another (a scope's enclosing
/// link and bound values, a function's closure, a list's elements). For every
/// node the pass compares its strong count with the number of graph edges
/// pointing at it; any surplus comes from outside the graph and makes the node
/// a root. Scopes not reachable from a root are cleared, which breaks the
/// cycles that kept them alive.
///
//===----------------------------------------------------------------------===//

#include "interp/Interpreter.hpp"

#include <algorithm>
#include <unordered_map>

namespace roadman::interp
{

namespace
{

struct GraphNode
{
    long strong = 0;
    long internal = 0;
    bool reachable = false;
    std::vector<const void *> edges;
};

class ScopeGraph
{
  public:
    /// @brief Register a scope; @p strong excludes the collector's own copy.
    void addScope(const Environment &scope, long strong)
    {
        nodes_[&scope].strong = strong;
    }

    /// @brief Record the edges leaving @p scope.
    void scanScope(const Environment &scope)
    {
        GraphNode &node = nodes_[&scope];
        if (const auto &enclosing = scope.enclosing())
            linkScope(node, enclosing.get());
        scope.forEachValue([&](const Value &v) { scanValue(node, v); });
    }

    /// @brief Mark everything reachable from nodes referenced outside the graph.
    void markFromRoots()
    {
        std::vector<const void *> work;
        for (auto &[key, node] : nodes_)
        {
            if (node.strong > node.internal)
            {
                node.reachable = true;
                work.push_back(key);
            }
        }
        while (!work.empty())
        {
            const void *key = work.back();
            work.pop_back();
            for (const void *next : nodes_[key].edges)
            {
                GraphNode &target = nodes_[next];
                if (!target.reachable)
                {
                    target.reachable = true;
                    work.push_back(next);
                }
            }
        }
    }

    bool isReachable(const Environment &scope) const
    {
        auto it = nodes_.find(&scope);
        return it == nodes_.end() || it->second.reachable;
    }

  private:
    void linkScope(GraphNode &from, const Environment *scope)
    {
        // Scopes outside the registry are not tracked; their references
        // count as external.
        auto it = nodes_.find(scope);
        if (it == nodes_.end())
            return;
        ++it->second.internal;
        from.edges.push_back(scope);
    }

    /// @brief Link @p from to the node for @p key, creating it on first sight.
    /// @return The target node when it was just created and must be scanned.
    GraphNode *link(GraphNode &from, const void *key, long strong)
    {
        auto [it, inserted] = nodes_.try_emplace(key);
        if (inserted)
            it->second.strong = strong;
        ++it->second.internal;
        from.edges.push_back(key);
        return inserted ? &it->second : nullptr;
    }

    void scanValue(GraphNode &from, const Value &v)
    {
        switch (v.kind())
        {
            case ValueKind::List:
            {
                const ListPtr &list = v.listHandle();
                if (GraphNode *node = link(from, list.get(), list.use_count()))
                {
                    for (const auto &elem : *list)
                        scanValue(*node, elem);
                }
                break;
            }
            case ValueKind::Callable:
            {
                const CallablePtr &fn = v.asCallable();
                const auto *user = dynamic_cast<const FunctionValue *>(fn.get());
                if (!user)
                    break;
                if (GraphNode *node = link(from, user, fn.use_count()))
                {
                    if (user->closure())
                        linkScope(*node, user->closure().get());
                }
                break;
            }
            case ValueKind::Nil:
            case ValueKind::Number:
            case ValueKind::String:
            case ValueKind::Bool:
                break;
        }
    }

    std::unordered_map<const void *, GraphNode> nodes_;
};

} // namespace

size_t Interpreter::collectCycles()
{
    std::vector<std::shared_ptr<Environment>> live;
    live.reserve(scopes_.size());
    for (const auto &weak : scopes_)
    {
        if (auto scope = weak.lock())
            live.push_back(std::move(scope));
    }

    ScopeGraph graph;
    for (const auto &scope : live)
        graph.addScope(*scope, scope.use_count() - 1);
    for (const auto &scope : live)
        graph.scanScope(*scope);
    graph.markFromRoots();

    size_t released = 0;
    for (const auto &scope : live)
    {
        if (!graph.isReachable(*scope))
        {
            scope->clear();
            ++released;
        }
    }
    live.clear();

    scopes_.erase(std::remove_if(scopes_.begin(),
                                 scopes_.end(),
                                 [](const std::weak_ptr<Environment> &w) { return w.expired(); }),
                  scopes_.end());
    return released;
}

size_t Interpreter::liveScopeCount() const
{
    return static_cast<size_t>(
        std::count_if(scopes_.begin(),
                      scopes_.end(),
                      [](const std::weak_ptr<Environment> &w) { return !w.expired(); }));
}

} // namespace roadman::interp
