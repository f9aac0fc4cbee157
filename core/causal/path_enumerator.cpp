#include "causal/path_enumerator.hpp"

#include <stdexcept>
#include <string>

namespace svcmap {

std::vector<Path> PathEnumerator::allSimplePaths(const Graph& g,
                                                 uint64_t source,
                                                 uint64_t target) {
    if (source == target) {
        return {};
    }
    if (source >= g.nodeCount() || target >= g.nodeCount()) {
        throw std::runtime_error("Path endpoint not found: " +
                                 std::to_string(source >= g.nodeCount() ? source : target));
    }

    WalkState state;
    state.graph = &g;
    state.target = target;
    state.on_stack.assign(g.nodeCount(), false);

    state.stack.push_back(source);
    state.on_stack[source] = true;
    walk(state, source);
    return state.results;
}

void PathEnumerator::walk(WalkState& state, uint64_t current) {
    for (uint64_t next : state.graph->getOutgoing(current)) {
        if (state.on_stack[next]) continue;

        if (next == state.target) {
            Path found(state.stack);
            found.nodes.push_back(next);
            state.results.push_back(std::move(found));
            continue;
        }

        // Tentatively extend
        state.stack.push_back(next);
        state.on_stack[next] = true;

        walk(state, next);

        // Undo
        state.on_stack[next] = false;
        state.stack.pop_back();
    }
}

} // namespace svcmap
