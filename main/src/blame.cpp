#include "blame.hpp"

#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

BlameEngine::BlameEngine(BlameOptions options)
    : options_(options) {}

BlameStats BlameEngine::run(PackageGraph& graph) const {
    BlameStats stats;
    for (auto& [name, node] : graph.nodes()) {
        visit(graph, node, stats);
    }
    for (const auto& [name, node] : graph.nodes()) {
        if (!node.collapsed() && !node.is_root()) ++stats.cycle_survivors;
    }
    return stats;
}

// Postorder walk with an explicit stack: a node uploads its blame only after
// all the children reachable within max_depth have uploaded theirs.
void BlameEngine::visit(PackageGraph& graph, PackageNode& start, BlameStats& stats) const {
    std::vector<Frame> stack;
    stack.reserve(static_cast<size_t>(std::max(options_.max_depth, 0)) + 1);

    auto enter = [&](PackageNode& node, int depth) {
        ++stats.visits;
        if (options_.trace) {
            log_trace(depth, string_format("trace.visit", node.name, node.dep_parents.size(), node.dep_children.size()));
        }
        if (node.collapsed()) return; // already visited
        stack.push_back({&node, depth, node.dep_children.cbegin()});
    };

    enter(start, 0);
    while (!stack.empty()) {
        Frame& frame = stack.back();
        PackageNode& node = *frame.node;

        if (frame.next_child != node.dep_children.cend()) {
            if (frame.depth >= options_.max_depth) {
                // Break dependency loops, the remaining children stay pending
                ++stats.depth_cutoffs;
                if (options_.trace) {
                    log_trace(frame.depth, string_format("trace.skip_dep", *frame.next_child));
                }
                frame.next_child = node.dep_children.cend();
                continue;
            }
            const std::string& child_name = *frame.next_child;
            ++frame.next_child;
            const int child_depth = frame.depth + 1;
            enter(graph.at(child_name), child_depth); // may invalidate frame
            continue;
        }

        const int depth = frame.depth;
        stack.pop_back();
        // Reached when the node sits in a dependency loop and was collapsed
        // deeper in this same walk
        if (node.collapsed()) continue;
        upload_blame(graph, node, depth, stats);
    }
}

void BlameEngine::upload_blame(PackageGraph& graph, PackageNode& node, int depth, BlameStats& stats) const {
    if (node.dep_parents.empty()) return; // root, keeps accumulating

    const bool has_pending_parent = std::any_of(node.dep_parents.begin(), node.dep_parents.end(),
        [&](const std::string& parent) { return !graph.at(parent).collapsed(); });
    if (!has_pending_parent) {
        // Closed loop: nobody left to take the size, keep it here
        if (options_.trace) log_trace(depth, get_string("trace.keep_blame"));
        return;
    }

    const auto np = node.dep_parents.size();
    const double blame_up = node.collapse() / static_cast<double>(np);
    ++stats.collapsed;
    if (options_.trace) log_trace(depth, string_format("trace.upload_blame", np));

    for (const auto& parent_name : node.dep_parents) {
        // Parents collapsed while breaking a loop lose their share, a
        // negligible loss in accuracy
        if (!graph.at(parent_name).receive(blame_up)) {
            stats.dropped_bytes += blame_up;
        }
    }
}
