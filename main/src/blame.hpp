#pragma once

#include "config.hpp"
#include "graph.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

struct BlameOptions {
    // Children of a node reached at this depth are not followed; this is
    // what breaks dependency loops.
    int max_depth = DEFAULT_MAX_DEPTH;
    bool trace = false;
};

struct BlameStats {
    std::size_t visits = 0;
    std::size_t collapsed = 0;
    std::size_t depth_cutoffs = 0;
    // Non-root nodes left pending because all their parents had collapsed
    std::size_t cycle_survivors = 0;
    // Shares addressed to parents that were already collapsed
    double dropped_bytes = 0;
};

// Moves the size of every non-root package onto its direct dependents,
// split equally, until the size is concentrated on root packages.
class BlameEngine {
public:
    explicit BlameEngine(BlameOptions options = {});

    // Starts a traversal from every node in name order. Running it again on
    // the same graph changes nothing.
    BlameStats run(PackageGraph& graph) const;

private:
    struct Frame {
        PackageNode* node;
        int depth;
        std::set<std::string>::const_iterator next_child;
    };

    void visit(PackageGraph& graph, PackageNode& start, BlameStats& stats) const;
    void upload_blame(PackageGraph& graph, PackageNode& node, int depth, BlameStats& stats) const;

    BlameOptions options_;
};
