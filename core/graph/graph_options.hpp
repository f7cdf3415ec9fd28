#pragma once

namespace graphine {

/// Behavior switches for a Graph. The defaults leave referential
/// integrity to the caller: node removal does not touch edges and
/// edge endpoints are not checked.
struct GraphOptions {
    /// removeNode() also removes every edge starting or ending at the node.
    bool cascade_node_removal = false;

    /// Edge creation and relocation throw UnknownIdentifier when an
    /// endpoint is not a live node.
    bool require_live_endpoints = false;
};

} // namespace graphine
