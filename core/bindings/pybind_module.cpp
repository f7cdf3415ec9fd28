// PyBind11 bindings for the graphine core.
// Exposes Graph with keyword-argument attributes, records, searches
// and traversals to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "graph/errors.hpp"
#include "graph/graph.hpp"

#include <string>
#include <vector>

namespace py = pybind11;

namespace {

graphine::Value toValue(const py::handle& obj) {
    if (obj.is_none()) return {};
    if (py::isinstance<py::bool_>(obj)) return obj.cast<bool>();
    if (py::isinstance<py::int_>(obj)) return obj.cast<int64_t>();
    if (py::isinstance<py::float_>(obj)) return obj.cast<double>();
    if (py::isinstance<py::str>(obj)) return obj.cast<std::string>();
    throw py::type_error("unsupported attribute value: " +
                         py::repr(obj).cast<std::string>());
}

py::object fromValue(const graphine::Value& v) {
    if (v.isBool()) return py::bool_(v.asBool());
    if (v.isInt()) return py::int_(v.asInt());
    if (v.isDouble()) return py::float_(v.asDouble());
    if (v.isString()) return py::str(v.asString());
    return py::none();
}

graphine::Attributes toAttributes(const py::kwargs& kwargs) {
    graphine::Attributes attrs;
    for (auto item : kwargs) {
        attrs.emplace_back(item.first.cast<std::string>(), toValue(item.second));
    }
    return attrs;
}

py::object recordFor(const graphine::Graph& g, graphine::Uid uid) {
    if (graphine::isNodeUid(uid)) return py::cast(g.getNode(uid));
    if (graphine::isEdgeUid(uid)) return py::cast(g.getEdge(uid));
    throw graphine::UnknownIdentifier(uid);
}

template <typename R>
py::list toList(const graphine::SearchResults<R>& results) {
    py::list out;
    for (const R& record : results) {
        out.append(py::cast(record));
    }
    return out;
}

} // namespace

PYBIND11_MODULE(graphine_bindings, m) {
    m.doc() = "graphine C++ core bindings";

    // ── Errors ──
    auto& graph_error = py::register_exception<graphine::GraphError>(m, "GraphError");
    py::register_exception<graphine::SchemaMismatch>(m, "SchemaMismatch", graph_error.ptr());
    py::register_exception<graphine::UnknownIdentifier>(m, "UnknownIdentifier", PyExc_KeyError);

    // ── Records ──
    py::class_<graphine::Record>(m, "Record")
        .def("__getitem__", [](const graphine::Record& r, const std::string& field) {
            return fromValue(r.get(field));
        })
        .def("__getattr__", [](const graphine::Record& r, const std::string& field) {
            if (!r.schema().hasField(field)) throw py::attribute_error(field);
            return fromValue(r.get(field));
        })
        .def("as_dict", [](const graphine::Record& r) {
            py::dict out;
            for (const auto& [name, value] : r.asAttributes()) {
                out[py::str(name)] = fromValue(value);
            }
            return out;
        })
        .def_property_readonly("fields", [](const graphine::Record& r) {
            return r.schema().fields();
        })
        .def("__repr__", &graphine::Record::toString)
        .def("__eq__", [](const graphine::Record& a, const graphine::Record& b) { return a == b; })
        .def("__hash__", [](const graphine::Record& r) {
            return py::hash(py::str(r.toString()));
        });

    py::class_<graphine::Node, graphine::Record>(m, "Node")
        .def("replace", [](const graphine::Node& n, py::kwargs kwargs) {
            return n.replace(toAttributes(kwargs));
        });

    py::class_<graphine::Edge, graphine::Record>(m, "Edge")
        .def_property_readonly("start", &graphine::Edge::start)
        .def_property_readonly("end", &graphine::Edge::end)
        .def("replace", [](const graphine::Edge& e, py::kwargs kwargs) {
            return e.replace(toAttributes(kwargs));
        });

    // ── GraphOptions ──
    py::class_<graphine::GraphOptions>(m, "GraphOptions")
        .def(py::init<>())
        .def_readwrite("cascade_node_removal", &graphine::GraphOptions::cascade_node_removal)
        .def_readwrite("require_live_endpoints", &graphine::GraphOptions::require_live_endpoints);

    // ── Traversal ──
    py::class_<graphine::Traversal>(m, "Traversal")
        .def("__iter__", [](graphine::Traversal& t) -> graphine::Traversal& { return t; },
             py::return_value_policy::reference_internal)
        .def("__next__", [](graphine::Traversal& t) {
            auto uid = t.next();
            if (!uid) throw py::stop_iteration();
            return *uid;
        });

    // ── Graph ──
    py::class_<graphine::Graph>(m, "Graph")
        .def(py::init<const std::vector<std::string>&, const std::vector<std::string>&,
                      graphine::GraphOptions>(),
             py::arg("node_properties"), py::arg("edge_properties"),
             py::arg("options") = graphine::GraphOptions{})
        .def_property_readonly("options", &graphine::Graph::options)
        .def("__getitem__", &recordFor)
        .def("__setitem__", &graphine::Graph::set)
        .def("__delitem__", [](graphine::Graph& g, graphine::Uid uid) { g.remove(uid); })
        .def("__contains__", [](const graphine::Graph& g, const graphine::Node& n) {
            return g.contains(n);
        })
        .def("__contains__", [](const graphine::Graph& g, const graphine::Edge& e) {
            return g.contains(e);
        })
        .def("add_node", [](graphine::Graph& g, py::kwargs kwargs) {
            return g.addNode(toAttributes(kwargs));
        })
        .def("add_edge", [](graphine::Graph& g, graphine::Uid start, graphine::Uid end,
                            py::kwargs kwargs) {
            return g.addEdge(start, end, toAttributes(kwargs));
        })
        .def("modify_node", [](graphine::Graph& g, graphine::Uid uid, py::kwargs kwargs) {
            return g.modifyNode(uid, toAttributes(kwargs));
        })
        .def("modify_edge", [](graphine::Graph& g, graphine::Uid uid, py::kwargs kwargs) {
            return g.modifyEdge(uid, toAttributes(kwargs));
        })
        .def("remove_node", &graphine::Graph::removeNode)
        .def("remove_edge", &graphine::Graph::removeEdge)
        .def("node_uids", &graphine::Graph::nodeUids)
        .def("edge_uids", &graphine::Graph::edgeUids)
        .def("get_nodes", [](const graphine::Graph& g) {
            py::list out;
            g.forEachNode([&](graphine::Uid, const graphine::Node& n) { out.append(py::cast(n)); });
            return out;
        })
        .def("get_edges", [](const graphine::Graph& g) {
            py::list out;
            g.forEachEdge([&](graphine::Uid, const graphine::Edge& e) { out.append(py::cast(e)); });
            return out;
        })
        .def("search_nodes", [](const graphine::Graph& g, py::kwargs kwargs) {
            return toList(g.searchNodes(toAttributes(kwargs)));
        })
        .def("search_edges", [](const graphine::Graph& g, py::kwargs kwargs) {
            return toList(g.searchEdges(toAttributes(kwargs)));
        })
        .def("get_adjacent_uids", &graphine::Graph::adjacentUids)
        .def("get_adjacent_nodes", &graphine::Graph::adjacentNodes)
        .def("get_outgoing_uids", &graphine::Graph::outgoingUids)
        .def("get_outgoing_edges", &graphine::Graph::outgoingEdges)
        .def("a_star_traversal", [](const graphine::Graph& g, graphine::Uid root,
                                    std::function<graphine::Uid(std::vector<graphine::Uid>)> pick) {
            // Python selectors choose from a snapshot of the frontier.
            graphine::Selector selector = [pick](graphine::Frontier& frontier) {
                graphine::Uid uid = pick(std::vector<graphine::Uid>(frontier.begin(), frontier.end()));
                for (auto it = frontier.begin(); it != frontier.end(); ++it) {
                    if (*it == uid) {
                        frontier.erase(it);
                        return uid;
                    }
                }
                throw graphine::UnknownIdentifier(uid);
            };
            return g.traverse(root, selector);
        }, py::keep_alive<0, 1>())
        .def("depth_first_traversal", &graphine::Graph::depthFirst, py::keep_alive<0, 1>())
        .def("breadth_first_traversal", &graphine::Graph::breadthFirst, py::keep_alive<0, 1>())
        .def("generate_subgraph", [](const graphine::Graph& g, py::args args) {
            return g.generateSubgraph(args.cast<std::vector<graphine::Uid>>());
        })
        .def("size", &graphine::Graph::edgeCount)
        .def("order", &graphine::Graph::nodeCount);
}
