#include <algorithm>
#include <array>
#include <gradelib/grader/js/value_graph.hh>
#include <gradelib/macros/throw.hh>
#include <nlohmann/json.hpp>

using std::string;
using std::string_view;

namespace {

constexpr std::array<std::pair<string_view, grader::js::NodeKind>, 13> kind_names = {{
    {"undefined", grader::js::NodeKind::UNDEFINED},
    {"null", grader::js::NodeKind::NULL_VALUE},
    {"boolean", grader::js::NodeKind::BOOLEAN},
    {"number", grader::js::NodeKind::NUMBER},
    {"bigint", grader::js::NodeKind::BIGINT},
    {"string", grader::js::NodeKind::STRING},
    {"symbol", grader::js::NodeKind::SYMBOL},
    {"function", grader::js::NodeKind::FUNCTION},
    {"date", grader::js::NodeKind::DATE},
    {"regexp", grader::js::NodeKind::REGEXP},
    {"typed", grader::js::NodeKind::TYPED_ARRAY},
    {"array", grader::js::NodeKind::ARRAY},
    {"object", grader::js::NodeKind::OBJECT},
}};

} // namespace

namespace grader::js {

string_view type_of(NodeKind kind) noexcept {
    switch (kind) {
    case NodeKind::UNDEFINED: return "undefined";
    case NodeKind::BOOLEAN: return "boolean";
    case NodeKind::NUMBER: return "number";
    case NodeKind::BIGINT: return "bigint";
    case NodeKind::STRING: return "string";
    case NodeKind::SYMBOL: return "symbol";
    case NodeKind::FUNCTION: return "function";
    case NodeKind::NULL_VALUE:
    case NodeKind::DATE:
    case NodeKind::REGEXP:
    case NodeKind::TYPED_ARRAY:
    case NodeKind::ARRAY:
    case NodeKind::OBJECT: return "object";
    }
    __builtin_unreachable();
}

void from_json(const nlohmann::json& j, Node& node) {
    auto t = j.at("t").get<string>();
    auto it = std::find_if(kind_names.begin(), kind_names.end(), [&](const auto& p) {
        return p.first == t;
    });
    if (it == kind_names.end()) {
        THROW("Unknown value node kind: ", t);
    }
    node = Node{.kind = it->second};

    switch (node.kind) {
    case NodeKind::UNDEFINED:
    case NodeKind::NULL_VALUE:
    case NodeKind::SYMBOL:
    case NodeKind::FUNCTION:
    case NodeKind::ARRAY:
    case NodeKind::OBJECT: break;
    case NodeKind::BOOLEAN: node.value = j.at("v").get<bool>() ? "true" : "false"; break;
    case NodeKind::NUMBER:
    case NodeKind::BIGINT:
    case NodeKind::STRING:
    case NodeKind::DATE: j.at("v").get_to(node.value); break;
    case NodeKind::REGEXP:
        j.at("source").get_to(node.value);
        j.at("flags").get_to(node.flags);
        break;
    case NodeKind::TYPED_ARRAY:
        j.at("ctor").get_to(node.value);
        j.at("items").get_to(node.elements);
        break;
    }

    if (node.kind == NodeKind::ARRAY) {
        j.at("items").get_to(node.items);
    } else if (type_of(node.kind) == "object" and node.kind != NodeKind::NULL_VALUE) {
        for (const auto& key : j.at("keys")) {
            node.keys.emplace_back(key.at(0).get<string>(), key.at(1).get<size_t>());
        }
    }
}

MatcherQuery parse_matcher_query(string_view json) {
    MatcherQuery query;
    try {
        auto j = nlohmann::json::parse(json);
        j.at("nodes").get_to(query.graph.nodes);
        j.at("a").get_to(query.a);
        j.at("b").get_to(query.b);
    } catch (const nlohmann::json::exception& e) {
        THROW("Malformed matcher query: ", e.what());
    }

    const size_t size = query.graph.nodes.size();
    auto check_index = [size](size_t idx) {
        if (idx >= size) {
            THROW("Matcher query refers to a non-existent node ", idx, " (nodes: ", size, ')');
        }
    };
    check_index(query.a);
    check_index(query.b);
    for (const auto& node : query.graph.nodes) {
        for (size_t idx : node.items) {
            check_index(idx);
        }
        for (const auto& [key, idx] : node.keys) {
            check_index(idx);
        }
    }
    return query;
}

} // namespace grader::js
