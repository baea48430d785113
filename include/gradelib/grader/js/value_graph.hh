#pragma once

#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace grader::js {

enum class NodeKind {
    UNDEFINED,
    NULL_VALUE,
    BOOLEAN,
    NUMBER,
    BIGINT,
    STRING,
    SYMBOL,
    FUNCTION,
    DATE,
    REGEXP,
    TYPED_ARRAY,
    ARRAY,
    OBJECT,
};

// Result of the JS typeof operator for a value of kind @p kind
[[nodiscard]] std::string_view type_of(NodeKind kind) noexcept;

/**
 * A JS value. Every object (and every symbol and function) is exactly one
 * node, so node identity is object identity. Numbers are kept in their JS
 * string form with "-0" for negative zero.
 */
struct Node {
    NodeKind kind = NodeKind::UNDEFINED;
    // BOOLEAN: "true" / "false", NUMBER, BIGINT, STRING: value,
    // DATE: timestamp in ms (as a number), REGEXP: source,
    // TYPED_ARRAY: constructor name
    std::string value;
    std::string flags; // REGEXP only
    std::vector<std::string> elements; // TYPED_ARRAY elements in String() form
    std::vector<size_t> items; // ARRAY elements (node indices)
    // Own enumerable string keys of non-array objects with node indices of
    // their values
    std::vector<std::pair<std::string, size_t>> keys;
};

struct ValueGraph {
    std::vector<Node> nodes;
};

// One toEqual() invocation: are nodes a and b deep equal
struct MatcherQuery {
    ValueGraph graph;
    size_t a;
    size_t b;
};

/**
 * @brief Decodes {"nodes": [...], "a": index, "b": index}
 *
 * @errors Throws std::runtime_error if the JSON is malformed, a node kind is
 *   unknown or any node index is out of range
 */
[[nodiscard]] MatcherQuery parse_matcher_query(std::string_view json);

void from_json(const nlohmann::json& j, Node& node);

} // namespace grader::js
