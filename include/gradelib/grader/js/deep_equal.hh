#pragma once

#include <cstddef>
#include <gradelib/grader/js/value_graph.hh>

namespace grader::js {

// Structural equality of nodes @p a and @p b of @p graph with the semantics
// of the toEqual() matcher: key order is ignored, cycles are handled
[[nodiscard]] bool deep_equal(const ValueGraph& graph, size_t a, size_t b);

} // namespace grader::js
