#include <algorithm>
#include <gradelib/grader/js/deep_equal.hh>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using std::string;
using std::string_view;

namespace {

using grader::js::Node;
using grader::js::NodeKind;
using grader::js::ValueGraph;

// JS === on numbers given in String() form
bool strict_equal_numbers(string_view a, string_view b) noexcept {
    if (a == "NaN" or b == "NaN") {
        return false;
    }
    auto unsign_zero = [](string_view x) { return x == "-0" ? string_view{"0"} : x; };
    return unsign_zero(a) == unsign_zero(b);
}

bool is_primitive(NodeKind kind) noexcept {
    return grader::js::type_of(kind) != "object";
}

class DeepEqual {
    const ValueGraph& graph_;
    std::unordered_map<size_t, size_t> seen_; // left node => right node

public:
    explicit DeepEqual(const ValueGraph& graph) : graph_(graph) {}

    bool operator()(size_t ai, size_t bi);
};

bool DeepEqual::operator()(size_t ai, size_t bi) { // NOLINT(misc-no-recursion)
    if (ai == bi) {
        return true;
    }
    const Node& a = graph_.nodes[ai];
    const Node& b = graph_.nodes[bi];

    // Object.is() for primitives given as separate nodes
    if (a.kind == b.kind and is_primitive(a.kind) and a.kind != NodeKind::SYMBOL and
        a.kind != NodeKind::FUNCTION and a.value == b.value)
    {
        return true;
    }

    auto is_nullish = [](const Node& x) {
        return x.kind == NodeKind::NULL_VALUE or x.kind == NodeKind::UNDEFINED;
    };
    if (is_nullish(a) or is_nullish(b)) {
        return a.kind == b.kind;
    }

    if (grader::js::type_of(a.kind) != grader::js::type_of(b.kind)) {
        return false;
    }

    if (is_primitive(a.kind)) {
        switch (a.kind) {
        case NodeKind::NUMBER: return strict_equal_numbers(a.value, b.value);
        case NodeKind::SYMBOL:
        case NodeKind::FUNCTION: return false; // identity was checked above
        default: return a.value == b.value;
        }
    }

    if (a.kind == NodeKind::DATE and b.kind == NodeKind::DATE) {
        return strict_equal_numbers(a.value, b.value);
    }

    if (a.kind == NodeKind::REGEXP and b.kind == NodeKind::REGEXP) {
        return a.value == b.value and a.flags == b.flags;
    }

    if (a.kind == NodeKind::TYPED_ARRAY and b.kind == NodeKind::TYPED_ARRAY) {
        if (a.value != b.value or a.elements.size() != b.elements.size()) {
            return false;
        }
        for (size_t i = 0; i < a.elements.size(); ++i) {
            if (not strict_equal_numbers(a.elements[i], b.elements[i])) {
                return false;
            }
        }
        return true;
    }

    if (auto it = seen_.find(ai); it != seen_.end() and it->second == bi) {
        return true;
    }
    seen_[ai] = bi;

    if (a.kind == NodeKind::ARRAY and b.kind == NodeKind::ARRAY) {
        if (a.items.size() != b.items.size()) {
            return false;
        }
        for (size_t i = 0; i < a.items.size(); ++i) {
            if (not (*this)(a.items[i], b.items[i])) {
                return false;
            }
        }
        return true;
    }
    if (a.kind == NodeKind::ARRAY or b.kind == NodeKind::ARRAY) {
        return false;
    }

    // Plain objects (and every other mix of object kinds)
    if (a.keys.size() != b.keys.size()) {
        return false;
    }
    auto sorted_keys = [](const Node& x) {
        std::vector<std::pair<string, size_t>> keys = x.keys;
        std::sort(keys.begin(), keys.end());
        return keys;
    };
    auto ka = sorted_keys(a);
    auto kb = sorted_keys(b);
    for (size_t i = 0; i < ka.size(); ++i) {
        if (ka[i].first != kb[i].first) {
            return false;
        }
    }
    for (size_t i = 0; i < ka.size(); ++i) {
        if (not (*this)(ka[i].second, kb[i].second)) {
            return false;
        }
    }
    return true;
}

} // namespace

namespace grader::js {

bool deep_equal(const ValueGraph& graph, size_t a, size_t b) { return DeepEqual{graph}(a, b); }

} // namespace grader::js
