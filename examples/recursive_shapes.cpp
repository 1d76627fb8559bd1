// recursive_shapes: diffing self-referential data
//
// Demonstrates:
//   - Building a recursive shape with shapes::recursive()
//   - Reusing one compiled differ across a whole tree
//   - Reading nested array and object operations
//
// Build: cmake -B build -DSHAPEDIFF_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/recursive_shapes

#include <shapediff-cpp/shapediff.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <variant>

namespace sd = shapediff_cpp;
namespace s = shapediff_cpp::shapes;

// A directory tree: every entry has a name and child entries.
static auto entry_shape() -> sd::ShapePtr {
    return s::recursive([](const sd::ShapePtr& self) {
        return s::struct_of({
            s::prop("name", s::string()),
            s::optional_prop("size", s::integer()),
            s::prop("children", s::array_of(self)),
        });
    });
}

static auto file(const std::string& name, int size) -> sd::Value {
    return sd::Object{{"name", name}, {"size", size}, {"children", sd::Array{}}};
}

static auto dir(const std::string& name, sd::Array children) -> sd::Value {
    return sd::Object{{"name", name}, {"children", std::move(children)}};
}

int main() {
    const auto differ = sd::compile(entry_shape());
    std::printf("compiled nodes: %zu\n", differ.node_count());

    const auto before = dir("/", {
        dir("src", {file("main.cpp", 120), file("util.cpp", 40)}),
        file("README.md", 10),
    });
    const auto after = dir("/", {
        dir("src", {file("main.cpp", 125)}),
        file("README.md", 10),
        file("LICENSE", 1),
    });

    const auto patch = differ(before, after);
    std::printf("patch: %s\n", sd::to_string(patch.op).c_str());

    const auto round_trip = sd::apply_patch(sd::reverse(patch), sd::apply_patch(patch, before));
    std::printf("round trip: %s\n", round_trip == before ? "ok" : "MISMATCH");

    if (const auto lowered = sd::to_json_patch(patch);
        const auto* ops = std::get_if<sd::JsonPatch>(&lowered)) {
        for (const auto& op : *ops) {
            std::printf("  %-7s %s\n",
                        std::string{sd::to_string_view(op.op)}.c_str(), op.path.c_str());
        }
    }
    return 0;
}
