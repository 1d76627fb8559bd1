// basic_usage: shapediff-cpp quick tour
//
// Demonstrates:
//   - Describing a value with a shape
//   - Compiling the shape into a reusable differ
//   - Applying and reversing the resulting patch
//
// Build: cmake -B build -DSHAPEDIFF_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/basic_usage

#include <shapediff-cpp/shapediff.hpp>

#include <cstdio>

namespace sd = shapediff_cpp;
namespace s = shapediff_cpp::shapes;

int main() {
    // -- Describe the data ----------------------------------------------------

    const auto user = s::struct_of({
        s::prop("name", s::string()),
        s::prop("age", s::integer()),
        s::optional_prop("email", s::string()),
        s::prop("roles", s::array_of(s::string())),
    });

    // -- Compile once, diff many times -----------------------------------------

    const auto differ = sd::compile(user);

    const auto before = sd::Value{sd::Object{
        {"name", "Alice"},
        {"age", 30},
        {"roles", sd::Array{"admin", "dev"}},
    }};
    const auto after = sd::Value{sd::Object{
        {"name", "Alice"},
        {"age", 31},
        {"email", "alice@example.com"},
        {"roles", sd::Array{"admin"}},
    }};

    const auto patch = differ(before, after);
    std::printf("patch:    %s\n", sd::to_string(patch.op).c_str());

    // -- Apply and undo --------------------------------------------------------

    const auto applied = sd::apply_patch(patch, before);
    std::printf("applied:  %s\n", sd::to_string(applied).c_str());
    std::printf("matches:  %s\n", applied == after ? "yes" : "no");

    const auto undone = sd::apply_patch(sd::reverse(patch), after);
    std::printf("undone:   %s\n", sd::to_string(undone).c_str());

    // -- Unchanged input ------------------------------------------------------

    const auto same = differ(before, before);
    std::printf("identical: %s\n", sd::is_identical(same.op) ? "yes" : "no");

    return 0;
}
