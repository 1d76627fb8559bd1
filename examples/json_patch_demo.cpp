// json_patch_demo: shapediff-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Importing JSON documents as Values
//   - Lowering a structural diff into an RFC 6902 JSON Patch
//   - Applying that patch with nlohmann::json::patch()
//   - Reporting values that have no JSON form
//
// Build: cmake -B build -DSHAPEDIFF_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/json_patch_demo

#include <shapediff-cpp/shapediff.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <variant>

namespace sd = shapediff_cpp;
namespace s = shapediff_cpp::shapes;
using json = nlohmann::json;

int main() {
    const auto config = s::struct_of({
        s::prop("service", s::string()),
        s::prop("replicas", s::integer()),
        s::prop("env", s::record(sd::KeyKind::string, s::string())),
        s::prop("ports", s::array_of(s::integer())),
    });

    const auto before_json = json::parse(R"({
        "service": "api",
        "replicas": 2,
        "env": {"LOG_LEVEL": "info", "a/b": "x"},
        "ports": [80, 443, 8080]
    })");
    const auto after_json = json::parse(R"({
        "service": "api",
        "replicas": 3,
        "env": {"LOG_LEVEL": "debug"},
        "ports": [80, 443]
    })");

    // -- Diff and lower --------------------------------------------------------

    const auto patch = sd::diff(config, before_json.get<sd::Value>(), after_json.get<sd::Value>());
    const auto lowered = sd::to_json_patch(patch);
    if (const auto* err = std::get_if<sd::Error>(&lowered)) {
        std::fprintf(stderr, "lowering failed: %s\n", sd::to_string(*err).c_str());
        return 1;
    }

    const auto document = sd::to_json_document(std::get<sd::JsonPatch>(lowered));
    std::printf("JSON Patch:\n%s\n", document.dump(2).c_str());

    // -- Apply with any RFC 6902 implementation ---------------------------------

    const auto patched = before_json.patch(document);
    std::printf("patched == after: %s\n", patched == after_json ? "yes" : "no");

    // -- Values JSON cannot carry -----------------------------------------------

    const auto stamped = s::struct_of({s::prop("at", s::timestamp())});
    const auto stamp_patch = sd::diff(stamped,
                                      sd::Object{{"at", sd::Timestamp{1}}},
                                      sd::Object{{"at", sd::Timestamp{2}}});
    const auto failed = sd::to_json_patch(stamp_patch);
    if (const auto* err = std::get_if<sd::Error>(&failed)) {
        std::printf("expected failure: %s\n", sd::to_string(*err).c_str());
    }

    return 0;
}
