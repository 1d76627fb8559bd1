// Fuzz target for diffing and JSON Patch lowering. The input is split at
// the first NUL into two JSON documents; any pair that parses is diffed
// as unknown leaves and as string-keyed records, and the lowered patch
// must transform the first document into the second.

#include <shapediff-cpp/shapediff.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>

namespace {

namespace s = shapediff_cpp::shapes;

void check(const shapediff_cpp::Differ& differ, const shapediff_cpp::Value& from,
           const shapediff_cpp::Value& to, const nlohmann::json& from_json,
           const nlohmann::json& to_json) {
    const auto patch = differ(from, to);
    if (shapediff_cpp::apply_patch(patch, from) != to) __builtin_trap();

    const auto lowered = shapediff_cpp::to_json_patch(patch);
    const auto* ops = std::get_if<shapediff_cpp::JsonPatch>(&lowered);
    if (!ops) __builtin_trap();
    if (from_json.patch(shapediff_cpp::to_json_document(*ops)) != to_json) __builtin_trap();
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = std::min(input.find('\0'), input.size());

    const auto a = nlohmann::json::parse(input.substr(0, split), nullptr, false);
    const auto b = nlohmann::json::parse(input.substr(std::min(split + 1, input.size())),
                                         nullptr, false);
    if (a.is_discarded() || b.is_discarded()) return 0;

    const auto from = a.get<shapediff_cpp::Value>();
    const auto to = b.get<shapediff_cpp::Value>();

    static const auto leaf_differ = shapediff_cpp::compile(s::unknown());
    check(leaf_differ, from, to, a, b);

    if (a.is_object() && b.is_object()) {
        static const auto record_differ =
            shapediff_cpp::compile(s::record(shapediff_cpp::KeyKind::string, s::unknown()));
        check(record_differ, from, to, a, b);
    }
    return 0;
}
