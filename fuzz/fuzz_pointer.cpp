// Fuzz target for the JSON Pointer codec. Any pointer that parses must
// encode back to the same text.

#include <shapediff-cpp/pointer.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    auto segments = shapediff_cpp::try_parse_pointer(input);
    if (segments) {
        if (shapediff_cpp::encode_pointer(*segments) != input) __builtin_trap();
        for (const auto& segment : *segments) {
            auto index = shapediff_cpp::parse_index(segment);
            (void)index;
        }
    }
    return 0;
}
