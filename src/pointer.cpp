#include <shapediff-cpp/pointer.hpp>
#include <shapediff-cpp/error.hpp>

#include <charconv>
#include <stdexcept>
#include <system_error>

namespace shapediff_cpp {

auto escape_segment(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto encode_pointer(const std::vector<std::string>& segments) -> std::string {
    auto result = std::string{};
    for (const auto& segment : segments) {
        result += '/';
        result += escape_segment(segment);
    }
    return result;
}

auto pointer_segment(const PropertyKey& key) -> std::optional<std::string> {
    if (const auto* s = std::get_if<std::string>(&key)) return *s;
    return std::nullopt;
}

namespace {

// Unescape one reference token in place. Returns false on a dangling or
// unknown escape. A single left-to-right pass means "~01" decodes to "~1"
// rather than "/".
auto unescape_segment(std::string_view raw, std::string& out) -> bool {
    out.clear();
    out.reserve(raw.size());
    for (auto i = std::size_t{0}; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            out += raw[i];
            continue;
        }
        if (i + 1 >= raw.size()) return false;
        if (raw[i + 1] == '0') { out += '~'; }
        else if (raw[i + 1] == '1') { out += '/'; }
        else { return false; }
        ++i;
    }
    return true;
}

auto parse_segments(std::string_view pointer, std::string* failure)
    -> std::optional<std::vector<std::string>> {
    if (pointer.empty()) return std::vector<std::string>{};
    if (pointer[0] != '/') {
        *failure = "JSON Pointer must start with '/' or be empty";
        return std::nullopt;
    }
    auto segments = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = pointer.find('/', pos);
        auto raw = pointer.substr(pos, next == std::string_view::npos ? next : next - pos);
        auto segment = std::string{};
        if (!unescape_segment(raw, segment)) {
            *failure = "invalid '~' escape in JSON Pointer segment '" + std::string{raw} + "'";
            return std::nullopt;
        }
        segments.push_back(std::move(segment));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return segments;
}

}  // anonymous namespace

auto parse_pointer(std::string_view pointer) -> std::vector<std::string> {
    auto failure = std::string{};
    auto segments = parse_segments(pointer, &failure);
    if (!segments) {
        throw std::runtime_error{
            std::string{to_string_view(ErrorKind::invalid_pointer)} + ": " + failure};
    }
    return std::move(*segments);
}

auto try_parse_pointer(std::string_view pointer) -> std::optional<std::vector<std::string>> {
    auto failure = std::string{};
    return parse_segments(pointer, &failure);
}

auto parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

}  // namespace shapediff_cpp
