#include <shapediff-cpp/json.hpp>
#include <shapediff-cpp/logging.hpp>
#include <shapediff-cpp/pointer.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace shapediff_cpp {

namespace {

// =============================================================================
// Strict encoder
// =============================================================================

// Encodes into `out`; on failure returns the error and leaves `out`
// partially built.
auto encode_into(const Value& v, nlohmann::json& out, std::string& path) -> std::optional<Error> {
    auto reject = [&](std::string what) {
        return std::optional<Error>{Error{ErrorKind::non_json_value,
                                          std::move(what) + " is not representable in JSON",
                                          path}};
    };

    return std::visit(overload{
        [&](Null) -> std::optional<Error> {
            out = nullptr;
            return std::nullopt;
        },
        [&](bool b) -> std::optional<Error> {
            out = b;
            return std::nullopt;
        },
        [&](std::int64_t i) -> std::optional<Error> {
            out = i;
            return std::nullopt;
        },
        [&](std::uint64_t u) -> std::optional<Error> {
            out = u;
            return std::nullopt;
        },
        [&](double d) -> std::optional<Error> {
            if (!std::isfinite(d)) return reject("non-finite number " + to_string(Value{d}));
            out = d;
            return std::nullopt;
        },
        [&](const std::string& s) -> std::optional<Error> {
            out = s;
            return std::nullopt;
        },
        [&](const Bytes& b) -> std::optional<Error> {
            return reject("byte string of " + std::to_string(b.size()) + " bytes");
        },
        [&](Timestamp t) -> std::optional<Error> {
            return reject("timestamp " + to_string(Value{t}));
        },
        [&](const Symbol& s) -> std::optional<Error> {
            return reject("symbol " + to_string(Value{s}));
        },
        [&](const std::shared_ptr<const Array>& a) -> std::optional<Error> {
            out = nlohmann::json::array();
            for (std::size_t i = 0; i < a->size(); ++i) {
                const auto base = path.size();
                path += "/" + std::to_string(i);
                out.push_back(nullptr);
                if (auto err = encode_into((*a)[i], out.back(), path)) return err;
                path.resize(base);
            }
            return std::nullopt;
        },
        [&](const std::shared_ptr<const Object>& o) -> std::optional<Error> {
            out = nlohmann::json::object();
            for (const auto& [key, child] : *o) {
                auto segment = pointer_segment(key);
                if (!segment) {
                    return Error{ErrorKind::non_string_key,
                                 "symbol key " + to_string(key) + " cannot be a JSON object key",
                                 path};
                }
                const auto base = path.size();
                path += "/" + escape_segment(*segment);
                if (auto err = encode_into(child, out[*segment], path)) return err;
                path.resize(base);
            }
            return std::nullopt;
        },
    }, v.storage());
}

// =============================================================================
// Lowering
// =============================================================================

class Lowering {
public:
    auto lower(const NestedOp& op) -> std::optional<Error> {
        return std::visit(overload{
            [&](const Replace& r) { return emit(JsonPatchOpType::replace, &r.to); },
            [&](const Add& a) { return emit(JsonPatchOpType::add, &a.value); },
            [&](const Remove&) { return emit(JsonPatchOpType::remove, nullptr); },
            [&](const ObjectOps& o) { return lower_object(o); },
            [&](const ArrayOps& a) { return lower_array(a); },
        }, op);
    }

    auto lower_object(const ObjectOps& ops) -> std::optional<Error> {
        for (const auto& entry : ops.entries) {
            auto segment = pointer_segment(entry.key);
            if (!segment) {
                return Error{ErrorKind::non_string_key,
                             "symbol key " + to_string(entry.key)
                                 + " cannot appear in a JSON Pointer",
                             encode_pointer(segments_)};
            }
            segments_.push_back(std::move(*segment));
            if (auto err = lower(entry.op)) return err;
            segments_.pop_back();
        }
        return std::nullopt;
    }

    auto lower_array(const ArrayOps& ops) -> std::optional<Error> {
        for (const ArrayEntry& entry : ordered_entries(ops)) {
            segments_.push_back(std::to_string(entry.index));
            if (auto err = lower(entry.op)) return err;
            segments_.pop_back();
        }
        return std::nullopt;
    }

    auto emit(JsonPatchOpType type, const Value* value) -> std::optional<Error> {
        auto path = encode_pointer(segments_);
        auto json_value = std::optional<nlohmann::json>{};
        if (value) {
            auto encoded = encode_json(*value, path);
            if (auto* err = std::get_if<Error>(&encoded)) return std::move(*err);
            json_value = std::move(std::get<nlohmann::json>(encoded));
        }
        out_.push_back(JsonPatchOp{type, std::move(path), std::move(json_value)});
        return std::nullopt;
    }

    auto take() -> JsonPatch { return std::move(out_); }

private:
    std::vector<std::string> segments_;
    JsonPatch out_;
};

auto failed(Error error) -> std::variant<JsonPatch, Error> {
    logger()->debug("JSON Patch lowering failed: {}", to_string(error));
    return error;
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Value& v) {
    auto encoded = encode_json(v);
    if (auto* err = std::get_if<Error>(&encoded)) {
        throw std::runtime_error{to_string(*err)};
    }
    j = std::move(std::get<nlohmann::json>(encoded));
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            v = Value{};
            break;
        case nlohmann::json::value_t::boolean:
            v = Value{j.get<bool>()};
            break;
        case nlohmann::json::value_t::number_integer:
            v = Value{j.get<std::int64_t>()};
            break;
        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                v = Value{static_cast<std::int64_t>(u)};
            } else {
                v = Value{u};
            }
            break;
        }
        case nlohmann::json::value_t::number_float:
            v = Value{j.get<double>()};
            break;
        case nlohmann::json::value_t::string:
            v = Value{j.get<std::string>()};
            break;
        case nlohmann::json::value_t::binary: {
            const auto& bin = j.get_binary();
            auto bytes = Bytes{};
            bytes.reserve(bin.size());
            for (auto b : bin) bytes.push_back(static_cast<std::byte>(b));
            v = Value{std::move(bytes)};
            break;
        }
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& item : j) arr.push_back(item.get<Value>());
            v = Value{std::move(arr)};
            break;
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj.set(it.key(), it.value().get<Value>());
            }
            v = Value{std::move(obj)};
            break;
        }
    }
}

auto encode_json(const Value& v, std::string_view base_path)
    -> std::variant<nlohmann::json, Error> {
    auto out = nlohmann::json{};
    auto path = std::string{base_path};
    if (auto err = encode_into(v, out, path)) return std::move(*err);
    return out;
}

// =============================================================================
// JSON Patch
// =============================================================================

void to_json(nlohmann::json& j, const JsonPatchOp& op) {
    j = nlohmann::json{
        {"op", std::string{to_string_view(op.op)}},
        {"path", op.path},
    };
    if (op.value) j["value"] = *op.value;
}

auto to_json_patch(const Op& op) -> std::variant<JsonPatch, Error> {
    if (is_identical(op)) return JsonPatch{};

    auto lowering = Lowering{};
    if (auto err = lowering.lower(to_nested(op))) return failed(std::move(*err));
    return lowering.take();
}

auto to_json_patch(const Patch& patch) -> std::variant<JsonPatch, Error> {
    return to_json_patch(patch.op);
}

auto to_json_document(const JsonPatch& patch) -> nlohmann::json {
    auto doc = nlohmann::json::array();
    for (const auto& op : patch) doc.push_back(nlohmann::json(op));
    return doc;
}

}  // namespace shapediff_cpp
