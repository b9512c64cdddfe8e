#include <cos-cpp/filter.hpp>

#include "filters/flate.hpp"
#include "grammar/char_class.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace cos_cpp {

namespace {

auto too_large(std::string_view filter, const ParseLimits& limits) -> Error {
    return Error{ErrorKind::filter_error,
                 std::string{filter} + " output exceeds " + std::to_string(limits.max_decoded_size) + " bytes"};
}

auto flate_filter(std::span<const std::byte> input, const Dictionary& params,
                  const ParseLimits& limits) -> Result<Bytes> {
    if (const auto* predictor = params.get("Predictor")) {
        auto p = get_as<std::int64_t>(predictor);
        if (!p || *p > 1) {
            return Error{ErrorKind::unsupported_filter, "FlateDecode predictors are not supported"};
        }
    }
    return flate_decode(input, limits);
}

auto empty_params() -> const Dictionary& {
    static const auto empty = Dictionary{};
    return empty;
}

// The DecodeParms dictionary for the filter at `index`: a single
// dictionary applies to a single filter; an array runs parallel to an
// array of filters.
auto params_for(const Value* decode_parms, std::size_t index) -> const Dictionary& {
    if (decode_parms == nullptr) return empty_params();
    const auto* target = decode_parms->deref();
    if (target == nullptr) return empty_params();
    if (target->is<Array>()) {
        target = target->at(index);
        if (target == nullptr) return empty_params();
    } else if (index != 0) {
        return empty_params();
    }
    if (const auto* dict = target->get_if<Dictionary>()) return *dict;
    return empty_params();
}

}  // anonymous namespace

// -- Filters ------------------------------------------------------------------

auto flate_decode(std::span<const std::byte> input, const ParseLimits& limits) -> Result<Bytes> {
    auto result = filters::inflate_bytes(input, 15 + 32, limits.max_decoded_size);
    if (result.status == filters::InflateStatus::corrupt) {
        result = filters::inflate_bytes(input, -15, limits.max_decoded_size);
    }
    switch (result.status) {
        case filters::InflateStatus::ok:        return std::move(result.output);
        case filters::InflateStatus::too_large: return too_large("FlateDecode", limits);
        case filters::InflateStatus::corrupt:   break;
    }
    return Error{ErrorKind::filter_error, "FlateDecode data is corrupt"};
}

auto ascii_hex_decode(std::span<const std::byte> input) -> Result<Bytes> {
    auto out = Bytes{};
    out.reserve(input.size() / 2);
    auto pending = std::optional<std::uint8_t>{};
    for (auto b : input) {
        auto c = grammar::to_u8(b);
        if (c == '>') break;
        if (grammar::is_whitespace(c)) continue;
        auto v = grammar::hex_value(c);
        if (!v) return Error{ErrorKind::filter_error, "ASCIIHexDecode: invalid hex digit"};
        if (pending) {
            out.push_back(static_cast<std::byte>((*pending << 4) | *v));
            pending.reset();
        } else {
            pending = v;
        }
    }
    // A final odd digit is padded with 0.
    if (pending) out.push_back(static_cast<std::byte>(*pending << 4));
    return out;
}

auto run_length_decode(std::span<const std::byte> input, const ParseLimits& limits) -> Result<Bytes> {
    auto out = Bytes{};
    auto i = std::size_t{0};
    while (i < input.size()) {
        auto length = grammar::to_u8(input[i++]);
        if (length == 128) break;  // EOD
        if (length < 128) {
            auto count = static_cast<std::size_t>(length) + 1;
            if (input.size() - i < count) {
                return Error{ErrorKind::filter_error, "RunLengthDecode: truncated literal run"};
            }
            out.insert(out.end(), input.begin() + static_cast<std::ptrdiff_t>(i),
                       input.begin() + static_cast<std::ptrdiff_t>(i + count));
            i += count;
        } else {
            if (i >= input.size()) {
                return Error{ErrorKind::filter_error, "RunLengthDecode: truncated repeat run"};
            }
            out.insert(out.end(), 257 - static_cast<std::size_t>(length), input[i++]);
        }
        if (out.size() > limits.max_decoded_size) return too_large("RunLengthDecode", limits);
    }
    return out;
}

// -- Registry -----------------------------------------------------------------

auto FilterRegistry::builtin() -> FilterRegistry {
    auto registry = FilterRegistry{};
    auto flate = FilterFn{flate_filter};
    auto hex = FilterFn{[](std::span<const std::byte> in, const Dictionary&, const ParseLimits&) {
        return ascii_hex_decode(in);
    }};
    auto rle = FilterFn{[](std::span<const std::byte> in, const Dictionary&, const ParseLimits& limits) {
        return run_length_decode(in, limits);
    }};
    registry.add("FlateDecode", flate);
    registry.add("Fl", flate);
    registry.add("ASCIIHexDecode", hex);
    registry.add("AHx", hex);
    registry.add("RunLengthDecode", rle);
    registry.add("RL", rle);
    return registry;
}

auto FilterRegistry::default_registry() -> const FilterRegistry& {
    static const auto registry = builtin();
    return registry;
}

void FilterRegistry::add(std::string name, FilterFn fn) {
    filters_.insert_or_assign(std::move(name), std::move(fn));
}

auto FilterRegistry::find(std::string_view name) const -> const FilterFn* {
    auto it = filters_.find(name);
    return it == filters_.end() ? nullptr : &it->second;
}

// -- Stream::decode -----------------------------------------------------------

auto Stream::decode() const -> Result<Bytes> {
    return decode(FilterRegistry::default_registry());
}

auto Stream::decode(const FilterRegistry& registry, const ParseLimits& limits) const -> Result<Bytes> {
    const auto* filter = dict.get("Filter");
    if (filter != nullptr) filter = filter->deref();
    if (filter == nullptr || filter->is_null()) return data;

    auto names = std::vector<std::string>{};
    if (const auto* name = filter->get_if<Name>()) {
        names.push_back(name->label);
    } else if (const auto* array = filter->get_if<Array>()) {
        for (std::size_t i = 0; i < array->size(); ++i) {
            const auto* element = filter->at(i);
            const auto* element_name = element == nullptr ? nullptr : element->get_if<Name>();
            if (element_name == nullptr) {
                return Error{ErrorKind::unsupported_filter, "Filter array holds a non-name entry"};
            }
            names.push_back(element_name->label);
        }
    } else {
        return Error{ErrorKind::unsupported_filter,
                     "Filter entry is a " + std::string{filter->type_name()} + ", not a name"};
    }

    const auto* decode_parms = dict.get("DecodeParms");
    auto current = data;
    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto* fn = registry.find(names[i]);
        if (fn == nullptr) {
            return Error{ErrorKind::unsupported_filter, "unsupported filter /" + names[i]};
        }
        auto decoded = (*fn)(current, params_for(decode_parms, i), limits);
        if (!decoded) return decoded.error();
        current = std::move(*decoded);
    }
    return current;
}

}  // namespace cos_cpp
