// Fuzz target for parse_value(): exercises the dispatcher and every
// candidate decoder. A successful decode must consume a non-empty prefix,
// and writing the value back must read back to an equal value.

#include <cos-cpp/cos.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto limits = cos_cpp::ParseLimits{};
    limits.max_depth = 64;

    auto result = cos_cpp::parse_value(span, limits);
    if (!result) return 0;
    if (result->bytes_read == 0 || result->bytes_read > size) std::abort();

    auto text = cos_cpp::to_cos_string(result->value);
    auto again = cos_cpp::parse_object(text, limits);
    if (!again) std::abort();
    return 0;
}
