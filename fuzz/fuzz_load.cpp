// Fuzz target for Document::load(): exercises segmenting, parsing and
// resolution together. Any document that loads is exported and written
// back out to check that traversal terminates.

#include <cos-cpp/cos.hpp>
#include <cos-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto limits = cos_cpp::ParseLimits{};
    limits.max_decoded_size = 1 << 20;

    auto doc = cos_cpp::Document::load(span, limits);
    if (doc) {
        auto exported = cos_cpp::export_json(*doc);
        (void)exported;
        for (const auto& [id, object] : doc->objects()) {
            auto text = cos_cpp::write_object(id, *object);
            (void)text;
            if (const auto* stream = object->get_if<cos_cpp::Stream>()) {
                auto decoded = stream->decode(cos_cpp::FilterRegistry::default_registry(), limits);
                (void)decoded;
            }
        }
    }
    return 0;
}
