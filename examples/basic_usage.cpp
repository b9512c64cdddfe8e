// basic_usage: demonstrates the core cos-cpp API
//
// Parses standalone values, resolves a small object table with a cycle,
// loads a complete file, walks it with get_path(), decodes a stream, and
// writes values back out.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <cos-cpp/cos.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace cos = cos_cpp;

namespace {

auto as_bytes(std::string_view s) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

constexpr auto sample_file = std::string_view{
    "%PDF-1.7\n"
    "1 0 obj\n"
    "<< /Type /Catalog /Pages 2 0 R >>\n"
    "endobj\n"
    "2 0 obj\n"
    "<< /Type /Pages /Kids [3 0 R] /Count 1 >>\n"
    "endobj\n"
    "3 0 obj\n"
    "<< /Type /Page /Parent 2 0 R /Contents 4 0 R /Title (Hello, world) >>\n"
    "endobj\n"
    "4 0 obj\n"
    "<< /Length 11 >>\n"
    "stream\n"
    "BT (Hi) Tj\n"
    "endstream\n"
    "endobj\n"
    "xref\n"
    "0 5\n"
    "trailer\n"
    "<< /Size 5 /Root 1 0 R >>\n"
    "startxref\n"
    "0\n"
    "%%EOF\n"};

}  // namespace

int main() {
    // -- Standalone values ----------------------------------------------------
    if (auto r = cos::parse_value("1 2 R/Name")) {
        std::printf("Decoded a %s, %zu bytes consumed\n",
                    std::string{r->value.type_name()}.c_str(), r->bytes_read);
    }

    if (auto dict = cos::parse_object("<< /Author (Leonard Rosenthol) /Pages 12 >>")) {
        if (auto author = cos::get_as<cos::String>(dict->get("Author"))) {
            std::printf("Author: %s\n", author->text().c_str());
        }
    }

    auto bad = cos::parse_object("[1 2");
    if (!bad) {
        std::printf("Error (%s): %s\n",
                    std::string{cos::to_string_view(bad.error().kind)}.c_str(),
                    bad.error().message.c_str());
    }

    // -- Resolving a table with a cycle ---------------------------------------
    auto table = cos::ObjectTable{};
    table[{1, 0}] = std::make_shared<cos::Value>(*cos::parse_object("<< /Next 2 0 R >>"));
    table[{2, 0}] = std::make_shared<cos::Value>(*cos::parse_object("<< /Next 1 0 R >>"));
    if (auto resolved = cos::resolve_table(std::move(table))) {
        const auto& first = *resolved->at({1, 0});
        const auto* around = first.get("Next")->get("Next");
        std::printf("Cycle returns to the same object: %s\n", around == &first ? "yes" : "no");
    }

    // -- Loading a file -------------------------------------------------------
    auto doc = cos::Document::load(as_bytes(sample_file));
    if (!doc) {
        std::fprintf(stderr, "load failed: %s\n", doc.error().message.c_str());
        return 1;
    }
    std::printf("Version %s, %zu objects\n", doc->version().c_str(), doc->size());

    if (auto count = cos::get_as<std::int64_t>(doc->get_path("Pages", "Count"))) {
        std::printf("Page count: %ld\n", static_cast<long>(*count));
    }
    if (auto title = cos::get_as<cos::String>(doc->get_path("Pages", "Kids", 0, "Title"))) {
        std::printf("First page title: %s\n", title->text().c_str());
    }

    // -- Streams --------------------------------------------------------------
    const auto* contents = doc->get_path("Pages", "Kids", 0, "Contents");
    if (const auto* stream = contents ? contents->get_if<cos::Stream>() : nullptr) {
        if (auto data = stream->decode()) {
            std::printf("Content stream: %.*s\n", static_cast<int>(data->size()),
                        reinterpret_cast<const char*>(data->data()));
        } else {
            std::printf("Cannot decode: %s\n", data.error().message.c_str());
        }
    }

    // -- Writing back ---------------------------------------------------------
    if (auto page = doc->lookup({3, 0})) {
        std::printf("%s", cos::write_object({3, 0}, **page).c_str());
    }

    std::printf("Done.\n");
    return 0;
}
