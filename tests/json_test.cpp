// json_test.cpp: nlohmann/json export and JSON Pointer navigation

#include <cos-cpp/json.hpp>
#include <cos-cpp/parser.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace cos_cpp;
using json = nlohmann::json;

namespace {

auto as_bytes(std::string_view s) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

auto to_j(std::string_view cos_text) -> json {
    auto value = parse_object(cos_text);
    EXPECT_TRUE(value) << cos_text;
    return value ? json(*value) : json{};
}

constexpr auto sample = std::string_view{
    "%PDF-1.6\n"
    "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
    "2 0 obj\n<< /Type /Pages /Kids [3 0 R] /Count 1 >>\nendobj\n"
    "3 0 obj\n<< /Type /Page /Parent 2 0 R /A#2FB (x) >>\nendobj\n"
    "trailer\n<< /Size 4 /Root 1 0 R /ID [<0102> <0304>] >>\n"
    "%%EOF\n"};

}  // namespace

// =============================================================================
// to_json
// =============================================================================

TEST(ToJson, scalars) {
    EXPECT_EQ(to_j("null"), json(nullptr));
    EXPECT_EQ(to_j("true"), json(true));
    EXPECT_EQ(to_j("-7"), json(-7));
    EXPECT_DOUBLE_EQ(to_j("2.5").get<double>(), 2.5);
}

TEST(ToJson, names_are_tagged) {
    EXPECT_EQ(to_j("/Catalog"), (json{{"/", "Catalog"}}));
}

TEST(ToJson, non_utf8_names_are_read_as_pdf_doc_encoding) {
    auto j = to_j("<< /Caf#E9 /Na#FFme >>");
    EXPECT_EQ(j, (json{{"Caf\xC3\xA9", {{"/", "Na\xC3\xBFme"}}}}));
    EXPECT_NO_THROW((void)j.dump());

    // Labels that are already UTF-8 pass through.
    EXPECT_EQ(to_j("/Caf#C3#A9"), (json{{"/", "Caf\xC3\xA9"}}));
}

TEST(ToJson, ill_formed_utf8_string_falls_back_to_hex) {
    auto j = to_j("<EFBBBFFF>");
    EXPECT_EQ(j, (json{{"hex", "efbbbfff"}}));
    EXPECT_NO_THROW((void)j.dump());

    EXPECT_EQ(to_j("<EFBBBFC3A9>"), json("\xC3\xA9"));
}

TEST(ExportJson, document_with_non_utf8_bytes_dumps) {
    constexpr auto text = std::string_view{
        "%PDF-1.7\n"
        "1 0 obj\n<< /Type /Catalog /Caf#E9 <EFBBBF80> >>\nendobj\n"
        "trailer\n<< /Root 1 0 R >>\n"};
    auto doc = Document::load(as_bytes(text));
    ASSERT_TRUE(doc) << doc.error().message;
    auto j = export_json(*doc);
    EXPECT_NO_THROW((void)j.dump());
    EXPECT_EQ(j["objects"]["1 0"]["Caf\xC3\xA9"], (json{{"hex", "efbbbf80"}}));
}

TEST(ToJson, text_and_binary_strings) {
    EXPECT_EQ(to_j("(Hello)"), json("Hello"));
    EXPECT_EQ(to_j("<FEFF00480069>"), json("Hi"));
    EXPECT_EQ(to_j("<00FF10>"), (json{{"hex", "00ff10"}}));
}

TEST(ToJson, containers) {
    auto j = to_j("<< /Kids [1 (a)] /Count 2 >>");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["Count"], json(2));
    EXPECT_EQ(j["Kids"], (json{1, "a"}));
}

TEST(ToJson, unresolved_reference) {
    EXPECT_EQ(to_j("4 0 R"), (json{{"ref", "4 0 R"}, {"resolved", false}}));
}

TEST(ToJson, stream_summarizes_payload) {
    auto j = to_j("<< /Length 3 >>\nstream\nabc\nendstream");
    EXPECT_EQ(j["length"], json(3));
    EXPECT_EQ(j["dict"]["Length"], json(3));
}

TEST(ToJson, object_id) {
    EXPECT_EQ(json(ObjectId{12, 1}), (json{{"number", 12}, {"generation", 1}}));
}

// =============================================================================
// export_json
// =============================================================================

TEST(ExportJson, whole_document) {
    auto doc = Document::load(as_bytes(sample));
    ASSERT_TRUE(doc) << doc.error().message;

    auto j = export_json(*doc);
    EXPECT_EQ(j["version"], json("1.6"));
    EXPECT_EQ(j["trailer"]["Size"], json(4));
    EXPECT_EQ(j["trailer"]["Root"], (json{{"ref", "1 0 R"}}));
    EXPECT_EQ(j["trailer"]["ID"][0], (json{{"hex", "0102"}}));

    ASSERT_EQ(j["objects"].size(), 3u);
    EXPECT_EQ(j["objects"]["1 0"]["Type"], (json{{"/", "Catalog"}}));
    // Cycles export as links, never expanded.
    EXPECT_EQ(j["objects"]["3 0"]["Parent"], (json{{"ref", "2 0 R"}}));
    EXPECT_EQ(j["objects"]["2 0"]["Kids"][0], (json{{"ref", "3 0 R"}}));
}

// =============================================================================
// get_pointer
// =============================================================================

TEST(GetPointer, follows_links) {
    auto doc = Document::load(as_bytes(sample));
    ASSERT_TRUE(doc);

    const auto* count = get_pointer(*doc, "/Root/Pages/Count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(*count, Value{std::int64_t{1}});

    const auto* page = get_pointer(*doc, "/Root/Pages/Kids/0");
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page, get_pointer(*doc, "/Root/Pages/Kids/0/Parent/Kids/0"));
}

TEST(GetPointer, escaped_segments) {
    auto doc = Document::load(as_bytes(sample));
    ASSERT_TRUE(doc);
    const auto* v = get_pointer(*doc, "/Root/Pages/Kids/0/A~1B");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->get_if<String>()->str(), "x");
}

TEST(GetPointer, missing_paths) {
    auto doc = Document::load(as_bytes(sample));
    ASSERT_TRUE(doc);
    EXPECT_EQ(get_pointer(*doc, ""), nullptr);
    EXPECT_EQ(get_pointer(*doc, "/Nope"), nullptr);
    EXPECT_EQ(get_pointer(*doc, "/Root/Pages/Kids/5"), nullptr);
    EXPECT_EQ(get_pointer(*doc, "/Root/Pages/Kids/01"), nullptr);
    EXPECT_EQ(get_pointer(*doc, "/Root/Pages/Kids/first"), nullptr);
}

TEST(GetPointer, malformed_pointer_throws) {
    auto doc = Document::load(as_bytes(sample));
    ASSERT_TRUE(doc);
    EXPECT_THROW(get_pointer(*doc, "Root"), std::runtime_error);
}
