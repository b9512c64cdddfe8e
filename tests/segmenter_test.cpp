#include <cos-cpp/segmenter.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

using namespace cos_cpp;

namespace {

auto as_bytes(std::string_view s) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

auto as_text(std::span<const std::byte> bytes) -> std::string {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

constexpr auto minimal = std::string_view{
    "%PDF-1.4\n"
    "%\xe2\xe3\xcf\xd3\n"
    "1 0 obj\n"
    "<< /Type /Catalog >>\n"
    "endobj\n"
    "2 0 obj 42 endobj\n"
    "xref\n"
    "0 3\n"
    "0000000000 65535 f \n"
    "trailer\n"
    "<< /Size 3 /Root 1 0 R >>\n"
    "startxref\n"
    "0\n"
    "%%EOF\n"};

}  // namespace

TEST(SegmentFile, minimal_file) {
    auto r = segment_file(as_bytes(minimal));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r->version, "1.4");
    ASSERT_EQ(r->objects.size(), 2u);

    EXPECT_EQ(r->objects[0].id, (ObjectId{1, 0}));
    EXPECT_EQ(as_text(r->objects[0].content), "\n<< /Type /Catalog >>\n");

    // Body on the header line.
    EXPECT_EQ(r->objects[1].id, (ObjectId{2, 0}));
    EXPECT_EQ(as_text(r->objects[1].content), " 42 ");

    EXPECT_EQ(as_text(r->trailer), "\n<< /Size 3 /Root 1 0 R >>\n");
    EXPECT_EQ(as_text(r->xref).substr(0, 4), "xref");
}

TEST(SegmentFile, crlf_line_endings) {
    auto text = std::string_view{
        "%PDF-1.7\r\n"
        "5 2 obj\r\n"
        "(x)\r\n"
        "endobj\r\n"
        "trailer\r\n"
        "<< /Size 6 >>\r\n"};
    auto r = segment_file(as_bytes(text));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r->version, "1.7");
    ASSERT_EQ(r->objects.size(), 1u);
    EXPECT_EQ(r->objects[0].id, (ObjectId{5, 2}));
    EXPECT_EQ(as_text(r->trailer), "\r\n<< /Size 6 >>\r\n");
    EXPECT_TRUE(r->xref.empty());
}

TEST(SegmentFile, multi_line_body) {
    auto text = std::string_view{
        "%PDF-1.5\n"
        "1 0 obj\n"
        "<<\n"
        "  /Kids [2 0 R\n"
        "         3 0 R]\n"
        ">>\n"
        "endobj\n"
        "trailer << /Root 1 0 R >>\n"};
    auto r = segment_file(as_bytes(text));
    ASSERT_TRUE(r);
    ASSERT_EQ(r->objects.size(), 1u);
    EXPECT_EQ(as_text(r->objects[0].content), "\n<<\n  /Kids [2 0 R\n         3 0 R]\n>>\n");
    EXPECT_EQ(as_text(r->trailer), " << /Root 1 0 R >>\n");
}

TEST(SegmentFile, endobj_on_the_last_body_line) {
    auto text = std::string_view{
        "%PDF-1.5\n"
        "1 0 obj\n"
        "[1 2 3]endobj\n"
        "trailer\n<< >>\n"};
    auto r = segment_file(as_bytes(text));
    ASSERT_TRUE(r);
    EXPECT_EQ(as_text(r->objects[0].content), "\n[1 2 3]");
}

TEST(SegmentFile, last_trailer_wins) {
    auto text = std::string_view{
        "%PDF-1.6\n"
        "1 0 obj null endobj\n"
        "trailer\n<< /Size 1 >>\n"
        "startxref\n0\n%%EOF\n"
        "2 0 obj null endobj\n"
        "trailer\n<< /Size 2 /Prev 0 >>\n"
        "startxref\n0\n%%EOF\n"};
    auto r = segment_file(as_bytes(text));
    ASSERT_TRUE(r);
    EXPECT_EQ(r->objects.size(), 2u);
    EXPECT_EQ(as_text(r->trailer), "\n<< /Size 2 /Prev 0 >>\n");
}

TEST(SegmentFile, header_after_leading_garbage) {
    auto text = std::string_view{"junk\n%PDF-2.0 \ntrailer\n<< >>\n"};
    auto r = segment_file(as_bytes(text));
    ASSERT_TRUE(r);
    EXPECT_EQ(r->version, "2.0");
    EXPECT_TRUE(r->objects.empty());
}

// =============================================================================
// Structural errors
// =============================================================================

TEST(SegmentFile, missing_header) {
    auto r = segment_file(as_bytes("1 0 obj null endobj\ntrailer\n<< >>\n"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_document);
}

TEST(SegmentFile, missing_trailer) {
    auto r = segment_file(as_bytes("%PDF-1.4\n1 0 obj null endobj\n"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_document);
    EXPECT_NE(r.error().message.find("trailer"), std::string::npos);
}

TEST(SegmentFile, unclosed_object) {
    auto r = segment_file(as_bytes("%PDF-1.4\n3 0 obj\n<< /A 1 >>\ntrailer\n<< >>\n"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_document);
    EXPECT_NE(r.error().message.find("3 0"), std::string::npos);
}

TEST(SegmentFile, duplicate_object) {
    auto r = segment_file(as_bytes("%PDF-1.4\n1 0 obj 1 endobj\n1 0 obj 2 endobj\ntrailer\n<< >>\n"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_document);
}

TEST(SegmentFile, same_number_other_generation_is_distinct) {
    auto r = segment_file(as_bytes("%PDF-1.4\n1 0 obj 1 endobj\n1 1 obj 2 endobj\ntrailer\n<< >>\n"));
    ASSERT_TRUE(r);
    EXPECT_EQ(r->objects.size(), 2u);
}

TEST(SegmentFile, object_count_is_bounded) {
    auto limits = ParseLimits{};
    limits.max_objects = 1;
    auto r = segment_file(as_bytes("%PDF-1.4\n1 0 obj 1 endobj\n2 0 obj 2 endobj\ntrailer\n<< >>\n"), limits);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_document);
}

TEST(SegmentFile, endobj_inside_stream_payload_is_data) {
    auto text = std::string_view{
        "%PDF-1.4\n"
        "1 0 obj\n"
        "<< /Length 9 >>\n"
        "stream\n"
        "ab\nendobj\n"
        "endstream\n"
        "endobj\n"
        "2 0 obj\n"
        "<< /Length 9 >>\n"
        "stream\n"
        "ab\rendobj\n"
        "endstream endobj\n"
        "trailer\n"
        "<< /Root 1 0 R >>\n"};
    auto r = segment_file(as_bytes(text));
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r->objects.size(), 2u);
    EXPECT_EQ(as_text(r->objects[0].content), "\n<< /Length 9 >>\nstream\nab\nendobj\nendstream\n");
    EXPECT_EQ(as_text(r->objects[1].content), "\n<< /Length 9 >>\nstream\nab\rendobj\nendstream ");
}

TEST(SegmentFile, stream_without_usable_length_ends_at_endstream) {
    auto text = std::string_view{
        "%PDF-1.4\n"
        "1 0 obj\n"
        "<< /Length 99 >>\n"
        "stream\n"
        "ab endobj\n"
        "endstream\n"
        "endobj\n"
        "trailer\n"
        "<< >>\n"};
    auto r = segment_file(as_bytes(text));
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r->objects.size(), 1u);
    EXPECT_EQ(as_text(r->objects[0].content), "\n<< /Length 99 >>\nstream\nab endobj\nendstream\n");
}
