#include <cos-cpp/value.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace cos_cpp;

namespace {

auto bytes_of(std::vector<int> values) -> Bytes {
    auto out = Bytes{};
    for (auto v : values) out.push_back(static_cast<std::byte>(v));
    return out;
}

}  // namespace

// -- Construction / type queries ----------------------------------------------

TEST(Value, default_is_null) {
    auto v = Value{};
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type_name(), "null");
}

TEST(Value, type_names) {
    EXPECT_EQ(Value{true}.type_name(), "boolean");
    EXPECT_EQ(Value{std::int64_t{1}}.type_name(), "integer");
    EXPECT_EQ(Value{0.5}.type_name(), "real");
    EXPECT_EQ(make_name("Type").type_name(), "name");
    EXPECT_EQ(Value{String::from_string("x")}.type_name(), "string");
    EXPECT_EQ(Value{Array{}}.type_name(), "array");
    EXPECT_EQ(Value{Dictionary{}}.type_name(), "dictionary");
    EXPECT_EQ(Value{Stream{}}.type_name(), "stream");
    EXPECT_EQ((Value{Reference{{1, 0}}}.type_name()), "reference");
    EXPECT_EQ((Value{Link{{1, 0}, {}}}.type_name()), "link");
}

TEST(Value, numbers_keep_their_case) {
    auto i = Value{std::int64_t{123}};
    auto d = Value{0.05};
    EXPECT_TRUE(i.is<std::int64_t>());
    EXPECT_TRUE(d.is<double>());
    EXPECT_TRUE(i.is_number());
    EXPECT_TRUE(d.is_number());
    EXPECT_EQ(i.as_number(), 123.0);
    EXPECT_EQ(d.as_number(), 0.05);
    EXPECT_FALSE(make_name("N").as_number().has_value());
}

TEST(Value, integer_and_real_are_distinct) {
    EXPECT_NE(Value{std::int64_t{1}}, Value{1.0});
}

// -- String -------------------------------------------------------------------

TEST(String, from_string_is_literal_form) {
    auto s = String::from_string("Leonard Rosenthol");
    EXPECT_EQ(s.form, StringForm::literal);
    EXPECT_EQ(s.str(), "Leonard Rosenthol");
    EXPECT_FALSE(s.encoding.has_value());
}

TEST(String, detects_utf16be_bom) {
    auto s = String::from_bytes(bytes_of({0xFE, 0xFF, 0x00, 0x41}));
    ASSERT_TRUE(s.encoding.has_value());
    EXPECT_EQ(*s.encoding, TextEncoding::utf16be);
}

TEST(String, detects_utf8_bom) {
    auto s = String::from_bytes(bytes_of({0xEF, 0xBB, 0xBF, 'h', 'i'}));
    ASSERT_TRUE(s.encoding.has_value());
    EXPECT_EQ(*s.encoding, TextEncoding::utf8);
}

TEST(String, equality_ignores_form) {
    auto literal = String::from_bytes(bytes_of({'a', 'b'}), StringForm::literal);
    auto hex = String::from_bytes(bytes_of({'a', 'b'}), StringForm::hex);
    EXPECT_EQ(literal, hex);
}

TEST(TextEncoding, to_string_view) {
    EXPECT_EQ(to_string_view(TextEncoding::utf16be), "utf16be");
    EXPECT_EQ(to_string_view(TextEncoding::utf8), "utf8");
}

// -- Dictionary ---------------------------------------------------------------

TEST(Dictionary, set_and_get) {
    auto d = Dictionary{};
    d.set("Type", make_name("Page"));
    ASSERT_NE(d.get("Type"), nullptr);
    EXPECT_EQ(*d.get("Type"), make_name("Page"));
    EXPECT_EQ(d.get("Missing"), nullptr);
    EXPECT_TRUE(d.contains("Type"));
    EXPECT_EQ(d.size(), 1u);
}

TEST(Dictionary, set_overwrites_in_place) {
    auto d = Dictionary{};
    d.set("A", Value{std::int64_t{1}});
    d.set("B", Value{std::int64_t{2}});
    d.set("A", Value{std::int64_t{3}});
    EXPECT_EQ(d.size(), 2u);
    EXPECT_EQ(d.keys(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(*d.get("A"), Value{std::int64_t{3}});
}

TEST(Dictionary, erase) {
    auto d = Dictionary{};
    d.set("A", Value{true});
    EXPECT_TRUE(d.erase("A"));
    EXPECT_FALSE(d.erase("A"));
    EXPECT_TRUE(d.empty());
}

TEST(Dictionary, equality_ignores_order) {
    auto a = Dictionary{};
    a.set("X", Value{std::int64_t{1}});
    a.set("Y", Value{std::int64_t{2}});
    auto b = Dictionary{};
    b.set("Y", Value{std::int64_t{2}});
    b.set("X", Value{std::int64_t{1}});
    EXPECT_EQ(a, b);

    b.set("X", Value{std::int64_t{9}});
    EXPECT_NE(a, b);
}

// -- Navigation ---------------------------------------------------------------

TEST(Value, get_and_at) {
    auto inner = Array{};
    inner.elements.push_back(make_name("First"));
    auto d = Dictionary{};
    d.set("Kids", Value{std::move(inner)});
    auto v = Value{std::move(d)};

    ASSERT_NE(v.get("Kids"), nullptr);
    ASSERT_NE(v.get("Kids")->at(0), nullptr);
    EXPECT_EQ(*v.get("Kids")->at(0), make_name("First"));
    EXPECT_EQ(v.get("Kids")->at(1), nullptr);
    EXPECT_EQ(v.at(0), nullptr);
    EXPECT_EQ(make_name("x").get("Kids"), nullptr);
}

TEST(Value, get_reads_stream_dictionary) {
    auto s = Stream{};
    s.dict.set("Length", Value{std::int64_t{0}});
    auto v = Value{std::move(s)};
    ASSERT_NE(v.get("Length"), nullptr);
    EXPECT_EQ(*v.get("Length"), Value{std::int64_t{0}});
}

TEST(Value, deref_follows_links) {
    auto target = std::make_shared<Value>(make_name("Target"));
    auto link = Value{Link{{5, 0}, target}};
    ASSERT_NE(link.deref(), nullptr);
    EXPECT_EQ(link.deref(), target.get());
    EXPECT_EQ(get_as<Name>(&link)->label, "Target");
}

TEST(Value, deref_of_expired_link_is_null) {
    auto link = Value{};
    {
        auto target = std::make_shared<Value>(Value{true});
        link = Value{Link{{1, 0}, target}};
    }
    EXPECT_EQ(link.deref(), nullptr);
    EXPECT_FALSE(get_as<bool>(&link).has_value());
}

TEST(Value, links_compare_by_identity) {
    auto a = std::make_shared<Value>(Value{true});
    auto b = std::make_shared<Value>(Value{false});
    EXPECT_EQ((Value{Link{{1, 0}, a}}), (Value{Link{{1, 0}, b}}));
    EXPECT_NE((Value{Link{{1, 0}, a}}), (Value{Link{{2, 0}, a}}));
}

TEST(GetAs, typed_extraction) {
    auto v = Value{std::int64_t{7}};
    EXPECT_EQ(get_as<std::int64_t>(&v), 7);
    EXPECT_FALSE(get_as<double>(&v).has_value());
    EXPECT_FALSE(get_as<std::int64_t>(nullptr).has_value());
}

// -- Children -----------------------------------------------------------------

TEST(Value, primitives_have_no_children) {
    EXPECT_TRUE(Value{}.children().empty());
    EXPECT_TRUE(Value{std::int64_t{1}}.children().empty());
    EXPECT_TRUE((Value{Reference{{1, 0}}}.children().empty()));
}

TEST(Value, array_children_in_order) {
    auto a = Array{};
    a.elements.push_back(Value{std::int64_t{1}});
    a.elements.push_back(make_name("Two"));
    auto v = Value{std::move(a)};
    auto children = v.children();
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(*children[0], Value{std::int64_t{1}});
    EXPECT_EQ(*children[1], make_name("Two"));
}

TEST(Value, stream_children_are_dictionary_values) {
    auto s = Stream{};
    s.dict.set("Length", Value{std::int64_t{3}});
    s.data = bytes_of({'a', 'b', 'c'});
    auto v = Value{std::move(s)};
    ASSERT_EQ(v.children().size(), 1u);
    EXPECT_EQ(*v.children()[0], Value{std::int64_t{3}});
}

// -- Reference replacement ----------------------------------------------------

TEST(Value, replace_references_rewrites_nested_slots) {
    auto table = ObjectTable{};
    table[{2, 0}] = std::make_shared<Value>(make_name("Two"));

    auto inner = Array{};
    inner.elements.push_back(Value{Reference{{2, 0}}});
    auto d = Dictionary{};
    d.set("Direct", Value{Reference{{2, 0}}});
    d.set("Nested", Value{std::move(inner)});
    auto v = Value{std::move(d)};

    EXPECT_FALSE(v.replace_references(table).has_value());
    EXPECT_TRUE(v.get_if<Dictionary>()->get("Direct")->is<Link>());
    EXPECT_EQ(v.get("Direct"), table.at({2, 0}).get());
    EXPECT_EQ(v.get("Nested")->at(0), table.at({2, 0}).get());
}

TEST(Value, replace_references_reports_missing_identity) {
    auto a = Array{};
    a.elements.push_back(Value{Reference{{9, 0}}});
    auto v = Value{std::move(a)};
    auto err = v.replace_references(ObjectTable{});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::dangling_reference);
    EXPECT_NE(err->message.find("9 0 R"), std::string::npos);
}
