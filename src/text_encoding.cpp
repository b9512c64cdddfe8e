#include <cos-cpp/value.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cos_cpp {

namespace {

constexpr char32_t replacement_char = 0xFFFD;

// PDFDocEncoding code points for bytes 0x18-0x1F and 0x80-0xA0; every
// other byte maps to the same Latin-1 code point.
constexpr auto pdf_doc_low = std::array<char32_t, 8>{
    0x02D8, 0x02C7, 0x02C6, 0x02D9, 0x02DD, 0x02DB, 0x02DA, 0x02DC,
};

constexpr auto pdf_doc_high = std::array<char32_t, 33>{
    0x2022, 0x2020, 0x2021, 0x2026, 0x2014, 0x2013, 0x0192, 0x2044,
    0x2039, 0x203A, 0x2212, 0x2030, 0x201E, 0x201C, 0x201D, 0x2018,
    0x2019, 0x201A, 0x2122, 0xFB01, 0xFB02, 0x0141, 0x0152, 0x0160,
    0x0178, 0x017D, 0x0131, 0x0142, 0x0153, 0x0161, 0x017E, replacement_char,
    0x20AC,
};

auto pdf_doc_code_point(std::uint8_t b) -> char32_t {
    if (b >= 0x18 && b <= 0x1F) return pdf_doc_low[b - 0x18];
    if (b >= 0x80 && b <= 0xA0) return pdf_doc_high[b - 0x80];
    if (b == 0x7F) return replacement_char;
    return b;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 when the
// bytes there are not one (overlong forms, surrogates and code points past
// U+10FFFF included).
auto utf8_sequence_length(std::string_view s, std::size_t pos) -> std::size_t {
    auto byte = [&](std::size_t i) { return static_cast<std::uint8_t>(s[i]); };
    auto lead = byte(pos);
    if (lead < 0x80) return 1;

    auto length = std::size_t{0};
    auto lo = std::uint8_t{0x80};
    auto hi = std::uint8_t{0xBF};
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (s.size() - pos < length) return 0;

    auto second = byte(pos + 1);
    if (second < lo || second > hi) return 0;
    for (std::size_t i = 2; i < length; ++i) {
        auto c = byte(pos + i);
        if (c < 0x80 || c > 0xBF) return 0;
    }
    return length;
}

auto is_valid_utf8(std::string_view s) -> bool {
    for (std::size_t pos = 0; pos < s.size();) {
        auto n = utf8_sequence_length(s, pos);
        if (n == 0) return false;
        pos += n;
    }
    return true;
}

// Copy well-formed sequences and replace each stray byte with U+FFFD.
auto sanitize_utf8(std::string_view s) -> std::string {
    auto out = std::string{};
    out.reserve(s.size());
    for (std::size_t pos = 0; pos < s.size();) {
        auto n = utf8_sequence_length(s, pos);
        if (n == 0) {
            append_utf8(out, replacement_char);
            ++pos;
        } else {
            out.append(s, pos, n);
            pos += n;
        }
    }
    return out;
}

auto has_prefix(const Bytes& bytes, std::initializer_list<std::uint8_t> prefix) -> bool {
    if (bytes.size() < prefix.size()) return false;
    auto i = std::size_t{0};
    for (auto b : prefix) {
        if (static_cast<std::uint8_t>(bytes[i++]) != b) return false;
    }
    return true;
}

// The bytes after a UTF-8 BOM, or all of them when there is none.
auto utf8_payload(const Bytes& bytes) -> std::string_view {
    auto skip = has_prefix(bytes, {0xEF, 0xBB, 0xBF}) ? std::size_t{3} : std::size_t{0};
    return {reinterpret_cast<const char*>(bytes.data()) + skip, bytes.size() - skip};
}

auto utf16be_to_utf8(const Bytes& bytes, std::size_t offset) -> std::string {
    auto out = std::string{};
    auto unit = [&](std::size_t i) -> char32_t {
        return (static_cast<char32_t>(bytes[i]) << 8) | static_cast<char32_t>(bytes[i + 1]);
    };
    auto i = offset;
    while (i + 1 < bytes.size()) {
        auto cu = unit(i);
        i += 2;
        if (cu >= 0xD800 && cu <= 0xDBFF) {
            if (i + 1 < bytes.size()) {
                auto lo = unit(i);
                if (lo >= 0xDC00 && lo <= 0xDFFF) {
                    i += 2;
                    append_utf8(out, 0x10000 + ((cu - 0xD800) << 10) + (lo - 0xDC00));
                    continue;
                }
            }
            append_utf8(out, replacement_char);
        } else if (cu >= 0xDC00 && cu <= 0xDFFF) {
            append_utf8(out, replacement_char);
        } else {
            append_utf8(out, cu);
        }
    }
    if (i < bytes.size()) append_utf8(out, replacement_char);  // dangling odd byte
    return out;
}

}  // anonymous namespace

auto label_to_utf8(std::string_view label) -> std::string {
    if (is_valid_utf8(label)) return std::string{label};
    auto out = std::string{};
    out.reserve(label.size() * 2);
    for (auto c : label) append_utf8(out, pdf_doc_code_point(static_cast<std::uint8_t>(c)));
    return out;
}

// The BOM is checked against the bytes again: `encoding` is a public field
// and may disagree with them.
auto String::text() const -> std::string {
    if (encoding == TextEncoding::utf16be) {
        return utf16be_to_utf8(bytes, has_prefix(bytes, {0xFE, 0xFF}) ? 2 : 0);
    }
    if (encoding == TextEncoding::utf8) return sanitize_utf8(utf8_payload(bytes));
    auto out = std::string{};
    out.reserve(bytes.size());
    for (auto b : bytes) append_utf8(out, pdf_doc_code_point(static_cast<std::uint8_t>(b)));
    return out;
}

auto String::is_text() const -> bool {
    if (encoding == TextEncoding::utf16be) return true;
    if (encoding == TextEncoding::utf8) return is_valid_utf8(utf8_payload(bytes));
    if (form == StringForm::hex) return false;
    for (auto b : bytes) {
        auto c = static_cast<std::uint8_t>(b);
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\b') return false;
        if (c == 0x7F || c == 0x9F) return false;
    }
    return true;
}

}  // namespace cos_cpp
