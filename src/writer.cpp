#include <cos-cpp/writer.hpp>

#include "grammar/char_class.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <variant>

namespace cos_cpp {

namespace {

constexpr auto hex_digits = std::string_view{"0123456789ABCDEF"};

void append_hex_byte(std::string& out, std::uint8_t b) {
    out.push_back(hex_digits[b >> 4]);
    out.push_back(hex_digits[b & 0x0F]);
}

void write_real(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "0";
        return;
    }
    // Fixed notation only: the grammar has no exponent form.
    auto buffer = std::array<char, 512>{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), d,
                                   std::chars_format::fixed);
    if (ec != std::errc{}) {
        out += "0";
        return;
    }
    auto text = std::string_view{buffer.data(), static_cast<std::size_t>(ptr - buffer.data())};
    out += text;
    // Keep the value a real when read back.
    if (text.find('.') == std::string_view::npos) out += ".0";
}

void write_name(std::string& out, const Name& name) {
    out.push_back('/');
    for (auto ch : name.label) {
        auto c = static_cast<std::uint8_t>(ch);
        if (grammar::is_name_char(c) && c != '#') {
            out.push_back(ch);
        } else {
            out.push_back('#');
            append_hex_byte(out, c);
        }
    }
}

void write_string(std::string& out, const String& s) {
    if (s.form == StringForm::hex) {
        out.push_back('<');
        for (auto b : s.bytes) append_hex_byte(out, static_cast<std::uint8_t>(b));
        out.push_back('>');
        return;
    }
    out.push_back('(');
    for (auto b : s.bytes) {
        auto c = static_cast<std::uint8_t>(b);
        switch (c) {
            case '(':  out += "\\("; break;
            case ')':  out += "\\)"; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20 || c >= 0x7F) {
                    out.push_back('\\');
                    out.push_back(static_cast<char>('0' + ((c >> 6) & 7)));
                    out.push_back(static_cast<char>('0' + ((c >> 3) & 7)));
                    out.push_back(static_cast<char>('0' + (c & 7)));
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    out.push_back(')');
}

void write_value(std::string& out, const Value& value);

void write_dictionary(std::string& out, const Dictionary& dict) {
    out += "<<";
    auto first = true;
    for (const auto& [key, v] : dict) {
        if (!first) out.push_back(' ');
        first = false;
        write_name(out, Name{key});
        out.push_back(' ');
        write_value(out, v);
    }
    out += ">>";
}

void write_value(std::string& out, const Value& value) {
    std::visit(overload{
        [&](const Null&) { out += "null"; },
        [&](bool b) { out += b ? "true" : "false"; },
        [&](std::int64_t i) { out += std::to_string(i); },
        [&](double d) { write_real(out, d); },
        [&](const Name& n) { write_name(out, n); },
        [&](const String& s) { write_string(out, s); },
        [&](const Array& a) {
            out.push_back('[');
            for (std::size_t i = 0; i < a.elements.size(); ++i) {
                if (i > 0) out.push_back(' ');
                write_value(out, a.elements[i]);
            }
            out.push_back(']');
        },
        [&](const Dictionary& d) { write_dictionary(out, d); },
        [&](const Stream& s) {
            // Length always describes the bytes written.
            auto dict = s.dict;
            dict.set("Length", Value{static_cast<std::int64_t>(s.data.size())});
            write_dictionary(out, dict);
            out += "\nstream\n";
            out.append(reinterpret_cast<const char*>(s.data.data()), s.data.size());
            out += "\nendstream";
        },
        [&](const Reference& r) { out += r.id.to_reference_string(); },
        [&](const Link& l) { out += l.id.to_reference_string(); },
    }, value.data());
}

}  // anonymous namespace

auto to_cos_string(const Value& value) -> std::string {
    auto out = std::string{};
    write_value(out, value);
    return out;
}

auto write_object(const ObjectId& id, const Value& value) -> std::string {
    auto out = std::to_string(id.number) + " " + std::to_string(id.generation) + " obj\n";
    write_value(out, value);
    out += "\nendobj\n";
    return out;
}

}  // namespace cos_cpp
