#include <cos-cpp/segmenter.hpp>
#include <cos-cpp/parser.hpp>

#include "grammar/char_class.hpp"
#include "grammar/primitives.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace cos_cpp {

namespace {

using grammar::Input;
using grammar::to_u8;

// One line of the file: [begin, end) without its end-of-line marker, and
// the start of the following line.
struct Line {
    std::size_t begin;
    std::size_t end;
    std::size_t next;
};

auto read_line(Input in, std::size_t pos) -> Line {
    auto end = pos;
    while (end < in.size() && !grammar::is_eol(to_u8(in[end]))) ++end;
    return {pos, end, end + grammar::eol_length(in, end)};
}

// The line with leading and trailing whitespace removed.
auto trimmed(Input in, Line line) -> Line {
    while (line.begin < line.end && grammar::is_whitespace(to_u8(in[line.begin]))) ++line.begin;
    while (line.end > line.begin && grammar::is_whitespace(to_u8(in[line.end - 1]))) --line.end;
    return line;
}

auto invalid(std::string message) -> Error {
    return Error{ErrorKind::invalid_document, std::move(message)};
}

// Does the (trimmed) line start with `keyword` as a whole token?
auto starts_with_keyword(Input in, Line line, std::string_view keyword) -> bool {
    if (!grammar::starts_with(in, line.begin, keyword)) return false;
    auto after = line.begin + keyword.size();
    return after >= line.end || grammar::is_token_boundary(to_u8(in[after]));
}

// Parse `N G obj` at the start of a trimmed line.
// Returns the identity and the position just past `obj`.
auto object_header(Input in, Line line) -> std::optional<std::pair<ObjectId, std::size_t>> {
    auto p = line.begin;
    auto number = grammar::detail::read_unsigned(in, p);
    if (!number || p >= line.end || !grammar::is_whitespace(to_u8(in[p]))) return std::nullopt;
    while (p < line.end && grammar::is_whitespace(to_u8(in[p]))) ++p;
    auto generation = grammar::detail::read_unsigned(in, p);
    if (!generation || p >= line.end || !grammar::is_whitespace(to_u8(in[p]))) return std::nullopt;
    while (p < line.end && grammar::is_whitespace(to_u8(in[p]))) ++p;
    if (!starts_with_keyword(in, Line{p, line.end, line.next}, "obj")) return std::nullopt;
    return std::pair{ObjectId{*number, *generation}, p + 3};
}

// Position of an `endobj` that closes the (trimmed) line, if any.
auto endobj_at_end(Input in, std::size_t from, std::size_t line_end) -> std::optional<std::size_t> {
    constexpr auto keyword = std::string_view{"endobj"};
    if (line_end < from || line_end - from < keyword.size()) return std::nullopt;
    auto at = line_end - keyword.size();
    if (!grammar::starts_with(in, at, keyword)) return std::nullopt;
    if (at > from && !grammar::is_token_boundary(to_u8(in[at - 1]))) return std::nullopt;
    return at;
}

// Where the search for endobj may begin. A stream payload is opaque and may
// itself contain lines ending in endobj, so when the body decodes as a
// stream the search starts after its endstream.
auto endobj_search_start(Input in, std::size_t content_begin, const ParseLimits& limits)
    -> std::size_t {
    auto body = parse_value(in.subspan(content_begin), limits);
    if (body && body->value.is<Stream>()) return content_begin + body->bytes_read;
    return content_begin;
}

}  // anonymous namespace

auto segment_file(std::span<const std::byte> data, const ParseLimits& limits)
    -> Result<FileSegments> {
    auto segments = FileSegments{};

    // -- Header ---------------------------------------------------------------
    auto pos = std::size_t{0};
    auto found_header = false;
    while (pos < data.size()) {
        auto line = read_line(data, pos);
        pos = line.next;
        if (grammar::starts_with(data, line.begin, "%PDF-")) {
            auto version = trimmed(data, Line{line.begin + 5, line.end, line.next});
            segments.version = std::string{grammar::text_of(data, version.begin, version.end)};
            found_header = true;
            break;
        }
    }
    if (!found_header) return invalid("missing %PDF- header");

    // -- Body, cross-reference section and trailer ----------------------------
    auto seen = std::set<ObjectId>{};
    auto xref_begin = std::optional<std::size_t>{};
    auto trailer_found = false;

    while (pos < data.size()) {
        auto raw = read_line(data, pos);
        auto line = trimmed(data, raw);
        pos = raw.next;

        if (auto header = object_header(data, line)) {
            auto [id, content_begin] = *header;
            if (!seen.insert(id).second) {
                return invalid("duplicate object " + std::to_string(id.number) + " "
                               + std::to_string(id.generation));
            }
            if (seen.size() > limits.max_objects) {
                return invalid("more than " + std::to_string(limits.max_objects) + " objects");
            }

            // Scan from the rest of the header line to the closing endobj.
            auto scan_from = content_begin;
            auto search_from = endobj_search_start(data, content_begin, limits);
            auto current = search_from == content_begin
                ? Line{content_begin, line.end, raw.next}
                : read_line(data, search_from);
            auto closed = std::optional<std::size_t>{};
            while (true) {
                auto end = trimmed(data, current).end;
                if ((closed = endobj_at_end(data, current.begin, end))) break;
                if (current.next >= data.size()) break;
                current = read_line(data, current.next);
            }
            if (!closed) {
                return invalid("object " + std::to_string(id.number) + " "
                               + std::to_string(id.generation) + " is not closed by endobj");
            }
            segments.objects.push_back(RawObject{id, data.subspan(scan_from, *closed - scan_from)});
            pos = current.next;
            continue;
        }

        if (starts_with_keyword(data, line, "xref")) {
            xref_begin = raw.begin;
            continue;
        }

        if (starts_with_keyword(data, line, "trailer")) {
            // A later trailer (incremental update) supersedes an earlier one.
            auto trailer_begin = line.begin + 7;
            auto trailer_end = data.size();
            auto next = raw.next;
            while (next < data.size()) {
                auto candidate = read_line(data, next);
                if (starts_with_keyword(data, trimmed(data, candidate), "startxref")) {
                    trailer_end = candidate.begin;
                    break;
                }
                next = candidate.next;
            }
            segments.trailer = data.subspan(trailer_begin, trailer_end - trailer_begin);
            if (xref_begin) {
                segments.xref = data.subspan(*xref_begin, raw.begin - *xref_begin);
                xref_begin.reset();
            }
            trailer_found = true;
            pos = next;
            continue;
        }
    }

    if (!trailer_found) return invalid("missing trailer");
    return segments;
}

}  // namespace cos_cpp
