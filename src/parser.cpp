#include <cos-cpp/parser.hpp>

#include "grammar/char_class.hpp"
#include "grammar/primitives.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace cos_cpp {

namespace {

using grammar::Input;
using grammar::Token;
using grammar::at_offset;
using grammar::no_match;
using grammar::skip_whitespace;
using grammar::starts_with;
using grammar::to_u8;

// The candidate decoders, in the order the dispatcher tries them.
//
// The order resolves the grammar's local ambiguities and must not change:
//   - reference before number: `1 2 R` would otherwise decode as the
//     number 1, leaving `2 R` behind;
//   - stream before dictionary: a stream starts with its dictionary, which
//     would otherwise decode alone and leave `stream ...` behind.
enum class Candidate : std::uint8_t {
    reference,
    stream,
    dictionary,
    string,
    name,
    array,
    null,
    boolean,
    number,
};

constexpr auto candidate_order = std::array{
    Candidate::reference,
    Candidate::stream,
    Candidate::dictionary,
    Candidate::string,
    Candidate::name,
    Candidate::array,
    Candidate::null,
    Candidate::boolean,
    Candidate::number,
};

class Parser {
public:
    Parser(Input in, const ParseLimits& limits) : in_{in}, limits_{limits} {}

    // The dispatcher: first candidate to succeed wins. When all fail, the
    // first failure more specific than "not recognized" is reported.
    auto parse_value(std::size_t pos) -> Result<Token> {
        auto first_specific = std::optional<Error>{};
        for (auto candidate : candidate_order) {
            auto result = try_candidate(candidate, pos);
            if (result) return result;
            if (!first_specific && result.error().kind != ErrorKind::unexpected_token) {
                first_specific = result.error();
            }
        }
        if (first_specific) return *first_specific;
        return Error{ErrorKind::unexpected_token, "no value" + at_offset(skip_whitespace(in_, pos))};
    }

private:
    auto try_candidate(Candidate candidate, std::size_t pos) -> Result<Token> {
        switch (candidate) {
            case Candidate::reference:  return grammar::decode_reference(in_, pos);
            case Candidate::stream:     return decode_stream(pos);
            case Candidate::dictionary: return decode_dictionary_candidate(pos);
            case Candidate::string:     return grammar::decode_string(in_, pos);
            case Candidate::name:       return grammar::decode_name(in_, pos);
            case Candidate::array:      return decode_array(pos);
            case Candidate::null:       return grammar::decode_null(in_, pos);
            case Candidate::boolean:    return grammar::decode_boolean(in_, pos);
            case Candidate::number:     return grammar::decode_number(in_, pos);
        }
        return no_match("value", pos);
    }

    // Tracks container nesting for the lifetime of one container decode.
    class DepthGuard {
    public:
        explicit DepthGuard(std::size_t& depth) : depth_{depth} { ++depth_; }
        ~DepthGuard() { --depth_; }
        DepthGuard(const DepthGuard&) = delete;
        auto operator=(const DepthGuard&) -> DepthGuard& = delete;
    private:
        std::size_t& depth_;
    };

    auto depth_error(std::size_t pos) const -> Error {
        return Error{ErrorKind::depth_exceeded,
                     "nesting deeper than " + std::to_string(limits_.max_depth) + at_offset(pos)};
    }

    // A child failure that is only "not recognized" means the container's
    // closing delimiter is missing; anything more specific is kept.
    static auto container_error(Error child, std::string_view what, std::size_t start) -> Error {
        if (child.kind != ErrorKind::unexpected_token) return child;
        return Error{ErrorKind::unterminated_container,
                     std::string{what} + " starting" + at_offset(start) + " is not terminated ("
                         + child.message + ")"};
    }

    // -- Array ----------------------------------------------------------------

    auto decode_array(std::size_t pos) -> Result<Token> {
        auto start = skip_whitespace(in_, pos);
        if (start >= in_.size() || to_u8(in_[start]) != '[') return no_match("array", start);
        if (depth_ >= limits_.max_depth) return depth_error(start);
        auto guard = DepthGuard{depth_};

        auto array = Array{};
        auto p = start + 1;
        while (true) {
            p = skip_whitespace(in_, p);
            auto element = parse_value(p);
            if (element) {
                array.elements.push_back(std::move(element->value));
                p = element->end;
                continue;
            }
            if (p < in_.size() && to_u8(in_[p]) == ']') {
                return Token{Value{std::move(array)}, p + 1};
            }
            return container_error(element.error(), "array", start);
        }
    }

    // -- Dictionary -----------------------------------------------------------

    auto decode_dictionary(std::size_t pos) -> Result<Token> {
        auto start = skip_whitespace(in_, pos);
        if (!starts_with(in_, start, "<<")) return no_match("dictionary", start);
        if (depth_ >= limits_.max_depth) return depth_error(start);
        auto guard = DepthGuard{depth_};

        auto dict = Dictionary{};
        auto p = start + 2;
        while (true) {
            p = skip_whitespace(in_, p);
            auto key = grammar::decode_name(in_, p);
            if (!key) {
                if (starts_with(in_, p, ">>")) return Token{Value{std::move(dict)}, p + 2};
                return container_error(key.error(), "dictionary", start);
            }

            auto label = std::move(key->value.get_if<Name>()->label);
            auto value = parse_value(key->end);
            if (!value) {
                if (value.error().kind != ErrorKind::unexpected_token) return value.error();
                return Error{ErrorKind::unterminated_container,
                             "dictionary key /" + label + " has no value" + at_offset(key->end)};
            }
            // Duplicate keys: the later value overwrites the earlier one.
            dict.set(std::move(label), std::move(value->value));
            p = value->end;
        }
    }

    // The stream candidate parses the leading dictionary first; when the
    // `stream` keyword does not follow, that result is memoized so the
    // dictionary candidate at the same position does not parse it again.
    auto decode_dictionary_candidate(std::size_t pos) -> Result<Token> {
        if (memo_ && memo_->first == pos) {
            auto result = std::move(memo_->second);
            memo_.reset();
            return result;
        }
        return decode_dictionary(pos);
    }

    // -- Stream ---------------------------------------------------------------

    auto decode_stream(std::size_t pos) -> Result<Token> {
        auto dict = decode_dictionary(pos);
        if (!dict) {
            auto error = dict.error();
            memo_.emplace(pos, std::move(dict));
            return error;
        }
        auto stream = stream_body(*dict);
        if (!stream) {
            // Once the `stream` keyword has been seen the bytes cannot be a
            // bare dictionary either, so the dictionary candidate reports
            // the stream's error.
            if (stream.error().kind == ErrorKind::unexpected_token) {
                memo_.emplace(pos, std::move(dict));
            } else {
                memo_.emplace(pos, stream.error());
            }
        }
        return stream;
    }

    auto stream_body(const Token& dict_token) -> Result<Token> {
        auto p = skip_whitespace(in_, dict_token.end);
        if (!starts_with(in_, p, "stream")) return no_match("stream keyword", p);
        auto keyword = p;
        p += 6;
        if (p < in_.size() && !grammar::is_token_boundary(to_u8(in_[p]))) {
            return no_match("stream keyword", keyword);
        }

        // The keyword is followed by exactly one EOL: LF or CRLF.
        if (starts_with(in_, p, "\r\n")) {
            p += 2;
        } else if (starts_with(in_, p, "\n")) {
            p += 1;
        } else {
            return Error{ErrorKind::unterminated_container,
                         "stream keyword not followed by end-of-line" + at_offset(keyword)};
        }
        auto data_begin = p;
        const auto& dict = *dict_token.value.get_if<Dictionary>();

        // Primary: a direct /Length, trusted only when endstream follows it.
        if (const auto* length = dict.get("Length")) {
            if (const auto* n = length->get_if<std::int64_t>(); n && *n >= 0 &&
                static_cast<std::uint64_t>(*n) <= in_.size() - data_begin) {
                auto data_end = data_begin + static_cast<std::size_t>(*n);
                auto q = data_end + grammar::eol_length(in_, data_end);
                if (starts_with(in_, q, "endstream")) {
                    return make_stream(dict, data_begin, data_end, q + 9);
                }
            }
        }

        // Fallback: the first endstream at the start of a line.
        for (auto q = data_begin; q < in_.size(); ++q) {
            if (!starts_with(in_, q, "endstream")) continue;
            if (q == data_begin) return make_stream(dict, data_begin, q, q + 9);
            auto prev = to_u8(in_[q - 1]);
            if (!grammar::is_eol(prev)) continue;
            auto data_end = q - 1;
            if (prev == '\n' && data_end > data_begin && to_u8(in_[data_end - 1]) == '\r') --data_end;
            return make_stream(dict, data_begin, data_end, q + 9);
        }
        return Error{ErrorKind::unterminated_container,
                     "stream starting" + at_offset(keyword) + " has no endstream"};
    }

    auto make_stream(const Dictionary& dict, std::size_t begin, std::size_t end,
                     std::size_t token_end) const -> Result<Token> {
        auto stream = Stream{};
        stream.dict = dict;
        stream.data.assign(in_.begin() + static_cast<std::ptrdiff_t>(begin),
                           in_.begin() + static_cast<std::ptrdiff_t>(end));
        return Token{Value{std::move(stream)}, token_end};
    }

    Input in_;
    const ParseLimits& limits_;
    std::size_t depth_{0};
    std::optional<std::pair<std::size_t, Result<Token>>> memo_;
};

}  // anonymous namespace

auto parse_value(std::span<const std::byte> input, const ParseLimits& limits)
    -> Result<DecodeResult> {
    auto parser = Parser{input, limits};
    auto token = parser.parse_value(0);
    if (!token) return token.error();
    return DecodeResult{std::move(token->value), token->end};
}

auto parse_value(std::string_view input, const ParseLimits& limits) -> Result<DecodeResult> {
    return parse_value(grammar::as_input(input), limits);
}

auto parse_object(std::span<const std::byte> input, const ParseLimits& limits) -> Result<Value> {
    auto parser = Parser{input, limits};
    auto token = parser.parse_value(0);
    if (!token) return token.error();
    auto rest = skip_whitespace(input, token->end);
    if (rest != input.size()) {
        return Error{ErrorKind::unexpected_token, "unexpected data after value" + at_offset(rest)};
    }
    return std::move(token->value);
}

auto parse_object(std::string_view input, const ParseLimits& limits) -> Result<Value> {
    return parse_object(grammar::as_input(input), limits);
}

}  // namespace cos_cpp
