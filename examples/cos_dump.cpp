// cos_dump: load a file and print its resolved object graph as JSON
//
// Usage: cos_dump [--max-depth N] [--pointer /Root/Pages] FILE
//
// With --pointer only the value at that JSON Pointer (taken from the
// trailer) is printed.
//
// Build: cmake --build build
// Run:   ./build/examples/cos_dump sample.pdf

#include <cos-cpp/cos.hpp>
#include <cos-cpp/json.hpp>

#include <charconv>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>


namespace {

void print_usage(const char* program) {
    std::fprintf(stderr, "usage: %s [--max-depth N] [--pointer PATH] FILE\n", program);
}

auto read_file(const std::string& path) -> std::optional<std::vector<char>> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    return std::vector<char>{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

auto parse_size(std::string_view text) -> std::optional<std::size_t> {
    auto value = std::size_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

}  // namespace

int main(int argc, char** argv) {
    auto limits = cos_cpp::ParseLimits{};
    auto pointer = std::optional<std::string>{};
    auto path = std::optional<std::string>{};

    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--max-depth" && i + 1 < argc) {
            auto depth = parse_size(argv[++i]);
            if (!depth) {
                std::fprintf(stderr, "invalid --max-depth value: %s\n", argv[i]);
                return 2;
            }
            limits.max_depth = *depth;
        } else if (arg == "--pointer" && i + 1 < argc) {
            pointer = argv[++i];
        } else if (!path && !arg.starts_with("--")) {
            path = std::string{arg};
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }
    if (!path) {
        print_usage(argv[0]);
        return 2;
    }

    auto contents = read_file(*path);
    if (!contents) {
        std::fprintf(stderr, "cannot read %s\n", path->c_str());
        return 1;
    }

    auto bytes = std::as_bytes(std::span{*contents});
    auto doc = cos_cpp::Document::load(bytes, limits);
    if (!doc) {
        std::fprintf(stderr, "%s: %s: %s\n", path->c_str(),
                     std::string{cos_cpp::to_string_view(doc.error().kind)}.c_str(),
                     doc.error().message.c_str());
        return 1;
    }

    if (!pointer) {
        std::printf("%s\n", cos_cpp::export_json(*doc).dump(2).c_str());
        return 0;
    }

    try {
        const auto* value = cos_cpp::get_pointer(*doc, *pointer);
        if (value == nullptr) {
            std::fprintf(stderr, "no value at %s\n", pointer->c_str());
            return 1;
        }
        auto j = nlohmann::json{};
        cos_cpp::to_json(j, *value);
        std::printf("%s\n", j.dump(2).c_str());
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "invalid pointer: %s\n", e.what());
        return 2;
    }
    return 0;
}
