#pragma once

// zlib inflate for the FlateDecode stream filter.
//
// FlateDecode payloads carry the zlib wrapper (RFC 1950). Some writers emit
// raw DEFLATE instead; windowBits 15 + 32 lets zlib detect zlib and gzip
// headers, and a raw retry covers the rest.
//
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include <zlib.h>

namespace cos_cpp::filters {

enum class InflateStatus {
    ok,
    corrupt,
    too_large,
};

struct InflateResult {
    InflateStatus status;
    std::vector<std::byte> output;
};

// Decompress DEFLATE data. window_bits selects the framing:
// 15 + 32 = zlib or gzip (auto-detected), -15 = raw DEFLATE.
// max_output_size limits decompressed output to prevent memory bombs.
inline auto inflate_bytes(std::span<const std::byte> input, int window_bits,
                          std::size_t max_output_size) -> InflateResult {

    if (input.empty()) return {InflateStatus::ok, {}};

    // Start with 4x the input size, grow if needed
    auto output_size = std::max<std::size_t>(std::min(input.size() * 4, max_output_size), 1);
    auto output = std::vector<std::byte>(output_size);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output_size);

    auto ret = ::inflateInit2(&stream, window_bits);
    if (ret != Z_OK) return {InflateStatus::corrupt, {}};

    ret = ::inflate(&stream, Z_FINISH);

    auto needs_space = [&] {
        return (ret == Z_BUF_ERROR || ret == Z_OK) && stream.avail_out == 0;
    };

    while (needs_space() && output_size < max_output_size) {
        auto written = stream.total_out;
        output_size = std::min(output_size * 2, max_output_size);
        output.resize(output_size);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + written);
        stream.avail_out = static_cast<uInt>(output_size - written);
        ret = ::inflate(&stream, Z_FINISH);
    }

    auto total = stream.total_out;
    auto exhausted_budget = needs_space();
    ::inflateEnd(&stream);

    if (exhausted_budget) return {InflateStatus::too_large, {}};
    if (ret != Z_STREAM_END) return {InflateStatus::corrupt, {}};

    output.resize(total);
    return {InflateStatus::ok, std::move(output)};
}

}  // namespace cos_cpp::filters
