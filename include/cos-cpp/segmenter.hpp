/// @file segmenter.hpp
/// @brief Line-based splitting of a file into header, objects,
/// cross-reference section and trailer.

#pragma once

#include <cos-cpp/error.hpp>
#include <cos-cpp/limits.hpp>
#include <cos-cpp/types.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace cos_cpp {

/// One indirect object as framed in the file, before parsing.
struct RawObject {
    ObjectId id;                         ///< From the `N G obj` line.
    std::span<const std::byte> content;  ///< The bytes between `obj` and `endobj`.
};

/// The structural parts of a file. All spans point into the input buffer.
struct FileSegments {
    std::string version;                 ///< e.g. "1.7" from `%PDF-1.7`.
    std::vector<RawObject> objects;      ///< In file order.
    std::span<const std::byte> xref;     ///< The `xref` section, opaque; empty if absent.
    std::span<const std::byte> trailer;  ///< The trailer dictionary bytes.
};

/// Split a file into its structural parts by scanning lines.
///
/// The header is the first line starting with `%PDF-`. Each object starts
/// on a line beginning `N G obj` (the body may continue on the same line)
/// and ends at the next `endobj`. The trailer is the text after the last
/// `trailer` keyword, up to `startxref` or end of file.
///
/// @return invalid_document if the header or trailer is missing, an object
///   is not closed, or two objects share an identity.
auto segment_file(std::span<const std::byte> data, const ParseLimits& limits = {})
    -> Result<FileSegments>;

}  // namespace cos_cpp
