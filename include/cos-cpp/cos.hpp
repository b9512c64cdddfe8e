/// @file cos.hpp
/// @brief Umbrella header for the cos-cpp library.
///
/// Include this single header for access to all public types:
/// Value and its cases, the parser, the resolver, stream filters,
/// the writer, the segmenter, Document, and Error.

#pragma once

#include <cos-cpp/document.hpp>
#include <cos-cpp/error.hpp>
#include <cos-cpp/filter.hpp>
#include <cos-cpp/limits.hpp>
#include <cos-cpp/parser.hpp>
#include <cos-cpp/resolver.hpp>
#include <cos-cpp/segmenter.hpp>
#include <cos-cpp/types.hpp>
#include <cos-cpp/value.hpp>
#include <cos-cpp/writer.hpp>
