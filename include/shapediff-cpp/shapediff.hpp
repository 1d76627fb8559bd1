/// @file shapediff.hpp
/// @brief Umbrella header for the shapediff-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Shape, Differ, Op, Patch, the JSON Patch lowering, JsonDiffer
/// and Error.

#pragma once

#include <shapediff-cpp/differ.hpp>
#include <shapediff-cpp/error.hpp>
#include <shapediff-cpp/json.hpp>
#include <shapediff-cpp/json_differ.hpp>
#include <shapediff-cpp/logging.hpp>
#include <shapediff-cpp/op.hpp>
#include <shapediff-cpp/patch.hpp>
#include <shapediff-cpp/pointer.hpp>
#include <shapediff-cpp/shape.hpp>
#include <shapediff-cpp/value.hpp>
