/// @file docmerge.hpp
/// @brief Umbrella header for the docmerge-cpp library.
///
/// Include this single header for access to all public types:
/// OpId, Value, Map, List, the patch tree, apply_patch, and Error.
/// JSON interop lives in <docmerge-cpp/json.hpp>.

#pragma once

#include <docmerge-cpp/apply_patch.hpp>
#include <docmerge-cpp/document.hpp>
#include <docmerge-cpp/error.hpp>
#include <docmerge-cpp/patch.hpp>
#include <docmerge-cpp/types.hpp>
#include <docmerge-cpp/value.hpp>
