/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Patch, PatchBuilder, Operation, Pointer, diff, and PatchError.

#pragma once

#include <jsonpatch-cpp/builder.hpp>
#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
