/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// Patch, PatchOptions, Operation, Pointer, Setter, Extension, Registry,
/// OutputFormat, Value and Error.

#pragma once

#include <jsonpatch-cpp/encoder.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/extension.hpp>
#include <jsonpatch-cpp/log.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/setter.hpp>
#include <jsonpatch-cpp/value.hpp>
