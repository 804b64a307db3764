// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by the merge engine.
///
/// - ImmutableValueError: base class
/// - NotImmutableError: a base argument is not a sealed ImmutableObject
/// - InvalidPatchError: a patch or construction source is not a mapping
/// - MalformedMergePairError: deep merge met a non-mapping pair
///
/// All of them are thrown before any result is built, so the values passed
/// to the failing call are still valid afterwards.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace imval {

/// @brief Base class for all imval exceptions
class ImmutableValueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief The base argument of an operation is not an ImmutableObject
class NotImmutableError : public ImmutableValueError {
public:
    /// @param operation Name of the rejecting operation (e.g. "set")
    /// @param actual_type Type name of the value that was passed instead
    NotImmutableError(std::string operation, std::string actual_type)
        : ImmutableValueError(operation + ": attempted to set fields on a " + actual_type +
                              " that is not an instance of ImmutableObject")
        , operation_(std::move(operation))
        , actual_type_(std::move(actual_type))
    {}

    const std::string& operation() const noexcept { return operation_; }
    const std::string& actual_type() const noexcept { return actual_type_; }

private:
    std::string operation_;
    std::string actual_type_;
};

/// @brief A patch (or construction source) is null, an array or a scalar
class InvalidPatchError : public ImmutableValueError {
public:
    /// @param operation Name of the rejecting operation
    /// @param actual_type Type name of the rejected patch
    InvalidPatchError(std::string operation, std::string actual_type)
        : ImmutableValueError("Invalid " + operation + " argument: expected a map or object, got " +
                              actual_type)
        , operation_(std::move(operation))
        , actual_type_(std::move(actual_type))
    {}

    const std::string& operation() const noexcept { return operation_; }
    const std::string& actual_type() const noexcept { return actual_type_; }

private:
    std::string operation_;
    std::string actual_type_;
};

/// @brief Deep merge reached a pair of values that can't be merged key-wise
///
/// Raised when, at some depth, the base or the patch is not a mapping.
/// The whole merge is aborted; no partially merged tree escapes.
class MalformedMergePairError : public ImmutableValueError {
public:
    /// @param path Dot path of the offending pair ("/" for the root)
    /// @param base_type Type name found on the base side
    /// @param patch_type Type name found on the patch side
    MalformedMergePairError(std::string path, std::string base_type, std::string patch_type)
        : ImmutableValueError("Tried to merge " + patch_type + " into " + base_type +
                              " at '" + path + "', both sides must be maps or objects")
        , path_(std::move(path))
        , base_type_(std::move(base_type))
        , patch_type_(std::move(patch_type))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& base_type() const noexcept { return base_type_; }
    const std::string& patch_type() const noexcept { return patch_type_; }

private:
    std::string path_;
    std::string base_type_;
    std::string patch_type_;
};

} // namespace imval
