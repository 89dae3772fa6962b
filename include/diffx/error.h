// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Exception types thrown by diffx.
///
/// Every failure is synchronous and all-or-nothing: an operation either
/// returns its complete result or throws one of these, never both.
///
/// - ParseError: malformed input text for a given format
/// - InvalidOptions: option values rejected before any comparison work
/// - UnsupportedFormat: unknown output or input format name
///
/// A root-level type mismatch is NOT an error; diff() reports it as a
/// TypeChanged record.

#pragma once

#include "api.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace diffx {

/// Base class of all diffx exceptions
class DIFFX_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DIFFX_API ParseError : public Error {
public:
    ParseError(std::string format, std::string message)
        : Error(format + " parse error: " + message)
        , format_(std::move(format))
        , message_(std::move(message)) {}

    /// Adapter name: "json", "yaml", "toml", "csv", "ini" or "xml"
    [[nodiscard]] const std::string& format() const noexcept { return format_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    std::string format_;
    std::string message_;
};

class DIFFX_API InvalidOptions : public Error {
public:
    using Error::Error;
};

class DIFFX_API UnsupportedFormat : public Error {
public:
    explicit UnsupportedFormat(std::string name)
        : Error("unsupported format: '" + name + "'")
        , name_(std::move(name)) {}

    [[nodiscard]] const std::string& format_name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace diffx
