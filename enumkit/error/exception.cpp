/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exceptions carrying their throw site

**************************************************/

#include "exception.hpp"

#include <sstream>

namespace enumkit::error {

// Rendered once, on first call. Layout:
//   <message> [<file>:<line> in <function>, thread <id>]
auto Exception::what() const noexcept -> const char* {
    if (!full_message_.empty()) {
        return full_message_.c_str();
    }
    try {
        std::ostringstream thread;
        thread << thread_id_;
        full_message_ = fmt::format("{} [{}:{} in {}, thread {}]", message_,
                                    file_, line_, func_, thread.str());
    } catch (const std::exception&) {
        return message_.c_str();
    }
    return full_message_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }

auto Exception::getLine() const -> int { return line_; }

auto Exception::getFunction() const -> std::string { return func_; }

auto Exception::getMessage() const -> std::string { return message_; }

auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }

}  // namespace enumkit::error
