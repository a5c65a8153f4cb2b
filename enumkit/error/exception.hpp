/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exceptions carrying their throw site

**************************************************/

#ifndef ENUMKIT_ERROR_EXCEPTION_HPP
#define ENUMKIT_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "enumkit/macro.hpp"

namespace enumkit::error {

/**
 * @brief Base exception carrying the throw site and a formatted message.
 *
 * The message is built with fmt-style placeholders from the trailing
 * arguments. When no arguments follow, the message is taken verbatim so
 * user supplied text containing braces is never reinterpreted.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              std::string_view format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        if constexpr (sizeof...(Args) == 0) {
            message_ = std::string(format);
        } else {
            message_ =
                fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class OutOfRange : public Exception {
public:
    using Exception::Exception;
};

class UnlawfulOperation : public Exception {
public:
    using Exception::Exception;
};

}  // namespace enumkit::error

#define THROW_EXCEPTION(...)                                           \
    throw enumkit::error::Exception(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, \
                                    ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                        \
    throw enumkit::error::InvalidArgument(ENUMKIT_FILE_NAME,               \
                                          ENUMKIT_FILE_LINE,               \
                                          ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_OUT_OF_RANGE(...)                                          \
    throw enumkit::error::OutOfRange(ENUMKIT_FILE_NAME, ENUMKIT_FILE_LINE, \
                                     ENUMKIT_FUNC_NAME, __VA_ARGS__)

#define THROW_UNLAWFUL_OPERATION(...)                                        \
    throw enumkit::error::UnlawfulOperation(ENUMKIT_FILE_NAME,               \
                                            ENUMKIT_FILE_LINE,               \
                                            ENUMKIT_FUNC_NAME, __VA_ARGS__)

#endif  // ENUMKIT_ERROR_EXCEPTION_HPP
