/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: Common macros shared by the enumkit modules

**************************************************/

#ifndef ENUMKIT_MACRO_HPP
#define ENUMKIT_MACRO_HPP

#define ENUMKIT_FILE_NAME __FILE__
#define ENUMKIT_FILE_LINE __LINE__

#if defined(__GNUC__) || defined(__clang__)
#define ENUMKIT_FUNC_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define ENUMKIT_FUNC_NAME __FUNCSIG__
#else
#define ENUMKIT_FUNC_NAME __func__
#endif

#if defined(__GNUC__) || defined(__clang__)
#define ENUMKIT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define ENUMKIT_UNLIKELY(x) (x)
#endif

// Discards a [[nodiscard]] result on purpose
#define ENUMKIT_UNUSED_RESULT(expr) static_cast<void>(expr)

#endif  // ENUMKIT_MACRO_HPP
