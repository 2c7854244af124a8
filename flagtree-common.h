/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include <ustring/ustring.h>
#include <string>
#include <string_view>
#include <functional>
#include <map>
#include <list>
#include <vector>
#include <cwctype>
#include <variant>
#include <optional>
#include <memory>
#include <set>
#include <type_traits>
#include <concepts>
#include <cinttypes>
#include <algorithm>
#include <iostream>
#include <cstdlib>

/* compile-time trace level of the matcher (0: disabled, 1: decisions, 2: every token) */
#ifndef FLAGTREE_TRACE_LEVEL
#define FLAGTREE_TRACE_LEVEL 0
#endif

#define FLAGTREE_TRACE(level, ...)																			\
	do {																									\
		if constexpr (FLAGTREE_TRACE_LEVEL >= (level))														\
			std::wcerr << L"[flagtree:" << (level) << L"] " << str::wd::Build(__VA_ARGS__) << L'\n';		\
	} while (false)

namespace flagtree {
	class Parsed;
	namespace detail {
		class Parser;
	}

	/* any enum or integer is considered an id */
	template <class Type>
	concept IsId = std::is_integral_v<Type> || std::is_enum_v<Type>;

	/* cardinality of switches and positionals (repeated allows zero or more occurrences) */
	enum class Arity : uint8_t {
		optional,
		required,
		repeated
	};

	/* selected entry of an enum-typed value */
	struct EnumValue {
		std::wstring name;
		size_t id = 0;
		bool operator==(const flagtree::EnumValue&) const = default;
	};

	/* verbatim argument bytes of path/bytes-typed values */
	struct RawValue {
		std::string bytes;
		bool operator==(const flagtree::RawValue&) const = default;
	};

	using Checker = std::function<std::wstring(const flagtree::Parsed&)>;

	/* exception thrown when using the library in an invalid way */
	struct Exception : public str::BuildException {
		template <class... Args>
		constexpr Exception(const Args&... args) : str::BuildException{ args... } {}
	};

	/* exception thrown when a malformed grammar is used */
	struct ConfigException : public flagtree::Exception {
		template <class... Args>
		constexpr ConfigException(const Args&... args) : flagtree::Exception{ args... } {}
	};

	/* exception thrown when accessing a flagtree::Value as a certain type, which it is not */
	struct TypeException : public flagtree::Exception {
		template <class... Args>
		constexpr TypeException(const Args&... args) : flagtree::Exception{ args... } {}
	};

	enum class ErrorKind : uint8_t {
		unknownSwitch,
		unexpectedArgument,
		missingValue,
		duplicateSwitch,
		missingRequired,
		typeConversion,
		constraint,
		help
	};

	/* error produced for invalid arguments or for requested help (the help text is the message)
	*	Note: exit code is 0 for help-requests and 2 for any actual failure */
	struct Error : public flagtree::Exception {
	private:
		std::wstring pMessage;
		flagtree::ErrorKind pKind = flagtree::ErrorKind::constraint;

	public:
		template <class... Args>
		Error(flagtree::ErrorKind kind, const Args&... args) : flagtree::Exception{ args... }, pMessage{ str::wd::Build(args...) }, pKind{ kind } {}

	public:
		constexpr flagtree::ErrorKind kind() const {
			return pKind;
		}
		constexpr const std::wstring& message() const {
			return pMessage;
		}
		constexpr bool help() const {
			return (pKind == flagtree::ErrorKind::help);
		}
		constexpr int exitCode() const {
			return (help() ? 0 : 2);
		}

		/* print the message (and the hint for failures) and terminate the process with the exit code */
		[[noreturn]] void exit(const std::wstring& hint = L"") const {
			if (help())
				std::wcout << pMessage << std::endl;
			else {
				std::wcerr << pMessage << std::endl;
				if (!hint.empty())
					std::wcerr << hint << std::endl;
			}
			std::exit(exitCode());
		}
	};
}
