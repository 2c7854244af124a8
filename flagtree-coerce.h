/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"
#include "flagtree-value.h"
#include "flagtree-config.h"
#include "flagtree-tokens.h"

namespace flagtree::detail {
	/* parse the text into the value and return an empty string on success or the failure reason */
	using TextParser = std::wstring(*)(const std::wstring& text, const flagtree::Type& type, flagtree::Value& out);

	/* target of a coercion with its resolved parser (null parser implies raw arguments) */
	struct ValidValue {
		const flagtree::Type* type = nullptr;
		detail::TextParser parser = nullptr;
	};

	inline std::wstring ParseString(const std::wstring& text, const flagtree::Type&, flagtree::Value& out) {
		out = flagtree::Value{ text };
		return L"";
	}
	inline std::wstring ParseINum(const std::wstring& text, const flagtree::Type&, flagtree::Value& out) {
		auto [num, len, res] = str::SiParseNum<int64_t>(text, { .prefix = str::PrefixMode::overwrite, .scale = str::SiScaleMode::detect });
		if (res != str::NumResult::valid || len != text.size() || text.empty())
			return L"not a valid signed integer";
		out = flagtree::Value{ num };
		return L"";
	}
	inline std::wstring ParseUNum(const std::wstring& text, const flagtree::Type&, flagtree::Value& out) {
		auto [num, len, res] = str::SiParseNum<uint64_t>(text, { .prefix = str::PrefixMode::overwrite, .scale = str::SiScaleMode::detect });
		if (res != str::NumResult::valid || len != text.size() || text.empty())
			return L"not a valid unsigned integer";
		out = flagtree::Value{ num };
		return L"";
	}
	inline std::wstring ParseReal(const std::wstring& text, const flagtree::Type&, flagtree::Value& out) {
		auto [num, len, res] = str::SiParseNum<double>(text, { .prefix = str::PrefixMode::overwrite, .scale = str::SiScaleMode::detect });
		if (res != str::NumResult::valid || len != text.size() || text.empty())
			return L"not a valid real";
		out = flagtree::Value{ num };
		return L"";
	}
	inline std::wstring ParseBoolean(const std::wstring& text, const flagtree::Type&, flagtree::Value& out) {
		if (str::View{ text }.icompare(L"true") || text == L"1") {
			out = flagtree::Value{ true };
			return L"";
		}
		if (str::View{ text }.icompare(L"false") || text == L"0") {
			out = flagtree::Value{ false };
			return L"";
		}
		return L"expected true or false";
	}
	inline std::wstring ParseEnum(const std::wstring& text, const flagtree::Type& type, flagtree::Value& out) {
		const flagtree::Enum& list = std::get<flagtree::Enum>(type);
		auto it = std::find_if(list.begin(), list.end(), [&](const flagtree::EnumEntry& e) { return e.name == text; });
		if (it == list.end()) {
			std::wstring allowed;
			for (const auto& entry : list)
				allowed.append(allowed.empty() ? L"" : L", ").append(entry.name);
			return str::wd::Build(L"expected one of ", allowed);
		}
		out = flagtree::Value{ flagtree::EnumValue{ it->name, it->id } };
		return L"";
	}

	/* closed table of text parsers indexed by the primitive type tag (path and bytes are never parsed from text) */
	static constexpr detail::TextParser PrimitiveParsers[] = {
		nullptr,
		nullptr,
		&detail::ParseString,
		&detail::ParseINum,
		&detail::ParseUNum,
		&detail::ParseReal,
		&detail::ParseBoolean
	};

	inline detail::TextParser ResolveParser(const flagtree::Type& type) {
		if (std::holds_alternative<flagtree::Enum>(type))
			return &detail::ParseEnum;
		return detail::PrimitiveParsers[size_t(std::get<flagtree::Primitive>(type))];
	}

	constexpr const wchar_t* TypeName(const flagtree::Type& type) {
		if (std::holds_alternative<flagtree::Enum>(type))
			return L"enum";
		switch (std::get<flagtree::Primitive>(type)) {
		case flagtree::Primitive::path:
			return L"path";
		case flagtree::Primitive::bytes:
			return L"bytes";
		case flagtree::Primitive::inum:
			return L"int";
		case flagtree::Primitive::unum:
			return L"uint";
		case flagtree::Primitive::real:
			return L"real";
		case flagtree::Primitive::boolean:
			return L"bool";
		case flagtree::Primitive::string:
		default:
			return L"string";
		}
	}

	/* convert the raw argument to the typed value (subject describes the switch or positional for errors) */
	inline flagtree::Value Coerce(const detail::ValidValue& value, const std::string& raw, const std::wstring& subject) {
		if (value.parser == nullptr)
			return flagtree::Value{ flagtree::RawValue{ raw } };

		/* only well-formed text can be handed to the text parsers */
		std::wstring text;
		if (!detail::DecodeText(raw, text))
			throw flagtree::Error{ flagtree::ErrorKind::typeConversion, L"Invalid value [", detail::Printable(raw), L"] for ", subject, L" of type [", detail::TypeName(*value.type), L"]: not valid utf-8 text." };

		flagtree::Value out;
		if (std::wstring err = value.parser(text, *value.type, out); !err.empty())
			throw flagtree::Error{ flagtree::ErrorKind::typeConversion, L"Invalid value [", text, L"] for ", subject, L" of type [", detail::TypeName(*value.type), L"]: ", err, L'.' };
		return out;
	}
}
