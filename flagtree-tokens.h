/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"

namespace flagtree::detail {
	enum class TokenKind : uint8_t {
		longSwitch,
		shortSwitch,
		separator,
		bare
	};

	struct Token {
		std::optional<std::string> payload;
		std::wstring name;
		const std::string* raw = nullptr;
		detail::TokenKind kind = detail::TokenKind::bare;
		bool text = true;
	};

	/* check if the bytes form well-formed utf-8 (no overlong encodings, surrogates or values beyond the unicode range) */
	inline bool IsUtf8(std::string_view bytes) {
		for (size_t i = 0; i < bytes.size();) {
			uint8_t c = uint8_t(bytes[i]);
			if (c < 0x80) {
				++i;
				continue;
			}

			/* determine the number of continuation bytes and the lower bound of the encoded value */
			size_t count = 0;
			uint32_t value = 0, minimum = 0;
			if ((c & 0xe0) == 0xc0) {
				count = 1;
				value = (c & 0x1f);
				minimum = 0x80;
			}
			else if ((c & 0xf0) == 0xe0) {
				count = 2;
				value = (c & 0x0f);
				minimum = 0x800;
			}
			else if ((c & 0xf8) == 0xf0) {
				count = 3;
				value = (c & 0x07);
				minimum = 0x10000;
			}
			else
				return false;
			if (i + count >= bytes.size())
				return false;

			/* collect the continuation bytes */
			for (size_t j = 1; j <= count; ++j) {
				uint8_t n = uint8_t(bytes[i + j]);
				if ((n & 0xc0) != 0x80)
					return false;
				value = (value << 6) | (n & 0x3f);
			}
			if (value < minimum || value > 0x10ffff || (value >= 0xd800 && value <= 0xdfff))
				return false;
			i += count + 1;
		}
		return true;
	}

	/* decode the argument as text (fails for arguments, which are not valid utf-8) */
	inline bool DecodeText(std::string_view bytes, std::wstring& out) {
		if (!detail::IsUtf8(bytes))
			return false;
		out = str::wd::To(bytes);
		return true;
	}

	/* lossy textual representation of an argument for messages */
	inline std::wstring Printable(std::string_view bytes) {
		std::wstring out;
		if (detail::DecodeText(bytes, out))
			return out;
		out.clear();
		for (char c : bytes)
			out.push_back((uint8_t(c) < 0x80) ? wchar_t(c) : L'?');
		return out;
	}

	/* lazy classification of the raw arguments into tokens (a new tokenizer restarts the sequence) */
	class Tokenizer {
	private:
		const std::vector<std::string>& pArgs;
		size_t pIndex = 0;
		bool pLocked = false;

	public:
		Tokenizer(const std::vector<std::string>& args) : pArgs{ args } {}

	private:
		/* names, which are not valid text, keep a printable form for messages but never match any switch */
		void fDecodeName(detail::Token& token, std::string_view name) const {
			if (detail::DecodeText(name, token.name))
				return;
			token.text = false;
			token.name = detail::Printable(name);
		}
		detail::Token fClassify(size_t index) const {
			const std::string& arg = pArgs[index];
			detail::Token token;
			token.raw = &arg;

			/* after the separator or for non-dash arguments (and the single dash), everything is a bare value */
			if (pLocked || arg.size() < 2 || arg[0] != '-')
				return token;
			if (arg == "--") {
				token.kind = detail::TokenKind::separator;
				return token;
			}

			/* check if its a single short switch (clustering is not supported, the matcher will reject longer names) */
			if (arg[1] != '-') {
				token.kind = detail::TokenKind::shortSwitch;
				fDecodeName(token, std::string_view{ arg }.substr(1));
				return token;
			}

			/* check if a payload is baked into the long switch */
			token.kind = detail::TokenKind::longSwitch;
			size_t end = arg.find('=', 2);
			if (end != std::string::npos)
				token.payload = arg.substr(end + 1);
			fDecodeName(token, std::string_view{ arg }.substr(2, end == std::string::npos ? std::string::npos : end - 2));
			return token;
		}

	public:
		/* fetch the next token and advance (returns null once all arguments are consumed) */
		std::optional<detail::Token> next() {
			if (pIndex >= pArgs.size())
				return std::nullopt;
			detail::Token token = fClassify(pIndex++);
			if (token.kind == detail::TokenKind::separator)
				pLocked = true;
			FLAGTREE_TRACE(2, L"Token [", detail::Printable(*token.raw), L"] classified as ", size_t(token.kind), L'.');
			return token;
		}

		/* consume the next argument, if it is a bare value, as payload of a switch */
		const std::string* nextValue() {
			if (pIndex >= pArgs.size() || fClassify(pIndex).kind != detail::TokenKind::bare)
				return nullptr;
			return &pArgs[pIndex++];
		}

		constexpr bool locked() const {
			return pLocked;
		}
	};
}
