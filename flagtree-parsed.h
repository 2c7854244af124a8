/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"
#include "flagtree-value.h"

namespace flagtree {
	/* represents the parsed results of one command of the selected path (sub-commands are nested)
	*	Note: switches are stored at the command, which declared them, irrespective of where they were supplied */
	class Parsed {
		friend class detail::Parser;
	private:
		std::map<std::wstring, std::vector<flagtree::Value>> pSwitches;
		std::map<std::wstring, std::vector<flagtree::Value>> pPositionals;
		std::vector<flagtree::Parsed> pSub;
		std::wstring pCommand;

	private:
		static const std::vector<flagtree::Value>& fLookup(const std::map<std::wstring, std::vector<flagtree::Value>>& map, const std::wstring& name) {
			static const std::vector<flagtree::Value> empty;
			auto it = map.find(name);
			return (it == map.end() ? empty : it->second);
		}

	public:
		bool operator==(const flagtree::Parsed&) const = default;

	public:
		const std::wstring& command() const {
			return pCommand;
		}
		const flagtree::Parsed* sub() const {
			return (pSub.empty() ? nullptr : &pSub.front());
		}
		const flagtree::Parsed& leaf() const {
			const flagtree::Parsed* out = this;
			while (!out->pSub.empty())
				out = &out->pSub.front();
			return *out;
		}
		std::vector<std::wstring> path() const {
			std::vector<std::wstring> out;
			for (const flagtree::Parsed* it = this; it != nullptr; it = it->sub())
				out.push_back(it->pCommand);
			return out;
		}

	public:
		bool flag(const std::wstring& name) const {
			return !fLookup(pSwitches, name).empty();
		}
		size_t count(const std::wstring& name) const {
			return fLookup(pSwitches, name).size();
		}
		const std::vector<flagtree::Value>& values(const std::wstring& name) const {
			return fLookup(pSwitches, name);
		}
		std::optional<flagtree::Value> value(const std::wstring& name, size_t index = 0) const {
			const std::vector<flagtree::Value>& list = fLookup(pSwitches, name);
			if (index >= list.size())
				return {};
			return list[index];
		}

	public:
		size_t positionals(const std::wstring& name) const {
			return fLookup(pPositionals, name).size();
		}
		const std::vector<flagtree::Value>& positionalValues(const std::wstring& name) const {
			return fLookup(pPositionals, name);
		}
		std::optional<flagtree::Value> positional(const std::wstring& name, size_t index = 0) const {
			const std::vector<flagtree::Value>& list = fLookup(pPositionals, name);
			if (index >= list.size())
				return {};
			return list[index];
		}
	};
}
