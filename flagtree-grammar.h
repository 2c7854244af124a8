/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"
#include "flagtree-config.h"
#include "flagtree-verify.h"

namespace flagtree {
	class Grammar;

	/* read-only view onto a command of a validated grammar (keeps the grammar alive) */
	class Node {
		friend class flagtree::Grammar;
	private:
		std::shared_ptr<const detail::ValidGrammar> pGrammar;
		const detail::ValidCommand* pCommand = nullptr;

	private:
		Node(std::shared_ptr<const detail::ValidGrammar> grammar, const detail::ValidCommand* command) : pGrammar{ grammar }, pCommand{ command } {}

	public:
		const std::wstring& name() const {
			return pCommand->command->name;
		}
		const std::set<std::wstring>& aliases() const {
			return pCommand->command->aliases;
		}
		const std::wstring& description() const {
			return pCommand->command->description;
		}
		size_t depth() const {
			return pCommand->depth;
		}

	public:
		/* all switches usable at this command (inherited first, in declaration order from the root downwards) */
		std::vector<const detail::Switch*> switches() const {
			std::vector<const detail::Switch*> out;
			for (const detail::ValidSwitch* entry : pCommand->visible)
				out.push_back(entry->option);
			return out;
		}
		const std::vector<detail::Switch>& ownSwitches() const {
			return pCommand->command->switches;
		}
		const std::vector<detail::Positional>& positionals() const {
			return pCommand->command->positionals;
		}

	public:
		std::vector<flagtree::Node> children() const {
			std::vector<flagtree::Node> out;
			for (const auto& sub : pCommand->sub)
				out.push_back(flagtree::Node{ pGrammar, &sub });
			return out;
		}
		std::optional<flagtree::Node> defaultChild() const {
			if (pCommand->defChild == nullptr)
				return std::nullopt;
			return flagtree::Node{ pGrammar, pCommand->defChild };
		}
		std::optional<flagtree::Node> parent() const {
			if (pCommand->super == nullptr)
				return std::nullopt;
			return flagtree::Node{ pGrammar, pCommand->super };
		}
		std::optional<flagtree::Node> child(const std::wstring& name) const {
			auto it = pCommand->names.find(name);
			if (it == pCommand->names.end())
				return std::nullopt;
			return flagtree::Node{ pGrammar, it->second };
		}

	public:
		const detail::ValidCommand& valid() const {
			return *pCommand;
		}
	};

	/* validated and immutable grammar (copies share the same validated state and can be used concurrently)
	*	Note: throws flagtree::ConfigException if the grammar is malformed */
	class Grammar {
	private:
		std::shared_ptr<const detail::ValidGrammar> pGrammar;

	public:
		Grammar(const flagtree::Command& root) : pGrammar{ detail::ValidateGrammar(root.pCommand) } {}

	public:
		const std::wstring& name() const {
			return pGrammar->burned.name;
		}
		flagtree::Node root() const {
			return flagtree::Node{ pGrammar, &pGrammar->root };
		}

		/* resolve the command-path (by names or aliases) starting below the root */
		flagtree::Node find(const std::vector<std::wstring>& path) const {
			const detail::ValidCommand* current = &pGrammar->root;
			for (const auto& name : path) {
				auto it = current->names.find(name);
				if (it == current->names.end())
					throw flagtree::Exception{ L"Command [", name, L"] not found for [", current->command->name, L"]." };
				current = it->second;
			}
			return flagtree::Node{ pGrammar, current };
		}

	public:
		const detail::ValidGrammar& valid() const {
			return *pGrammar;
		}
	};
}
