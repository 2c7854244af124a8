/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"
#include "flagtree-config.h"
#include "flagtree-value.h"
#include "flagtree-coerce.h"

namespace flagtree::detail {
	struct ValidCommand;

	struct ValidSwitch : public detail::ValidValue {
		const detail::Switch* option = nullptr;
		bool payload = false;
	};
	struct ValidSlot : public detail::ValidValue {
		const detail::Positional* positional = nullptr;
	};
	struct ValidCommand {
		std::list<detail::ValidCommand> sub;
		std::map<std::wstring, const detail::ValidCommand*> names;
		std::list<detail::ValidSwitch> own;
		std::vector<const detail::ValidSwitch*> visible;
		std::map<std::wstring, const detail::ValidSwitch*> switches;
		std::map<wchar_t, const detail::ValidSwitch*> abbreviations;
		std::vector<detail::ValidSlot> positionals;
		const detail::Command* command = nullptr;
		const detail::ValidCommand* super = nullptr;
		const detail::ValidCommand* defChild = nullptr;
		size_t depth = 0;
	};
	struct ValidGrammar {
		detail::Command burned;
		detail::ValidCommand root;
		ValidGrammar(const detail::Command& command) : burned{ command } {}
	};

	inline void ValidateName(const std::wstring& name, const wchar_t* what) {
		if (name.empty())
			throw flagtree::ConfigException{ what, L" name must not be empty." };
		if (name.starts_with(L"-"))
			throw flagtree::ConfigException{ what, L" name [", name, L"] must not start with a hyphen." };
	}
	inline void ValidateType(const flagtree::Type& type) {
		if (!std::holds_alternative<flagtree::Enum>(type))
			return;
		const flagtree::Enum& list = std::get<flagtree::Enum>(type);
		if (list.empty())
			throw flagtree::ConfigException{ L"Enum must not be empty." };

		std::set<std::wstring> names;
		for (const auto& entry : list) {
			if (entry.name.empty())
				throw flagtree::ConfigException{ L"Enum entry name must not be empty." };
			if (!names.insert(entry.name).second)
				throw flagtree::ConfigException{ L"Enum entry names must be unique." };
		}
	}
	inline void ValidateSwitch(detail::ValidCommand& entry, const detail::Switch& option) {
		detail::ValidateName(option.name, L"Switch");
		if (option.name.find(L'=') != std::wstring::npos)
			throw flagtree::ConfigException{ L"Switch name [", option.name, L"] must not contain an equal sign." };

		/* check if the name and abbreviation are unique among all visible switches (no shadowing of inherited switches) */
		if (entry.switches.contains(option.name))
			throw flagtree::ConfigException{ L"Switch [--", option.name, L"] is already visible for command [", entry.command->name, L"]." };
		if (option.abbreviation != 0) {
			if (option.abbreviation == L'-' || std::iswspace(option.abbreviation))
				throw flagtree::ConfigException{ L"Switch [--", option.name, L"] has an invalid abbreviation." };
			if (entry.abbreviations.contains(option.abbreviation))
				throw flagtree::ConfigException{ L"Switch abbreviation [-", option.abbreviation, L"] is already visible for command [", entry.command->name, L"]." };
		}

		/* setup the new entry and resolve its value parser */
		detail::ValidSwitch& next = entry.own.emplace_back();
		next.option = &option;
		next.payload = !option.payload.name.empty();
		if (next.payload) {
			detail::ValidateType(option.payload.type);
			next.type = &option.payload.type;
			next.parser = detail::ResolveParser(option.payload.type);
			if (option.help)
				throw flagtree::ConfigException{ L"Help switch [--", option.name, L"] must not take a value." };
		}

		/* register the switch as visible */
		entry.visible.push_back(&next);
		entry.switches[option.name] = &next;
		if (option.abbreviation != 0)
			entry.abbreviations[option.abbreviation] = &next;
	}
	inline void ValidatePositionals(detail::ValidCommand& entry) {
		const std::vector<detail::Positional>& positionals = entry.command->positionals;
		std::set<std::wstring> names;

		for (size_t i = 0; i < positionals.size(); ++i) {
			const detail::Positional& positional = positionals[i];
			if (positional.name.empty())
				throw flagtree::ConfigException{ L"Positional argument must not have an empty name." };
			if (!names.insert(positional.name).second)
				throw flagtree::ConfigException{ L"Positional argument names of command [", entry.command->name, L"] must be unique." };
			if (entry.switches.contains(positional.name))
				throw flagtree::ConfigException{ L"Positional argument [", positional.name, L"] clashes with a visible switch." };
			detail::ValidateType(positional.type);

			/* validate the ordering of the arities */
			if (positional.arity == flagtree::Arity::repeated && i + 1 < positionals.size())
				throw flagtree::ConfigException{ L"Repeated positional argument [", positional.name, L"] must be the last positional argument." };
			if (positional.arity == flagtree::Arity::required && i > 0 && positionals[i - 1].arity != flagtree::Arity::required)
				throw flagtree::ConfigException{ L"Required positional argument [", positional.name, L"] must not follow optional positional arguments." };

			detail::ValidSlot& slot = entry.positionals.emplace_back();
			slot.positional = &positional;
			slot.type = &positional.type;
			slot.parser = detail::ResolveParser(positional.type);
		}
	}
	inline void ValidateCommand(const detail::Command& command, detail::ValidCommand& entry, const detail::ValidCommand* super) {
		entry.command = &command;
		entry.super = super;
		entry.depth = (super == nullptr ? 0 : super->depth + 1);

		/* inherit all switches of the parent */
		if (super != nullptr) {
			entry.visible = super->visible;
			entry.switches = super->switches;
			entry.abbreviations = super->abbreviations;
		}

		/* validate the own switches and positionals */
		for (const auto& option : command.switches)
			detail::ValidateSwitch(entry, option);
		detail::ValidatePositionals(entry);
		if (!command.commands.empty() && !entry.positionals.empty() && entry.positionals.back().positional->arity == flagtree::Arity::repeated)
			throw flagtree::ConfigException{ L"Command [", command.name, L"] cannot have sub-commands and a repeated positional argument." };

		/* validate all sub-commands */
		for (const auto& sub : command.commands) {
			detail::ValidateName(sub.name, L"Command");
			detail::ValidCommand& next = entry.sub.emplace_back();

			/* validate the uniqueness of the name and all aliases */
			if (entry.names.contains(sub.name))
				throw flagtree::ConfigException{ L"Command name [", sub.name, L"] within command [", command.name, L"] must be unique." };
			entry.names[sub.name] = &next;
			for (const auto& alias : sub.aliases) {
				detail::ValidateName(alias, L"Command alias");
				if (entry.names.contains(alias))
					throw flagtree::ConfigException{ L"Command alias [", alias, L"] within command [", command.name, L"] must be unique." };
				entry.names[alias] = &next;
			}

			/* check if this is the default command */
			if (sub.isDefault) {
				if (entry.defChild != nullptr)
					throw flagtree::ConfigException{ L"Command [", command.name, L"] must have at most one default sub-command." };
				entry.defChild = &next;
			}
			detail::ValidateCommand(sub, next, &entry);
		}
	}

	/* validate the burned grammar and pre-process it for the parser (the grammar must not be modified afterwards) */
	inline std::shared_ptr<const detail::ValidGrammar> ValidateGrammar(const detail::Command& command) {
		auto out = std::make_shared<detail::ValidGrammar>(command);
		detail::ValidateName(out->burned.name, L"Program");
		if (out->burned.isDefault)
			throw flagtree::ConfigException{ L"Program [", out->burned.name, L"] cannot be a default sub-command." };
		detail::ValidateCommand(out->burned, out->root, nullptr);
		return out;
	}
}
