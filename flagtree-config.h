/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"
#include "flagtree-value.h"

namespace flagtree {
	enum class Primitive : uint8_t {
		path,
		bytes,
		string,
		inum,
		unum,
		real,
		boolean
	};
	struct EnumEntry {
		std::wstring name;
		std::wstring description;
		size_t id = 0;
		constexpr EnumEntry(std::wstring name, flagtree::IsId auto id, std::wstring description) : name{ name }, description{ description }, id{ static_cast<size_t>(id) } {}
	};
	using Enum = std::vector<flagtree::EnumEntry>;
	using Type = std::variant<flagtree::Primitive, flagtree::Enum>;

	namespace detail {
		struct Configurator {};

		struct Description {
			std::wstring description;
		};
		struct Abbreviation {
			wchar_t abbreviation = 0;
		};
		struct Aliases {
			std::set<std::wstring> aliases;
		};
		struct Payload {
			struct {
				std::wstring name;
				flagtree::Type type;
			} payload;
		};
		struct Constraint {
			std::vector<flagtree::Checker> constraints;
		};
		struct HelpMarker {
			bool help = false;
		};
		struct DefaultMarker {
			bool isDefault = false;
		};

		struct Positional :
			public detail::Description {
			std::wstring name;
			flagtree::Arity arity = flagtree::Arity::required;
			flagtree::Type type;
			Positional(std::wstring name, flagtree::Arity arity, flagtree::Type type) : name{ name }, arity{ arity }, type{ type } {}
		};
		struct PositionalList {
			std::vector<detail::Positional> positionals;
		};

		struct Switch :
			public detail::Description,
			public detail::Abbreviation,
			public detail::Payload,
			public detail::HelpMarker {
			std::wstring name;
			flagtree::Arity arity = flagtree::Arity::optional;
			Switch(std::wstring name, flagtree::Arity arity) : name{ name }, arity{ arity } {}
		};
		struct SwitchList {
			std::vector<detail::Switch> switches;
		};

		struct Command;
		struct CommandList {
			std::vector<detail::Command> commands;
		};

		struct Command :
			public detail::Description,
			public detail::Aliases,
			public detail::PositionalList,
			public detail::SwitchList,
			public detail::CommandList,
			public detail::Constraint,
			public detail::DefaultMarker {
			std::wstring name;
			Command(std::wstring name) : name{ name } {}
		};

		struct ConfigBurner {
			template <class Base>
			static constexpr void Apply(Base& base) {}
			template <class Base, class Config, class... Configs>
			static constexpr void Apply(Base& base, const Config& config, const Configs&... configs) {
				config.burnConfig(base);
				detail::ConfigBurner::Apply<Base, Configs...>(base, configs...);
			}

			template <class Base, class Config>
			static decltype(std::declval<Config>().burnConfig(std::declval<Base&>()), std::true_type{}) CanBurn(int) { return {}; }
			template <class, class>
			static std::false_type CanBurn(...) { return {}; }
		};
	}

	template <class Type, class Base>
	concept IsConfig = std::is_base_of_v<detail::Configurator, Type>&& decltype(detail::ConfigBurner::CanBurn<Base, Type>(0))::value;

	/* command of the grammar (the top-most command is the program itself, all nested commands are sub-commands)
	*	Note: switches are inherited into all sub-commands, positionals are only bound to the command itself */
	struct Command : public detail::Configurator {
		friend struct detail::ConfigBurner;
	public:
		detail::Command pCommand;

	public:
		Command(std::wstring name, const flagtree::IsConfig<detail::Command> auto&... configs) : pCommand{ name } {
			detail::ConfigBurner::Apply(pCommand, configs...);
		}
		flagtree::Command& add(const flagtree::IsConfig<detail::Command> auto&... configs) {
			detail::ConfigBurner::Apply(pCommand, configs...);
			return *this;
		}

	private:
		void burnConfig(detail::CommandList& base) const {
			base.commands.push_back(pCommand);
		}
	};

	/* switch of a command with a mandatory long name (used as --name) and the given arity
	*	Note: if payload is provided, the switch takes a value, otherwise it only counts its occurrences */
	struct Switch : public detail::Configurator {
		friend struct detail::ConfigBurner;
	public:
		detail::Switch pSwitch;

	public:
		Switch(std::wstring name, flagtree::Arity arity, const flagtree::IsConfig<detail::Switch> auto&... configs) : pSwitch{ name, arity } {
			detail::ConfigBurner::Apply(pSwitch, configs...);
		}
		flagtree::Switch& add(const flagtree::IsConfig<detail::Switch> auto&... configs) {
			detail::ConfigBurner::Apply(pSwitch, configs...);
			return *this;
		}

	private:
		void burnConfig(detail::SwitchList& base) const {
			base.switches.push_back(pSwitch);
		}
	};

	/* add an additional positional argument to the command using the given name, arity and type
	*	Note: at most one repeated positional, which must be the last, and optionals must follow all required */
	struct Positional : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		detail::Positional pPositional;

	public:
		Positional(std::wstring name, flagtree::Arity arity, flagtree::Type type, std::wstring desc) : pPositional{ name, arity, type } {
			pPositional.description = desc;
		}
		Positional(std::wstring name, flagtree::Arity arity, flagtree::Type type, const flagtree::IsConfig<detail::Positional> auto&... configs) : pPositional{ name, arity, type } {
			detail::ConfigBurner::Apply(pPositional, configs...);
		}

	private:
		void burnConfig(detail::PositionalList& base) const {
			base.positionals.push_back(pPositional);
		}
	};

	/* description to the corresponding object */
	struct Description : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::wstring pDescription;

	public:
		Description(std::wstring desc) : pDescription{ desc } {}

	private:
		void burnConfig(detail::Description& base) const {
			base.description = pDescription;
		}
	};

	/* add an abbreviation character for a switch to allow it to be used as, for example, -x */
	struct Abbreviation : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		wchar_t pChar = 0;

	public:
		constexpr Abbreviation(wchar_t c) : pChar{ c } {}

	private:
		constexpr void burnConfig(detail::Abbreviation& base) const {
			base.abbreviation = pChar;
		}
	};

	/* add an alternative name, by which a command can be selected */
	struct Alias : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::wstring pName;

	public:
		Alias(std::wstring name) : pName{ name } {}

	private:
		void burnConfig(detail::Aliases& base) const {
			base.aliases.insert(pName);
		}
	};

	/* add a payload to a switch with a given name and of a given type */
	struct Payload : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		std::wstring pName;
		flagtree::Type pType;

	public:
		Payload(std::wstring name, flagtree::Type type) : pName{ name }, pType{ type } {}

	private:
		void burnConfig(detail::Payload& base) const {
			base.payload.name = pName;
			base.payload.type = pType;
		}
	};

	/* add a constraint to be executed if the corresponding command is part of the selected path */
	struct Constraint : public detail::Configurator {
		friend struct detail::ConfigBurner;
	private:
		flagtree::Checker pConstraint;

	public:
		Constraint(flagtree::Checker constraint) : pConstraint{ constraint } {}

	private:
		void burnConfig(detail::Constraint& base) const {
			base.constraints.push_back(pConstraint);
		}
	};

	/* mark the sub-command as selected, if no sub-command name is supplied */
	struct DefaultCommand : public detail::Configurator {
		friend struct detail::ConfigBurner;

	private:
		constexpr void burnConfig(detail::DefaultMarker& base) const {
			base.isDefault = true;
		}
	};

	/* mark the switch as help entry, which stops the parsing and produces the help text of the current command */
	struct Help : public detail::Configurator {
		friend struct detail::ConfigBurner;

	private:
		constexpr void burnConfig(detail::HelpMarker& base) const {
			base.help = true;
		}
	};

	/* conventional -h/--help switch */
	inline flagtree::Switch HelpSwitch(std::wstring description = L"Prints help") {
		return flagtree::Switch{ L"help", flagtree::Arity::optional, flagtree::Abbreviation{ L'h' }, flagtree::Description{ description }, flagtree::Help{} };
	}
}
