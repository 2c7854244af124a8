/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "../flagtree.h"

enum class Level : uint8_t {
	quick,
	full
};

static flagtree::Grammar MakeGrammar() {
	return flagtree::Command{ L"healthck",
		flagtree::Description{ L"Run basic system diagnostics." },
		flagtree::Switch{ L"verbose", flagtree::Arity::repeated, flagtree::Abbreviation{ L'v' }, flagtree::Description{ L"Verbosity level, can be repeated multiple times." } },
		flagtree::Switch{ L"config", flagtree::Arity::optional, flagtree::Payload{ L"path", flagtree::Primitive::path }, flagtree::Description{ L"Optional configuration file." } },
		flagtree::HelpSwitch(),
		flagtree::Command{ L"check",
			flagtree::DefaultCommand{},
			flagtree::Description{ L"Check the given targets." },
			flagtree::Switch{ L"jobs", flagtree::Arity::optional, flagtree::Abbreviation{ L'j' }, flagtree::Payload{ L"n", flagtree::Primitive::unum }, flagtree::Description{ L"Number of checks to run in parallel." } },
			flagtree::Switch{ L"level", flagtree::Arity::optional, flagtree::Payload{ L"level", flagtree::Enum{
				flagtree::EnumEntry{ L"quick", Level::quick, L"Only run fast checks." },
				flagtree::EnumEntry{ L"full", Level::full, L"Run all checks." } } } },
			flagtree::Positional{ L"targets", flagtree::Arity::repeated, flagtree::Primitive::bytes, L"Targets to check." }
		},
		flagtree::Command{ L"report",
			flagtree::Alias{ L"r" },
			flagtree::Description{ L"Write the last report." },
			flagtree::Positional{ L"output", flagtree::Arity::required, flagtree::Primitive::path, L"Destination of the report." }
		}
	};
}

int main(int argc, char** argv) {
	flagtree::Grammar grammar = MakeGrammar();
	flagtree::Parsed parsed = flagtree::ParseOrExit(argc, argv, grammar);

	std::wcout << L"verbosity: " << parsed.count(L"verbose") << std::endl;
	if (std::optional<flagtree::Value> config = parsed.value(L"config"); config.has_value())
		std::wcout << L"config: " << config->path().wstring() << std::endl;

	const flagtree::Parsed& leaf = parsed.leaf();
	std::wcout << L"command: " << leaf.command() << std::endl;
	if (leaf.command() == L"check") {
		std::wcout << L"jobs: " << leaf.value(L"jobs").value_or(flagtree::Value{ 1u }).unum() << std::endl;
		if (std::optional<flagtree::Value> level = leaf.value(L"level"); level.has_value())
			std::wcout << L"level: " << level->str() << std::endl;
		for (const flagtree::Value& target : leaf.positionalValues(L"targets"))
			std::wcout << L"target: " << target.raw().size() << L" bytes" << std::endl;
	}
	else
		std::wcout << L"output: " << leaf.positional(L"output")->path().wstring() << std::endl;
	return 0;
}
