/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"
#include "flagtree-config.h"
#include "flagtree-grammar.h"
#include "flagtree-parsed.h"
#include "flagtree-parser.h"
#include "flagtree-verify.h"
#include "flagtree-help.h"

#include <cctype>
#include <string_view>

namespace flagtree {
	/* convenience function to prepare the arguments (skips the program name) */
	inline std::vector<std::string> Prepare(int argc, const char* const* argv) {
		std::vector<std::string> args;
		for (int i = 1; i < argc; ++i)
			args.emplace_back(argv[i]);
		return args;
	}

	/* split the argument line into the list of separate arguments */
	inline std::vector<std::string> Prepare(std::string_view line) {
		std::vector<std::string> args;

		/* split the string */
		char inStr = 0;
		bool lastWhitespace = true;
		for (size_t i = 0; i < line.size(); ++i) {
			/* check if the character is whitespace and a new argument needs to be
			*	started or if it can just be written out, as its part of a string */
			if (std::isspace(static_cast<unsigned char>(line[i]))) {
				if (inStr != 0)
					args.back().push_back(line[i]);
				else
					lastWhitespace = true;
				continue;
			}
			if (lastWhitespace)
				args.emplace_back();
			lastWhitespace = false;

			/* check if the next character is escaped */
			if (line[i] == '\\') {
				if (++i >= line.size())
					break;
				args.back().push_back(line[i]);
			}

			/* check if a string is being ended or continued */
			else if (inStr != 0) {
				if (line[i] == inStr)
					inStr = 0;
				else
					args.back().push_back(line[i]);
			}

			/* check if a string is being started */
			else if (line[i] == '\'' || line[i] == '\"')
				inStr = line[i];
			else
				args.back().push_back(line[i]);
		}
		return args;
	}

	/* convenience functions for parsing from a single command-line (without program name) */
	inline flagtree::Parsed Parse(std::string_view line, const flagtree::Grammar& grammar, size_t lineLength = flagtree::NumCharsHelp) {
		return flagtree::Parse(flagtree::Prepare(line), grammar, lineLength);
	}

	/* convenience functions for standard program arguments parsing */
	inline flagtree::Parsed Parse(int argc, const char* const* argv, const flagtree::Grammar& grammar, size_t lineLength = flagtree::NumCharsHelp) {
		return flagtree::Parse(flagtree::Prepare(argc, argv), grammar, lineLength);
	}

	/* parse the program arguments and print the help/error and exit the process on failure */
	inline flagtree::Parsed ParseOrExit(int argc, const char* const* argv, const flagtree::Grammar& grammar, size_t lineLength = flagtree::NumCharsHelp) {
		try {
			return flagtree::Parse(argc, argv, grammar, lineLength);
		}
		catch (const flagtree::Error& err) {
			err.exit(flagtree::HelpHint(grammar));
		}
	}
}
