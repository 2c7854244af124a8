/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-parsed.h"
#include "flagtree-config.h"
#include "flagtree-verify.h"
#include "flagtree-grammar.h"
#include "flagtree-tokens.h"
#include "flagtree-coerce.h"
#include "flagtree-help.h"

namespace flagtree {
	static constexpr size_t MaxSuggestionDistance = 2;

	namespace detail {
		inline size_t EditDistance(const std::wstring& a, const std::wstring& b) {
			std::vector<size_t> last(b.size() + 1), next(b.size() + 1);
			for (size_t j = 0; j <= b.size(); ++j)
				last[j] = j;

			for (size_t i = 1; i <= a.size(); ++i) {
				next[0] = i;
				for (size_t j = 1; j <= b.size(); ++j)
					next[j] = std::min({ last[j] + 1, next[j - 1] + 1, last[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1) });
				std::swap(last, next);
			}
			return last[b.size()];
		}

		/* find the closest candidate within the suggestion distance (empty if none is close enough) */
		inline std::wstring Suggest(const std::wstring& name, const std::vector<std::wstring>& candidates) {
			std::wstring best;
			size_t distance = flagtree::MaxSuggestionDistance + 1;
			for (const auto& candidate : candidates) {
				size_t next = detail::EditDistance(name, candidate);
				if (next < distance) {
					distance = next;
					best = candidate;
				}
			}
			return best;
		}

		class Parser {
		private:
			struct Level {
				const detail::ValidCommand* command = nullptr;
				std::vector<std::vector<flagtree::Value>> positionals;
				size_t slot = 0;
			};

		private:
			detail::Tokenizer pTokens;
			const detail::ValidGrammar& pGrammar;
			std::vector<Level> pLevels;
			std::map<const detail::ValidSwitch*, std::vector<flagtree::Value>> pSwitches;
			size_t pLineLength = 0;

		public:
			Parser(const std::vector<std::string>& args, const detail::ValidGrammar& grammar, size_t lineLength) : pTokens{ args }, pGrammar{ grammar }, pLineLength{ lineLength } {}

		private:
			std::wstring fCommandSuffix(const detail::ValidCommand* command) const {
				if (command->super == nullptr)
					return L"";
				return str::wd::Build(L" for command [", command->command->name, L']');
			}
			void fEnter(const detail::ValidCommand* command) {
				Level& level = pLevels.emplace_back();
				level.command = command;
				level.positionals.resize(command->positionals.size());
				FLAGTREE_TRACE(1, L"Entered command [", command->command->name, L"] at depth ", command->depth, L'.');
			}
			void fCheckPositionals(const Level& level) const {
				for (size_t i = level.slot; i < level.command->positionals.size(); ++i) {
					const detail::Positional& positional = *level.command->positionals[i].positional;
					if (positional.arity == flagtree::Arity::required && level.positionals[i].empty())
						throw flagtree::Error{ flagtree::ErrorKind::missingRequired, L"Argument <", positional.name, L"> is missing", fCommandSuffix(level.command), L'.' };
				}
			}
			void fDescend(const detail::ValidCommand* command) {
				fCheckPositionals(pLevels.back());
				fEnter(command);
			}

		private:
			void fParseSwitch(const detail::Token& token) {
				const detail::ValidCommand* current = pLevels.back().command;
				const detail::ValidSwitch* entry = nullptr;

				/* resolve the switch among all switches visible to the current command (own and inherited) */
				if (!token.text)
					FLAGTREE_TRACE(2, L"Switch [", detail::Printable(*token.raw), L"] is not valid text.");
				else if (token.kind == detail::TokenKind::longSwitch) {
					if (auto it = current->switches.find(token.name); it != current->switches.end())
						entry = it->second;
				}
				else if (token.name.size() == 1) {
					if (auto it = current->abbreviations.find(token.name[0]); it != current->abbreviations.end())
						entry = it->second;
				}

				/* check if the switch is unknown and try to find a similar switch */
				if (entry == nullptr) {
					std::vector<std::wstring> names;
					for (const detail::ValidSwitch* visible : current->visible)
						names.push_back(visible->option->name);
					std::wstring given = (token.kind == detail::TokenKind::longSwitch && token.text ? token.name : L"");
					if (std::wstring hint = detail::Suggest(given, names); !hint.empty() && !given.empty())
						throw flagtree::Error{ flagtree::ErrorKind::unknownSwitch, L"Unknown switch [", detail::Printable(*token.raw), L"] encountered", fCommandSuffix(current), L". Did you mean [--", hint, L"]?" };
					throw flagtree::Error{ flagtree::ErrorKind::unknownSwitch, L"Unknown switch [", detail::Printable(*token.raw), L"] encountered", fCommandSuffix(current), L'.' };
				}
				const detail::Switch& option = *entry->option;

				/* check if the help was requested, which stops the parsing immediately */
				if (option.help) {
					FLAGTREE_TRACE(1, L"Help requested for command [", current->command->name, L"].");
					throw flagtree::Error{ flagtree::ErrorKind::help, detail::HelpBuilder{ current, pLineLength }.buildHelpString() };
				}

				/* check if the switch has already been supplied */
				std::vector<flagtree::Value>& list = pSwitches[entry];
				if (!list.empty() && option.arity != flagtree::Arity::repeated)
					throw flagtree::Error{ flagtree::ErrorKind::duplicateSwitch, L"Switch [--", option.name, L"] can at most be specified once." };

				/* check if this is a boolean switch, which only counts its occurrences */
				if (!entry->payload) {
					if (token.payload.has_value())
						throw flagtree::Error{ flagtree::ErrorKind::unexpectedArgument, L"Switch [--", option.name, L"] does not take a value." };
					list.emplace_back(true);
					return;
				}

				/* fetch the payload either from the token itself or from the next bare argument */
				const std::string* raw = (token.payload.has_value() ? &token.payload.value() : pTokens.nextValue());
				if (raw == nullptr)
					throw flagtree::Error{ flagtree::ErrorKind::missingValue, L"Value <", option.payload.name, L"> of switch [--", option.name, L"] is missing." };
				list.push_back(detail::Coerce(*entry, *raw, str::wd::Build(L"switch [--", option.name, L']')));
			}
			void fParseBare(const std::string& raw) {
				while (true) {
					Level& level = pLevels.back();
					const detail::ValidCommand* current = level.command;

					/* check if an open positional slot exists (repeated slots consume all remaining values) */
					if (level.slot < current->positionals.size()) {
						const detail::ValidSlot& slot = current->positionals[level.slot];
						level.positionals[level.slot].push_back(detail::Coerce(slot, raw, str::wd::Build(L"argument <", slot.positional->name, L'>')));
						if (slot.positional->arity != flagtree::Arity::repeated)
							++level.slot;
						return;
					}
					if (current->sub.empty())
						throw flagtree::Error{ flagtree::ErrorKind::unexpectedArgument, L"Unexpected argument [", detail::Printable(raw), L"] encountered", fCommandSuffix(current), L'.' };

					/* check if the argument selects a sub-command by name or alias (only exact matches) */
					std::wstring name;
					if (detail::DecodeText(raw, name)) {
						if (auto it = current->names.find(name); it != current->names.end()) {
							fDescend(it->second);
							return;
						}
					}

					/* check if the default sub-command can be selected and retry the argument with it */
					if (current->defChild != nullptr) {
						FLAGTREE_TRACE(1, L"Selecting default command [", current->defChild->command->name, L"] for [", detail::Printable(raw), L"].");
						fDescend(current->defChild);
						continue;
					}

					/* setup the failed match */
					std::vector<std::wstring> names;
					for (const auto& [key, _] : current->names)
						names.push_back(key);
					if (std::wstring hint = detail::Suggest(name, names); !hint.empty() && !name.empty())
						throw flagtree::Error{ flagtree::ErrorKind::unexpectedArgument, L"Unknown command [", detail::Printable(raw), L"] for [", current->command->name, L"]. Did you mean [", hint, L"]?" };
					throw flagtree::Error{ flagtree::ErrorKind::unexpectedArgument, L"Unknown command [", detail::Printable(raw), L"] for [", current->command->name, L"]." };
				}
			}
			void fFinalize() {
				/* select the default sub-commands, if no further sub-command has been selected */
				while (!pLevels.back().command->sub.empty()) {
					const detail::ValidCommand* current = pLevels.back().command;
					if (current->defChild == nullptr)
						throw flagtree::Error{ flagtree::ErrorKind::missingRequired, L"Command for [", current->command->name, L"] is missing." };
					fDescend(current->defChild);
				}
				fCheckPositionals(pLevels.back());

				/* validate the required switches along the entire path (checked last, as they might be inherited) */
				for (const Level& level : pLevels) {
					for (const auto& entry : level.command->own) {
						if (entry.option->arity != flagtree::Arity::required)
							continue;
						auto it = pSwitches.find(&entry);
						if (it == pSwitches.end() || it->second.empty())
							throw flagtree::Error{ flagtree::ErrorKind::missingRequired, L"Switch [--", entry.option->name, L"] is missing." };
					}
				}
			}
			flagtree::Parsed fBuild(size_t index) {
				const Level& level = pLevels[index];
				flagtree::Parsed out;
				out.pCommand = level.command->command->name;

				/* move the switch occurrences to the command, which declared them */
				for (const auto& entry : level.command->own) {
					std::vector<flagtree::Value>& list = out.pSwitches[entry.option->name];
					if (auto it = pSwitches.find(&entry); it != pSwitches.end())
						list = std::move(it->second);
				}
				for (size_t i = 0; i < level.positionals.size(); ++i)
					out.pPositionals[level.command->positionals[i].positional->name] = level.positionals[i];

				if (index + 1 < pLevels.size())
					out.pSub.push_back(fBuild(index + 1));
				return out;
			}
			void fCheckConstraints(const flagtree::Parsed& parsed) const {
				for (const Level& level : pLevels) {
					for (const auto& fn : level.command->command->constraints) {
						if (std::wstring err = fn(parsed); !err.empty())
							throw flagtree::Error{ flagtree::ErrorKind::constraint, err };
					}
				}
			}

		public:
			flagtree::Parsed parse() {
				fEnter(&pGrammar.root);

				/* iterate over the tokens and match them against the grammar */
				while (std::optional<detail::Token> token = pTokens.next()) {
					switch (token->kind) {
					case detail::TokenKind::separator:
						break;
					case detail::TokenKind::longSwitch:
					case detail::TokenKind::shortSwitch:
						fParseSwitch(*token);
						break;
					case detail::TokenKind::bare:
						fParseBare(*token->raw);
						break;
					}
				}

				/* complete the command-path and check all requirements */
				fFinalize();
				flagtree::Parsed out = fBuild(0);
				fCheckConstraints(out);
				return out;
			}
		};
	}

	/* parse the arguments (excluding the program name) against the grammar
	*	Note: throws flagtree::Error for invalid arguments and help-requests */
	inline flagtree::Parsed Parse(const std::vector<std::string>& args, const flagtree::Grammar& grammar, size_t lineLength = flagtree::NumCharsHelp) {
		return detail::Parser{ args, grammar.valid(), lineLength }.parse();
	}
}
