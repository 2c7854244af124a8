/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#pragma once

#include "flagtree-common.h"
#include "flagtree-config.h"
#include "flagtree-verify.h"
#include "flagtree-grammar.h"

namespace flagtree {
	static constexpr size_t NumCharsHelp = 100;
	static constexpr size_t NumCharsHelpLeft = 32;
	static constexpr size_t MinNumCharsRight = 8;
	static constexpr size_t IndentInformation = 4;
	static constexpr size_t AutoIndentLongText = 2;
	static constexpr size_t SpacingHelpColumns = 4;

	namespace detail {
		class HelpBuilder {
		private:
			struct Entry {
				std::wstring left;
				std::wstring right;
				const flagtree::Type* type = nullptr;
			};

		private:
			std::wstring pBuffer;
			const detail::ValidCommand* pCommand = nullptr;
			size_t pPosition = 0;
			size_t pNumChars = 0;
			size_t pOpenWhiteSpace = 0;

		public:
			HelpBuilder(const detail::ValidCommand* command, size_t numChars) : pCommand{ command } {
				pNumChars = std::max(flagtree::NumCharsHelpLeft + flagtree::MinNumCharsRight, numChars);
			}

		private:
			constexpr void fAddNewLine(bool emptyLine) {
				if (pBuffer.empty())
					return;
				if (pBuffer.back() != L'\n')
					pBuffer.push_back(L'\n');
				if (emptyLine)
					pBuffer.push_back(L'\n');
				pPosition = 0;
				pOpenWhiteSpace = 0;
			}
			constexpr void fAddToken(const std::wstring& add) {
				if (pPosition > 0 && pPosition + add.size() > pNumChars) {
					pBuffer.push_back(L'\n');
					pPosition = 0;
				}

				pBuffer.append(add);
				pPosition += add.size();
				pOpenWhiteSpace = 0;
			}
			constexpr void fAddSpacedToken(const std::wstring& add) {
				if (pPosition > 0) {
					if (pPosition + 1 + add.size() > pNumChars) {
						pBuffer.push_back(L'\n');
						pPosition = 0;
					}
					else {
						pBuffer.push_back(L' ');
						++pPosition;
					}
				}
				fAddToken(add);
			}
			constexpr void fAddString(const std::wstring& add, size_t offset = 0, size_t indentAutoBreaks = 0) {
				std::wstring tokenPrint;
				bool isWhitespace = true;

				/* ensure the initial indentation is valid */
				if (offset > 0) {
					if (pPosition + pOpenWhiteSpace >= offset) {
						pBuffer.push_back(L'\n');
						pPosition = 0;
					}
					pBuffer.append(offset - pPosition, L' ');
					pPosition = offset;
					offset += indentAutoBreaks;
				}
				pOpenWhiteSpace = 0;

				/* iterate over the string and collect all ranges of whitespace, followed by printable characters, and
				*	flush them out to the output whenever the line overflows or a newline/new printable-token is encountered */
				for (size_t i = 0; i <= add.size(); ++i) {
					if (i < add.size() && !std::iswspace(add[i])) {
						isWhitespace = false;
						tokenPrint.push_back(add[i]);
						continue;
					}

					/* flush the pending whitespace and printable token (replace the whitespace
					*	by a line-break, if the printable token would exceed the line limit) */
					if (!isWhitespace) {
						if ((pPosition > offset || pOpenWhiteSpace > 0) && pPosition + pOpenWhiteSpace + tokenPrint.size() > pNumChars)
							pBuffer.append(1, L'\n').append(pPosition = offset, L' ');
						else {
							pBuffer.append(pOpenWhiteSpace, L' ');
							pPosition += pOpenWhiteSpace;
						}

						pBuffer.append(tokenPrint);
						pPosition += tokenPrint.size();
						pOpenWhiteSpace = 0;
						tokenPrint.clear();
					}
					if (i >= add.size())
						break;

					/* check if the new token is a linebreak and insert it and otherwise add the whitespace to the current token */
					isWhitespace = true;
					if (add[i] == L'\n')
						pBuffer.append(1, L'\n').append(pPosition = offset, L' ');
					else if (add[i] == L'\t')
						pOpenWhiteSpace += 4;
					else
						++pOpenWhiteSpace;
				}
			}

		private:
			std::wstring fPositionalToken(const detail::Positional& positional) const {
				switch (positional.arity) {
				case flagtree::Arity::required:
					return str::wd::Build(L'<', positional.name, L'>');
				case flagtree::Arity::optional:
					return str::wd::Build(L'[', positional.name, L']');
				case flagtree::Arity::repeated:
				default:
					return str::wd::Build(L'[', positional.name, L"]...");
				}
			}
			std::wstring fSwitchToken(const detail::ValidSwitch& entry) const {
				const detail::Switch& option = *entry.option;
				std::wstring token = (option.abbreviation != 0 ? str::wd::Build(L'-', option.abbreviation) : str::wd::Build(L"--", option.name));
				if (entry.payload)
					token.append(L" <").append(option.payload.name).append(1, L'>');

				if (option.arity == flagtree::Arity::required)
					return token;
				if (option.arity == flagtree::Arity::optional)
					return str::wd::Build(L'[', token, L']');
				return str::wd::Build(L'[', token, L"]...");
			}
			constexpr void fRecCommandPath(const detail::ValidCommand* command) {
				if (command == nullptr)
					return;
				fRecCommandPath(command->super);
				fAddSpacedToken(command->command->name);
			}
			void fAddEnumDescription(const flagtree::Type* type, size_t offset) {
				/* check if this is an enum to be added */
				if (type == nullptr || !std::holds_alternative<flagtree::Enum>(*type))
					return;

				/* count the key-length */
				size_t length = 0;
				for (const auto& val : std::get<flagtree::Enum>(*type))
					length = std::max<size_t>(length, val.name.size());

				/* add the separate keys */
				for (const auto& val : std::get<flagtree::Enum>(*type)) {
					fAddNewLine(false);
					std::wstring key = val.name;
					key.append(length - val.name.size(), L' ');
					fAddString(str::wd::Build(L" - [", key, L"]: ", val.description), offset, 7 + length);
				}
			}
			void fAddSection(const wchar_t* header, const std::vector<Entry>& entries) {
				if (entries.empty())
					return;

				/* align the descriptions of the section, but never beyond the left limit */
				size_t offset = 0;
				for (const auto& entry : entries)
					offset = std::max(offset, entry.left.size());
				offset = std::min(offset + flagtree::SpacingHelpColumns, flagtree::NumCharsHelpLeft);

				fAddNewLine(true);
				fAddString(header);
				for (const auto& entry : entries) {
					fAddNewLine(false);
					fAddString(entry.left);
					if (!entry.right.empty())
						fAddString(entry.right, offset, flagtree::AutoIndentLongText);
					fAddEnumDescription(entry.type, offset);
				}
			}

		private:
			void fBuildUsage() {
				fAddToken(L"Usage:");
				fRecCommandPath(pCommand);

				for (const auto& slot : pCommand->positionals)
					fAddSpacedToken(fPositionalToken(*slot.positional));
				for (const detail::ValidSwitch* entry : pCommand->visible)
					fAddSpacedToken(fSwitchToken(*entry));

				if (!pCommand->sub.empty())
					fAddSpacedToken(pCommand->defChild == nullptr ? L"<command>" : L"[command]");
			}
			void fBuildArguments() {
				std::vector<Entry> entries;
				for (const auto& slot : pCommand->positionals)
					entries.push_back(Entry{ L"  " + fPositionalToken(*slot.positional), slot.positional->description, slot.type });
				fAddSection(L"Arguments:", entries);
			}
			void fBuildOptions() {
				std::vector<Entry> entries;
				for (const detail::ValidSwitch* entry : pCommand->visible) {
					const detail::Switch& option = *entry->option;

					/* construct the abbreviation, name and payload */
					std::wstring left = L"  ";
					if (option.abbreviation != 0)
						left.append(1, L'-').append(1, option.abbreviation).append(L", ");
					left.append(L"--").append(option.name);
					if (entry->payload)
						left.append(L" <").append(option.payload.name).append(1, L'>');

					/* construct the arity-marker and description */
					std::wstring right;
					if (option.arity == flagtree::Arity::required)
						right = L"[required]";
					else if (option.arity == flagtree::Arity::repeated)
						right = L"[repeated]";
					if (!option.description.empty())
						right.append(right.empty() ? 0 : 1, L' ').append(option.description);
					entries.push_back(Entry{ left, right, (entry->payload ? entry->type : nullptr) });
				}
				fAddSection(L"Options:", entries);
			}
			void fBuildCommands() {
				std::vector<Entry> entries;
				for (const auto& sub : pCommand->sub) {
					std::wstring left = L"  " + sub.command->name;
					for (const auto& alias : sub.command->aliases)
						left.append(L", ").append(alias);

					std::wstring right = (pCommand->defChild == &sub ? L"[default]" : L"");
					if (!sub.command->description.empty())
						right.append(right.empty() ? 0 : 1, L' ').append(sub.command->description);
					entries.push_back(Entry{ left, right, nullptr });
				}
				fAddSection(L"Commands:", entries);
			}

		public:
			std::wstring buildHelpString() {
				fBuildUsage();

				/* add the command description */
				if (!pCommand->command->description.empty()) {
					fAddNewLine(true);
					fAddString(pCommand->command->description, flagtree::IndentInformation);
				}

				fBuildArguments();
				fBuildOptions();
				fBuildCommands();

				/* return the constructed help-string */
				std::wstring out;
				std::swap(out, pBuffer);
				return out;
			}
		};

		inline const detail::Switch* FindHelpSwitch(const detail::ValidCommand& command) {
			for (const detail::ValidSwitch* entry : command.visible) {
				if (entry->option->help)
					return entry->option;
			}
			return nullptr;
		}
	}

	/* render the help text of the given command (depends only on the grammar) */
	inline std::wstring HelpText(const flagtree::Node& node, size_t lineLength = flagtree::NumCharsHelp) {
		return detail::HelpBuilder{ &node.valid(), lineLength }.buildHelpString();
	}

	/* render the help text of the command selected by the path of names/aliases below the root */
	inline std::wstring HelpText(const flagtree::Grammar& grammar, const std::vector<std::wstring>& path = {}, size_t lineLength = flagtree::NumCharsHelp) {
		return flagtree::HelpText(grammar.find(path), lineLength);
	}

	/* construct help-hint suggesting to use the help switch (for example 'try app --help'), or empty if no help switch exists */
	inline std::wstring HelpHint(const flagtree::Grammar& grammar) {
		const detail::Switch* help = detail::FindHelpSwitch(grammar.valid().root);
		if (help == nullptr)
			return L"";
		return str::wd::Build(L"Try '", grammar.name(), L" --", help->name, L"' for more information.");
	}
}
