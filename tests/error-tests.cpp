/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "test-helpers.h"

using namespace flagtree;

TEST_CASE( "error exit codes" ) {
	Grammar grammar = Command{ L"app",
		HelpSwitch(),
		Switch{ L"count", Arity::optional, Payload{ L"n", Primitive::inum } },
		Switch{ L"name", Arity::required, Payload{ L"text", Primitive::string } },
		Constraint{ [](const Parsed& parsed) -> std::wstring {
			if (parsed.value(L"count").has_value() && parsed.value(L"count")->inum() < 0)
				return L"Count must not be negative.";
			return L"";
		} }
	};

	struct Case {
		std::vector<std::string> args;
		ErrorKind kind;
	};
	std::vector<Case> cases = {
		{ { "--unknown" }, ErrorKind::unknownSwitch },
		{ { "--name", "a", "extra" }, ErrorKind::unexpectedArgument },
		{ { "--name" }, ErrorKind::missingValue },
		{ { "--name", "a", "--name", "b" }, ErrorKind::duplicateSwitch },
		{ {}, ErrorKind::missingRequired },
		{ { "--name", "a", "--count", "x" }, ErrorKind::typeConversion },
		{ { "--name", "a", "--count=-3" }, ErrorKind::constraint }
	};

	for (const Case& entry : cases) {
		Error err = ParseError(entry.args, grammar);
		CHECK( err.kind() == entry.kind );
		CHECK_FALSE( err.help() );
		CHECK( err.exitCode() == 2 );
		CHECK_FALSE( err.message().empty() );
	}

	Error help = ParseError(Args{ "--name", "a", "-h" }, grammar);
	CHECK( help.exitCode() == 0 );
	CHECK( help.help() );

	/* negative numbers can only be passed inline */
	CHECK( ParseError(Args{ "--name", "a", "--count", "-3" }, grammar).kind() == ErrorKind::missingValue );
	CHECK( Parse(Args{ "--name", "a", "--count=3" }.args, grammar).value(L"count")->inum() == 3 );
}

TEST_CASE( "errors are exceptions" ) {
	Grammar grammar = AppGrammar();

	CHECK_THROWS_AS( Parse(Args{ "--unknown" }.args, grammar), Error );
	CHECK_THROWS_AS( Parse(Args{ "--unknown" }.args, grammar), Exception );

	CHECK_THROWS_AS( Parse(Args{ "--home" }.args, grammar), Exception );
	CHECK_THROWS_AS( Grammar{ Command{ L"" } }, ConfigException );
}

TEST_CASE( "error messages are self-contained" ) {
	Grammar grammar = AppGrammar();

	CHECK( ParseError(Args{ "--home", "a", "--home", "b" }, grammar).message() == L"Switch [--home] can at most be specified once." );
	CHECK( ParseError(Args{ "bar", "baz" }, grammar).message() == L"Unexpected argument [baz] encountered for command [bar]." );
	CHECK( ParseError(Args{ "--verbose=\xff" }, grammar).message() == L"Switch [--verbose] does not take a value." );
	CHECK( ParseError(Args{ "--\xff" }, grammar).message() == L"Unknown switch [--?] encountered." );
}
