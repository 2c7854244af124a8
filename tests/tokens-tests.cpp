/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "test-helpers.h"

using namespace flagtree;

static std::vector<detail::Token> Tokenize(const std::vector<std::string>& args) {
	std::vector<detail::Token> out;
	detail::Tokenizer tokens{ args };
	while (std::optional<detail::Token> token = tokens.next())
		out.push_back(*token);
	return out;
}

TEST_CASE( "tokenizer classification" ) {
	SECTION( "long switches" ) {
		Args args{ "--verbose", "--jobs=4", "--name=a=b", "--empty=" };
		auto tokens = Tokenize(args.args);
		REQUIRE( tokens.size() == 4 );

		CHECK( tokens[0].kind == detail::TokenKind::longSwitch );
		CHECK( tokens[0].name == L"verbose" );
		CHECK_FALSE( tokens[0].payload.has_value() );

		CHECK( tokens[1].name == L"jobs" );
		REQUIRE( tokens[1].payload.has_value() );
		CHECK( *tokens[1].payload == "4" );

		CHECK( tokens[2].name == L"name" );
		CHECK( *tokens[2].payload == "a=b" );

		CHECK( tokens[3].name == L"empty" );
		REQUIRE( tokens[3].payload.has_value() );
		CHECK( tokens[3].payload->empty() );
	}
	SECTION( "short switches and bare values" ) {
		Args args{ "-v", "-xyz", "-", "value", "" };
		auto tokens = Tokenize(args.args);
		REQUIRE( tokens.size() == 5 );

		CHECK( tokens[0].kind == detail::TokenKind::shortSwitch );
		CHECK( tokens[0].name == L"v" );
		CHECK( tokens[1].kind == detail::TokenKind::shortSwitch );
		CHECK( tokens[1].name == L"xyz" );
		CHECK( tokens[2].kind == detail::TokenKind::bare );
		CHECK( tokens[3].kind == detail::TokenKind::bare );
		CHECK( *tokens[3].raw == "value" );
		CHECK( tokens[4].kind == detail::TokenKind::bare );
	}
	SECTION( "separator forces bare values" ) {
		Args args{ "-a", "--", "-x", "--flag", "--" };
		auto tokens = Tokenize(args.args);
		REQUIRE( tokens.size() == 5 );

		CHECK( tokens[0].kind == detail::TokenKind::shortSwitch );
		CHECK( tokens[1].kind == detail::TokenKind::separator );
		CHECK( tokens[2].kind == detail::TokenKind::bare );
		CHECK( *tokens[2].raw == "-x" );
		CHECK( tokens[3].kind == detail::TokenKind::bare );
		CHECK( tokens[4].kind == detail::TokenKind::bare );
		CHECK( *tokens[4].raw == "--" );
	}
}

TEST_CASE( "switch names of non-text arguments" ) {
	Args args{ "-\xff", "--a\xff=1", "--ok" };
	auto tokens = Tokenize(args.args);
	REQUIRE( tokens.size() == 3 );

	CHECK( tokens[0].kind == detail::TokenKind::shortSwitch );
	CHECK_FALSE( tokens[0].text );
	CHECK( tokens[1].kind == detail::TokenKind::longSwitch );
	CHECK_FALSE( tokens[1].text );
	CHECK( *tokens[1].payload == "1" );
	CHECK( tokens[2].text );
	CHECK( tokens[2].name == L"ok" );
}

TEST_CASE( "tokenizer value consumption" ) {
	Args args{ "--jobs", "4", "--name", "--other", "--", "-x" };
	detail::Tokenizer tokens{ args.args };

	REQUIRE( tokens.next()->name == L"jobs" );
	const std::string* value = tokens.nextValue();
	REQUIRE( value != nullptr );
	CHECK( *value == "4" );

	REQUIRE( tokens.next()->name == L"name" );
	CHECK( tokens.nextValue() == nullptr );
	CHECK( tokens.next()->name == L"other" );

	CHECK( tokens.next()->kind == detail::TokenKind::separator );
	CHECK( tokens.locked() );
	CHECK( tokens.next()->kind == detail::TokenKind::bare );
	CHECK_FALSE( tokens.next().has_value() );
}

TEST_CASE( "utf-8 detection" ) {
	CHECK( detail::IsUtf8("plain") );
	CHECK( detail::IsUtf8("gr\xc3\xbc\xc3\x9f") );
	CHECK( detail::IsUtf8("\xf0\x9f\x98\x80") );
	CHECK_FALSE( detail::IsUtf8("\xff") );
	CHECK_FALSE( detail::IsUtf8("\xc3") );
	CHECK_FALSE( detail::IsUtf8("\xc0\xaf") );
	CHECK_FALSE( detail::IsUtf8("\xed\xa0\x80") );

	std::wstring text;
	REQUIRE( detail::DecodeText("abc", text) );
	CHECK( text == L"abc" );
	CHECK_FALSE( detail::DecodeText("a\xff", text) );
	CHECK( detail::Printable("a\xff") == L"a?" );
}

TEST_CASE( "command line preparation" ) {
	CHECK( Prepare("") == std::vector<std::string>{} );
	CHECK( Prepare("a  b") == std::vector<std::string>{ "a", "b" } );
	CHECK( Prepare("--name \"two words\" 'x y' a\\ b") == std::vector<std::string>{ "--name", "two words", "x y", "a b" } );

	const char* argv[] = { "/usr/bin/app", "-v", "foo" };
	CHECK( Prepare(3, argv) == std::vector<std::string>{ "-v", "foo" } );
}
