/* SPDX-License-Identifier: BSD-3-Clause */
/* Copyright (c) 2024-2025 Bjoern Boss Henrichsen */
#include "test-helpers.h"

using namespace flagtree;

static void Validate(const Command& command) {
	Grammar grammar{ command };
}

TEST_CASE( "grammar navigation" ) {
	Grammar grammar = AppGrammar();
	Node root = grammar.root();

	CHECK( grammar.name() == L"app" );
	CHECK( root.name() == L"app" );
	CHECK( root.depth() == 0 );
	CHECK_FALSE( root.parent().has_value() );

	std::vector<Node> children = root.children();
	REQUIRE( children.size() == 2 );
	CHECK( children[0].name() == L"foo" );
	CHECK( children[1].name() == L"bar" );
	CHECK( children[1].aliases() == std::set<std::wstring>{ L"b" } );

	REQUIRE( root.defaultChild().has_value() );
	CHECK( root.defaultChild()->name() == L"foo" );
	CHECK_FALSE( children[1].defaultChild().has_value() );

	SECTION( "lookup by name or alias" ) {
		CHECK( root.child(L"b")->name() == L"bar" );
		CHECK_FALSE( root.child(L"baz").has_value() );
		CHECK( grammar.find({ L"b" }).name() == L"bar" );
		CHECK( grammar.find({}).name() == L"app" );
		CHECK_THROWS_AS( grammar.find({ L"baz" }), Exception );
	}
	SECTION( "switches are inherited in declaration order" ) {
		Node foo = grammar.find({ L"foo" });
		CHECK( foo.depth() == 1 );
		CHECK( foo.parent()->name() == L"app" );

		std::vector<const detail::Switch*> switches = foo.switches();
		REQUIRE( switches.size() == 3 );
		CHECK( switches[0]->name == L"verbose" );
		CHECK( switches[1]->name == L"home" );
		CHECK( switches[2]->name == L"switch" );

		REQUIRE( foo.ownSwitches().size() == 1 );
		CHECK( foo.ownSwitches()[0].abbreviation == L's' );
		REQUIRE( foo.positionals().size() == 1 );
		CHECK( foo.positionals()[0].name == L"name" );
	}
	SECTION( "copies share the validated state" ) {
		Grammar copy = grammar;
		CHECK( &copy.valid() == &grammar.valid() );
	}
}

TEST_CASE( "incremental grammar authoring" ) {
	Switch jobs{ L"jobs", Arity::optional };
	jobs.add(Abbreviation{ L'j' }).add(Payload{ L"n", Primitive::unum }, Description{ L"Parallel jobs" });

	Command command{ L"app" };
	command.add(Switch{ L"verbose", Arity::repeated }).add(jobs, Command{ L"sub" });
	Grammar grammar{ command };

	std::vector<const detail::Switch*> switches = grammar.root().switches();
	REQUIRE( switches.size() == 2 );
	CHECK( switches[1]->abbreviation == L'j' );
	CHECK( switches[1]->description == L"Parallel jobs" );
	REQUIRE( grammar.root().children().size() == 1 );

	Parsed parsed = Parse(Args{ "-j", "3", "sub" }.args, grammar);
	CHECK( parsed.value(L"jobs")->unum() == 3 );
	CHECK( parsed.leaf().command() == L"sub" );
}

TEST_CASE( "switch validation" ) {
	SECTION( "valid switches" ) {
		CHECK_NOTHROW( Validate(Command{ L"app", Switch{ L"a", Arity::optional }, Switch{ L"b", Arity::repeated, Abbreviation{ L'b' } } }) );
	}
	SECTION( "malformed names" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"", Arity::optional } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"-x", Arity::optional } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"a=b", Arity::optional } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"a", Arity::optional, Abbreviation{ L'-' } } }), ConfigException );
	}
	SECTION( "duplicate names" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"a", Arity::optional }, Switch{ L"a", Arity::repeated } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Switch{ L"a", Arity::optional, Abbreviation{ L'x' } },
			Switch{ L"b", Arity::optional, Abbreviation{ L'x' } }
		}), ConfigException );
	}
	SECTION( "inherited switches cannot be shadowed" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Switch{ L"verbose", Arity::optional },
			Command{ L"sub", Switch{ L"verbose", Arity::optional } }
		}), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Switch{ L"verbose", Arity::optional, Abbreviation{ L'v' } },
			Command{ L"sub", Switch{ L"version", Arity::optional, Abbreviation{ L'v' } } }
		}), ConfigException );
	}
	SECTION( "sibling commands may reuse names" ) {
		CHECK_NOTHROW( Validate(Command{ L"app",
			Command{ L"one", Switch{ L"force", Arity::optional, Abbreviation{ L'f' } } },
			Command{ L"two", Switch{ L"force", Arity::optional, Abbreviation{ L'f' } } }
		}) );
	}
	SECTION( "help switches take no value" ) {
		CHECK_NOTHROW( Validate(Command{ L"app", HelpSwitch() }) );
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"help", Arity::optional, Help{}, Payload{ L"topic", Primitive::string } } }), ConfigException );
	}
	SECTION( "enum payloads" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"mode", Arity::optional, Payload{ L"m", Enum{} } } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Switch{ L"mode", Arity::optional, Payload{ L"m", Enum{
			EnumEntry{ L"fast", 0, L"" },
			EnumEntry{ L"fast", 1, L"" }
		} } } }), ConfigException );
	}
}

TEST_CASE( "positional validation" ) {
	SECTION( "valid ordering" ) {
		CHECK_NOTHROW( Validate(Command{ L"app",
			Positional{ L"a", Arity::required, Primitive::string },
			Positional{ L"b", Arity::optional, Primitive::string },
			Positional{ L"c", Arity::repeated, Primitive::string }
		}) );
	}
	SECTION( "required after optional" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Positional{ L"a", Arity::optional, Primitive::string },
			Positional{ L"b", Arity::required, Primitive::string }
		}), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Positional{ L"a", Arity::repeated, Primitive::string },
			Positional{ L"b", Arity::required, Primitive::string }
		}), ConfigException );
	}
	SECTION( "repeated must be last" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Positional{ L"a", Arity::repeated, Primitive::string },
			Positional{ L"b", Arity::optional, Primitive::string }
		}), ConfigException );
	}
	SECTION( "duplicate and clashing names" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Positional{ L"a", Arity::required, Primitive::string },
			Positional{ L"a", Arity::required, Primitive::string }
		}), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Switch{ L"file", Arity::optional },
			Positional{ L"file", Arity::required, Primitive::path }
		}), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Positional{ L"", Arity::required, Primitive::path } }), ConfigException );
	}
	SECTION( "repeated positional excludes sub-commands" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Positional{ L"files", Arity::repeated, Primitive::path },
			Command{ L"sub" }
		}), ConfigException );
	}
}

TEST_CASE( "command validation" ) {
	SECTION( "malformed names" ) {
		CHECK_THROWS_AS( Validate(Command{ L"" }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Command{ L"" } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Command{ L"-sub" } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", DefaultCommand{} }), ConfigException );
	}
	SECTION( "duplicate names and aliases" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app", Command{ L"a" }, Command{ L"a" } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Command{ L"a" }, Command{ L"b", Alias{ L"a" } } }), ConfigException );
		CHECK_THROWS_AS( Validate(Command{ L"app", Command{ L"a", Alias{ L"x" } }, Command{ L"b", Alias{ L"x" } } }), ConfigException );
		CHECK_NOTHROW( Validate(Command{ L"app", Command{ L"a", Command{ L"a" } } }) );
	}
	SECTION( "at most one default" ) {
		CHECK_THROWS_AS( Validate(Command{ L"app",
			Command{ L"a", DefaultCommand{} },
			Command{ L"b", DefaultCommand{} }
		}), ConfigException );
	}
	SECTION( "nested defaults" ) {
		Grammar grammar = Command{ L"app",
			Command{ L"a", DefaultCommand{},
				Command{ L"inner", DefaultCommand{} },
				Command{ L"other" }
			}
		};
		CHECK( Parse(Args{}.args, grammar).path() == std::vector<std::wstring>{ L"app", L"a", L"inner" } );
		CHECK( Parse(Args{ "other" }.args, grammar).path() == std::vector<std::wstring>{ L"app", L"a", L"other" } );
	}
}
