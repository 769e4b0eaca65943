#include <reskin/util/cli_opts.hpp>
#include <catch2/catch.hpp>
#include <string>
#include <utility>

namespace reskin::tests {
namespace {
struct Recorder : CliOpts::Parser {
	std::vector<std::pair<char, std::string>> opts{};
	std::vector<std::string> args{};

	void opt(CliOpts::Key key, CliOpts::Value value) final { opts.emplace_back(key.single, std::string{value}); }
	void arg(CliOpts::Value value) final { args.emplace_back(value); }
};

CliOpts::Spec make_spec() {
	auto ret = CliOpts::Spec{};
	ret.options = {
		CliOpts::Opt{.key = {.full = "neighbours", .single = 'k'}, .value = "COUNT"},
		CliOpts::Opt{.key = {.full = "sparse", .single = 's'}},
		CliOpts::Opt{.key = {.full = "no-normalize", .single = 'n'}},
	};
	ret.args = {"source", "mesh", "output"};
	ret.version = "v0.0.0";
	return ret;
}

template <std::size_t N>
CliOpts::Result parse(Recorder& out, char const* const (&argv)[N]) {
	return CliOpts::parse(make_spec(), &out, static_cast<int>(N), argv);
}
} // namespace

TEST_CASE("CliOpts-PositionalAndOptions", "[cli]") {
	auto recorder = Recorder{};
	char const* const argv[] = {"reskin", "-k", "1", "a.skn", "--sparse", "b.obj", "--neighbours=2", "c.skn"};
	REQUIRE(parse(recorder, argv) == CliOpts::Result::eContinue);
	REQUIRE(recorder.args == std::vector<std::string>{"a.skn", "b.obj", "c.skn"});
	REQUIRE(recorder.opts.size() == 3);
	REQUIRE(recorder.opts[0] == std::pair<char, std::string>{'k', "1"});
	REQUIRE(recorder.opts[1] == std::pair<char, std::string>{'s', ""});
	REQUIRE(recorder.opts[2] == std::pair<char, std::string>{'k', "2"});
}

TEST_CASE("CliOpts-ShortGroups", "[cli]") {
	auto recorder = Recorder{};
	char const* const argv[] = {"reskin", "-snk3", "a", "b", "c"};
	REQUIRE(parse(recorder, argv) == CliOpts::Result::eContinue);
	REQUIRE(recorder.opts.size() == 3);
	REQUIRE(recorder.opts[0].first == 's');
	REQUIRE(recorder.opts[1].first == 'n');
	REQUIRE(recorder.opts[2] == std::pair<char, std::string>{'k', "3"});
}

TEST_CASE("CliOpts-EndOfOptions", "[cli]") {
	auto recorder = Recorder{};
	char const* const argv[] = {"reskin", "a", "--", "-b.obj", "c"};
	REQUIRE(parse(recorder, argv) == CliOpts::Result::eContinue);
	REQUIRE(recorder.args == std::vector<std::string>{"a", "-b.obj", "c"});
}

TEST_CASE("CliOpts-Exit", "[cli]") {
	auto recorder = Recorder{};
	SECTION("help") {
		char const* const argv[] = {"reskin", "--help"};
		REQUIRE(parse(recorder, argv) == CliOpts::Result::eExitSuccess);
	}
	SECTION("version") {
		char const* const argv[] = {"reskin", "--version"};
		REQUIRE(parse(recorder, argv) == CliOpts::Result::eExitSuccess);
	}
	SECTION("missing positional") {
		char const* const argv[] = {"reskin", "a", "b"};
		REQUIRE(parse(recorder, argv) == CliOpts::Result::eExitFailure);
	}
	SECTION("extra positional") {
		char const* const argv[] = {"reskin", "a", "b", "c", "d"};
		REQUIRE(parse(recorder, argv) == CliOpts::Result::eExitFailure);
	}
	SECTION("unknown option") {
		char const* const argv[] = {"reskin", "--frobnicate", "a", "b", "c"};
		REQUIRE(parse(recorder, argv) == CliOpts::Result::eExitFailure);
	}
	SECTION("missing value") {
		char const* const argv[] = {"reskin", "a", "b", "c", "-k"};
		REQUIRE(parse(recorder, argv) == CliOpts::Result::eExitFailure);
	}
	SECTION("value for flag") {
		char const* const argv[] = {"reskin", "--sparse=yes", "a", "b", "c"};
		REQUIRE(parse(recorder, argv) == CliOpts::Result::eExitFailure);
	}
}
} // namespace reskin::tests
