#include <app/app.hpp>
#include <reskin/util/cli_opts.hpp>
#include <reskin/util/logger.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace reskin;

namespace {
std::optional<std::uint32_t> to_u32(std::string const& s) {
	try {
		std::size_t consumed{};
		int i = std::stoi(s, &consumed);
		if (i < 0 || consumed != s.size()) {
			logger::error("Invalid value: {}", s);
			return {};
		}
		return static_cast<std::uint32_t>(i);
	} catch (std::exception const& e) { logger::error("Invalid value: {} ({})", s, e.what()); }
	return {};
}
} // namespace

int main(int argc, char** argv) {
	try {
		struct Parser : CliOpts::Parser {
			AppOpts app_opts{};
			std::size_t args{};
			bool valid{true};

			void opt(CliOpts::Key key, CliOpts::Value value) final {
				switch (key.single) {
				case 'k': {
					auto const count = to_u32(std::string{value});
					if (!count) {
						valid = false;
						return;
					}
					app_opts.neighbours = *count;
					return;
				}
				case 'c': app_opts.config = value; return;
				case 'o': app_opts.object = std::string{value}; return;
				case 's': app_opts.sparse = true; return;
				case 'n': app_opts.no_normalize = true; return;
				default: break;
				}
			}

			void arg(CliOpts::Value value) final {
				switch (args++) {
				case 0: app_opts.source = value; return;
				case 1: app_opts.mesh = value; return;
				case 2: app_opts.output = value; return;
				default: break;
				}
			}
		};
		auto spec = CliOpts::Spec{};
		spec.options = {
			CliOpts::Opt{
				.key = CliOpts::Key{.full = "neighbours", .single = 'k'},
				.value = "COUNT",
				.help = "Nearest source vertices per target vertex (only 1 is supported)",
			},
			CliOpts::Opt{
				.key = CliOpts::Key{.full = "config", .single = 'c'},
				.value = "PATH",
				.help = "JSON config file (default: reskin.conf, if present)",
			},
			CliOpts::Opt{
				.key = CliOpts::Key{.full = "object", .single = 'o'},
				.value = "NAME",
				.help = "Mesh object to take faces from (overrides config)",
			},
			CliOpts::Opt{
				.key = CliOpts::Key{.full = "sparse", .single = 's'},
				.help = "Drop zero weights from output bones",
			},
			CliOpts::Opt{
				.key = CliOpts::Key{.full = "no-normalize", .single = 'n'},
				.help = "Keep mesh positions in their exported axis convention",
			},
		};
		spec.args = {"source.skn", "target.obj", "output.skn"};
		spec.version = version_string();
		auto parser = Parser{};
		switch (CliOpts::parse(spec, &parser, argc, argv)) {
		case CliOpts::Result::eExitSuccess: return EXIT_SUCCESS;
		case CliOpts::Result::eExitFailure: return EXIT_FAILURE;
		case CliOpts::Result::eContinue: break;
		}
		if (!parser.valid) { return EXIT_FAILURE; }
		return execute(parser.app_opts);
	} catch (std::exception const& e) {
		std::cerr << e.what() << '\n';
		return EXIT_FAILURE;
	}
}
