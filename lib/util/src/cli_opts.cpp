#include <reskin/util/cli_opts.hpp>
#include <reskin/util/logger.hpp>
#include <algorithm>
#include <string>

namespace reskin {
namespace {
using Opt = CliOpts::Opt;
using Spec = CliOpts::Spec;
using Result = CliOpts::Result;

std::string usage_line(Spec const& spec) {
	auto ret = fmt::format("Usage: {} [OPTIONS]", spec.app_name);
	for (auto const arg : spec.args) { ret += fmt::format(" <{}>", arg); }
	return ret;
}

std::string option_line(Opt const& opt) {
	auto ret = std::string{"  "};
	ret += opt.key.single != '\0' ? fmt::format("-{}, ", opt.key.single) : std::string{"    "};
	if (!opt.key.full.empty()) { ret += fmt::format("--{}", opt.key.full); }
	if (!opt.value.empty()) { ret += fmt::format("={}", opt.value); }
	if (ret.size() < 32) { ret.resize(32, ' '); }
	ret += opt.help;
	return ret;
}

void print_help(Spec const& spec) {
	fmt::print("{}\n\nOPTIONS\n", usage_line(spec));
	fmt::print("{}\n", option_line(Opt{.key = {.full = "help", .single = 'h'}, .help = "Show this help text"}));
	fmt::print("{}\n", option_line(Opt{.key = {.full = "version"}, .help = "Show version"}));
	for (auto const& opt : spec.options) { fmt::print("{}\n", option_line(opt)); }
}

class Walker {
  public:
	Walker(Spec const& spec, CliOpts::Parser& out, int argc, char const* const* argv) : m_spec(spec), m_out(out), m_argc(argc), m_argv(argv) {}

	Result operator()() {
		// argv[0] is the executable
		for (m_index = 1; m_index < m_argc; ++m_index) {
			auto const arg = std::string_view{m_argv[m_index]};
			if (m_options_ended || arg.size() < 2 || arg[0] != '-') {
				if (m_args >= m_spec.args.size()) {
					logger::error("Unexpected argument: {}", arg);
					return Result::eExitFailure;
				}
				m_out.arg(arg);
				++m_args;
				continue;
			}
			if (arg == "--") {
				m_options_ended = true;
				continue;
			}
			auto const result = arg[1] == '-' ? long_opt(arg.substr(2)) : short_opts(arg.substr(1));
			if (result != Result::eContinue) { return result; }
		}
		if (m_args < m_spec.args.size()) {
			logger::error("Missing argument: <{}>", m_spec.args[m_args]);
			fmt::print("{}\n", usage_line(m_spec));
			return Result::eExitFailure;
		}
		return Result::eContinue;
	}

  private:
	Opt const* find(std::string_view full) const {
		auto const it = std::find_if(m_spec.options.begin(), m_spec.options.end(), [full](Opt const& o) { return o.key.full == full; });
		return it == m_spec.options.end() ? nullptr : &*it;
	}

	Opt const* find(char single) const {
		auto const it = std::find_if(m_spec.options.begin(), m_spec.options.end(), [single](Opt const& o) { return o.key.single == single; });
		return it == m_spec.options.end() ? nullptr : &*it;
	}

	bool next_value(CliOpts::Value& out) {
		if (m_index + 1 >= m_argc) { return false; }
		out = m_argv[++m_index];
		return true;
	}

	Result long_opt(std::string_view arg) {
		auto value = CliOpts::Value{};
		auto has_value = false;
		if (auto const eq = arg.find('='); eq != std::string_view::npos) {
			value = arg.substr(eq + 1);
			arg = arg.substr(0, eq);
			has_value = true;
		}
		if (arg == "help") {
			print_help(m_spec);
			return Result::eExitSuccess;
		}
		if (arg == "version") {
			fmt::print("{} {}\n", m_spec.app_name, m_spec.version);
			return Result::eExitSuccess;
		}
		auto const* opt = find(arg);
		if (!opt) {
			logger::error("Unknown option: --{}", arg);
			return Result::eExitFailure;
		}
		if (opt->value.empty()) {
			if (has_value) {
				logger::error("Option --{} does not take a value", arg);
				return Result::eExitFailure;
			}
		} else if (!has_value && !next_value(value)) {
			logger::error("Missing value for option: --{}", arg);
			return Result::eExitFailure;
		}
		m_out.opt(opt->key, value);
		return Result::eContinue;
	}

	Result short_opts(std::string_view arg) {
		for (std::size_t i = 0; i < arg.size(); ++i) {
			auto const single = arg[i];
			if (single == 'h') {
				print_help(m_spec);
				return Result::eExitSuccess;
			}
			auto const* opt = find(single);
			if (!opt) {
				logger::error("Unknown option: -{}", single);
				return Result::eExitFailure;
			}
			if (opt->value.empty()) {
				m_out.opt(opt->key, {});
				continue;
			}
			// -k1 and -k 1 are both accepted; a value consumes the rest of the group
			auto value = arg.substr(i + 1);
			if (value.empty() && !next_value(value)) {
				logger::error("Missing value for option: -{}", single);
				return Result::eExitFailure;
			}
			m_out.opt(opt->key, value);
			return Result::eContinue;
		}
		return Result::eContinue;
	}

	Spec const& m_spec;
	CliOpts::Parser& m_out;
	int m_argc{};
	char const* const* m_argv{};
	int m_index{};
	std::size_t m_args{};
	bool m_options_ended{};
};
} // namespace

CliOpts::Result CliOpts::parse(Spec const& spec, Parser* out, int argc, char const* const* argv) {
	if (!out) { return Result::eExitFailure; }
	return Walker{spec, *out, argc, argv}();
}
} // namespace reskin
