#pragma once
#include <string_view>
#include <vector>

namespace reskin {
struct CliOpts {
	enum class Result { eContinue, eExitFailure, eExitSuccess };

	struct Key {
		std::string_view full{};
		char single{};
	};

	using Value = std::string_view;

	///
	/// \brief Option description.
	///
	/// An empty value denotes a flag; otherwise value names the argument in usage text.
	///
	struct Opt {
		Key key{};
		Value value{};
		std::string_view help{};
	};

	struct Parser {
		virtual void opt(Key key, Value value) = 0;
		virtual void arg(Value value) = 0;
	};

	struct Spec {
		std::vector<Opt> options{};
		std::vector<std::string_view> args{};
		std::string_view app_name{"reskin"};
		std::string_view version{"(unknown)"};
	};

	///
	/// \brief Parse command line arguments against spec, forwarding options and positional args to out.
	/// \returns eExitSuccess if help / version was printed, eExitFailure on usage error, else eContinue
	///
	/// Every positional argument named in spec.args is required.
	///
	static Result parse(Spec const& spec, Parser* out, int argc, char const* const* argv);
};
} // namespace reskin
