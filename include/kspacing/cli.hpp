#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>

namespace kspacing {

// Parse an integer from a string with bounds checking.
// Throws std::invalid_argument or std::out_of_range on error.
long long parse_int64(const std::string& s, long long minVal, long long maxVal);

// Parse a list of unsigned values: "3", "2,3,5" or an inclusive range "2..10".
// Throws std::invalid_argument on malformed input or an empty/reversed range.
std::vector<uint32_t> parse_uint_list(const std::string& s);

// Small CLI parser for the executables.
// Supports --long VALUE, --long=VALUE, -s VALUE, flags, defaults, required
// options and generated usage/help text.
enum class ArgType { Flag, String, UInt64 };

struct OptionSpec {
	std::string longName;        // e.g. "input"
	char shortName = '\0';       // e.g. 'i' (optional)
	ArgType type = ArgType::String;
	std::string valueName;       // e.g. "FILE" or "N"; empty for flags
	std::string help;            // description for --help
	bool required = false;       // must be provided by user
	std::string defaultValue;    // default string (empty means no default)
	bool allowInfToken = false;  // UInt64 only: accept "inf" as the maximum value
};

class ArgParser {
public:
	explicit ArgParser(std::string description = "");

	void add_option(const OptionSpec& opt);
	void add_flag(const std::string& longName, char shortName, const std::string& help);

	// Parse argc/argv. Returns false if --help/-h was requested.
	// Throws std::runtime_error on invalid input.
	bool parse(int argc, char** argv);

	// Whether an option was explicitly given on the command line.
	bool provided(const std::string& longName) const;

	// Typed accessors; fall back to the default, throw if neither is present.
	std::string get_string(const std::string& longName) const;
	unsigned long long get_uint64(const std::string& longName) const;
	bool get_flag(const std::string& longName) const;

	std::string usage(const std::string& progName) const;
	std::string help(const std::string& progName) const;

private:
	struct Slot {
		OptionSpec spec;
		std::string value;   // last value seen, or the default
		bool given = false;  // set by the user
	};

	std::string desc_;
	std::vector<Slot> slots_;
	std::unordered_map<std::string, std::size_t> byLong_;
	std::unordered_map<char, std::size_t> byShort_;
	bool helpRequested_ = false;

	void add_slot(const OptionSpec& spec);
	Slot& take(std::size_t idx, const std::string& shown, const char* inlineValue, int& i, int argc, char** argv);
	const Slot& slot(const std::string& longName) const;
};

} // namespace kspacing
