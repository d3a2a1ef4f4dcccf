#include "kspacing/cli.hpp"
#include <charconv>
#include <limits>
#include <stdexcept>
#include <sstream>

namespace kspacing {

long long parse_int64(const std::string& s, long long minVal, long long maxVal) {
    long long value = 0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        throw std::invalid_argument("invalid integer: " + s);
    }
    if (value < minVal || value > maxVal) {
        throw std::out_of_range("value out of range: " + s);
    }
    return value;
}

std::vector<uint32_t> parse_uint_list(const std::string& s) {
    constexpr long long kMax = std::numeric_limits<uint32_t>::max();
    std::vector<uint32_t> out;
    const std::size_t dots = s.find("..");
    if (dots != std::string::npos) {
        const long long lo = parse_int64(s.substr(0, dots), 0, kMax);
        const long long hi = parse_int64(s.substr(dots + 2), 0, kMax);
        if (hi < lo) throw std::invalid_argument("reversed range: " + s);
        for (long long v = lo; v <= hi; ++v) out.push_back(static_cast<uint32_t>(v));
        return out;
    }
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        out.push_back(static_cast<uint32_t>(parse_int64(s.substr(start, comma - start), 0, kMax)));
        start = comma + 1;
    }
    return out;
}

// ---------------- ArgParser ----------------

ArgParser::ArgParser(std::string description) : desc_(std::move(description)) {}

void ArgParser::add_slot(const OptionSpec& spec) {
    const std::size_t idx = slots_.size();
    slots_.push_back(Slot{spec, spec.defaultValue, false});
    byLong_[spec.longName] = idx;
    if (spec.shortName) byShort_[spec.shortName] = idx;
}

void ArgParser::add_option(const OptionSpec& opt) {
    add_slot(opt);
}

void ArgParser::add_flag(const std::string& longName, char shortName, const std::string& help) {
    OptionSpec spec;
    spec.longName = longName;
    spec.shortName = shortName;
    spec.type = ArgType::Flag;
    spec.help = help;
    add_slot(spec);
}

ArgParser::Slot& ArgParser::take(std::size_t idx, const std::string& shown, const char* inlineValue,
                                 int& i, int argc, char** argv) {
    Slot& s = slots_[idx];
    s.given = true;
    if (s.spec.type == ArgType::Flag) {
        if (inlineValue) throw std::runtime_error("flag " + shown + " does not take a value");
        if (s.spec.longName == "help") helpRequested_ = true;
        return s;
    }
    if (inlineValue) {
        s.value = inlineValue;
    } else {
        if (i + 1 >= argc) throw std::runtime_error("missing value for " + shown);
        s.value = argv[++i];
    }
    return s;
}

bool ArgParser::parse(int argc, char** argv) {
    helpRequested_ = false;
    if (!byLong_.count("help")) {
        add_flag("help", 'h', "Show this help message and exit");
    }

    for (int i = 1; i < argc; ++i) {
        const std::string tok = argv[i];
        if (tok.rfind("--", 0) == 0) {
            std::string name = tok.substr(2);
            const char* inlineValue = nullptr;
            const std::size_t eq = name.find('=');
            if (eq != std::string::npos) {
                inlineValue = argv[i] + 2 + eq + 1;
                name.resize(eq);
            }
            if (name.empty()) throw std::runtime_error("invalid option '" + tok + "'");
            auto it = byLong_.find(name);
            if (it == byLong_.end()) throw std::runtime_error("unknown option '--" + name + "'");
            take(it->second, "--" + name, inlineValue, i, argc, argv);
        } else if (tok.size() == 2 && tok[0] == '-') {
            auto it = byShort_.find(tok[1]);
            if (it == byShort_.end()) throw std::runtime_error("unknown option '" + tok + "'");
            take(it->second, tok, nullptr, i, argc, argv);
        } else if (tok.size() > 2 && tok[0] == '-') {
            // No short-option bundling and no single-dash long options.
            throw std::runtime_error("invalid option '" + tok + "'. Use --<long> for long options.");
        } else {
            throw std::runtime_error("unexpected positional argument: " + tok);
        }
    }

    if (helpRequested_) return false;
    for (const auto& s : slots_) {
        if (s.spec.required && !s.given && s.spec.defaultValue.empty()) {
            throw std::runtime_error("missing required option --" + s.spec.longName);
        }
    }
    return true;
}

const ArgParser::Slot& ArgParser::slot(const std::string& longName) const {
    auto it = byLong_.find(longName);
    if (it == byLong_.end()) throw std::runtime_error("option --" + longName + " is not defined");
    return slots_[it->second];
}

bool ArgParser::provided(const std::string& longName) const {
    auto it = byLong_.find(longName);
    return it != byLong_.end() && slots_[it->second].given;
}

std::string ArgParser::get_string(const std::string& longName) const {
    const Slot& s = slot(longName);
    if (s.value.empty() && !s.given) throw std::runtime_error("option --" + longName + " not provided");
    return s.value;
}

unsigned long long ArgParser::get_uint64(const std::string& longName) const {
    const Slot& s = slot(longName);
    const std::string v = get_string(longName);
    if (s.spec.allowInfToken && (v == "inf" || v == "INF")) {
        return std::numeric_limits<unsigned long long>::max();
    }
    unsigned long long value = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
    if (ec != std::errc{} || ptr != v.data() + v.size()) throw std::invalid_argument("invalid integer: " + v);
    return value;
}

bool ArgParser::get_flag(const std::string& longName) const {
    return provided(longName);
}

std::string ArgParser::usage(const std::string& progName) const {
    std::ostringstream oss;
    oss << "Usage: " << progName;
    for (const auto& s : slots_) {
        if (s.spec.longName == "help") continue;
        oss << ' ' << (s.spec.required ? "" : "[");
        if (s.spec.shortName) oss << '-' << s.spec.shortName << '|';
        oss << "--" << s.spec.longName;
        if (s.spec.type != ArgType::Flag) {
            oss << ' ' << (s.spec.valueName.empty() ? "VAL" : s.spec.valueName);
        }
        oss << (s.spec.required ? "" : "]");
    }
    return oss.str();
}

std::string ArgParser::help(const std::string& progName) const {
    std::ostringstream oss;
    if (!desc_.empty()) oss << desc_ << "\n";
    oss << usage(progName) << "\n\nOptions:\n";
    for (const auto& s : slots_) {
        if (s.spec.longName == "help") continue;
        oss << "  ";
        if (s.spec.shortName) oss << '-' << s.spec.shortName << ", "; else oss << "    ";
        oss << "--" << s.spec.longName;
        if (s.spec.type != ArgType::Flag) {
            oss << ' ' << (s.spec.valueName.empty() ? "VAL" : s.spec.valueName);
        }
        if (!s.spec.help.empty()) oss << "\n      " << s.spec.help;
        if (!s.spec.defaultValue.empty()) oss << " (default: " << s.spec.defaultValue << ")";
        if (s.spec.required) oss << " [required]";
        oss << "\n";
    }
    oss << "  -h, --help\n      Show this help message and exit\n";
    return oss.str();
}

} // namespace kspacing
