#include <algexpr/algexpr.hpp>

#include "logger.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using algexpr::cli::Logger;
using algexpr::cli::LogLevel;

namespace {

enum class Mode { Tokens, Parse, Eval, Simplify, Analyze };

struct Options {
    std::optional<Mode> mode;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    std::optional<std::string> denominator;
    std::string config_file;
    std::vector<std::string> expressions;
};

struct UsageError : std::runtime_error { using std::runtime_error::runtime_error; };

bool parse_mode(const std::string& text, Mode& mode) {
    if (text == "tokens") mode = Mode::Tokens;
    else if (text == "parse") mode = Mode::Parse;
    else if (text == "eval") mode = Mode::Eval;
    else if (text == "simplify") mode = Mode::Simplify;
    else if (text == "analyze") mode = Mode::Analyze;
    else return false;
    return true;
}

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

void set_mode(Options& opt, const std::string& value) {
    Mode m{};
    if (!parse_mode(value, m)) throw UsageError("unknown mode: " + value);
    opt.mode = m;
}

void set_log_level(Options& opt, const std::string& value) {
    LogLevel level{};
    if (!Logger::parse_level(value, level)) throw UsageError("unknown log level: " + value);
    opt.log_level = level;
}

// key=value lines; '#' starts a comment line. Values already set on the
// command line win.
void load_config(Options& opt) {
    std::ifstream in(opt.config_file);
    if (!in.is_open()) throw UsageError("cannot open config file: " + opt.config_file);

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (key == "mode") {
            if (!opt.mode) set_mode(opt, val);
        } else if (key == "log-level") {
            if (!opt.log_level) set_log_level(opt, val);
        } else if (key == "log-file") {
            if (!opt.log_file) opt.log_file = val;
        } else if (key == "denominator") {
            if (!opt.denominator) opt.denominator = val;
        } else {
            ALGEXPR_LOG_WARN("Ignoring unknown config key: " + key);
        }
    }
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] [expression...]\n"
              << "Reads expressions from stdin when none are given.\n"
              << "Options:\n"
              << "  -m, --mode MODE         tokens, parse, eval, simplify, analyze (default: simplify)\n"
              << "  -d, --denominator EXPR  analyze each expression as a fraction over EXPR\n"
              << "  -l, --log-level LVL     debug, info, warn, error (default: warn)\n"
              << "  --log-file PATH         append log lines to PATH instead of stderr\n"
              << "  --config FILE           key=value defaults (mode, log-level, log-file, denominator)\n"
              << "  -h, --help              show this help\n";
}

std::string span_text(const algexpr::Span& s) {
    return "[" + std::to_string(s.start) + "," + std::to_string(s.end) + ")";
}

// Returns false if the expression did not parse in a mode that needs it.
bool run(Mode mode, const std::string& text, const algexpr::Node* denominator) {
    using namespace algexpr;

    switch (mode) {
        case Mode::Tokens: {
            std::vector<Token> tokens = tokenize(text);
            std::size_t implicit = 0;
            for (const auto& t : tokens) {
                if (t.implicit()) { ++implicit; continue; }
                std::cout << to_string(t.kind);
                if (!t.text.empty()) std::cout << " '" << t.text << "'";
                std::cout << " " << span_text(t.span) << "\n";
            }
            ALGEXPR_LOG_DEBUG(std::to_string(tokens.size()) + " tokens, " +
                              std::to_string(implicit) + " implicit multiplications");
            return true;
        }
        case Mode::Simplify:
            std::cout << simplify_string(text) << "\n";
            return true;
        default:
            break;
    }

    NodePtr ast;
    try {
        ast = parse(text);
    } catch (const ParseError& e) {
        ALGEXPR_LOG_WARN("Parse error at offset " + std::to_string(e.position()) + ": " + e.what());
        std::cout << "error: " << e.what() << " (at " << e.position() << ")\n";
        return false;
    }

    switch (mode) {
        case Mode::Parse:
            std::cout << ast_to_string(*ast);
            if (ast->span) std::cout << " " << span_text(*ast->span);
            std::cout << "\n";
            break;
        case Mode::Eval:
            if (auto v = try_evaluate(*ast)) {
                std::cout << format_number(*v) << "\n";
            } else {
                std::cout << "not a number: " << ast_to_string(*simplify(*ast)) << "\n";
            }
            break;
        case Mode::Analyze: {
            std::vector<Opportunity> found = denominator ? analyze_fraction(*ast, *denominator)
                                                         : analyze_expression(*ast);
            if (found.empty()) std::cout << "no opportunities\n";
            for (const auto& o : found) std::cout << describe(o) << "\n";
            break;
        }
        default:
            break;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opt;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-m" || arg == "--mode") && i + 1 < argc) {
                set_mode(opt, argv[++i]);
            } else if ((arg == "-d" || arg == "--denominator") && i + 1 < argc) {
                opt.denominator = argv[++i];
            } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
                set_log_level(opt, argv[++i]);
            } else if (arg == "--log-file" && i + 1 < argc) {
                opt.log_file = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                opt.config_file = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
                throw UsageError("unknown option: " + arg);
            } else {
                // "-x" is an expression, not an option
                opt.expressions.push_back(arg);
            }
        }
        if (!opt.config_file.empty()) load_config(opt);
    } catch (const UsageError& e) {
        std::cerr << "algexpr_cli: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    Logger& logger = Logger::instance();
    logger.set_level(opt.log_level.value_or(LogLevel::Warn));
    if (opt.log_file && !logger.enable_file_logging(*opt.log_file))
        ALGEXPR_LOG_ERROR("Cannot open log file: " + *opt.log_file);

    const Mode mode = opt.mode.value_or(Mode::Simplify);

    algexpr::NodePtr denominator;
    if (opt.denominator) {
        try {
            denominator = algexpr::parse(*opt.denominator);
        } catch (const algexpr::ParseError& e) {
            ALGEXPR_LOG_ERROR("Denominator does not parse at offset " +
                              std::to_string(e.position()) + ": " + e.what());
            return 1;
        }
    }

    bool ok = true;
    auto handle = [&](const std::string& text) {
        auto t0 = std::chrono::steady_clock::now();
        ok = run(mode, text, denominator.get()) && ok;
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - t0).count();
        ALGEXPR_LOG_DEBUG("'" + text + "' handled in " + std::to_string(us) + "us");
    };

    if (opt.expressions.empty()) {
        ALGEXPR_LOG_INFO("Reading expressions from stdin");
        std::string line;
        while (std::getline(std::cin, line)) {
            if (trim(line).empty()) continue;
            handle(line);
        }
    } else {
        for (const auto& e : opt.expressions) handle(e);
    }

    return ok ? 0 : 1;
}
