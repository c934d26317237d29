#include "sandbox/network_policy.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace autolab::sandbox {
namespace {

// One source line, split into what executes and what is quoted text.
struct ScannedLine {
    std::string code;                   // comment removed, literals kept
    std::string bare;                   // comment removed, literals blanked
    std::vector<std::string> literals;  // literal contents closed on this line
};

enum class ScanState { kCode, kString, kComment };

// Line scanner shared by Python and shell programs. '#' opens a comment unless it
// follows '$' or '{' (shell `$#`, `${#x}`); single-quoted literals close at the end of
// the line, triple-quoted ones may span lines.
std::vector<ScannedLine> ScanProgram(const std::string& program) {
    std::vector<ScannedLine> lines(1);
    ScanState state = ScanState::kCode;
    std::string quote;
    std::string literal;
    for (std::size_t i = 0; i < program.size(); ++i) {
        const char c = program[i];
        auto& line = lines.back();
        if (c == '\n') {
            if (state == ScanState::kString && quote.size() == 1) {
                line.literals.push_back(literal);
                literal.clear();
                state = ScanState::kCode;
            } else if (state == ScanState::kString) {
                literal += c;
            } else if (state == ScanState::kComment) {
                state = ScanState::kCode;
            }
            lines.emplace_back();
            continue;
        }
        switch (state) {
            case ScanState::kComment:
                break;
            case ScanState::kString:
                if (program.compare(i, quote.size(), quote) == 0) {
                    line.code += quote;
                    line.bare.append(quote.size(), ' ');
                    line.literals.push_back(literal);
                    literal.clear();
                    i += quote.size() - 1;
                    state = ScanState::kCode;
                } else if (c == '\\' && i + 1 < program.size() && program[i + 1] != '\n') {
                    line.code += c;
                    line.code += program[i + 1];
                    line.bare += "  ";
                    literal += program[i + 1];
                    ++i;
                } else {
                    line.code += c;
                    line.bare += ' ';
                    literal += c;
                }
                break;
            case ScanState::kCode:
                if (c == '#' && (i == 0 || (program[i - 1] != '$' && program[i - 1] != '{'))) {
                    state = ScanState::kComment;
                } else if (c == '\'' || c == '"') {
                    const std::string triple(3, c);
                    quote = program.compare(i, 3, triple) == 0 ? triple : std::string(1, c);
                    line.code += quote;
                    line.bare.append(quote.size(), ' ');
                    i += quote.size() - 1;
                    state = ScanState::kString;
                } else {
                    line.code += c;
                    line.bare += c;
                }
                break;
        }
    }
    if (state == ScanState::kString && !literal.empty()) {
        lines.back().literals.push_back(literal);
    }
    return lines;
}

const std::regex& ShellCallPattern() {
    static const std::regex kPattern(
        R"(\b(os\.(system|popen|exec\w*|spawn\w*)|subprocess\.\w+|Popen|check_output|check_call|getoutput|getstatusoutput)\s*\()");
    return kPattern;
}

// Text that a shell would interpret: every line with its literals blanked (shell
// scripts), plus the joined literals of any line that hands a string to a shell.
std::vector<std::string> ShellContexts(const std::vector<ScannedLine>& lines) {
    std::vector<std::string> contexts;
    for (const auto& line : lines) {
        contexts.push_back(line.bare);
        if (!line.literals.empty() && std::regex_search(line.bare, ShellCallPattern())) {
            std::string joined;
            for (const auto& literal : line.literals) {
                if (!joined.empty()) {
                    joined += ' ';
                }
                joined += literal;
            }
            // Each literal may itself hold several lines of script.
            std::size_t start = 0;
            while (start <= joined.size()) {
                const auto end = joined.find('\n', start);
                contexts.push_back(joined.substr(start, end == std::string::npos ? std::string::npos : end - start));
                if (end == std::string::npos) {
                    break;
                }
                start = end + 1;
            }
        }
    }
    return contexts;
}

// A command word only counts at the start of a line or after a separator.
constexpr const char* kCommandStart = R"((?:^|[;&|`]|\$\()\s*)";

struct Rule {
    std::regex pattern;
    std::string label;  // empty: report capture group 1
};

std::optional<std::string> FirstMatch(const std::vector<std::string>& texts, const std::vector<Rule>& rules) {
    std::smatch match;
    for (const auto& text : texts) {
        for (const auto& rule : rules) {
            if (std::regex_search(text, match, rule.pattern)) {
                return rule.label.empty() ? match[1].str() : rule.label;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> CodeLines(const std::vector<ScannedLine>& lines) {
    std::vector<std::string> code;
    code.reserve(lines.size());
    for (const auto& line : lines) {
        code.push_back(line.code);
    }
    return code;
}

bool ContainsAny(const std::string& text, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const std::string& needle) {
        return text.find(needle) != std::string::npos;
    });
}

}  // namespace

std::optional<std::string> FindNetworkViolation(const std::string& program) {
    const auto lines = ScanProgram(program);

    static const std::regex kImport(
        R"(^\s*(?:import\s+(?:[\w.]+\s*,\s*)*|from\s+)(socket|ssl|urllib[0-9]*|requests|httpx|aiohttp|http|ftplib|smtplib|poplib|imaplib|telnetlib|paramiko|websockets?|xmlrpc)\b)");
    std::smatch match;
    for (const auto& line : lines) {
        if (std::regex_search(line.bare, match, kImport)) {
            return "import " + match[1].str();
        }
    }

    static const std::vector<Rule> kCodeRules = {
        {std::regex(R"(__import__\(\s*['"](socket|ssl|requests|urllib[0-9]*|http)\b)"), "__import__"},
        {std::regex(R"(\b(urlopen|socket\.socket|socket\.create_connection|getaddrinfo)\s*\()"), ""}
    };
    if (auto hit = FirstMatch(CodeLines(lines), kCodeRules)) {
        return hit;
    }

    static const std::vector<Rule> kShellRules = {
        {std::regex(std::string(kCommandStart)
                    + R"((?:sudo\s+)?(curl|wget|nc|ncat|netcat|ssh|scp|sftp|telnet|ftp)(?:\s+[^=\s]|\s*$))"), ""},
        {std::regex(std::string(kCommandStart) + R"((?:python3?\s+-m\s+)?pip3?\s+install\b)"), "pip install"},
        {std::regex(R"(/dev/(tcp|udp)/)"), "/dev/tcp"}
    };
    return FirstMatch(ShellContexts(lines), kShellRules);
}

std::optional<std::string> FindBlockedCommand(const std::string& program) {
    std::string compact;
    for (const char c : program) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact += c;
        }
    }
    if (compact.find(":(){:|:&};:") != std::string::npos) {
        return ":(){:|:&};:";
    }

    const auto lines = ScanProgram(program);
    static const std::vector<Rule> kCodeRules = {
        {std::regex(R"(shutil\.rmtree\(\s*['"](/|~)['"]\s*\))"), "shutil.rmtree('/')"}
    };
    if (auto hit = FirstMatch(CodeLines(lines), kCodeRules)) {
        return hit;
    }

    const std::string start(kCommandStart);
    static const std::vector<Rule> kShellRules = {
        {std::regex(start + R"(rm\s+(?:-[-\w]+\s+)+(?:/|~/?)(?:\*|\s|$))"), "rm -rf /"},
        {std::regex(start + R"((shutdown|reboot|halt|poweroff|killall|chown|sudo|mkfs(?:\.\w+)?)(?:\s+[^=\s]|\s*$))"), ""},
        {std::regex(start + R"(dd\s+[^;&|]*\bof=/dev/)"), "dd of=/dev/"},
        {std::regex(start + R"(kill\s+-(?:9|KILL)\s+-1(?:\s|$))"), "kill -9 -1"},
        {std::regex(start + R"(chmod\s+(?:-\w+\s+)*0?777\s+/(?:\s|$))"), "chmod 777 /"}
    };
    return FirstMatch(ShellContexts(lines), kShellRules);
}

bool LooksLikeNetworkFailure(const std::string& output) {
    static const std::vector<std::string> kSignatures = {
        "Network is unreachable",
        "Temporary failure in name resolution",
        "Name or service not known",
        "nodename nor servname",
        "getaddrinfo failed",
        "socket.gaierror",
        "Could not resolve host",
        "Failed to establish a new connection",
        "ProxyError",
        "Connection refused"
    };
    return ContainsAny(output, kSignatures);
}

bool LooksLikeAllocationFailure(const std::string& output) {
    static const std::vector<std::string> kSignatures = {
        "MemoryError",
        "std::bad_alloc",
        "Cannot allocate memory",
        "Out of memory",
        "out of memory"
    };
    return ContainsAny(output, kSignatures);
}

}  // namespace autolab::sandbox
