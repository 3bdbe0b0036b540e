#include "summary_rules.hpp"
#include <algorithm>
#include "concat_errors.hpp"

namespace module_concat {

using json = nlohmann::json;

namespace {

// A header whose body is already an elision placeholder is left alone.
const std::string kNotElided = R"((?!\s*\.\.\.))";

// How far past a signature's ':' a body pattern may look.
constexpr size_t kBodyWindow = 512;

const std::regex& declaration_re() {
    static const std::regex re(R"((?:@|(?:async[ \t]+)?(?:class|def)\b))");
    return re;
}

size_t line_end(const std::string& text, size_t pos) {
    size_t eol = text.find('\n', pos);
    return eol == std::string::npos ? text.size() : eol;
}

size_t indent_width(const std::string& text, size_t line_start) {
    size_t i = line_start;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
    return i - line_start;
}

size_t skip_blanks(const std::string& text, size_t i) {
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
    return i;
}

// One past the ")" closing the "(" at `open`, or npos. Quoted strings on a
// line are skipped and continuation lines must be indented, so an unclosed
// "(" never runs past the enclosing top-level block.
size_t closing_paren(const std::string& text, size_t open) {
    int depth = 0;
    char quote = 0;
    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n') {
            quote = 0;
            if (i + 1 >= text.size() || (text[i + 1] != ' ' && text[i + 1] != '\t')) return std::string::npos;
            continue;
        }
        if (quote) {
            if (c == '\\') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')' && --depth == 0) {
            return i + 1;
        }
    }
    return std::string::npos;
}

// "$n", "$nn", "$&" and "$$" over prepared capture groups.
std::string expand(const std::string& format, const std::vector<std::string>& groups) {
    std::string out;
    for (size_t i = 0; i < format.size(); ++i) {
        char c = format[i];
        if (c != '$' || i + 1 >= format.size()) {
            out += c;
            continue;
        }
        char next = format[i + 1];
        if (next == '$') {
            out += '$';
            ++i;
        } else if (next == '&') {
            out += groups[0];
            ++i;
        } else if (next >= '1' && next <= '9') {
            size_t n = static_cast<size_t>(next - '0');
            size_t digits = 1;
            if (i + 2 < format.size() && format[i + 2] >= '0' && format[i + 2] <= '9') {
                size_t two = n * 10 + static_cast<size_t>(format[i + 2] - '0');
                if (two < groups.size()) {
                    n = two;
                    digits = 2;
                }
            }
            if (n < groups.size()) out += groups[n];
            i += digits;
        } else {
            out += c;
        }
    }
    return out;
}

std::shared_ptr<const std::regex> compile(const std::string& pattern, const char* what) {
    try {
        return std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ConcatError(ConcatErrorCode::InvalidRule,
                          std::string("Invalid summary ") + what + " '" + pattern + "': " + e.what());
    }
}

RuleHeader parse_header(const std::string& name) {
    if (name == "pattern") return RuleHeader::Pattern;
    if (name == "signature") return RuleHeader::Signature;
    throw ConcatError(ConcatErrorCode::InvalidRule, "Unknown rule header: " + name);
}

bool is_blank(const std::string& text, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        if (text[i] != ' ' && text[i] != '\t' && text[i] != '\r') return false;
    }
    return true;
}

bool starts_declaration(const std::string& text, size_t line_start, size_t max_indent) {
    size_t indent = indent_width(text, line_start);
    if (indent > max_indent) return false;
    auto first = text.cbegin() + static_cast<std::ptrdiff_t>(line_start + indent);
    if (first == text.cend()) return false;
    std::smatch m;
    return std::regex_search(first, text.cend(), m, declaration_re(),
                             std::regex_constants::match_continuous |
                             std::regex_constants::match_prev_avail);
}

RuleExtent parse_extent(const std::string& name) {
    if (name == "block") return RuleExtent::Block;
    if (name == "line") return RuleExtent::Line;
    throw ConcatError(ConcatErrorCode::InvalidRule, "Unknown rule extent: " + name);
}

} // namespace

const char* to_string(SummaryLevel level) {
    switch (level) {
        case SummaryLevel::None: return "none";
        case SummaryLevel::Interface: return "interface";
        case SummaryLevel::Core: return "core";
    }
    return "none";
}

std::optional<SummaryLevel> parse_summary_level(const std::string& name) {
    if (name == "none") return SummaryLevel::None;
    if (name == "interface") return SummaryLevel::Interface;
    if (name == "core") return SummaryLevel::Core;
    return std::nullopt;
}

// --- RULE ---

SummaryRule::SummaryRule(std::string pattern, std::string replacement, std::string explanation,
                         RuleExtent extent, RuleHeader header, std::string body)
    : pattern_(std::move(pattern)),
      replacement_(std::move(replacement)),
      explanation_(std::move(explanation)),
      extent_(extent),
      header_(header),
      body_(std::move(body)) {
    if (pattern_.empty()) {
        throw ConcatError(ConcatErrorCode::InvalidRule, "Summary rule has an empty pattern");
    }
    if (!body_.empty() && header_ != RuleHeader::Signature) {
        throw ConcatError(ConcatErrorCode::InvalidRule,
                          "Summary rule '" + pattern_ + "' has a body pattern but no signature header");
    }
    regex_ = compile(pattern_, "pattern");
    if (!body_.empty()) body_regex_ = compile(body_, "body pattern");
}

std::optional<SummaryRule::Match> SummaryRule::match_signature(const std::string& text, size_t pos,
                                                              const std::smatch& head) const {
    size_t name_end = pos + static_cast<size_t>(head.length(0));

    size_t i = skip_blanks(text, name_end);
    if (i < text.size() && text[i] == '(') {
        i = closing_paren(text, i);
        if (i == std::string::npos) return std::nullopt;
    }
    size_t signature_end = i;

    i = skip_blanks(text, i);
    if (text.compare(i, 2, "->") == 0) {
        size_t colon = text.find_first_of(":\n", i);
        if (colon == std::string::npos || text[colon] != ':') return std::nullopt;
        signature_end = colon;
        i = colon;
    }
    if (i >= text.size() || text[i] != ':') return std::nullopt;
    size_t end = i + 1;

    if (body_regex_) {
        auto from = text.cbegin() + static_cast<std::ptrdiff_t>(end);
        auto to = text.cbegin() + static_cast<std::ptrdiff_t>(std::min(text.size(), end + kBodyWindow));
        std::smatch body;
        if (!std::regex_search(from, to, body, *body_regex_,
                               std::regex_constants::match_continuous |
                               std::regex_constants::match_prev_avail)) {
            return std::nullopt;
        }
        end += static_cast<size_t>(body.length(0));
    }

    std::vector<std::string> groups;
    for (size_t g = 0; g < head.size(); ++g) groups.push_back(head[g].str());
    groups.back() += text.substr(name_end, signature_end - name_end);
    groups[0] = text.substr(pos, end - pos);
    return Match{end, expand(replacement_, groups)};
}

std::optional<SummaryRule::Match> SummaryRule::match_at(const std::string& text, size_t pos) const {
    auto flags = std::regex_constants::match_continuous;
    if (pos > 0) flags |= std::regex_constants::match_prev_avail;

    std::smatch match;
    auto begin = text.cbegin() + static_cast<std::ptrdiff_t>(pos);
    if (!std::regex_search(begin, text.cend(), match, *regex_, flags) || match.length(0) == 0) {
        return std::nullopt;
    }
    if (header_ == RuleHeader::Signature) return match_signature(text, pos, match);
    return Match{pos + static_cast<size_t>(match.length(0)), match.format(replacement_)};
}

std::string SummaryRule::apply(const std::string& text) const {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;

    while (pos < text.size()) {
        size_t eol = line_end(text, pos);

        auto match = match_at(text, pos);
        if (!match) {
            size_t next = eol < text.size() ? eol + 1 : eol;
            out.append(text, pos, next - pos);
            pos = next;
            continue;
        }

        size_t match_end = match->end;
        size_t span_end = (text[match_end - 1] == '\n') ? match_end - 1 : line_end(text, match_end);

        if (extent_ == RuleExtent::Block) {
            size_t header_indent = indent_width(text, pos);
            size_t cursor = span_end;
            while (cursor < text.size()) {
                size_t next_start = cursor + 1;
                if (next_start >= text.size()) break;
                if (starts_declaration(text, next_start, header_indent)) break;
                size_t next_end = line_end(text, next_start);
                // trailing blank lines stay with whatever follows
                if (!is_blank(text, next_start, next_end)) span_end = next_end;
                cursor = next_end;
            }
        }

        out += match->output;
        if (!explanation_.empty()) out += "  # " + explanation_;

        if (span_end < text.size()) {
            out += '\n';
            pos = span_end + 1;
        } else {
            pos = span_end;
        }
    }
    return out;
}

json SummaryRule::to_json() const {
    json j{
        {"pattern", pattern_},
        {"replacement", replacement_},
        {"explanation", explanation_},
        {"extent", extent_ == RuleExtent::Block ? "block" : "line"},
        {"header", header_ == RuleHeader::Signature ? "signature" : "pattern"}
    };
    if (!body_.empty()) j["body"] = body_;
    return j;
}

SummaryRule SummaryRule::from_json(const json& j) {
    try {
        return SummaryRule(j.at("pattern").get<std::string>(),
                           j.at("replacement").get<std::string>(),
                           j.value("explanation", std::string{}),
                           parse_extent(j.value("extent", std::string{"block"})),
                           parse_header(j.value("header", std::string{"pattern"})),
                           j.value("body", std::string{}));
    } catch (const json::exception& e) {
        throw ConcatError(ConcatErrorCode::InvalidRule, std::string("Malformed summary rule: ") + e.what());
    }
}

// --- RULE SET ---

SummaryRules SummaryRules::default_rules() {
    SummaryRules rules;
    rules.interface = {
        SummaryRule(R"(([ \t]*)(class[ \t]+\w+))",
                    "$1$2:\n$1    ...",
                    "Class interface preserved",
                    RuleExtent::Block, RuleHeader::Signature, kNotElided),
        SummaryRule(R"(([ \t]*)((?:async[ \t]+)?def[ \t]+\w+))",
                    "$1$2:\n$1    ...",
                    "Function signature preserved",
                    RuleExtent::Block, RuleHeader::Signature, kNotElided)
    };
    rules.core = {
        SummaryRule(R"(([ \t]*)((?:async[ \t]+)?def[ \t]+get_\w+))",
                    "$1$2: ...",
                    "Getter method summarized",
                    RuleExtent::Line, RuleHeader::Signature, R"(\s*return\b)"),
        SummaryRule(R"(([ \t]*)(def[ \t]+__init__))",
                    "$1$2: ...",
                    "Standard initialization summarized",
                    RuleExtent::Block, RuleHeader::Signature, kNotElided)
    };
    return rules;
}

SummaryRules SummaryRules::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConcatError(ConcatErrorCode::InvalidRule, "Summary rules must be a JSON object");
    }
    SummaryRules rules;
    auto load = [&](const char* key, std::vector<SummaryRule>& into) {
        if (!j.contains(key)) return;
        if (!j[key].is_array()) {
            throw ConcatError(ConcatErrorCode::InvalidRule, std::string("Summary rules '") + key + "' must be an array");
        }
        for (const auto& r : j[key]) into.push_back(SummaryRule::from_json(r));
    };
    load("interface", rules.interface);
    load("core", rules.core);
    return rules;
}

json SummaryRules::to_json() const {
    json j{{"interface", json::array()}, {"core", json::array()}};
    for (const auto& r : interface) j["interface"].push_back(r.to_json());
    for (const auto& r : core) j["core"].push_back(r.to_json());
    return j;
}

std::vector<const SummaryRule*> SummaryRules::for_level(SummaryLevel level) const {
    std::vector<const SummaryRule*> selected;
    if (level == SummaryLevel::None) return selected;
    for (const auto& r : interface) selected.push_back(&r);
    if (level == SummaryLevel::Core) {
        for (const auto& r : core) selected.push_back(&r);
    }
    return selected;
}

} // namespace module_concat
