#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace module_concat {

enum class SummaryLevel {
    None,       // full code
    Interface,  // declarations only
    Core        // interface + trivial getters/initializers collapsed
};

const char* to_string(SummaryLevel level);
std::optional<SummaryLevel> parse_summary_level(const std::string& name);

// How much text a rule consumes once its pattern matched at a line start.
enum class RuleExtent {
    Line,   // through the end of the line where the match ends
    Block   // plus every following line up to the next declaration at the
            // header's indentation or shallower
};

// What the pattern of a rule covers.
enum class RuleHeader {
    Pattern,    // the regex matches the whole header
    Signature   // the regex matches through the declaration name; the
                // parameter list, return annotation and ':' after it are
                // scanned by hand and appended to the last capture group
};

// A pattern/replacement/explanation triple. `pattern` is an ECMAScript regex
// tried at the start of every line; `replacement` uses $N back-references.
// The explanation is appended to the replacement as an inline `#` annotation.
//
// Signature rules may carry a `body` regex that must match right after the
// header's ':' (within a short window); the matched text belongs to the match.
class SummaryRule {
public:
    SummaryRule(std::string pattern, std::string replacement, std::string explanation,
                RuleExtent extent = RuleExtent::Block,
                RuleHeader header = RuleHeader::Pattern,
                std::string body = "");

    std::string apply(const std::string& text) const;

    const std::string& pattern() const { return pattern_; }
    const std::string& replacement() const { return replacement_; }
    const std::string& explanation() const { return explanation_; }
    RuleExtent extent() const { return extent_; }
    RuleHeader header() const { return header_; }
    const std::string& body() const { return body_; }

    nlohmann::json to_json() const;
    static SummaryRule from_json(const nlohmann::json& j);

private:
    struct Match {
        size_t end;           // one past the consumed text
        std::string output;   // replacement, before the annotation
    };

    std::string pattern_;
    std::string replacement_;
    std::string explanation_;
    RuleExtent extent_;
    RuleHeader header_;
    std::string body_;
    std::shared_ptr<const std::regex> regex_;
    std::shared_ptr<const std::regex> body_regex_;

    std::optional<Match> match_at(const std::string& text, size_t pos) const;
    std::optional<Match> match_signature(const std::string& text, size_t pos, const std::smatch& head) const;
};

class SummaryRules {
public:
    std::vector<SummaryRule> interface;
    std::vector<SummaryRule> core;

    static SummaryRules default_rules();
    static SummaryRules from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Rules to run for `level`, in application order.
    std::vector<const SummaryRule*> for_level(SummaryLevel level) const;
};

} // namespace module_concat
