#include "toolroute/router/heuristic_parser.hpp"
#include "toolroute/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <unordered_set>

namespace toolroute::router {

namespace {

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "and", "or", "of", "to", "in", "on", "at", "for",
        "with", "from", "by", "is", "are", "be", "it", "this", "that", "my",
        "me", "i", "you", "your", "please", "can", "could", "would", "should",
        "will", "do", "does", "some", "any", "all", "up", "about", "into", "out",
        "what", "us", "our", "just", "now"
    };
    return words;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            current += static_cast<char>(std::tolower(uc));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::vector<std::string> split_name(const std::string& name) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= name.size()) {
        size_t end = name.find('_', start);
        if (end == std::string::npos) end = name.size();
        if (end > start) segments.push_back(name.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Raw text after the whitespace-delimited word holding the first token that
// is not a stop word ("please remember: buy milk" -> "buy milk")
std::string remainder_after_verb(const std::string& input) {
    const auto& stops = stop_words();
    size_t i = 0;
    while (i < input.size()) {
        if (!is_word_char(input[i])) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < input.size() && is_word_char(input[i])) {
            ++i;
        }
        if (stops.count(to_lower(input.substr(start, i - start)))) {
            continue;
        }
        size_t end = input.find_first_of(" \t\r\n", i);
        return end == std::string::npos ? "" : trim(input.substr(end));
    }
    return "";
}

std::optional<Json> convert_argument(const tools::ParamSpec& param, const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }

    switch (param.type) {
        case tools::ParamType::String:
            return Json(raw);
        case tools::ParamType::Integer: {
            try {
                size_t used = 0;
                long long v = std::stoll(raw, &used);
                if (used != raw.size()) return std::nullopt;
                return Json(static_cast<int64_t>(v));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        case tools::ParamType::Number: {
            try {
                size_t used = 0;
                double v = std::stod(raw, &used);
                if (used != raw.size() || !std::isfinite(v)) return std::nullopt;
                return Json(v);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        case tools::ParamType::Boolean: {
            std::string lowered = to_lower(raw);
            if (lowered == "true" || lowered == "yes") return Json(true);
            if (lowered == "false" || lowered == "no") return Json(false);
            return std::nullopt;
        }
    }
    return std::nullopt;
}

}  // namespace

std::vector<std::string> HeuristicParser::tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    const auto& stops = stop_words();
    for (auto& word : split_words(input)) {
        if (!stops.count(word)) {
            tokens.push_back(std::move(word));
        }
    }
    return tokens;
}

int HeuristicParser::score_tool(const ToolSpec& spec, const std::vector<std::string>& tokens) {
    auto segments = split_name(spec.name);
    std::set<std::string> keywords;
    for (const auto& kw : spec.keywords) {
        keywords.insert(to_lower(kw));
    }
    std::set<std::string> weak;
    for (auto& word : split_words(spec.description)) {
        weak.insert(std::move(word));
    }
    for (const auto& name : spec.required_names()) {
        weak.insert(to_lower(name));
    }

    std::set<std::string> distinct(tokens.begin(), tokens.end());
    int score = 0;
    for (const auto& token : distinct) {
        if (std::find(segments.begin(), segments.end(), token) != segments.end()) {
            score += 10;
        }
        if (keywords.count(token)) {
            score += 5;
        }
        if (weak.count(token)) {
            score += 2;
        }
    }
    return score;
}

std::vector<HeuristicCandidate> HeuristicParser::score(const std::string& input,
                                                       const ToolRegistry& registry) const {
    auto tokens = tokenize(input);
    std::vector<HeuristicCandidate> candidates;
    if (tokens.empty()) {
        return candidates;
    }

    for (const auto& spec : registry.list()) {
        if (!spec.dispatchable()) {
            continue;
        }
        int s = score_tool(spec, tokens);
        if (s > 0) {
            candidates.push_back({spec.name, s});
        }
    }

    std::sort(candidates.begin(), candidates.end(),
        [](const HeuristicCandidate& a, const HeuristicCandidate& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.tool < b.tool;
        });
    return candidates;
}

std::optional<ToolCall> HeuristicParser::parse(const std::string& input,
                                               const ToolRegistry& registry) const {
    auto candidates = score(input, registry);
    if (candidates.empty()) {
        return std::nullopt;
    }

    const auto& top = candidates.front();
    int runner_up = candidates.size() > 1 ? candidates[1].score : 0;

    if (top.score < options_.threshold || top.score - runner_up <= options_.margin) {
        spdlog::debug("Heuristic: no decisive winner ({}={}, runner-up={})",
                      top.tool, top.score, runner_up);
        return std::nullopt;
    }

    const auto* entry = registry.find(top.tool);
    if (!entry) {
        return std::nullopt;
    }

    std::vector<const tools::ParamSpec*> required;
    for (const auto& param : entry->spec.parameters) {
        if (param.required) required.push_back(&param);
    }

    Json args = Json::object();
    if (required.size() == 1) {
        auto value = convert_argument(*required.front(), remainder_after_verb(input));
        if (!value) {
            spdlog::debug("Heuristic: could not extract '{}' for {}", required.front()->name, top.tool);
            return std::nullopt;
        }
        args[required.front()->name] = std::move(*value);
    } else if (required.size() > 1) {
        spdlog::debug("Heuristic: {} needs {} arguments, deferring", top.tool, required.size());
        return std::nullopt;
    }

    double confidence = static_cast<double>(top.score - runner_up) / static_cast<double>(top.score);
    return ToolCall{
        .tool_name = top.tool,
        .args = std::move(args),
        .stage = ResolutionStage::Heuristic,
        .confidence = confidence
    };
}

}  // namespace toolroute::router
