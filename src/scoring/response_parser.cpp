#include "scoring/response_parser.h"

#include <optional>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "common/error.h"

namespace tracescore::scoring {

using json = nlohmann::json;

namespace {

std::optional<double> ScoreValue(const json& node) {
    if (node.is_boolean()) {
        return node.get<bool>() ? 1.0 : 0.0;
    }
    if (node.is_number()) {
        return node.get<double>();
    }
    return std::nullopt;
}

}  // namespace

std::string_view ResponseParser::StripCodeFence(std::string_view content) {
    auto strip = [](std::string_view text) {
        while (!text.empty() && absl::ascii_isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && absl::ascii_isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    };

    content = strip(content);
    if (content.substr(0, 3) != "```") {
        return content;
    }
    size_t newline = content.find('\n');
    if (newline == std::string_view::npos) {
        return content;
    }
    std::string_view body = content.substr(newline + 1);
    size_t close = body.rfind("```");
    if (close != std::string_view::npos) {
        body = body.substr(0, close);
    }
    return strip(body);
}

absl::StatusOr<std::vector<ParsedScore>> ResponseParser::Parse(std::string_view content) {
    std::string_view body = StripCodeFence(content);

    json parsed = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("judge response is not a JSON object: ", std::string(content)));
    }

    std::vector<ParsedScore> scores;
    for (const auto& [name, entry] : parsed.items()) {
        if (entry.is_object()) {
            auto score = entry.find("score");
            if (score == entry.end()) {
                continue;
            }
            auto value = ScoreValue(*score);
            if (!value) {
                continue;
            }
            std::string reason;
            auto reason_it = entry.find("reason");
            if (reason_it != entry.end() && reason_it->is_string()) {
                reason = reason_it->get<std::string>();
            }
            scores.push_back(ParsedScore{name, *value, std::move(reason)});
        } else if (auto value = ScoreValue(entry)) {
            scores.push_back(ParsedScore{name, *value, ""});
        }
    }

    if (scores.empty()) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("judge response holds no scores: ", std::string(content)));
    }
    return scores;
}

}  // namespace tracescore::scoring
