#pragma once

/// @file response_parser.h
/// @brief Turns a judge answer into named scores

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

namespace tracescore::scoring {

struct ParsedScore {
    std::string name;
    double value = 0.0;
    std::string reason;
};

class ResponseParser {
public:
    /// @brief Parse {"<name>": {"score": ..., "reason": "..."}, ...}
    ///
    /// A ```json fenced block is unwrapped first. Numeric scores pass through
    /// and booleans become 1 or 0; entries of any other shape are skipped.
    /// @return kInternal when the text is not a JSON object or yields no score
    static absl::StatusOr<std::vector<ParsedScore>> Parse(std::string_view content);

    /// @brief Strip a markdown code fence and surrounding whitespace
    static std::string_view StripCodeFence(std::string_view content);
};

}  // namespace tracescore::scoring
