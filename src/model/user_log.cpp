#include "model/user_log.h"

namespace tracescore::model {

std::string_view ToString(UserLogLevel level) {
    switch (level) {
        case UserLogLevel::kTrace:
            return "TRACE";
        case UserLogLevel::kDebug:
            return "DEBUG";
        case UserLogLevel::kInfo:
            return "INFO";
        case UserLogLevel::kWarn:
            return "WARN";
        case UserLogLevel::kError:
            return "ERROR";
    }
    return "INFO";
}

std::optional<UserLogLevel> ParseUserLogLevel(std::string_view text) {
    if (text == "TRACE") return UserLogLevel::kTrace;
    if (text == "DEBUG") return UserLogLevel::kDebug;
    if (text == "INFO") return UserLogLevel::kInfo;
    if (text == "WARN") return UserLogLevel::kWarn;
    if (text == "ERROR") return UserLogLevel::kError;
    return std::nullopt;
}

}  // namespace tracescore::model
