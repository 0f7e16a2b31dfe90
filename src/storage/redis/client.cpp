/// @file client.cpp
/// @brief hiredis-backed Redis client

#include "storage/redis/client.h"

#include <mutex>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <hiredis/hiredis.h>

#include "common/logging.h"

namespace tracescore::storage {

namespace {

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply != nullptr) {
            freeReplyObject(reply);
        }
    }
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

std::string ReplyString(const redisReply* reply) {
    if (reply == nullptr || reply->str == nullptr) {
        return "";
    }
    return std::string(reply->str, reply->len);
}

// [id, [field, value, ...]]; a nil field list means the entry was deleted
std::optional<model::StreamEntry> ParseEntry(const redisReply* reply) {
    if (reply == nullptr || reply->type != REDIS_REPLY_ARRAY || reply->elements < 2) {
        return std::nullopt;
    }
    const redisReply* fields = reply->element[1];
    if (fields == nullptr || fields->type != REDIS_REPLY_ARRAY) {
        return std::nullopt;
    }

    model::StreamEntry entry;
    entry.id = ReplyString(reply->element[0]);
    for (size_t i = 0; i + 1 < fields->elements; i += 2) {
        entry.fields[ReplyString(fields->element[i])] = ReplyString(fields->element[i + 1]);
    }
    return entry;
}

std::vector<model::StreamEntry> ParseEntries(const redisReply* list) {
    std::vector<model::StreamEntry> entries;
    if (list == nullptr || list->type != REDIS_REPLY_ARRAY) {
        return entries;
    }
    entries.reserve(list->elements);
    for (size_t i = 0; i < list->elements; ++i) {
        if (auto entry = ParseEntry(list->element[i])) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

}  // namespace

// =============================================================================
// RedisClient Implementation
// =============================================================================

class RedisClient::Impl {
public:
    explicit Impl(RedisConfig config) : config_(std::move(config)) {}

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        Close();
    }

    absl::Status Connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        return ConnectLocked();
    }

    absl::Status Disconnect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (context_ != nullptr) {
            Close();
            TRACESCORE_LOG_INFO("Disconnected from Redis");
        }
        return absl::OkStatus();
    }

    bool IsConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return context_ != nullptr;
    }

    /// @brief Run one command; connection failures come back as kUnavailable
    absl::StatusOr<ReplyPtr> Command(const std::vector<std::string>& args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (context_ == nullptr) {
            auto status = ConnectLocked();
            if (!status.ok()) {
                return status;
            }
        }

        std::vector<const char*> argv;
        std::vector<size_t> argvlen;
        argv.reserve(args.size());
        argvlen.reserve(args.size());
        for (const auto& arg : args) {
            argv.push_back(arg.data());
            argvlen.push_back(arg.size());
        }

        ReplyPtr reply(static_cast<redisReply*>(
            redisCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));

        if (reply == nullptr) {
            std::string error_msg = context_->errstr;
            TRACESCORE_LOG_WARN("Redis connection lost during {}: {}", args.front(), error_msg);
            Close();
            return absl::UnavailableError(absl::StrCat(args.front(), " failed: ", error_msg));
        }
        if (reply->type == REDIS_REPLY_ERROR) {
            return absl::InternalError(absl::StrCat(args.front(), " failed: ", ReplyString(reply.get())));
        }
        return reply;
    }

private:
    absl::Status ConnectLocked() {
        if (context_ != nullptr) {
            return absl::OkStatus();
        }

        struct timeval timeout;
        timeout.tv_sec = config_.connection_timeout.count();
        timeout.tv_usec = 0;

        context_ = redisConnectWithTimeout(config_.host.c_str(), config_.port, timeout);

        if (context_ == nullptr || context_->err) {
            std::string error_msg = context_ ? context_->errstr : "Unknown error";
            Close();
            return absl::UnavailableError("Failed to connect to Redis: " + error_msg);
        }

        struct timeval socket_timeout;
        socket_timeout.tv_sec = config_.socket_timeout.count();
        socket_timeout.tv_usec = 0;
        redisSetTimeout(context_, socket_timeout);

        if (!config_.password.empty()) {
            ReplyPtr reply(static_cast<redisReply*>(
                redisCommand(context_, "AUTH %s", config_.password.c_str())));
            if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
                std::string error_msg = reply ? ReplyString(reply.get()) : "Unknown error";
                Close();
                return absl::PermissionDeniedError("Redis authentication failed: " + error_msg);
            }
        }

        if (config_.database != 0) {
            ReplyPtr reply(static_cast<redisReply*>(
                redisCommand(context_, "SELECT %d", config_.database)));
            if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
                std::string error_msg = reply ? ReplyString(reply.get()) : "Unknown error";
                Close();
                return absl::InternalError("Failed to select database: " + error_msg);
            }
        }

        TRACESCORE_LOG_INFO("Connected to Redis at {}:{}/{}", config_.host, config_.port,
                            config_.database);
        return absl::OkStatus();
    }

    void Close() {
        if (context_ != nullptr) {
            redisFree(context_);
            context_ = nullptr;
        }
    }

    RedisConfig config_;
    mutable std::mutex mutex_;
    redisContext* context_ = nullptr;
};

// =============================================================================
// RedisClient Public Interface
// =============================================================================

RedisClient::RedisClient(RedisConfig config)
    : config_(std::move(config)), impl_(std::make_unique<Impl>(config_)) {}

RedisClient::~RedisClient() = default;

RedisClient::RedisClient(RedisClient&&) noexcept = default;
RedisClient& RedisClient::operator=(RedisClient&&) noexcept = default;

absl::Status RedisClient::Connect() {
    return impl_->Connect();
}

absl::Status RedisClient::Disconnect() {
    return impl_->Disconnect();
}

bool RedisClient::IsConnected() const {
    return impl_->IsConnected();
}

absl::Status RedisClient::Ping() {
    auto reply = impl_->Command({"PING"});
    return reply.ok() ? absl::OkStatus() : reply.status();
}

absl::Status RedisClient::Set(const std::string& key, const std::string& value,
                              std::optional<std::chrono::seconds> ttl) {
    std::vector<std::string> args = {"SET", key, value};
    if (ttl.has_value() && ttl->count() > 0) {
        args.push_back("EX");
        args.push_back(std::to_string(ttl->count()));
    }
    auto reply = impl_->Command(args);
    return reply.ok() ? absl::OkStatus() : reply.status();
}

absl::StatusOr<std::optional<std::string>> RedisClient::Get(const std::string& key) {
    auto reply = impl_->Command({"GET", key});
    if (!reply.ok()) {
        return reply.status();
    }
    if ((*reply)->type == REDIS_REPLY_NIL) {
        return std::optional<std::string>();
    }
    return std::optional<std::string>(ReplyString(reply->get()));
}

absl::StatusOr<bool> RedisClient::Delete(const std::string& key) {
    auto reply = impl_->Command({"DEL", key});
    if (!reply.ok()) {
        return reply.status();
    }
    return (*reply)->integer > 0;
}

absl::StatusOr<std::vector<std::string>> RedisClient::Scan(const std::string& pattern,
                                                           size_t batch) {
    std::vector<std::string> keys;
    std::string cursor = "0";
    do {
        auto reply = impl_->Command({"SCAN", cursor, "MATCH", pattern, "COUNT", std::to_string(batch)});
        if (!reply.ok()) {
            return reply.status();
        }
        const redisReply* r = reply->get();
        if (r->type != REDIS_REPLY_ARRAY || r->elements != 2) {
            return absl::InternalError("SCAN returned an unexpected reply");
        }
        cursor = ReplyString(r->element[0]);
        const redisReply* page = r->element[1];
        for (size_t i = 0; i < page->elements; ++i) {
            keys.push_back(ReplyString(page->element[i]));
        }
    } while (cursor != "0");
    return keys;
}

absl::Status RedisClient::CreateGroup(const std::string& stream, const std::string& group) {
    auto reply = impl_->Command({"XGROUP", "CREATE", stream, group, "$", "MKSTREAM"});
    if (!reply.ok() && absl::StrContains(reply.status().message(), "BUSYGROUP")) {
        return absl::OkStatus();
    }
    return reply.ok() ? absl::OkStatus() : reply.status();
}

absl::StatusOr<std::vector<model::StreamEntry>> RedisClient::ReadGroup(
    const std::string& stream, const std::string& group, const std::string& consumer,
    size_t count, std::chrono::milliseconds block) {
    std::vector<std::string> args = {"XREADGROUP", "GROUP", group, consumer,
                                     "COUNT", std::to_string(count)};
    if (block.count() > 0) {
        args.push_back("BLOCK");
        args.push_back(std::to_string(block.count()));
    }
    args.push_back("STREAMS");
    args.push_back(stream);
    args.push_back(">");

    auto reply = impl_->Command(args);
    if (!reply.ok()) {
        return reply.status();
    }
    // [[stream, [entries...]]], or nil when the block timed out
    const redisReply* r = reply->get();
    if (r->type != REDIS_REPLY_ARRAY || r->elements == 0) {
        return std::vector<model::StreamEntry>{};
    }
    const redisReply* stream_reply = r->element[0];
    if (stream_reply->type != REDIS_REPLY_ARRAY || stream_reply->elements < 2) {
        return std::vector<model::StreamEntry>{};
    }
    return ParseEntries(stream_reply->element[1]);
}

absl::StatusOr<std::vector<model::StreamEntry>> RedisClient::AutoClaim(
    const std::string& stream, const std::string& group, const std::string& consumer,
    std::chrono::milliseconds min_idle, size_t count) {
    auto reply = impl_->Command({"XAUTOCLAIM", stream, group, consumer,
                                 std::to_string(min_idle.count()), "0-0",
                                 "COUNT", std::to_string(count)});
    if (!reply.ok()) {
        return reply.status();
    }
    // [next-cursor, [entries...], [deleted ids...]]
    const redisReply* r = reply->get();
    if (r->type != REDIS_REPLY_ARRAY || r->elements < 2) {
        return std::vector<model::StreamEntry>{};
    }
    return ParseEntries(r->element[1]);
}

absl::StatusOr<int64_t> RedisClient::Ack(const std::string& stream, const std::string& group,
                                         const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return 0;
    }
    std::vector<std::string> args = {"XACK", stream, group};
    args.insert(args.end(), ids.begin(), ids.end());
    auto reply = impl_->Command(args);
    if (!reply.ok()) {
        return reply.status();
    }
    return static_cast<int64_t>((*reply)->integer);
}

absl::StatusOr<int64_t> RedisClient::DeleteEntries(const std::string& stream,
                                                   const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return 0;
    }
    std::vector<std::string> args = {"XDEL", stream};
    args.insert(args.end(), ids.begin(), ids.end());
    auto reply = impl_->Command(args);
    if (!reply.ok()) {
        return reply.status();
    }
    return static_cast<int64_t>((*reply)->integer);
}

absl::StatusOr<int64_t> RedisClient::DeliveryCount(const std::string& stream,
                                                   const std::string& group,
                                                   const std::string& id) {
    auto reply = impl_->Command({"XPENDING", stream, group, id, id, "1"});
    if (!reply.ok()) {
        return reply.status();
    }
    // [[id, consumer, idle-ms, delivery-count]]
    const redisReply* r = reply->get();
    if (r->type != REDIS_REPLY_ARRAY || r->elements == 0) {
        return 0;
    }
    const redisReply* item = r->element[0];
    if (item->type != REDIS_REPLY_ARRAY || item->elements < 4) {
        return 0;
    }
    return static_cast<int64_t>(item->element[3]->integer);
}

absl::StatusOr<std::string> RedisClient::PendingOwner(const std::string& stream,
                                                     const std::string& group,
                                                     const std::string& id) {
    auto reply = impl_->Command({"XPENDING", stream, group, id, id, "1"});
    if (!reply.ok()) {
        return reply.status();
    }
    const redisReply* r = reply->get();
    if (r->type != REDIS_REPLY_ARRAY || r->elements == 0) {
        return std::string();
    }
    const redisReply* item = r->element[0];
    if (item->type != REDIS_REPLY_ARRAY || item->elements < 2) {
        return std::string();
    }
    return ReplyString(item->element[1]);
}

absl::Status RedisClient::RemoveConsumer(const std::string& stream, const std::string& group,
                                         const std::string& consumer) {
    auto reply = impl_->Command({"XGROUP", "DELCONSUMER", stream, group, consumer});
    return reply.ok() ? absl::OkStatus() : reply.status();
}

absl::StatusOr<std::string> RedisClient::Append(
    const std::string& stream, const std::vector<std::pair<std::string, std::string>>& fields) {
    std::vector<std::string> args = {"XADD", stream, "*"};
    for (const auto& [field, value] : fields) {
        args.push_back(field);
        args.push_back(value);
    }
    auto reply = impl_->Command(args);
    if (!reply.ok()) {
        return reply.status();
    }
    return ReplyString(reply->get());
}

}  // namespace tracescore::storage
