#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace admin {

struct LogFields {
    std::optional<std::string> trace_id;
    std::optional<std::string> request_trace_id;
    std::optional<std::uint64_t> user_id;
    std::optional<std::uint64_t> partner_id;
    std::optional<std::uint32_t> item_id;
    std::optional<std::uint32_t> slot;
    std::optional<std::uint64_t> quantity;
    std::optional<std::uint64_t> gold;
    std::optional<std::string> error;
    std::optional<std::string> reason;
};

// One JSON object per line.
class StructuredLogger {
public:
    StructuredLogger();
    explicit StructuredLogger(std::ostream &out);

    void log(const std::string &level,
             const std::string &event,
             const std::string &message,
             const LogFields &fields = {});

    static std::string generateTraceId();

private:
    std::ostream *out_;
    std::mutex mutex_;
};

}  // namespace admin
