#include "admin/logging.h"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace admin {
namespace {

void appendEscaped(std::ostringstream &out, const std::string &value) {
    for (char ch : value) {
        const auto byte = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (byte < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(byte) << std::dec << std::setfill(' ');
                } else {
                    out << ch;
                }
                break;
        }
    }
}

std::string isoTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) %
                        1000;
    std::tm utc_tm{};
#if defined(_WIN32)
    gmtime_s(&utc_tm, &time);
#else
    gmtime_r(&time, &utc_tm);
#endif
    std::ostringstream stamp;
    stamp << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << '.'
          << std::setw(3) << std::setfill('0') << millis.count() << 'Z';
    return stamp.str();
}

class JsonLine {
public:
    JsonLine() { out_ << '{'; }

    void text(const char *key, const std::optional<std::string> &value) {
        if (!value.has_value() || value->empty()) {
            return;
        }
        separator();
        out_ << '"' << key << "\":\"";
        appendEscaped(out_, *value);
        out_ << '"';
    }

    template <typename T>
    void number(const char *key, const std::optional<T> &value) {
        if (!value.has_value()) {
            return;
        }
        separator();
        out_ << '"' << key << "\":" << *value;
    }

    std::string finish() {
        out_ << '}';
        return out_.str();
    }

private:
    void separator() {
        if (!first_) {
            out_ << ',';
        }
        first_ = false;
    }

    std::ostringstream out_;
    bool first_{true};
};

}  // namespace

StructuredLogger::StructuredLogger() : out_(&std::cout) {}

StructuredLogger::StructuredLogger(std::ostream &out) : out_(&out) {}

void StructuredLogger::log(const std::string &level,
                           const std::string &event,
                           const std::string &message,
                           const LogFields &fields) {
    JsonLine line;
    line.text("timestamp", isoTimestamp());
    line.text("level", level);
    line.text("event", event);
    line.text("message", message);
    line.text("trace_id", fields.trace_id);
    line.text("request_trace_id", fields.request_trace_id);
    line.number("user_id", fields.user_id);
    line.number("partner_id", fields.partner_id);
    line.number("item_id", fields.item_id);
    line.number("slot", fields.slot);
    line.number("quantity", fields.quantity);
    line.number("gold", fields.gold);
    line.text("error", fields.error);
    line.text("reason", fields.reason);
    const auto entry = line.finish();

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << entry << std::endl;
}

std::string StructuredLogger::generateTraceId() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::array<std::uint64_t, 2> words{generator(), generator()};
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (auto word : words) {
        out << std::setw(16) << word;
    }
    return out.str();
}

}  // namespace admin
