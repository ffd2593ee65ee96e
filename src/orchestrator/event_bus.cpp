#include "eclipsefs/orchestrator/event_bus.h"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <span>
#include <sstream>

#include "eclipsefs/crypto/sha256.h"

namespace eclipsefs::orchestrator {

namespace {

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

struct EventBusStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;
};

EventBusStorage& EventBusSingleton() {
  static EventBusStorage storage;
  return storage;
}

class PublishReentrancyGuard {
public:
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }

  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

private:
  bool& flag_;
};

} // namespace

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kStorage:
    return "storage";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  std::string lowered;
  lowered.reserve(text.size());
  for (char c : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lowered == "debug") {
    return EventSeverity::kDebug;
  }
  if (lowered == "info") {
    return EventSeverity::kInfo;
  }
  if (lowered == "warning" || lowered == "warn") {
    return EventSeverity::kWarning;
  }
  if (lowered == "error") {
    return EventSeverity::kError;
  }
  if (lowered == "critical") {
    return EventSeverity::kCritical;
  }
  return std::nullopt;
}

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  const auto* data = reinterpret_cast<const uint8_t*>(input.data());
  auto digest = crypto::SHA256_Hash(std::span<const uint8_t>(data, input.size()));
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : digest) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point tp) {
  std::string line;
  line.reserve(128 + event.message.size());
  line.append("{\"ts\":\"").append(FormatTimestamp(tp));
  line.append("\",\"severity\":\"").append(SeverityToString(event.severity));
  line.append("\",\"category\":\"").append(CategoryToString(event.category));
  line.append("\",\"event\":\"").append(EscapeJson(event.event_id));
  line.append("\",\"message\":\"").append(EscapeJson(event.message)).append("\"");
  if (!event.fields.empty()) {
    line.append(",\"fields\":{");
    bool first = true;
    for (const auto& field : event.fields) {
      if (!first) {
        line.push_back(',');
      }
      first = false;
      line.append("\"").append(EscapeJson(field.key)).append("\":");
      switch (field.privacy) {
      case FieldPrivacy::kRedact:
        line.append("\"<redacted>\"");
        break;
      case FieldPrivacy::kHash:
        line.append("\"").append(HashForTelemetry(field.value)).append("\"");
        break;
      case FieldPrivacy::kPublic:
        if (field.numeric) {
          line.append(field.value.empty() ? "0" : field.value);
        } else {
          line.append("\"").append(EscapeJson(field.value)).append("\"");
        }
        break;
      }
    }
    line.push_back('}');
  }
  line.push_back('}');
  return line;
}

JsonLineLogger::JsonLineLogger() {
  if (const char* path = std::getenv("ECLIPSEFS_LOG_PATH"); path && *path != '\0') {
    log_path_ = path;
  }
  if (const char* level = std::getenv("ECLIPSEFS_LOG_LEVEL"); level && *level != '\0') {
    if (auto parsed = ParseSeverity(level)) {
      min_severity_ = *parsed;
    } else {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"unknown ECLIPSEFS_LOG_LEVEL\"}"
                << std::endl;
    }
  }
}

void JsonLineLogger::SetMinimumSeverity(EventSeverity severity) {
  std::lock_guard<std::mutex> guard(mutex_);
  min_severity_ = severity;
}

EventSeverity JsonLineLogger::MinimumSeverity() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return min_severity_;
}

void JsonLineLogger::EnsureOpen() {
  if (open_attempted_ || log_path_.empty()) {
    return;
  }
  open_attempted_ = true;
  stream_.open(log_path_, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}"
              << std::endl;
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (static_cast<int>(event.severity) < static_cast<int>(min_severity_)) {
    return;
  }
  const auto line = FormatEventJson(event, std::chrono::system_clock::now());
  EnsureOpen();
  if (stream_.is_open()) {
    stream_ << line << '\n';
    stream_.flush();
    return;
  }
  std::clog << line << std::endl;
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  std::call_once(storage.once, [&storage]() { storage.instance = std::make_unique<EventBus>(); });
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                  std::string message, std::vector<EventField> fields) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

void ResetEventBusForTesting() {
  auto& bus = EventBus::Instance();
  auto initial = std::make_shared<EventBus::SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(bus.subscribers_mutex_);
  std::atomic_store_explicit(&bus.subscribers_snapshot_,
                             std::const_pointer_cast<const EventBus::SubscriberList>(initial),
                             std::memory_order_release);
}

} // namespace eclipsefs::orchestrator
