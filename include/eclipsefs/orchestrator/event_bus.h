#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eclipsefs::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kStorage, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  // SHA-256 hex of |input| for fields marked FieldPrivacy::kHash.
  std::string HashForTelemetry(std::string_view input);

  // Renders one event as a single JSON object without a trailing newline.
  std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point tp);

  class JsonLineLogger {
  public:
    // Reads ECLIPSEFS_LOG_PATH and ECLIPSEFS_LOG_LEVEL.
    JsonLineLogger();
    void Log(const Event& event);
    void SetMinimumSeverity(EventSeverity severity);
    [[nodiscard]] EventSeverity MinimumSeverity() const;

  private:
    void EnsureOpen();

    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::string log_path_;
    bool open_attempted_{false};
    EventSeverity min_severity_{EventSeverity::kWarning};
  };

  JsonLineLogger& DefaultJsonLogger();

  void ResetEventBusForTesting(); // test-only: drop extra subscribers

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    EventBus();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

  private:
    friend void ResetEventBusForTesting();

    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Convenience wrapper around EventBus::Instance().Publish().
  void PublishEvent(EventCategory category, EventSeverity severity, std::string event_id,
                    std::string message, std::vector<EventField> fields = {});

} // namespace eclipsefs::orchestrator
