// procsup timing spans: nested named intervals with an exporter seam
#pragma once

#include "procsup/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace procsup::telemetry
{

constexpr const char* INSTRUMENTATION_NAME = "procsup";

using SpanId = std::uint64_t;
using Clock = std::chrono::steady_clock;

enum class StatusCode
{
    Unset,
    Ok,
    Error
};

struct Span
{
    std::string name;
    std::string instrumentation_name;
    SpanId id{0};
    std::optional<SpanId> parent;
    StatusCode status{StatusCode::Unset};
    Clock::time_point start{};
    Clock::time_point end{};
    std::unordered_map<std::string, Json> attributes;
    std::optional<std::string> exception_message;

    void set_attribute(const std::string& key, const Json& value)
    {
        attributes[key] = value;
    }

    void record_exception(const std::string& message)
    {
        exception_message = message;
        status = StatusCode::Error;
    }

    void set_status(StatusCode code)
    {
        status = code;
    }

    /// Seconds between start and end (or now, while the span is open)
    double elapsed_seconds() const;
};

class SpanExporter
{
  public:
    virtual ~SpanExporter() = default;
    virtual void export_span(const Span& span) = 0;
};

/// Keeps finished spans in memory. Safe to export from several threads.
class InMemorySpanExporter : public SpanExporter
{
  public:
    void export_span(const Span& span) override;
    std::vector<Span> finished_spans() const;
    void reset();

  private:
    mutable std::mutex mutex_;
    std::vector<Span> spans_;
};

class SpanScope
{
  public:
    SpanScope() = default;
    SpanScope(Span span, std::shared_ptr<SpanExporter> exporter);
    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;
    SpanScope(SpanScope&& other) noexcept;
    SpanScope& operator=(SpanScope&& other) noexcept;
    ~SpanScope();

    Span& span();
    bool active() const;

    /// Close the span and return its elapsed seconds. Later calls return
    /// the same value without exporting again.
    double end();

  private:
    void finalize(bool record_error);

    bool active_{false};
    bool ended_{false};
    int uncaught_on_enter_{0};
    Span span_;
    std::shared_ptr<SpanExporter> exporter_;
};

class Tracer
{
  public:
    /// Spans go to exporter, or to the process-wide exporter when null
    explicit Tracer(std::string instrumentation_name,
                    std::shared_ptr<SpanExporter> exporter = nullptr)
        : instrumentation_name_(std::move(instrumentation_name)), exporter_(std::move(exporter))
    {
    }

    /// Start a span. Without an explicit parent, the innermost open span
    /// on the calling thread becomes the parent.
    SpanScope start_span(const std::string& name,
                         const std::optional<SpanId>& parent = std::nullopt) const;

  private:
    std::string instrumentation_name_;
    std::shared_ptr<SpanExporter> exporter_;
};

Tracer get_tracer();
void set_span_exporter(std::shared_ptr<SpanExporter> exporter);
std::shared_ptr<SpanExporter> span_exporter();

/// Innermost open span on the calling thread
std::optional<SpanId> current_span_id();

/// Indented tree of finished spans with their elapsed times, one per line
std::string format_summary(const std::vector<Span>& spans);

} // namespace procsup::telemetry
