#include "procsup/telemetry.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <exception>
#include <functional>
#include <map>
#include <sstream>

namespace procsup::telemetry
{
namespace
{

std::shared_ptr<SpanExporter>& exporter_ref()
{
    static std::shared_ptr<SpanExporter> exporter;
    return exporter;
}

std::mutex& exporter_mutex()
{
    static std::mutex mutex;
    return mutex;
}

thread_local std::vector<SpanId> context_stack;

SpanId next_span_id()
{
    static std::atomic<SpanId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

void pop_context(SpanId id)
{
    auto it = std::find(context_stack.rbegin(), context_stack.rend(), id);
    if (it != context_stack.rend())
        context_stack.erase(std::next(it).base());
}

std::string format_seconds(double seconds)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%6.1fs", seconds);
    return buf;
}

} // namespace

double Span::elapsed_seconds() const
{
    auto stop = end == Clock::time_point{} ? Clock::now() : end;
    return std::chrono::duration<double>(stop - start).count();
}

void InMemorySpanExporter::export_span(const Span& span)
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.push_back(span);
}

std::vector<Span> InMemorySpanExporter::finished_spans() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

void InMemorySpanExporter::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.clear();
}

SpanScope::SpanScope(Span span, std::shared_ptr<SpanExporter> exporter)
    : active_(true), span_(std::move(span)), exporter_(std::move(exporter))
{
    uncaught_on_enter_ = std::uncaught_exceptions();
    span_.start = Clock::now();
    context_stack.push_back(span_.id);
}

SpanScope::SpanScope(SpanScope&& other) noexcept
    : active_(other.active_), ended_(other.ended_), uncaught_on_enter_(other.uncaught_on_enter_),
      span_(std::move(other.span_)), exporter_(std::move(other.exporter_))
{
    other.active_ = false;
    other.ended_ = true;
}

SpanScope& SpanScope::operator=(SpanScope&& other) noexcept
{
    if (this == &other)
        return *this;

    if (active_ && !ended_)
        finalize(false);

    active_ = other.active_;
    ended_ = other.ended_;
    uncaught_on_enter_ = other.uncaught_on_enter_;
    span_ = std::move(other.span_);
    exporter_ = std::move(other.exporter_);

    other.active_ = false;
    other.ended_ = true;
    return *this;
}

SpanScope::~SpanScope()
{
    if (ended_)
        return;
    bool record_error = std::uncaught_exceptions() > uncaught_on_enter_;
    finalize(record_error);
}

Span& SpanScope::span()
{
    return span_;
}

bool SpanScope::active() const
{
    return active_;
}

double SpanScope::end()
{
    if (!ended_)
        finalize(false);
    return active_ ? span_.elapsed_seconds() : 0.0;
}

void SpanScope::finalize(bool record_error)
{
    ended_ = true;
    if (!active_)
        return;

    span_.end = Clock::now();
    if (record_error)
        span_.status = StatusCode::Error;
    if (span_.status == StatusCode::Unset)
        span_.status = StatusCode::Ok;

    pop_context(span_.id);

    auto exporter = exporter_ ? exporter_ : span_exporter();
    if (!exporter)
        return;
    try
    {
        exporter->export_span(span_);
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "procsup: failed to export span '%s': %s\n", span_.name.c_str(),
                     e.what());
    }
}

SpanScope Tracer::start_span(const std::string& name, const std::optional<SpanId>& parent) const
{
    Span span;
    span.name = name;
    span.instrumentation_name = instrumentation_name_;
    span.id = next_span_id();
    if (parent)
        span.parent = parent;
    else
        span.parent = current_span_id();

    return SpanScope(std::move(span), exporter_);
}

Tracer get_tracer()
{
    return Tracer(INSTRUMENTATION_NAME);
}

void set_span_exporter(std::shared_ptr<SpanExporter> exporter)
{
    std::lock_guard<std::mutex> lock(exporter_mutex());
    exporter_ref() = std::move(exporter);
}

std::shared_ptr<SpanExporter> span_exporter()
{
    std::lock_guard<std::mutex> lock(exporter_mutex());
    return exporter_ref();
}

std::optional<SpanId> current_span_id()
{
    if (!context_stack.empty())
        return context_stack.back();
    return std::nullopt;
}

std::string format_summary(const std::vector<Span>& spans)
{
    std::map<SpanId, const Span*> by_id;
    for (const auto& span : spans)
        by_id[span.id] = &span;

    // Spans whose parent never finished are treated as roots
    std::map<SpanId, std::vector<const Span*>> children;
    std::vector<const Span*> roots;
    for (const auto& span : spans)
    {
        if (span.parent && by_id.count(*span.parent))
            children[*span.parent].push_back(&span);
        else
            roots.push_back(&span);
    }

    auto by_start = [](const Span* a, const Span* b) { return a->start < b->start; };
    std::sort(roots.begin(), roots.end(), by_start);
    for (auto& entry : children)
        std::sort(entry.second.begin(), entry.second.end(), by_start);

    std::ostringstream out;
    std::function<void(const Span*, int)> emit = [&](const Span* span, int depth)
    {
        out << format_seconds(span->elapsed_seconds()) << " " << std::string(depth * 2, ' ')
            << span->name;
        if (span->status == StatusCode::Error)
            out << " (error)";
        out << "\n";
        auto it = children.find(span->id);
        if (it == children.end())
            return;
        for (const auto* child : it->second)
            emit(child, depth + 1);
    };
    for (const auto* root : roots)
        emit(root, 0);

    auto text = out.str();
    if (!text.empty())
        text.pop_back();
    return text;
}

} // namespace procsup::telemetry
