#include "procsup/runner.hpp"

#include "procsup/util/command.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace procsup
{

namespace
{

constexpr const char* VERBOSE_SPAN_ATTRIBUTE = "procsup.span.verbose";
constexpr size_t MAX_COMMAND_SPAN_NAME = 80;
// The child's streams close before it can be reaped
constexpr std::chrono::milliseconds EXIT_GRACE{200};

std::string format_secs(double seconds)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0.2f", seconds);
    return buf;
}

std::string trim(const std::string& text)
{
    const char* ws = " \t\r\n\f\v";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

/// Keeps the session's finished spans and logs the end of verbose ones
class SessionSpanExporter : public telemetry::InMemorySpanExporter
{
  public:
    explicit SessionSpanExporter(std::shared_ptr<Output> output) : output_(std::move(output)) {}

    void export_span(const telemetry::Span& span) override
    {
        telemetry::InMemorySpanExporter::export_span(span);
        auto it = span.attributes.find(VERBOSE_SPAN_ATTRIBUTE);
        if (it != span.attributes.end() && it->second.is_boolean() && it->second.get<bool>())
            output_->write("END SPAN " + span.name + " " + format_secs(span.elapsed_seconds()) +
                           " secs.");
    }

  private:
    std::shared_ptr<Output> output_;
};

} // namespace

// =============================================================================
// TrackLogger / CaptureBuffer
// =============================================================================

TrackLogger::TrackLogger(std::shared_ptr<Output> output_sink, Track track)
    : output(std::move(output_sink))
{
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%03llu", static_cast<unsigned long long>(track));
    prefix = buf;
}

CaptureBuffer::CaptureBuffer() : closed_future_(closed_promise_.get_future().share()) {}

void CaptureBuffer::append(const LineEvent& line)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        throw Error("Capture buffer received data after end of stream");
    if (line)
    {
        lines_.push_back(*line);
        return;
    }
    closed_ = true;
    closed_promise_.set_value();
}

std::vector<std::string> CaptureBuffer::wait() const
{
    closed_future_.wait();
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

// =============================================================================
// Runner
// =============================================================================

Runner::Runner(std::shared_ptr<Output> output, Settings settings)
    : output_(std::move(output)), settings_(std::move(settings)),
      spans_(std::make_shared<SessionSpanExporter>(output_)),
      tracer_(telemetry::INSTRUMENTATION_NAME, spans_),
      cache_(std::filesystem::path(settings_.cache_dir.empty() ? Settings::default_cache_dir()
                                                               : settings_.cache_dir) /
             "cache.json")
{
    if (!output_)
        throw ValidationError("Runner requires an output sink");
    cache_ = Cache::load(cache_.path());
    cache_.invalidate(std::chrono::seconds(settings_.cache_ttl_seconds));
}

Runner::~Runner()
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        std::cerr << "procsup: failed to close runner: " << e.what() << std::endl;
    }
}

std::unique_ptr<Runner> Runner::open(const std::filesystem::path& logfile_path,
                                     const std::string& kubectl_cmd, bool verbose)
{
    auto settings = Settings::from_env();
    settings.log_file = logfile_path.string();
    settings.kubectl_cmd = kubectl_cmd;
    settings.verbose = verbose;

    auto runner = std::make_unique<Runner>(std::make_shared<Output>(logfile_path), settings);
    runner->log_environment();
    return runner;
}

void Runner::log_environment()
{
    const std::vector<Args> report = {
        {"kubectl", "version", "--short"},
        {"oc", "version"},
        {"uname", "-a"},
    };
    for (const auto& command : report)
    {
        try
        {
            popen(command);
        }
        catch (const SpawnFailed&)
        {
            // Missing tools are already logged with their track
        }
    }
    output_->write(std::string("procsup ") + VERSION);
}

// =============================================================================
// Internals
// =============================================================================

telemetry::SpanScope Runner::command_span(Track track, const Args& args)
{
    std::string name = std::to_string(track) + " " + util::str_command(args);
    if (name.size() > MAX_COMMAND_SPAN_NAME)
        name.resize(MAX_COMMAND_SPAN_NAME);
    auto scope = tracer_.start_span(name);
    scope.span().set_attribute("procsup.track", track);
    scope.span().set_attribute(VERBOSE_SPAN_ATTRIBUTE, false);
    return scope;
}

void Runner::write_track(Track track, const std::string& message)
{
    output_->write("[" + std::to_string(track) + "] " + message);
}

ProcessHandle Runner::launch_command(Track track, LineCallback out_cb, LineCallback err_cb,
                                     const Args& args, const LaunchOptions& options,
                                     CompletionCallback done)
{
    try
    {
        return launch(LaunchSpec{args, options}, std::move(out_cb), std::move(err_cb),
                      std::move(done));
    }
    catch (const SpawnFailed& e)
    {
        write_track(track, e.what());
        throw;
    }
}

void Runner::run_command(Track track, const std::string& running, const std::string& ran,
                         LineCallback out_cb, LineCallback err_cb, const Args& args,
                         const LaunchOptions& options)
{
    write_track(track, running + ": " + util::str_command(args));
    auto span = command_span(track, args);
    auto proc = launch_command(track, std::move(out_cb), std::move(err_cb), args, options);
    int retcode = proc->wait();
    if (retcode != 0)
        span.span().set_status(telemetry::StatusCode::Error);
    double spent = span.end();
    if (retcode != 0)
    {
        write_track(track, "exit " + std::to_string(retcode) + " in " + format_secs(spent) +
                               " secs.");
        throw CommandFailed(args, retcode);
    }
    if (spent > settings_.slow_command_seconds)
        write_track(track, ran + " in " + format_secs(spent) + " secs.");
}

// =============================================================================
// Execution modes
// =============================================================================

void Runner::check_call(const Args& args, const LaunchOptions& options)
{
    Track track = tracks_.next();
    TrackLogger logger(output_, track);
    run_command(track, "Running", "ran", logger, logger, args, options);
}

std::string Runner::get_output(const Args& args, bool reveal, const LaunchOptions& options)
{
    if (options.stdout_mode && *options.stdout_mode != StreamMode::Pipe)
        throw ValidationError("get_output() needs stdout piped");

    Track track = tracks_.next();
    auto capture = std::make_shared<CaptureBuffer>();

    LineCallback out_cb;
    if (reveal || settings_.verbose)
    {
        TrackLogger logger(output_, track);
        out_cb = [capture, logger](const LineEvent& line)
        {
            capture->append(line);
            logger(line);
        };
    }
    else
    {
        out_cb = [capture](const LineEvent& line) { capture->append(line); };
    }
    TrackLogger err_logger(output_, track);

    std::optional<CommandFailed> failure;
    try
    {
        run_command(track, "Capturing", "captured", out_cb, err_logger, args, options);
    }
    catch (const CommandFailed& e)
    {
        failure = e;
    }

    // Exit can be observed before the stdout pump has delivered its last lines
    auto lines = capture->wait();
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            joined += '\n';
        joined += lines[i];
    }
    std::string output = trim(joined);

    if (failure)
        throw CommandFailed(failure->args(), failure->returncode(), output);
    return output;
}

ProcessHandle Runner::popen(const Args& args, const LaunchOptions& options)
{
    Track track = tracks_.next();
    TrackLogger logger(output_, track);
    auto span = command_span(track, args);

    write_track(track, "Launching: " + util::str_command(args));
    auto output = output_;
    auto done = [output, track](const ProcessHandle& proc)
    {
        if (auto retcode = proc->wait_for(EXIT_GRACE))
            output->write("[" + std::to_string(track) + "] exit " + std::to_string(*retcode));
    };
    return launch_command(track, logger, logger, args, options, done);
}

// =============================================================================
// kubectl helpers
// =============================================================================

Args Runner::kubectl(const std::string& context, const std::string& namespace_,
                     const Args& args) const
{
    Args result{settings_.kubectl_cmd};
    if (settings_.verbose)
        result.push_back("--v=4");
    result.push_back("--context");
    result.push_back(context);
    result.push_back("--namespace");
    result.push_back(namespace_);
    result.insert(result.end(), args.begin(), args.end());
    return result;
}

std::string Runner::get_kubectl(const std::string& context, const std::string& namespace_,
                                const Args& args, std::optional<StreamMode> stderr_mode)
{
    LaunchOptions options;
    options.stderr_mode = stderr_mode;
    return get_output(kubectl(context, namespace_, args), false, options);
}

void Runner::check_kubectl(const std::string& context, const std::string& namespace_,
                           const Args& args, const LaunchOptions& options)
{
    check_call(kubectl(context, namespace_, args), options);
}

// =============================================================================
// Session
// =============================================================================

telemetry::SpanScope Runner::span(const std::string& name, bool verbose)
{
    auto scope = tracer_.start_span(name);
    scope.span().set_attribute(VERBOSE_SPAN_ATTRIBUTE, verbose);
    if (verbose)
        output_->write("BEGIN SPAN " + name);
    return scope;
}

void Runner::write(const std::string& message, const std::string& prefix)
{
    output_->write(message, prefix);
}

std::string Runner::read_logs() const
{
    return output_->read_logs();
}

void Runner::set_success(bool flag)
{
    success_ = flag;
    output_->write("Success. Starting cleanup.");
}

void Runner::close()
{
    if (closed_.exchange(true))
        return;
    if (!success_)
        return;

    auto summary = telemetry::format_summary(spans_->finished_spans());
    if (summary.empty())
        return;
    output_->write("Timing summary:");
    std::istringstream lines(summary);
    std::string line;
    while (std::getline(lines, line))
        output_->write(line);
}

std::vector<telemetry::Span> Runner::finished_spans() const
{
    return spans_->finished_spans();
}

} // namespace procsup
