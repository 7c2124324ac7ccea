#include "render_job.hpp"
#include "fractal_error.hpp"

#include <spdlog/spdlog.h>

#include <new>
#include <stdexcept>
#include <system_error>
#include <utility>

const char* job_state_name(JobState s)
{
    switch (s) {
        case JobState::Pending:   return "pending";
        case JobState::Running:   return "running";
        case JobState::Completed: return "completed";
        case JobState::Failed:    return "failed";
    }
    return "unknown";
}

// -----------------------------------------------------------------------
// RenderJob
// -----------------------------------------------------------------------
RenderJob::RenderJob(const RenderRequest& request, CpuRenderer renderer)
    : request_(request)
    , renderer_(std::move(renderer))
{}

bool RenderJob::finished() const
{
    const JobState s = state_.load();
    return s == JobState::Completed || s == JobState::Failed;
}

std::string RenderJob::error() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return error_;
}

void RenderJob::fail(const std::string& msg)
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        error_ = msg;
        result_ = PixelBuffer{};
    }
    state_.store(JobState::Failed);
}

void RenderJob::run()
{
    JobState expected = JobState::Pending;
    if (!state_.compare_exchange_strong(expected, JobState::Running))
        throw std::logic_error(std::string("render job already ") + job_state_name(expected));

    PixelBuffer buf;
    try {
        renderer_.render_into(request_, buf, [this](double f) {
            // The renderer's final 1.0 is published below, after the buffer
            // has been handed over.
            if (f < 1.0) progress_.store(f);
        });
    } catch (const FractalError& e) {
        spdlog::warn("render job failed: {}", e.what());
        fail(e.what());
        return;
    } catch (const std::bad_alloc&) {
        spdlog::error("render job failed: out of memory for {}x{}",
                      request_.width, request_.height);
        fail("out of memory for " + std::to_string(request_.width) + "x" +
             std::to_string(request_.height) + " pixel buffer");
        return;
    }

    render_ms_ = renderer_.last_render_ms;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        result_ = std::move(buf);
    }
    progress_.store(1.0);
    state_.store(JobState::Completed);
}

PixelBuffer RenderJob::take_result()
{
    if (state_.load() != JobState::Completed)
        return {};
    std::lock_guard<std::mutex> lock(mtx_);
    return std::move(result_);
}

// -----------------------------------------------------------------------
// BackgroundRender
// -----------------------------------------------------------------------
BackgroundRender::~BackgroundRender()
{
    if (worker.joinable())
        worker.join();
}

bool BackgroundRender::start(const RenderRequest& request, CpuRenderer renderer)
{
    if (job) return false;
    if (worker.joinable()) worker.join();

    job = std::make_unique<RenderJob>(request, std::move(renderer));
    RenderJob* j = job.get();
    try {
        worker = std::thread([j] { j->run(); });
    } catch (const std::system_error& e) {
        spdlog::error("cannot start background render: {}", e.what());
        job.reset();
        return false;
    }
    return true;
}

std::unique_ptr<RenderJob> BackgroundRender::take()
{
    if (!job || !job->finished())
        return nullptr;
    if (worker.joinable())
        worker.join();
    return std::move(job);
}
