#pragma once

#include "cpu_renderer.hpp"
#include "renderer.hpp"
#include "view_state.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

enum class JobState {
    Pending,
    Running,
    Completed,
    Failed,
};

const char* job_state_name(JobState s);

// One render request driven through Pending -> Running -> {Completed, Failed}.
// state(), progress() and error() may be read from any thread while run()
// executes on another.
class RenderJob {
public:
    explicit RenderJob(const RenderRequest& request, CpuRenderer renderer = CpuRenderer());

    // Runs the render on the calling thread. A rejected request or an
    // allocation failure moves the job to Failed with error() set; no
    // partial buffer is kept. Calling run() twice throws std::logic_error.
    void run();

    JobState state() const { return state_.load(); }
    bool     finished() const;

    // Fraction of partitions completed; 1.0 only once the job is Completed.
    double progress() const { return progress_.load(); }

    std::string error() const;

    // Moves the buffer out of a Completed job; empty buffer otherwise.
    PixelBuffer take_result();

    const RenderRequest& request() const { return request_; }
    double render_ms() const { return render_ms_; }

private:
    void fail(const std::string& msg);

    const RenderRequest     request_;
    CpuRenderer             renderer_;
    std::atomic<JobState>   state_{JobState::Pending};
    std::atomic<double>     progress_{0.0};
    double                  render_ms_ = 0.0;

    mutable std::mutex      mtx_;       // guards error_ and result_
    std::string             error_;
    PixelBuffer             result_;
};

// Runs a RenderJob on its own thread so the UI thread can keep drawing a
// busy indicator. Dropping the object waits for the thread; the result of an
// abandoned job is simply discarded.
class BackgroundRender {
public:
    BackgroundRender() = default;
    ~BackgroundRender();

    BackgroundRender(const BackgroundRender&)            = delete;
    BackgroundRender& operator=(const BackgroundRender&) = delete;

    // Returns false (and does nothing) while a previous job is still held.
    bool start(const RenderRequest& request, CpuRenderer renderer = CpuRenderer());

    bool   active()   const { return job != nullptr; }
    bool   finished() const { return job && job->finished(); }
    double progress() const { return job ? job->progress() : 0.0; }

    // Hands back the finished job (Completed or Failed) and makes room for
    // the next one. Returns nullptr while the job is still running.
    std::unique_ptr<RenderJob> take();

private:
    std::unique_ptr<RenderJob> job;
    std::thread                worker;
};
