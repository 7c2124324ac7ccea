#include "render_job.hpp"
#include "fractal.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

RenderRequest job_request(int w = 48, int h = 36)
{
    RenderRequest r;
    r.viewport       = Viewport::default_view(w, h);
    r.max_iterations = 100;
    r.width          = w;
    r.height         = h;
    return r;
}

// Polls until the background job is finished, up to a generous timeout.
bool wait_finished(const BackgroundRender& bg)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (!bg.finished()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

}  // namespace

TEST(RenderJob, CompletesWithFullBuffer)
{
    const RenderRequest req = job_request();
    RenderJob job(req);
    EXPECT_EQ(job.state(), JobState::Pending);
    EXPECT_FALSE(job.finished());
    EXPECT_EQ(job.progress(), 0.0);

    job.run();
    EXPECT_EQ(job.state(), JobState::Completed);
    EXPECT_TRUE(job.finished());
    EXPECT_EQ(job.progress(), 1.0);
    EXPECT_TRUE(job.error().empty());

    const PixelBuffer buf = job.take_result();
    ASSERT_EQ(buf.width, req.width);
    ASSERT_EQ(buf.height, req.height);
    EXPECT_EQ(buf.at(7, 9), compute_pixel(7, 9, req));
}

TEST(RenderJob, InvalidRequestFailsWithoutBuffer)
{
    RenderRequest req = job_request();
    req.max_iterations = -5;
    RenderJob job(req);
    job.run();

    EXPECT_EQ(job.state(), JobState::Failed);
    EXPECT_TRUE(job.finished());
    EXPECT_NE(job.error().find("InvalidRequest"), std::string::npos) << job.error();
    EXPECT_LT(job.progress(), 1.0);
    EXPECT_TRUE(job.take_result().empty());
}

TEST(RenderJob, RunsOnlyOnce)
{
    RenderJob job(job_request());
    job.run();
    EXPECT_THROW(job.run(), std::logic_error);
    EXPECT_EQ(job.state(), JobState::Completed);
}

TEST(RenderJob, StateNames)
{
    EXPECT_STREQ(job_state_name(JobState::Pending), "pending");
    EXPECT_STREQ(job_state_name(JobState::Running), "running");
    EXPECT_STREQ(job_state_name(JobState::Completed), "completed");
    EXPECT_STREQ(job_state_name(JobState::Failed), "failed");
}

TEST(BackgroundRender, DeliversResultToPollingThread)
{
    BackgroundRender bg;
    EXPECT_FALSE(bg.active());
    EXPECT_TRUE(bg.take() == nullptr);

    const RenderRequest req = job_request(160, 120);
    ASSERT_TRUE(bg.start(req));
    EXPECT_TRUE(bg.active());
    // Busy: a second request is refused until the first is taken.
    EXPECT_FALSE(bg.start(req));

    ASSERT_TRUE(wait_finished(bg));
    EXPECT_EQ(bg.progress(), 1.0);
    std::unique_ptr<RenderJob> job = bg.take();
    ASSERT_TRUE(job != nullptr);
    EXPECT_EQ(job->state(), JobState::Completed);
    EXPECT_FALSE(bg.active());

    const PixelBuffer buf = job->take_result();
    EXPECT_EQ(buf.width, 160);
    EXPECT_EQ(buf.at(80, 60), compute_pixel(80, 60, req));

    // Room for the next job now.
    EXPECT_TRUE(bg.start(req));
    ASSERT_TRUE(wait_finished(bg));
    EXPECT_TRUE(bg.take() != nullptr);
}

TEST(BackgroundRender, ReportsFailure)
{
    BackgroundRender bg;
    RenderRequest req = job_request();
    req.height = 0;
    ASSERT_TRUE(bg.start(req));
    ASSERT_TRUE(wait_finished(bg));
    std::unique_ptr<RenderJob> job = bg.take();
    ASSERT_TRUE(job != nullptr);
    EXPECT_EQ(job->state(), JobState::Failed);
    EXPECT_FALSE(job->error().empty());
}

TEST(BackgroundRender, DestructorWaitsForAbandonedJob)
{
    // Dropping the runner with a job in flight must join, not crash.
    {
        BackgroundRender bg;
        ASSERT_TRUE(bg.start(job_request(400, 300)));
    }
    SUCCEED();
}
