/**
 * @file jobs.hpp
 * @brief Asynchronous job submission and polling for CanvaSDK C++
 */

#ifndef CANVASDK_JOBS_HPP
#define CANVASDK_JOBS_HPP

#include "types.hpp"
#include "cancellation.hpp"
#include "gateway.hpp"
#include <memory>

namespace canvasdk {

/**
 * Polling schedule: initial interval growing by `factor`, capped at `cap`
 */
struct PollPolicy {
    std::chrono::milliseconds initial{1000};
    double factor = 1.5;
    std::chrono::milliseconds cap{10000};

    std::chrono::milliseconds next(std::chrono::milliseconds current) const;
};

/**
 * Job wait options
 */
struct JobOptions {
    std::chrono::milliseconds timeout{300000};
    PollPolicy poll;
};

/**
 * How to create and poll one kind of job
 */
struct JobSpec {
    JobKind kind = JobKind::Export;
    ApiRequest create_request;
    std::function<ApiRequest(const std::string& job_id)> poll_request;
};

// Per-kind job specs

JobSpec asset_upload_job(
    const std::string& filename,
    int64_t file_size,
    const std::optional<std::string>& folder_id = std::nullopt
);

JobSpec url_asset_upload_job(
    const std::string& url,
    const std::string& filename,
    const std::optional<std::string>& folder_id = std::nullopt
);

/**
 * Design export job
 * @throws ValidationError if file_type is not one of CANVA_EXPORT_FILE_TYPES
 */
JobSpec export_job(
    const std::string& design_id,
    const std::string& file_type,
    const std::optional<json>& page_range = std::nullopt
);

JobSpec autofill_job(const std::string& brand_template_id, const json& dataset);

/**
 * Submits a job and polls it to a terminal status.
 *
 * Polling runs on the caller's thread. The engine never retries a failed
 * job and never cancels it remotely.
 */
class AsyncJobEngine {
public:
    /**
     * Create a job engine
     * @param gateway Gateway used for create and poll requests
     * @param sleep Wait function between polls (defaults to interruptible_sleep)
     * @param clock Monotonic clock (defaults to steady_clock::now)
     */
    AsyncJobEngine(
        std::shared_ptr<HttpGateway> gateway,
        SleepFunction sleep = nullptr,
        SteadyClock clock = nullptr
    );

    /**
     * Create the job and wait for it to finish
     * @param spec Job kind and endpoints
     * @param options Timeout and poll schedule
     * @param ctx Caller cancellation and deadline
     * @return Job result
     * @throws JobFailedError, JobTimeoutError, JobCancelledError
     */
    json submit_and_await(const JobSpec& spec, const JobOptions& options = {},
                          const CallContext& ctx = {});

private:
    json execute(const ApiRequest& request, const std::string& job_id, const JobOptions& options,
                 const CallContext& ctx);

    std::shared_ptr<HttpGateway> gateway_;
    SleepFunction sleep_;
    SteadyClock clock_;
};

} // namespace canvasdk

#endif // CANVASDK_JOBS_HPP
