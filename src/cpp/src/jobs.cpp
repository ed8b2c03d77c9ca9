/**
 * @file jobs.cpp
 * @brief Asynchronous job engine implementation for CanvaSDK C++
 */

#include "canvasdk/jobs.hpp"
#include "canvasdk/errors.hpp"
#include "canvasdk/logging.hpp"
#include <algorithm>

namespace canvasdk {

std::chrono::milliseconds PollPolicy::next(std::chrono::milliseconds current) const {
    auto grown = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(current.count()) * factor));
    return std::min(std::max(grown, current), cap);
}

// =============================================================================
// Job specs
// =============================================================================

JobSpec asset_upload_job(const std::string& filename, int64_t file_size,
                         const std::optional<std::string>& folder_id) {
    json body = {{"filename", filename}, {"file_size", file_size}};
    if (folder_id.has_value()) {
        body["folder_id"] = *folder_id;
    }

    JobSpec spec;
    spec.kind = JobKind::AssetUpload;
    spec.create_request = ApiRequest::post("/assets/upload", body);
    spec.poll_request = [](const std::string& job_id) {
        return ApiRequest::get("/assets/upload/" + percent_encode(job_id));
    };
    return spec;
}

JobSpec url_asset_upload_job(const std::string& url, const std::string& filename,
                             const std::optional<std::string>& folder_id) {
    json body = {{"url", url}, {"filename", filename}};
    if (folder_id.has_value()) {
        body["folder_id"] = *folder_id;
    }

    JobSpec spec;
    spec.kind = JobKind::UrlAssetUpload;
    spec.create_request = ApiRequest::post("/assets/upload/url", body);
    spec.poll_request = [](const std::string& job_id) {
        return ApiRequest::get("/assets/upload/url/" + percent_encode(job_id));
    };
    return spec;
}

JobSpec export_job(const std::string& design_id, const std::string& file_type,
                   const std::optional<json>& page_range) {
    if (std::find(CANVA_EXPORT_FILE_TYPES.begin(), CANVA_EXPORT_FILE_TYPES.end(), file_type) ==
        CANVA_EXPORT_FILE_TYPES.end()) {
        throw ValidationError("Unsupported export file type: " + file_type, 0);
    }
    if (design_id.empty()) {
        throw ValidationError("design_id is required", 0);
    }

    json body = {{"file_type", file_type}};
    if (page_range.has_value()) {
        body["page_range"] = *page_range;
    }

    JobSpec spec;
    spec.kind = JobKind::Export;
    spec.create_request = ApiRequest::post("/designs/" + percent_encode(design_id) + "/exports", body);
    spec.poll_request = [](const std::string& job_id) {
        return ApiRequest::get("/exports/" + percent_encode(job_id));
    };
    return spec;
}

JobSpec autofill_job(const std::string& brand_template_id, const json& dataset) {
    if (brand_template_id.empty()) {
        throw ValidationError("brand_template_id is required", 0);
    }

    JobSpec spec;
    spec.kind = JobKind::Autofill;
    spec.create_request = ApiRequest::post("/autofills", {
        {"brand_template_id", brand_template_id},
        {"dataset", dataset}
    });
    spec.poll_request = [](const std::string& job_id) {
        return ApiRequest::get("/autofills/" + percent_encode(job_id));
    };
    return spec;
}

// =============================================================================
// AsyncJobEngine
// =============================================================================

AsyncJobEngine::AsyncJobEngine(std::shared_ptr<HttpGateway> gateway, SleepFunction sleep,
                               SteadyClock clock)
    : gateway_(std::move(gateway)),
      sleep_(sleep ? std::move(sleep) : SleepFunction(&interruptible_sleep)),
      clock_(clock ? std::move(clock) : SteadyClock(&steady_now)) {
}

json AsyncJobEngine::execute(const ApiRequest& request, const std::string& job_id,
                             const JobOptions& options, const CallContext& ctx) {
    double timeout_seconds = std::chrono::duration<double>(options.timeout).count();
    try {
        return gateway_->execute(request, ctx);
    } catch (const CancellationError&) {
        throw JobCancelledError(job_id);
    } catch (const TimeoutError&) {
        throw JobTimeoutError(job_id, timeout_seconds);
    }
}

json AsyncJobEngine::submit_and_await(const JobSpec& spec, const JobOptions& options,
                                      const CallContext& ctx) {
    const std::string kind = job_kind_to_string(spec.kind);
    double timeout_seconds = std::chrono::duration<double>(options.timeout).count();
    CallContext job_ctx = ctx.with_deadline(clock_() + options.timeout);

    if (ctx.cancelled()) {
        throw JobCancelledError("");
    }

    Job job = Job::from_response(spec.kind, execute(spec.create_request, "", options, job_ctx));
    logger()->info("{} job {} created ({})", kind, job.id, job_status_to_string(job.status));

    auto interval = options.poll.initial;
    int polls = 0;
    while (!job.is_terminal()) {
        if (ctx.cancelled()) {
            throw JobCancelledError(job.id);
        }

        auto remaining = job_ctx.remaining(clock_());
        if (remaining.has_value() && remaining->count() == 0) {
            logger()->warn("{} job {} timed out after {} polls", kind, job.id, polls);
            throw JobTimeoutError(job.id, timeout_seconds);
        }

        auto nap = remaining.has_value() ? std::min(interval, *remaining) : interval;
        try {
            sleep_(nap, job_ctx);
        } catch (const CancellationError&) {
            throw JobCancelledError(job.id);
        }

        // The deadline passed during the sleep: no further polls
        remaining = job_ctx.remaining(clock_());
        if (remaining.has_value() && remaining->count() == 0) {
            logger()->warn("{} job {} timed out after {} polls", kind, job.id, polls);
            throw JobTimeoutError(job.id, timeout_seconds);
        }

        Job observed = Job::from_response(spec.kind,
                                          execute(spec.poll_request(job.id), job.id, options, job_ctx));
        job.advance(observed);
        ++polls;
        logger()->debug("{} job {} poll {}: {}", kind, job.id, polls, job_status_to_string(job.status));

        interval = options.poll.next(interval);
    }

    if (job.status == JobStatus::Failed) {
        std::string reason = job.error.value_or("unknown");
        logger()->error("{} job {} failed: {}", kind, job.id, reason);
        throw JobFailedError(job.id, reason);
    }

    logger()->info("{} job {} succeeded after {} polls", kind, job.id, polls);
    return job.result.value_or(json::object());
}

} // namespace canvasdk
