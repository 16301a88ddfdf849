//
// Created by lewis on 4/11/24.
//

#include "../Bulk/SubmissionState.h"
#include "../Settings.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace {
const char* const DEFAULT_OUTPUT_FORMAT = "application/fhir+ndjson";

struct sBulkSubmitRequest {
    sSubmitter submitter;
    std::string submissionId;

    // in-progress, complete or aborted. in-progress when the parameter is missing
    std::string submissionStatus = "in-progress";
    bool bHasSubmissionStatus = false;

    std::string manifestUrl;
    std::string replacesManifestUrl;
    std::string outputFormat = DEFAULT_OUTPUT_FORMAT;
    std::string fhirBaseUrl;
    SimpleWeb::CaseInsensitiveMultimap fileRequestHeaders;

    [[nodiscard]] auto toJobRequest() const -> sJobRequest {
        // Without a FHIR base url, relative attachment urls resolve against the manifest
        return {manifestUrl, outputFormat, fhirBaseUrl.empty() ? manifestUrl : fhirBaseUrl, fileRequestHeaders};
    }
};

auto parseSubmitter(const nlohmann::json& parameters) -> sSubmitter {
    const auto* parameter = findParameter(parameters, "submitter");
    if (parameter == nullptr || !parameter->contains("valueIdentifier") || !(*parameter)["valueIdentifier"].is_object()) {
        throw eBadRequest("Missing or invalid submitter parameter");
    }

    const auto& identifier = (*parameter)["valueIdentifier"];
    auto system = identifier.value("system", "");
    auto value = identifier.value("value", "");
    if (value.empty()) {
        throw eBadRequest("Missing or invalid submitter parameter");
    }

    return {system, value};
}

auto parseFileRequestHeaders(const nlohmann::json& parameters) -> SimpleWeb::CaseInsensitiveMultimap {
    SimpleWeb::CaseInsensitiveMultimap headers;

    for (const auto& parameter : parameters.at("parameter")) {
        if (!parameter.is_object() || parameter.value("name", "") != "fileRequestHeaders") {
            continue;
        }

        std::string headerName;
        std::string headerValue;
        for (const auto& part : parameter.value("part", nlohmann::json::array())) {
            if (!part.is_object()) {
                continue;
            }

            if (part.value("name", "") == "headerName") {
                headerName = part.value("valueString", "");
            } else if (part.value("name", "") == "headerValue") {
                headerValue = part.value("valueString", "");
            }
        }

        if (headerName.empty()) {
            throw eBadRequest("Invalid fileRequestHeaders parameter. Each header needs a headerName");
        }

        headers.emplace(headerName, headerValue);
    }

    return headers;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
auto parseBulkSubmitRequest(const nlohmann::json& parameters) -> sBulkSubmitRequest {
    sBulkSubmitRequest result;

    result.submitter = parseSubmitter(parameters);

    auto submissionId = getParameterString(parameters, "submissionId");
    if (!submissionId) {
        throw eBadRequest("Missing or invalid submissionId parameter");
    }
    result.submissionId = *submissionId;

    if (const auto* parameter = findParameter(parameters, "submissionStatus")) {
        if (parameter->contains("valueCoding") && (*parameter)["valueCoding"].is_object()) {
            auto code = (*parameter)["valueCoding"].value("code", "");
            if (!code.empty()) {
                result.submissionStatus = code;
                result.bHasSubmissionStatus = true;
            }
        }
    }

    if (result.submissionStatus != "in-progress"
        && result.submissionStatus != "complete"
        && result.submissionStatus != "aborted") {
        throw eBadRequest("Invalid submissionStatus parameter. Must be one of in-progress, complete, or aborted.");
    }

    result.manifestUrl = getParameterString(parameters, "manifestUrl", {"valueString", "valueUri", "valueUrl"})
            .value_or("");
    result.replacesManifestUrl = getParameterString(
            parameters, "replacesManifestUrl", {"valueString", "valueUri", "valueUrl"}
    ).value_or("");

    if (!result.bHasSubmissionStatus && result.manifestUrl.empty()) {
        throw eBadRequest("Either submissionStatus or manifestUrl SHALL be populated");
    }

    result.outputFormat = getParameterString(parameters, "outputFormat").value_or(DEFAULT_OUTPUT_FORMAT);
    if (!result.outputFormat.starts_with("application/fhir+ndjson")
        && !result.outputFormat.starts_with("application/ndjson")
        && !result.outputFormat.starts_with("ndjson")) {
        throw eBadRequest("Invalid outputFormat parameter. Only ndjson formats are supported by this server.");
    }

    result.fhirBaseUrl = getParameterString(parameters, "FHIRBaseUrl", {"valueString", "valueUri", "valueUrl"})
            .value_or("");
    result.fileRequestHeaders = parseFileRequestHeaders(parameters);

    return result;
}

void rejectTerminal(const std::shared_ptr<SubmissionState>& submission) {
    if (submission->isTerminal()) {
        throw eBadRequest("Submission is already complete or aborted");
    }
}

void writeInformation(const std::shared_ptr<HttpServerImpl::Response>& response, const std::string& diagnostics) {
    writeOperationOutcome(response, SimpleWeb::StatusCode::success_ok, "information", "informational", diagnostics);
}

void abortSubmission(
        const sBulkSubmitRequest& submitRequest,
        const std::shared_ptr<ISubmissionRegistry>& registry,
        const std::shared_ptr<HttpServerImpl::Response>& response
) {
    auto submission = registry->find(submitRequest.submissionId, submitRequest.submitter);
    if (!submission) {
        writeOperationOutcome(
                response,
                SimpleWeb::StatusCode::client_error_not_found,
                "error",
                "not-found",
                "Submission not found for the given submitter and submissionId"
        );
        return;
    }

    auto requestLock = submission->lockRequests();
    rejectTerminal(submission);

    submission->abort();

    writeInformation(response, "Submission " + submission->getSlug() + " marked as aborted");
}

void completeSubmission(
        const sBulkSubmitRequest& submitRequest,
        const std::shared_ptr<ISubmissionRegistry>& registry,
        const std::shared_ptr<HttpServerImpl::Response>& response
) {
    auto submission = registry->findOrCreate(submitRequest.submissionId, submitRequest.submitter);
    auto requestLock = submission->lockRequests();
    rejectTerminal(submission);

    // A submission can be kicked off and completed in the same request
    if (submission->getJobs().empty() && !submitRequest.manifestUrl.empty()) {
        auto job = submission->createJob(submitRequest.toJobRequest());
        submission->start();
        submission->complete();

        writeInformation(
                response,
                "Job " + job->getJobId() + " started successfully and marked as complete. Submission: "
                + submission->getSlug()
        );
        return;
    }

    submission->complete();

    writeInformation(response, "Submission " + submission->getSlug() + " marked as complete");
}

void startNewJob(
        const sBulkSubmitRequest& submitRequest,
        const std::shared_ptr<ISubmissionRegistry>& registry,
        const std::shared_ptr<HttpServerImpl::Response>& response
) {
    if (submitRequest.manifestUrl.empty()) {
        throw eBadRequest("Missing manifestUrl parameter");
    }

    auto submission = registry->findOrCreate(submitRequest.submissionId, submitRequest.submitter);
    auto requestLock = submission->lockRequests();
    rejectTerminal(submission);

    if (submission->findJobByManifestUrl(submitRequest.manifestUrl)) {
        throw eBadRequest(
                "Manifest " + submitRequest.manifestUrl + " was already submitted. Use replacesManifestUrl to replace it"
        );
    }

    auto job = submission->createJob(submitRequest.toJobRequest());
    submission->start();

    writeInformation(
            response,
            "Job " + job->getJobId() + " started successfully! Submission: " + submission->getSlug()
    );
}

void replaceManifest(
        const sBulkSubmitRequest& submitRequest,
        const std::shared_ptr<ISubmissionRegistry>& registry,
        const std::shared_ptr<HttpServerImpl::Response>& response
) {
    if (submitRequest.manifestUrl.empty()) {
        throw eBadRequest("Missing manifestUrl parameter");
    }

    auto submission = registry->find(submitRequest.submissionId, submitRequest.submitter);
    std::unique_lock<std::mutex> requestLock;
    if (submission) {
        requestLock = submission->lockRequests();
        rejectTerminal(submission);
    }

    if (!submission || !submission->findJobByManifestUrl(submitRequest.replacesManifestUrl)) {
        writeOperationOutcome(
                response,
                SimpleWeb::StatusCode::client_error_not_found,
                "error",
                "not-found",
                "No job found for manifest " + submitRequest.replacesManifestUrl
        );
        return;
    }

    auto job = submission->replaceManifest(submitRequest.replacesManifestUrl, submitRequest.toJobRequest());

    submission->start();

    writeInformation(
            response,
            "Manifest " + submitRequest.replacesManifestUrl + " replaced by job " + job->getJobId()
            + ". Submission: " + submission->getSlug()
    );
}
} // namespace

void BulkSubmitApi(const std::string &path, HttpServer *server, const std::shared_ptr<ISubmissionRegistry>& registry) {
    // Post     -> Start, complete, abort or replace (FHIR Parameters)

    server->getServer().resource["^" + path + "$"]["POST"] = [registry](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        try {
            auto submitRequest = parseBulkSubmitRequest(readParameters(request));

            std::cout << "API: Requested submission status " << submitRequest.submissionStatus
                      << " for submitter \"" << submitRequest.submitter.system << "|" << submitRequest.submitter.value
                      << "\", submissionId " << submitRequest.submissionId << std::endl;

            if (submitRequest.submissionStatus == "aborted") {
                abortSubmission(submitRequest, registry, response);
            } else if (submitRequest.submissionStatus == "complete") {
                completeSubmission(submitRequest, registry, response);
            } else if (!submitRequest.replacesManifestUrl.empty()) {
                replaceManifest(submitRequest, registry, response);
            } else {
                startNewJob(submitRequest, registry, response);
            }
        } catch (eBadRequest& e) {
            writeOperationOutcome(response, SimpleWeb::StatusCode::client_error_bad_request, "error", "invalid", e.what());
        } catch (std::exception& e) {
            dumpExceptions(e);

            writeOperationOutcome(
                    response, SimpleWeb::StatusCode::server_error_internal_server_error, "error", "exception", e.what()
            );
        }
    };
}
