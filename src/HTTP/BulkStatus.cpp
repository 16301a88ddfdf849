//
// Created by lewis on 4/11/24.
//

#include "../Bulk/SubmissionState.h"
#include "../Settings.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <memory>
#include <sstream>
#include <string>

namespace {
auto formatProgress(double progress) -> std::string {
    // Whole numbers print without a fraction, 33.33 prints as is
    std::ostringstream stream;
    stream << progress;
    return stream.str();
}

void kickoff(
        const std::shared_ptr<ISubmissionRegistry>& registry,
        const std::shared_ptr<HttpServerImpl::Response>& response,
        const std::shared_ptr<HttpServerImpl::Request>& request
) {
    auto parameters = readParameters(request);

    const auto* submitterParameter = findParameter(parameters, "submitter");
    if (submitterParameter == nullptr
        || !submitterParameter->contains("valueIdentifier")
        || !(*submitterParameter)["valueIdentifier"].is_object()) {
        throw eBadRequest("Missing or invalid submitter parameter");
    }

    const auto& identifier = (*submitterParameter)["valueIdentifier"];
    sSubmitter submitter{identifier.value("system", ""), identifier.value("value", "")};

    auto submissionId = getParameterString(parameters, "submissionId");
    if (!submissionId) {
        throw eBadRequest("Missing or invalid submissionId parameter");
    }

    auto outputFormat = getParameterString(parameters, "_outputFormat").value_or("application/fhir+ndjson");
    if (outputFormat != "application/fhir+ndjson" && outputFormat != "application/ndjson" && outputFormat != "ndjson") {
        throw eBadRequest("Invalid _outputFormat parameter. Only ndjson formats are supported by this server.");
    }

    auto accept = getHeader(request->header, "Accept");
    if (!accept.empty() && accept != "application/fhir+json") {
        throw eBadRequest("Invalid Accept header. Only application/fhir+json is supported by this server.");
    }

    auto prefer = getHeader(request->header, "Prefer");
    if (!prefer.empty() && prefer != "respond-async") {
        throw eBadRequest("Invalid Prefer header. Only respond-async is supported by this server.");
    }

    auto submission = registry->find(*submissionId, submitter);
    if (!submission) {
        writeOperationOutcome(
                response,
                SimpleWeb::StatusCode::client_error_not_found,
                "error",
                "not-found",
                "No submission found for the given submitter and submissionId"
        );
        return;
    }

    auto statusUrl = std::string{BASE_URL} + "/$bulk-submit-status/" + submission->getSlug();

    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Location", statusUrl);
    headers.emplace("Cache-Control", "no-cache");
    headers.emplace("Pragma", "no-cache");
    headers.emplace("Expires", "0");

    writeOperationOutcome(
            response,
            SimpleWeb::StatusCode::success_accepted,
            "information",
            "informational",
            "Check job status at " + statusUrl,
            headers
    );
}

void status(
        const std::shared_ptr<ISubmissionRegistry>& registry,
        const std::shared_ptr<HttpServerImpl::Response>& response,
        const std::string& slug
) {
    auto submission = registry->find(slug);
    if (!submission) {
        writeOperationOutcome(
                response,
                SimpleWeb::StatusCode::client_error_not_found,
                "error",
                "not-found",
                "No submission found for the given id. Perhaps it expired and was cleaned up."
        );
        return;
    }

    auto submissionStatus = submission->getStatus();

    if (submissionStatus == eSubmissionStatus::aborted) {
        writeOperationOutcome(
                response,
                SimpleWeb::StatusCode::server_error_internal_server_error,
                "error",
                "exception",
                "The submission has been aborted"
        );
        return;
    }

    auto progress = submission->getProgress();

    // The manifest is only ready once the submission is complete and every file has been processed. A complete
    // submission can still be processing files
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    if (submissionStatus == eSubmissionStatus::complete && progress >= 100) {
        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", "application/json");

        response->write(SimpleWeb::StatusCode::success_ok, submission->getErrorManifest()->toJson().dump(), headers);
        return;
    }

    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("X-Progress", formatProgress(progress) + "% processed");

    response->write(SimpleWeb::StatusCode::success_accepted, "", headers);
}
} // namespace

void BulkStatusApi(const std::string &path, HttpServer *server, const std::shared_ptr<ISubmissionRegistry>& registry) {
    // Post     -> Status kick-off (FHIR Parameters)
    // Get      -> Submission status (slug)

    server->getServer().resource["^" + path + "$"]["POST"] = [registry](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        try {
            kickoff(registry, response, request);
        } catch (eBadRequest& e) {
            writeOperationOutcome(response, SimpleWeb::StatusCode::client_error_bad_request, "error", "invalid", e.what());
        } catch (std::exception& e) {
            dumpExceptions(e);

            writeOperationOutcome(
                    response, SimpleWeb::StatusCode::server_error_internal_server_error, "error", "exception", e.what()
            );
        }
    };

    server->getServer().resource["^" + path + "/([^/]+)$"]["GET"] = [registry](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        try {
            status(registry, response, request->path_match[1].str());
        } catch (std::exception& e) {
            dumpExceptions(e);

            writeOperationOutcome(
                    response, SimpleWeb::StatusCode::server_error_internal_server_error, "error", "exception", e.what()
            );
        }
    };
}
