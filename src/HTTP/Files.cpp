//
// Created by lewis on 4/12/24.
//

#include "HttpServer.h"
#include "HttpUtils.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace {
auto contentTypeForExtension(std::string extension) -> std::string {
    static const std::map<std::string, std::string> mimeTypes = {
            {".ndjson", "application/fhir+ndjson"},
            {".json", "application/json"},
            {".txt", "text/plain"}
    };

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });

    auto mimeType = mimeTypes.find(extension);
    return mimeType == mimeTypes.end() ? "application/octet-stream" : mimeType->second;
}
} // namespace

void JobFilesApi(const std::string &path, HttpServer *server, const std::filesystem::path& jobsDirectory) {
    // Get      -> Download a record file or a downloaded data file (path under the jobs directory)

    server->getServer().resource["^" + path + "(.+)$"]["GET"] = [jobsDirectory](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        try {
            auto relativePath = request->path_match[1].str();

            // Nothing outside the jobs directory may be served
            if (relativePath.find("..") != std::string::npos) {
                writeOperationOutcome(
                        response, SimpleWeb::StatusCode::client_error_bad_request, "error", "invalid", "Invalid path"
                );
                return;
            }

            auto filePath = jobsDirectory / relativePath;
            if (!std::filesystem::is_regular_file(filePath)) {
                writeOperationOutcome(
                        response, SimpleWeb::StatusCode::client_error_not_found, "error", "not-found", "File not found"
                );
                return;
            }

            std::ifstream file(filePath, std::ios::in | std::ios::binary);
            if (!file.is_open()) {
                throw std::runtime_error("Unable to open " + filePath.string());
            }

            SimpleWeb::CaseInsensitiveMultimap headers;
            headers.emplace("Content-Type", contentTypeForExtension(filePath.extension().string()));
            headers.emplace("Content-Disposition", "inline; filename=\"" + filePath.filename().string() + "\"");

            response->write(SimpleWeb::StatusCode::success_ok, file, headers);
        } catch (std::exception& e) {
            dumpExceptions(e);

            writeOperationOutcome(
                    response, SimpleWeb::StatusCode::server_error_internal_server_error, "error", "exception", e.what()
            );
        }
    };
}
