//
// Created by lewis on 4/4/24.
//

#include "ManifestFetcher.h"
#include "../Lib/FhirResources.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/HttpClient.h"
#include "../Lib/NdjsonLineBuffer.h"
#include "../Lib/UrlUtils.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace {
    auto toLower(std::string value) -> std::string {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
            return static_cast<char>(std::tolower(character));
        });
        return value;
    }

    // Bodies are split in to lines unless the server clearly says they are something else
    auto isNdjsonContentType(const std::string& contentType) -> bool {
        auto mediaType = toLower(contentType.substr(0, contentType.find(';')));
        mediaType.erase(std::remove_if(mediaType.begin(), mediaType.end(), [](unsigned char character) {
            return std::isspace(character) != 0;
        }), mediaType.end());

        return mediaType.empty()
               || mediaType.find("ndjson") != std::string::npos
               || mediaType == "application/octet-stream"
               || mediaType == "text/plain";
    }

    auto notFoundOrProcessing(uint32_t statusCode) -> std::string {
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        return statusCode == 404 || statusCode == 410 ? ISSUE_TYPE_NOT_FOUND : ISSUE_TYPE_PROCESSING;
    }

    // Rejects names that would escape the documents directory
    auto safeFilename(const std::string& filename) -> std::string {
        if (filename.empty() || filename == "." || filename == ".."
            || filename.find_first_of("/\\") != std::string::npos) {
            throw std::invalid_argument("Unsafe file name: " + filename);
        }
        return filename;
    }

    auto parseEntries(const nlohmann::json& entries) -> std::vector<sFileEntry> {
        std::vector<sFileEntry> result;
        if (!entries.is_array()) {
            return result;
        }

        for (const auto& entry : entries) {
            // Entries without a url can't be downloaded
            if (!entry.is_object() || !entry.contains("url") || !entry["url"].is_string()) {
                continue;
            }

            sFileEntry file;
            file.url = entry["url"].get<std::string>();

            if (entry.contains("type") && entry["type"].is_string()) {
                file.type = entry["type"].get<std::string>();
            }

            if (entry.contains("count") && entry["count"].is_number_integer()
                && (entry["count"].is_number_unsigned() || entry["count"].get<int64_t>() >= 0)) {
                file.count = entry["count"].get<uint64_t>();
            }

            result.push_back(file);
        }

        return result;
    }
}

auto sManifest::allFiles() const -> std::vector<std::pair<std::string, sFileEntry>> {
    std::vector<std::pair<std::string, sFileEntry>> files;

    for (const auto& file : output) {
        files.emplace_back("output", file);
    }

    for (const auto& file : deleted) {
        files.emplace_back("deleted", file);
    }

    for (const auto& file : error) {
        files.emplace_back("error", file);
    }

    return files;
}

auto sManifest::fromJson(const nlohmann::json& manifest) -> sManifest {
    if (!manifest.is_object()) {
        throw std::invalid_argument("Manifest is not an object");
    }

    if (!manifest.contains("transactionTime") || manifest["transactionTime"].is_null()) {
        throw std::invalid_argument("Manifest is missing transactionTime");
    }

    if (!manifest.contains("requiresAccessToken") || !manifest["requiresAccessToken"].is_boolean()) {
        throw std::invalid_argument("Manifest has missing or invalid requiresAccessToken");
    }

    if (!manifest.contains("output") || !manifest["output"].is_array()) {
        throw std::invalid_argument("Manifest output must be an array");
    }

    if (manifest.contains("deleted") && !manifest["deleted"].is_null() && !manifest["deleted"].is_array()) {
        throw std::invalid_argument("Manifest deleted must be an array if present");
    }

    sManifest result;
    result.transactionTime = manifest["transactionTime"].is_string()
                             ? manifest["transactionTime"].get<std::string>() : manifest["transactionTime"].dump();
    result.request = manifest.contains("request") && manifest["request"].is_string()
                     ? manifest["request"].get<std::string>() : std::string{};
    result.requiresAccessToken = manifest["requiresAccessToken"].get<bool>();
    result.output = parseEntries(manifest["output"]);

    if (manifest.contains("deleted")) {
        result.deleted = parseEntries(manifest["deleted"]);
    }

    if (manifest.contains("error")) {
        result.error = parseEntries(manifest["error"]);
    }

    return result;
}

ManifestFetcher::ManifestFetcher(sManifestFetcherOptions options) : options(std::move(options)) {
    // Progress is counted by the tasks themselves, the idle event only wakes up the waiting run
    queue.setIdleHandler([this]() {
        std::unique_lock<std::mutex> lock(stateMutex);
        stateCV.notify_all();
    });
}

ManifestFetcher::~ManifestFetcher() {
    clearEvents();
    queue.clearHandlers();
    queue.abortAll();
}

void ManifestFetcher::setEvents(sManifestFetcherEvents events) {
    std::unique_lock<std::mutex> lock(eventsMutex);
    pEvents = std::make_shared<const sManifestFetcherEvents>(std::move(events));
}

void ManifestFetcher::clearEvents() {
    std::unique_lock<std::mutex> lock(eventsMutex);
    pEvents = nullptr;
}

auto ManifestFetcher::getEvents() const -> std::shared_ptr<const sManifestFetcherEvents> {
    std::unique_lock<std::mutex> lock(eventsMutex);
    return pEvents;
}

void ManifestFetcher::emitError(const eBulkError& error) const {
    auto events = getEvents();
    if (events && events->onError) {
        events->onError(error);
    }
}

void ManifestFetcher::emitError(const eBulkError& error, uint64_t fileRunId) const {
    if (isCurrentRun(fileRunId)) {
        emitError(error);
    }
}

auto ManifestFetcher::isCurrentRun(uint64_t fileRunId) const -> bool {
    std::unique_lock<std::mutex> lock(stateMutex);
    return fileRunId == runId;
}

auto ManifestFetcher::isAborted() const -> bool {
    std::unique_lock<std::mutex> lock(stateMutex);
    return bAborted;
}

auto ManifestFetcher::getStatus() const -> std::string {
    std::unique_lock<std::mutex> lock(stateMutex);

    if (bAborted) {
        return "Download aborted";
    }

    if (total == 0) {
        return "No files to download";
    }

    if (downloaded == total) {
        return "All files downloaded";
    }

    return "Downloaded " + std::to_string(downloaded) + " of " + std::to_string(total) + " files";
}

void ManifestFetcher::abort() {
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        if (bAborted) {
            return;
        }

        bAborted = true;

        // Cancel an in flight manifest request, and start a fresh source for the next run
        abortSource.request_stop();
        abortSource = std::stop_source();
    }

    queue.abortAll();
    stateCV.notify_all();

    auto events = getEvents();
    if (events && events->onAbort) {
        events->onAbort();
    }
}

void ManifestFetcher::reset() {
    std::unique_lock<std::mutex> lock(stateMutex);
    bAborted = false;
    total = 0;
    downloaded = 0;

    // Tasks still finishing from an earlier run must not count towards the next one
    runId++;
}

void ManifestFetcher::run(const std::string& manifestUrl) {
    auto events = getEvents();
    if (events && events->onStart) {
        events->onStart();
    }

    try {
        auto manifest = downloadManifest(manifestUrl);
        downloadAllFiles(manifest, manifestUrl);
    } catch (eBulkError& error) {
        if (!isAborted()) {
            emitError(error);
        }
    } catch (std::exception& e) {
        dumpExceptions(e);
        if (!isAborted()) {
            emitError(eBulkError(e.what()));
        }
    }

    // Handlers may have been detached while running
    events = getEvents();
    if (events && events->onComplete) {
        events->onComplete();
    }
}

auto ManifestFetcher::downloadManifest(const std::string& manifestUrl) -> sManifest {
    sBulkErrorContext context;
    context.request = "GET " + manifestUrl;
    context.issueType = ISSUE_TYPE_NOT_FOUND;

    std::stop_token stopToken;
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        stopToken = abortSource.get_token();
    }

    std::string body;
    try {
        auto response = httpGetString(manifestUrl, options.fileRequestHeaders, body, stopToken);
        context.response = response.statusLine;

        if (!response.isSuccess()) {
            throw std::runtime_error(
                    "Request to " + manifestUrl + " failed with status " + std::to_string(response.statusCode)
            );
        }
    } catch (std::exception& e) {
        throw eBulkError(std::string{"Failed to download manifest: "} + e.what(), context);
    }

    context.issueType = ISSUE_TYPE_INVALID;

    nlohmann::json manifest;
    try {
        manifest = nlohmann::json::parse(body);
    } catch (nlohmann::json::parse_error& e) {
        throw eBulkError(std::string{"Failed to parse manifest: "} + e.what(), context);
    }

    try {
        return sManifest::fromJson(manifest);
    } catch (std::invalid_argument& e) {
        throw eBulkError(e.what(), context);
    }
}

void ManifestFetcher::downloadAllFiles(const sManifest& manifest, const std::string& manifestUrl) {
    auto files = manifest.allFiles();
    uint64_t currentRunId = 0;

    {
        std::unique_lock<std::mutex> lock(stateMutex);
        currentRunId = runId;
        downloaded = 0;
        total = files.size();

        // Nothing will ever be queued, so nothing would ever signal completion
        if (total == 0 || bAborted) {
            return;
        }
    }

    for (const auto& [exportType, file] : files) {
        // The future is not needed, progress is reported by the task itself
        queue.enqueue([this, file = file, exportType = exportType, manifestUrl, currentRunId](const std::stop_token& stopToken) {
            auto count = downloadFile(file, exportType, manifestUrl, stopToken, currentRunId);
            fileFinished(currentRunId);
            return count;
        });
    }

    // Wait until every file has been processed, or the run was aborted
    std::unique_lock<std::mutex> lock(stateMutex);
    stateCV.wait(lock, [this] { return downloaded >= total || bAborted; });
}

void ManifestFetcher::fileFinished(uint64_t fileRunId) {
    uint64_t currentDownloaded = 0;
    uint64_t currentTotal = 0;
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        if (fileRunId != runId) {
            return;
        }

        currentDownloaded = ++downloaded;
        currentTotal = total;
    }

    auto events = getEvents();
    if (events && events->onProgress) {
        events->onProgress(currentDownloaded, currentTotal);
    }

    stateCV.notify_all();
}

auto ManifestFetcher::downloadFile(
        const sFileEntry& file,
        const std::string& exportType,
        const std::string& manifestUrl,
        const std::stop_token& stopToken,
        uint64_t fileRunId
) -> uint64_t {
    if (isAborted() || stopToken.stop_requested() || !isCurrentRun(fileRunId)) {
        return 0;
    }

    auto events = getEvents();
    if (events && events->onDownloadStart) {
        events->onDownloadStart(file.url);
    }

    uint64_t count = 0;
    sBulkErrorContext context;

    try {
        sFileTask task{file, resolveUrl(manifestUrl, file.url), options.destinationDir / exportType, stopToken, fileRunId};
        const auto& fileUrl = task.fileUrl;
        auto filePath = task.subfolder / safeFilename(urlBasename(fileUrl));
        std::filesystem::create_directories(task.subfolder);

        context.request = "GET " + fileUrl;
        context.filePath = filePath.string();

        std::ofstream output;
        std::string rejectedContentType;
        uint64_t lineNumber = 0;
        NdjsonLineBuffer lineBuffer;

        // Blank lines are counted so line numbers match the file
        auto onLine = [&](const std::string& line) {
            lineNumber++;
            if (!NdjsonLineBuffer::isBlank(line)) {
                processLine(line, lineNumber, task, output, count);
            }
        };

        auto response = httpGet(
                fileUrl,
                options.fileRequestHeaders,
                [&](const char* data, std::size_t size) { lineBuffer.push({data, size}, onLine); },
                stopToken,
                [&](const sHttpResponseInfo& info) {
                    if (!isNdjsonContentType(info.contentType())) {
                        rejectedContentType = info.contentType();
                        return false;
                    }

                    // Several manifests may write to the same file, so always append
                    output.open(filePath, std::ios::out | std::ios::app | std::ios::binary);
                    if (!output.is_open()) {
                        throw std::runtime_error("Unable to open " + filePath.string() + " for writing");
                    }
                    return true;
                }
        );
        context.response = response.statusLine;

        if (!response.isSuccess()) {
            context.issueType = notFoundOrProcessing(response.statusCode);
            throw std::runtime_error(
                    "Request to " + fileUrl + " failed with status " + std::to_string(response.statusCode)
            );
        }

        if (!rejectedContentType.empty()) {
            context.issueType = ISSUE_TYPE_INVALID;
            throw std::runtime_error("Unexpected content type " + rejectedContentType);
        }

        // A partially written file is left as it is
        if (isAborted() || stopToken.stop_requested()) {
            return count;
        }

        lineBuffer.flush(onLine);

        output.close();
        if (output.fail()) {
            throw std::runtime_error("Failed writing to " + filePath.string());
        }

        if (file.count && *file.count != count) {
            context.issueType = ISSUE_TYPE_INCOMPLETE;
            throw std::runtime_error(
                    "File " + file.url + " expected " + std::to_string(*file.count)
                    + " resources but got " + std::to_string(count)
            );
        }

        events = getEvents();
        if (events && events->onDownloadComplete && isCurrentRun(fileRunId)) {
            events->onDownloadComplete(file.url, count);
        }
    } catch (std::exception& e) {
        if (isAborted()) {
            return count;
        }

        emitError(eBulkError("Failed to download file " + urlBasename(file.url) + ": " + e.what(), context), fileRunId);
    }

    return count;
}

void ManifestFetcher::processLine(
        const std::string& line,
        uint64_t lineNumber,
        const sFileTask& task,
        std::ofstream& output,
        uint64_t& count
) {
    // Stop writing as soon as the download is cancelled
    if (task.stopToken.stop_requested()) {
        return;
    }

    const auto& fileUrl = task.fileUrl;

    sBulkErrorContext context;
    context.request = "GET " + fileUrl;
    context.filePath = (task.subfolder / urlBasename(fileUrl)).string();
    context.lineNumber = lineNumber;
    context.issueType = ISSUE_TYPE_INVALID;

    nlohmann::json resource;
    try {
        resource = nlohmann::json::parse(line);
    } catch (nlohmann::json::parse_error& e) {
        emitError(eBulkError(
                "Failed to download file " + urlBasename(fileUrl) + ": Invalid JSON at line "
                + std::to_string(lineNumber) + ": " + e.what(),
                context
        ), task.runId);
        return;
    }

    context.resource = resource;

    try {
        validateResource(resource, task.file.type);
    } catch (std::invalid_argument& e) {
        emitError(eBulkError("Failed to download file " + urlBasename(fileUrl) + ": " + e.what(), context), task.runId);
        return;
    }

    output << resource.dump() << '\n';
    count++;

    if (resource["resourceType"] == "DocumentReference") {
        downloadDocumentReferenceAttachments(resource, task);
    }
}

void ManifestFetcher::downloadDocumentReferenceAttachments(
        const nlohmann::json& documentReference,
        const sFileTask& task
) {
    if (!documentReference.contains("content") || !documentReference["content"].is_array()) {
        return;
    }

    const auto documentReferenceId = documentReference["id"].get<std::string>();

    for (const auto& content : documentReference["content"]) {
        // Check if aborted before processing each attachment
        if (isAborted() || task.stopToken.stop_requested()) {
            return;
        }

        if (!content.is_object() || !content.contains("attachment") || !content["attachment"].is_object()) {
            continue;
        }

        const auto& attachment = content["attachment"];

        if (attachment.contains("url") && attachment["url"].is_string() && !attachment["url"].get<std::string>().empty()) {
            downloadAttachment(attachment["url"].get<std::string>(), documentReferenceId, task);
        } else if (attachment.contains("data") && attachment["data"].is_string()
                   && !attachment["data"].get<std::string>().empty()) {
            saveInlineAttachment(attachment, documentReferenceId, task);
        }
    }
}

auto ManifestFetcher::resolveAttachmentUrl(const std::string& url, const std::string& fileUrl) const -> std::string {
    if (url.starts_with("http")) {
        return url;
    }

    auto baseUrl = options.fhirBaseUrl;
    if (!baseUrl.empty() && baseUrl.back() == '/') {
        baseUrl.pop_back();
    }

    if (url.starts_with("/")) {
        return baseUrl + url;
    }

    if (url.starts_with(".")) {
        return resolveUrl(fileUrl, url);
    }

    return baseUrl + "/" + url;
}

void ManifestFetcher::downloadAttachment(
        const std::string& url,
        const std::string& documentReferenceId,
        const sFileTask& task
) {
    if (isAborted() || task.stopToken.stop_requested()) {
        return;
    }

    sBulkErrorContext context;
    context.issueType = ISSUE_TYPE_PROCESSING;
    context.resource = nlohmann::json{{"resourceType", "DocumentReference"}, {"id", documentReferenceId}};

    try {
        auto absoluteUrl = resolveAttachmentUrl(url, task.fileUrl);
        context.request = "GET " + absoluteUrl;

        auto filename = urlBasename(absoluteUrl);
        if (filename.empty() || filename == "." || filename == "..") {
            filename = "document-" + documentReferenceId;
        }

        auto documentsDir = task.subfolder / "documents";
        auto filePath = documentsDir / safeFilename(filename);
        context.filePath = filePath.string();
        std::filesystem::create_directories(documentsDir);

        std::ofstream output;
        auto response = httpGet(
                absoluteUrl,
                options.fileRequestHeaders,
                [&output](const char* data, std::size_t size) {
                    output.write(data, static_cast<std::streamsize>(size));
                },
                task.stopToken,
                [&](const sHttpResponseInfo&) {
                    output.open(filePath, std::ios::out | std::ios::trunc | std::ios::binary);
                    if (!output.is_open()) {
                        throw std::runtime_error("Unable to open " + filePath.string() + " for writing");
                    }
                    return true;
                }
        );
        context.response = response.statusLine;

        if (!response.isSuccess()) {
            throw std::runtime_error(
                    "Request to " + absoluteUrl + " failed with status " + std::to_string(response.statusCode)
            );
        }

        output.close();
        if (output.fail()) {
            throw std::runtime_error("Failed writing to " + filePath.string());
        }
    } catch (std::exception& e) {
        if (isAborted()) {
            return;
        }

        emitError(eBulkError("Failed to download attachment from " + url + ": " + e.what(), context), task.runId);
    }
}

void ManifestFetcher::saveInlineAttachment(
        const nlohmann::json& attachment,
        const std::string& documentReferenceId,
        const sFileTask& task
) {
    if (isAborted()) {
        return;
    }

    sBulkErrorContext context;
    context.issueType = ISSUE_TYPE_PROCESSING;
    context.resource = nlohmann::json{{"resourceType", "DocumentReference"}, {"id", documentReferenceId}};

    try {
        // Throws on anything that isn't valid base64
        auto data = base64Decode(attachment["data"].get<std::string>());

        auto contentType = attachment.contains("contentType") && attachment["contentType"].is_string()
                           ? attachment["contentType"].get<std::string>() : std::string{};

        auto documentsDir = task.subfolder / "documents";
        auto filePath = documentsDir / safeFilename(documentReferenceId + extensionFromContentType(contentType));
        context.filePath = filePath.string();
        std::filesystem::create_directories(documentsDir);

        std::ofstream output(filePath, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!output.is_open()) {
            throw std::runtime_error("Unable to open " + filePath.string() + " for writing");
        }

        output.write(data.data(), static_cast<std::streamsize>(data.size()));
        output.close();
        if (output.fail()) {
            throw std::runtime_error("Failed writing to " + filePath.string());
        }
    } catch (std::exception& e) {
        emitError(eBulkError(
                "Failed to save inline attachment for DocumentReference " + documentReferenceId + ": " + e.what(),
                context
        ), task.runId);
    }
}

void ManifestFetcher::undoAll(const std::string& manifestUrl) {
    auto manifest = downloadManifest(manifestUrl);

    for (const auto& [exportType, file] : manifest.allFiles()) {
        sBulkErrorContext context;

        try {
            auto fileUrl = resolveUrl(manifestUrl, file.url);
            auto filePath = options.destinationDir / exportType / safeFilename(urlBasename(fileUrl));
            context.filePath = filePath.string();

            // remove() is a no-op for files that were never written
            std::filesystem::remove(filePath);
        } catch (std::exception& e) {
            emitError(eBulkError("Failed to delete file " + urlBasename(file.url) + ": " + e.what(), context));
        }
    }
}
