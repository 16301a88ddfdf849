//
// Created by lewis on 4/4/24.
//

#ifndef BULK_SUBMIT_SERVER_MANIFESTFETCHER_H
#define BULK_SUBMIT_SERVER_MANIFESTFETCHER_H

#include "../Lib/BulkError.h"
#include "../Lib/TaskQueue.h"
#include "../Lib/TestingMacros.h"
#include <client_http.hpp>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

struct sFileEntry {
    // The resource type every line of the file must have. Empty if the manifest doesn't say
    std::string type;
    std::string url;
    std::optional<uint64_t> count;
};

struct sManifest {
    std::string transactionTime;
    std::string request;
    bool requiresAccessToken = false;
    std::vector<sFileEntry> output;
    std::vector<sFileEntry> deleted;
    std::vector<sFileEntry> error;

    // Every file in download order, paired with the export type it belongs to
    [[nodiscard]] auto allFiles() const -> std::vector<std::pair<std::string, sFileEntry>>;

    // Throws std::invalid_argument if the manifest is structurally invalid
    static auto fromJson(const nlohmann::json& manifest) -> sManifest;
};

struct sManifestFetcherOptions {
    // Files are written to <destinationDir>/<output|deleted|error>/
    std::filesystem::path destinationDir;

    // Base for relative DocumentReference attachment urls
    std::string fhirBaseUrl;

    // Sent with every outbound request
    SimpleWeb::CaseInsensitiveMultimap fileRequestHeaders;
};

struct sManifestFetcherEvents {
    std::function<void()> onStart;
    std::function<void(uint64_t downloaded, uint64_t total)> onProgress;
    std::function<void(const eBulkError& error)> onError;
    std::function<void()> onComplete;
    std::function<void()> onAbort;
    std::function<void(const std::string& url)> onDownloadStart;
    std::function<void(const std::string& url, uint64_t count)> onDownloadComplete;
};

class ManifestFetcher {
public:
    explicit ManifestFetcher(sManifestFetcherOptions options);
    virtual ~ManifestFetcher();
    ManifestFetcher(ManifestFetcher const&) = delete;
    auto operator =(ManifestFetcher const&) -> ManifestFetcher& = delete;
    ManifestFetcher(ManifestFetcher&&) = delete;
    auto operator=(ManifestFetcher&&) -> ManifestFetcher& = delete;

    void setEvents(sManifestFetcherEvents events);

    // Detaches all event handlers. Handlers already running are allowed to finish
    void clearEvents();

    // Fetches the manifest and downloads every file it lists. Blocks until all files are processed, or until aborted.
    // Always emits start first and complete last
    void run(const std::string& manifestUrl);

    // Cancels the running and queued file downloads. Emits abort the first time it's called
    void abort();

    // Clears the aborted state and counters so the fetcher can run again
    void reset();

    // Fetches the manifest again and deletes every file that was written for it
    void undoAll(const std::string& manifestUrl);

    [[nodiscard]] auto getStatus() const -> std::string;

    [[nodiscard]] auto isAborted() const -> bool;

    [[nodiscard]] auto getOptions() const -> const sManifestFetcherOptions& { return options; }

    // Resolves a DocumentReference attachment url against the FHIR base url, or against the ndjson file url when it
    // starts with "."
    [[nodiscard]] auto resolveAttachmentUrl(const std::string& url, const std::string& fileUrl) const -> std::string;

private:
    // One queued file download
    struct sFileTask {
        sFileEntry file;
        std::string fileUrl;
        std::filesystem::path subfolder;
        std::stop_token stopToken;

        // The run the file was queued by. Anything a stale task reports is dropped
        uint64_t runId = 0;
    };

    auto downloadManifest(const std::string& manifestUrl) -> sManifest;
    void downloadAllFiles(const sManifest& manifest, const std::string& manifestUrl);
    auto downloadFile(
            const sFileEntry& file,
            const std::string& exportType,
            const std::string& manifestUrl,
            const std::stop_token& stopToken,
            uint64_t fileRunId
    ) -> uint64_t;
    void processLine(const std::string& line, uint64_t lineNumber, const sFileTask& task, std::ofstream& output, uint64_t& count);
    void downloadDocumentReferenceAttachments(const nlohmann::json& documentReference, const sFileTask& task);
    void downloadAttachment(const std::string& url, const std::string& documentReferenceId, const sFileTask& task);
    void saveInlineAttachment(const nlohmann::json& attachment, const std::string& documentReferenceId, const sFileTask& task);
    void fileFinished(uint64_t fileRunId);

    [[nodiscard]] auto isCurrentRun(uint64_t fileRunId) const -> bool;
    [[nodiscard]] auto getEvents() const -> std::shared_ptr<const sManifestFetcherEvents>;
    void emitError(const eBulkError& error) const;
    void emitError(const eBulkError& error, uint64_t fileRunId) const;

    sManifestFetcherOptions options;

    mutable std::mutex eventsMutex;
    std::shared_ptr<const sManifestFetcherEvents> pEvents;

    mutable std::mutex stateMutex;
    std::condition_variable stateCV;
    uint64_t total = 0;
    uint64_t downloaded = 0;
    bool bAborted = false;
    uint64_t runId = 0;

    // Cancels the manifest request, the file downloads are cancelled through the queue
    std::stop_source abortSource;

    TaskQueue<uint64_t> queue;

// Testing
EXPOSE_PROPERTY_FOR_TESTING(total);
EXPOSE_PROPERTY_FOR_TESTING(downloaded);
EXPOSE_FUNCTION_FOR_TESTING_ONE_PARAM(downloadManifest, const std::string&);
};

#endif //BULK_SUBMIT_SERVER_MANIFESTFETCHER_H
