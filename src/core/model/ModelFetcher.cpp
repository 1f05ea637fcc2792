#include "core/model/ModelFetcher.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <thread>

namespace core::model {

    namespace {
        int progressCallback(void *clientp, curl_off_t dltotal, curl_off_t dlnow,
                             curl_off_t ultotal, curl_off_t ulnow) {
            (void) dltotal;
            (void) dlnow;
            (void) ultotal;
            (void) ulnow;

            auto *cancellation = static_cast<jobs::CancellationToken *>(clientp);
            return cancellation->isCancelled() ? 1 : 0; // non-zero aborts the transfer
        }
    }

    ModelFetcher::ModelFetcher(FetchSettings settings)
            : settings_(settings) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ModelFetcher::~ModelFetcher() {
        curl_global_cleanup();
    }

    bool ModelFetcher::fetch(const std::string &url, const std::string &destination,
                             jobs::CancellationToken &cancellation) {
        std::string lastError;

        for (int attempt = 1; attempt <= settings_.maxAttempts; ++attempt) {
            if (cancellation.isCancelled()) {
                return false;
            }

            Logger::logInfo("[ModelFetcher] Download attempt #" + std::to_string(attempt) + " for URL: " + url);
            lastError = performSingleDownload(url, destination, cancellation);
            if (lastError.empty()) {
                return true;
            }
            if (cancellation.isCancelled()) {
                Logger::logInfo("[ModelFetcher] Download cancelled: " + url);
                return false;
            }
            if (attempt == settings_.maxAttempts) {
                break;
            }

            Logger::logWarning("[ModelFetcher] Download failed on attempt #" + std::to_string(attempt) +
                               ". Retrying in " + std::to_string(settings_.retryDelay.count()) + " seconds...");

            auto deadline = std::chrono::steady_clock::now() + settings_.retryDelay;
            while (std::chrono::steady_clock::now() < deadline && !cancellation.isCancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        throw types::ModelFetchException("Cannot download " + url + ": " + lastError);
    }

    std::string ModelFetcher::performSingleDownload(const std::string &url, const std::string &destination,
                                                    jobs::CancellationToken &cancellation) {
        std::ofstream outFile(destination, std::ios::binary | std::ios::trunc);
        if (!outFile.is_open()) {
            Logger::logError("[ModelFetcher] Cannot create file: " + destination);
            return "cannot create " + destination;
        }

        CURL *curl = curl_easy_init();
        if (!curl) {
            Logger::logError("[ModelFetcher] Failed to initialize CURL");
            outFile.close();
            std::error_code ec;
            std::filesystem::remove(destination, ec);
            return "failed to initialize libcurl";
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &outFile);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancellation);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, settings_.connectTimeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, settings_.timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "conveyor/1.0");

        CURLcode res = curl_easy_perform(curl);
        long responseCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);

        curl_easy_cleanup(curl);
        outFile.close();

        std::string error;
        std::error_code ec;

        if (res != CURLE_OK) {
            error = "download failed: " + std::string(curl_easy_strerror(res));
        } else if (responseCode != 200) {
            error = "HTTP error: " + std::to_string(responseCode);
        } else if (!std::filesystem::exists(destination) || std::filesystem::file_size(destination, ec) == 0) {
            error = "downloaded file is empty or missing";
        }

        if (!error.empty()) {
            if (!cancellation.isCancelled()) {
                Logger::logError("[ModelFetcher] " + error);
            }
            std::filesystem::remove(destination, ec);
            return error;
        }

        Logger::logInfo("[ModelFetcher] Download completed: " + destination + " (" +
                        std::to_string(std::filesystem::file_size(destination, ec)) + " bytes)");
        return "";
    }

    size_t ModelFetcher::writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
        auto *file = static_cast<std::ofstream *>(userp);
        size_t totalSize = size * nmemb;
        file->write(static_cast<char *>(contents), static_cast<std::streamsize>(totalSize));
        return file->good() ? totalSize : 0;
    }

} // namespace core::model
