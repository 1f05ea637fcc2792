#pragma once

#include <chrono>
#include <string>

#include "core/jobs/CancellationToken.hpp"

namespace core::model {

    struct FetchSettings {
        int maxAttempts = 3;
        std::chrono::seconds retryDelay{5};
        long connectTimeoutSeconds = 30;
        long timeoutSeconds = 300;
    };

    /**
     * @brief Downloads remote models over HTTP(S) with libcurl.
     */
    class ModelFetcher {
    public:
        explicit ModelFetcher(FetchSettings settings = {});

        virtual ~ModelFetcher();

        ModelFetcher(const ModelFetcher &) = delete;

        ModelFetcher &operator=(const ModelFetcher &) = delete;

        /**
         * @brief Download @p url to @p destination, blocking; retries transient failures.
         * @return false if the token was cancelled before the download finished
         * @throws core::types::ModelFetchException once every attempt failed
         */
        virtual bool fetch(const std::string &url, const std::string &destination,
                           jobs::CancellationToken &cancellation);

    private:
        FetchSettings settings_;

        /**
         * @return Empty string on success, the error otherwise
         */
        std::string performSingleDownload(const std::string &url, const std::string &destination,
                                          jobs::CancellationToken &cancellation);

        static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);
    };

} // namespace core::model
