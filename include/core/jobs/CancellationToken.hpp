#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace core::jobs {

    /**
     * @brief Cooperative cancellation flag shared between the orchestrator and one job's worker.
     *
     * Callbacks registered through subscribe() run once, on the thread that calls cancel().
     * They must not call back into the token.
     */
    class CancellationToken {
    public:
        using Callback = std::function<void()>;

        /**
         * @brief Unregisters its callback on destruction
         */
        class Registration {
        public:
            Registration() = default;

            Registration(CancellationToken *token, uint64_t id) : token_(token), id_(id) {}

            Registration(const Registration &) = delete;

            Registration &operator=(const Registration &) = delete;

            Registration(Registration &&other) noexcept;

            Registration &operator=(Registration &&other) noexcept;

            ~Registration();

        private:
            CancellationToken *token_ = nullptr;
            uint64_t id_ = 0;
        };

        CancellationToken() = default;

        CancellationToken(const CancellationToken &) = delete;

        CancellationToken &operator=(const CancellationToken &) = delete;

        bool isCancelled() const noexcept { return cancelled_; }

        /**
         * @brief Set the flag and run the registered callbacks; later calls do nothing
         */
        void cancel();

        /**
         * @brief Register a callback; runs immediately if the token is already cancelled
         */
        [[nodiscard]] Registration subscribe(Callback callback);

    private:
        std::atomic<bool> cancelled_{false};
        std::mutex callbacksMutex_;
        std::map<uint64_t, Callback> callbacks_;
        uint64_t nextId_ = 1;

        void unsubscribe(uint64_t id);
    };

} // namespace core::jobs
