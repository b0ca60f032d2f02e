#ifndef NETPROV_SERVICES_PROGRESS_CHANNEL_HPP
#define NETPROV_SERVICES_PROGRESS_CHANNEL_HPP

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "model/network_objects.hpp"

namespace netprov
{
    namespace services
    {

        enum class Severity
        {
            INFO,
            WARNING,
            ERROR,
            CRITICAL
        };

        std::string to_string(Severity severity);

        /**
         * One discrete step of a provisioning operation
         */
        struct ProgressEvent
        {
            uint64_t sequence = 0;
            std::string operation_id; // "op-17"
            model::ObjectKind kind = model::ObjectKind::WIRELESS;
            std::string key;
            std::string state; // driver state or reconciler phase
            std::string message;
            Severity severity = Severity::INFO;
            int64_t timestamp = 0; // Unix milliseconds
        };

        /**
         * Subscribe / notify stream of progress events. Subscribers run
         * synchronously on the publishing thread; the newest events are also
         * retained for polling readers.
         */
        class ProgressChannel
        {
        public:
            using Subscriber = std::function<void(const ProgressEvent &)>;

            explicit ProgressChannel(size_t retained = 256);

            int subscribe(Subscriber subscriber);
            void unsubscribe(int id);

            uint64_t publish(const std::string &operation_id, model::ObjectKind kind, const std::string &key,
                             const std::string &state, const std::string &message,
                             Severity severity = Severity::INFO);

            // Retained events with sequence > after, oldest first
            std::vector<ProgressEvent> since(uint64_t after) const;

            uint64_t last_sequence() const;
            size_t retained() const { return capacity_; }

            std::string next_operation_id();

        private:
            size_t capacity_;
            mutable std::mutex mutex_;
            std::deque<ProgressEvent> events_;
            uint64_t sequence_ = 0;

            std::mutex subscribers_mutex_;
            std::map<int, Subscriber> subscribers_;
            int next_subscriber_ = 1;

            std::atomic<uint64_t> operation_counter_{0};
        };

    } // namespace services
} // namespace netprov

#endif // NETPROV_SERVICES_PROGRESS_CHANNEL_HPP
