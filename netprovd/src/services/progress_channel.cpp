#include "services/progress_channel.hpp"

#include <chrono>

namespace netprov
{
    namespace services
    {

        std::string to_string(Severity severity)
        {
            switch (severity)
            {
            case Severity::INFO:
                return "info";
            case Severity::WARNING:
                return "warning";
            case Severity::ERROR:
                return "error";
            case Severity::CRITICAL:
                return "critical";
            }
            return "info";
        }

        ProgressChannel::ProgressChannel(size_t retained)
            : capacity_(retained == 0 ? 1 : retained)
        {
        }

        int ProgressChannel::subscribe(Subscriber subscriber)
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            int id = next_subscriber_++;
            subscribers_[id] = std::move(subscriber);
            return id;
        }

        void ProgressChannel::unsubscribe(int id)
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            subscribers_.erase(id);
        }

        std::string ProgressChannel::next_operation_id()
        {
            return "op-" + std::to_string(++operation_counter_);
        }

        uint64_t ProgressChannel::publish(const std::string &operation_id, model::ObjectKind kind,
                                          const std::string &key, const std::string &state,
                                          const std::string &message, Severity severity)
        {
            ProgressEvent event;
            event.operation_id = operation_id;
            event.kind = kind;
            event.key = key;
            event.state = state;
            event.message = message;
            event.severity = severity;
            event.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                event.sequence = ++sequence_;
                events_.push_back(event);
                while (events_.size() > capacity_)
                {
                    events_.pop_front();
                }
            }

            std::vector<Subscriber> targets;
            {
                std::lock_guard<std::mutex> lock(subscribers_mutex_);
                for (const auto &entry : subscribers_)
                {
                    targets.push_back(entry.second);
                }
            }
            for (const auto &subscriber : targets)
            {
                subscriber(event);
            }

            return event.sequence;
        }

        std::vector<ProgressEvent> ProgressChannel::since(uint64_t after) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<ProgressEvent> result;
            for (const auto &event : events_)
            {
                if (event.sequence > after)
                {
                    result.push_back(event);
                }
            }
            return result;
        }

        uint64_t ProgressChannel::last_sequence() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return sequence_;
        }

    } // namespace services
} // namespace netprov
