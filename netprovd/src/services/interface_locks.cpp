#include "services/interface_locks.hpp"

#include <algorithm>

namespace netprov
{
    namespace services
    {

        InterfaceLocks::Guard::Guard(std::vector<std::shared_ptr<std::mutex>> held)
            : held_(std::move(held))
        {
        }

        InterfaceLocks::Guard::~Guard()
        {
            release();
        }

        InterfaceLocks::Guard::Guard(Guard &&other) noexcept
            : held_(std::move(other.held_))
        {
            other.held_.clear();
        }

        InterfaceLocks::Guard &InterfaceLocks::Guard::operator=(Guard &&other) noexcept
        {
            if (this != &other)
            {
                release();
                held_ = std::move(other.held_);
                other.held_.clear();
            }
            return *this;
        }

        void InterfaceLocks::Guard::release()
        {
            for (auto it = held_.rbegin(); it != held_.rend(); ++it)
            {
                (*it)->unlock();
            }
            held_.clear();
        }

        std::shared_ptr<std::mutex> InterfaceLocks::token(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            auto &slot = tokens_[name];
            if (!slot)
            {
                slot = std::make_shared<std::mutex>();
            }
            return slot;
        }

        InterfaceLocks::Guard InterfaceLocks::acquire(std::vector<std::string> names)
        {
            std::sort(names.begin(), names.end());
            names.erase(std::unique(names.begin(), names.end()), names.end());
            names.erase(std::remove(names.begin(), names.end(), std::string()), names.end());

            std::vector<std::shared_ptr<std::mutex>> held;
            held.reserve(names.size());
            for (const auto &name : names)
            {
                auto mutex = token(name);
                mutex->lock();
                held.push_back(std::move(mutex));
            }
            return Guard(std::move(held));
        }

    } // namespace services
} // namespace netprov
