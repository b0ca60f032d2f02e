#ifndef NETPROV_SERVICES_INTERFACE_LOCKS_HPP
#define NETPROV_SERVICES_INTERFACE_LOCKS_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace netprov
{
    namespace services
    {

        /**
         * One mutual-exclusion token per interface name. Operations lock every
         * interface they reference, always in sorted order, so two operations
         * never wait on each other in a cycle.
         */
        class InterfaceLocks
        {
        public:
            class Guard
            {
            public:
                Guard() = default;
                explicit Guard(std::vector<std::shared_ptr<std::mutex>> held);
                ~Guard();

                Guard(Guard &&other) noexcept;
                Guard &operator=(Guard &&other) noexcept;
                Guard(const Guard &) = delete;
                Guard &operator=(const Guard &) = delete;

                size_t size() const { return held_.size(); }

            private:
                void release();

                std::vector<std::shared_ptr<std::mutex>> held_;
            };

            // Blocks until every named interface is free
            Guard acquire(std::vector<std::string> names);

        private:
            std::shared_ptr<std::mutex> token(const std::string &name);

            std::mutex table_mutex_;
            std::map<std::string, std::shared_ptr<std::mutex>> tokens_;
        };

    } // namespace services
} // namespace netprov

#endif // NETPROV_SERVICES_INTERFACE_LOCKS_HPP
