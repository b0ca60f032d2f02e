#ifndef NETPROV_CORE_ERRORS_HPP
#define NETPROV_CORE_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/network_objects.hpp"

namespace netprov
{
    namespace core
    {

        enum class ErrorKind
        {
            VALIDATION_CONFLICT,
            INTERFACE_NOT_FOUND,
            DEPENDENCY_EXISTS,
            OBJECT_NOT_FOUND,
            DRIVER_FAILURE,
            ROLLBACK_FAILURE,
            STORE_FAILURE
        };

        // "ValidationConflict", "RollbackFailure", ...
        std::string to_string(ErrorKind kind);

        /**
         * Base of every error the engine reports to its callers. Carries enough
         * detail (object kind, key, step, cause) to render a specific message.
         */
        class ProvisionError : public std::runtime_error
        {
        public:
            ProvisionError(ErrorKind error_kind, model::ObjectKind object_kind, const std::string &key,
                           const std::string &step, const std::string &cause, const std::string &detail);

            ErrorKind error_kind() const { return error_kind_; }
            model::ObjectKind object_kind() const { return object_kind_; }
            const std::string &key() const { return key_; }
            const std::string &step() const { return step_; }
            const std::string &cause() const { return cause_; }

            /**
             * Rejected before anything touched the host.
             */
            bool leaves_state_unchanged() const;

            /**
             * Desired and live state may have drifted; needs a human.
             */
            bool operator_attention() const { return error_kind_ == ErrorKind::ROLLBACK_FAILURE; }

        private:
            ErrorKind error_kind_;
            model::ObjectKind object_kind_;
            std::string key_;
            std::string step_;
            std::string cause_;
        };

        class ValidationConflict : public ProvisionError
        {
        public:
            ValidationConflict(model::ObjectKind kind, const std::string &key, const std::string &reason);
        };

        class InterfaceNotFound : public ProvisionError
        {
        public:
            InterfaceNotFound(model::ObjectKind kind, const std::string &key, const std::string &interface);

            const std::string &interface() const { return interface_; }

        private:
            std::string interface_;
        };

        class DependencyExists : public ProvisionError
        {
        public:
            DependencyExists(model::ObjectKind kind, const std::string &key,
                             const std::vector<std::string> &dependents);

            // Qualified keys such as "hotspot:eth0.10"
            const std::vector<std::string> &dependents() const { return dependents_; }

        private:
            std::vector<std::string> dependents_;
        };

        class ObjectNotFound : public ProvisionError
        {
        public:
            ObjectNotFound(model::ObjectKind kind, const std::string &key);
        };

        class DriverFailure : public ProvisionError
        {
        public:
            DriverFailure(model::ObjectKind kind, const std::string &key,
                          const std::string &step, const std::string &cause);
        };

        class RollbackFailure : public ProvisionError
        {
        public:
            RollbackFailure(model::ObjectKind kind, const std::string &key,
                            const std::string &step, const std::string &cause);
        };

        class StoreFailure : public ProvisionError
        {
        public:
            StoreFailure(model::ObjectKind kind, const std::string &key, const std::string &cause);
        };

    } // namespace core
} // namespace netprov

#endif // NETPROV_CORE_ERRORS_HPP
