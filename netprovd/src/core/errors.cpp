#include "core/errors.hpp"

namespace netprov
{
    namespace core
    {

        namespace
        {
            std::string join(const std::vector<std::string> &items)
            {
                std::string out;
                for (const auto &item : items)
                {
                    if (!out.empty())
                    {
                        out += ", ";
                    }
                    out += item;
                }
                return out;
            }
        } // namespace

        std::string to_string(ErrorKind kind)
        {
            switch (kind)
            {
            case ErrorKind::VALIDATION_CONFLICT:
                return "ValidationConflict";
            case ErrorKind::INTERFACE_NOT_FOUND:
                return "InterfaceNotFound";
            case ErrorKind::DEPENDENCY_EXISTS:
                return "DependencyExists";
            case ErrorKind::OBJECT_NOT_FOUND:
                return "ObjectNotFound";
            case ErrorKind::DRIVER_FAILURE:
                return "DriverFailure";
            case ErrorKind::ROLLBACK_FAILURE:
                return "RollbackFailure";
            case ErrorKind::STORE_FAILURE:
                return "StoreFailure";
            }
            return "ProvisionError";
        }

        ProvisionError::ProvisionError(ErrorKind error_kind, model::ObjectKind object_kind, const std::string &key,
                                       const std::string &step, const std::string &cause, const std::string &detail)
            : std::runtime_error(to_string(error_kind) + ": " + detail),
              error_kind_(error_kind), object_kind_(object_kind), key_(key), step_(step), cause_(cause)
        {
        }

        bool ProvisionError::leaves_state_unchanged() const
        {
            switch (error_kind_)
            {
            case ErrorKind::VALIDATION_CONFLICT:
            case ErrorKind::INTERFACE_NOT_FOUND:
            case ErrorKind::DEPENDENCY_EXISTS:
            case ErrorKind::OBJECT_NOT_FOUND:
                return true;
            default:
                return false;
            }
        }

        ValidationConflict::ValidationConflict(model::ObjectKind kind, const std::string &key,
                                               const std::string &reason)
            : ProvisionError(ErrorKind::VALIDATION_CONFLICT, kind, key, "validate", reason,
                             model::qualified_key(kind, key) + ": " + reason)
        {
        }

        InterfaceNotFound::InterfaceNotFound(model::ObjectKind kind, const std::string &key,
                                             const std::string &interface)
            : ProvisionError(ErrorKind::INTERFACE_NOT_FOUND, kind, key, "validate",
                             "interface " + interface + " does not exist",
                             model::qualified_key(kind, key) + ": interface " + interface + " does not exist"),
              interface_(interface)
        {
        }

        DependencyExists::DependencyExists(model::ObjectKind kind, const std::string &key,
                                           const std::vector<std::string> &dependents)
            : ProvisionError(ErrorKind::DEPENDENCY_EXISTS, kind, key, "dependency-check",
                             "referenced by " + join(dependents), "[" + join(dependents) + "]"),
              dependents_(dependents)
        {
        }

        ObjectNotFound::ObjectNotFound(model::ObjectKind kind, const std::string &key)
            : ProvisionError(ErrorKind::OBJECT_NOT_FOUND, kind, key, "lookup", "no such object",
                             model::qualified_key(kind, key) + " is not configured")
        {
        }

        DriverFailure::DriverFailure(model::ObjectKind kind, const std::string &key,
                                     const std::string &step, const std::string &cause)
            : ProvisionError(ErrorKind::DRIVER_FAILURE, kind, key, step, cause,
                             model::qualified_key(kind, key) + " failed at " + step + ": " + cause)
        {
        }

        RollbackFailure::RollbackFailure(model::ObjectKind kind, const std::string &key,
                                         const std::string &step, const std::string &cause)
            : ProvisionError(ErrorKind::ROLLBACK_FAILURE, kind, key, step, cause,
                             model::qualified_key(kind, key) + " could not be rolled back at " + step + ": " + cause)
        {
        }

        StoreFailure::StoreFailure(model::ObjectKind kind, const std::string &key, const std::string &cause)
            : ProvisionError(ErrorKind::STORE_FAILURE, kind, key, "persist", cause,
                             model::qualified_key(kind, key) + ": " + cause)
        {
        }

    } // namespace core
} // namespace netprov
