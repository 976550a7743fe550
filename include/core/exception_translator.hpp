#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <functional>
#include <string>
#include <utility>

namespace ybadapter {

/**
 * @brief Runs a unit of work and normalizes its failures
 *
 * Driver database errors: rollback-if-open (its own driver failures are
 * logged and dropped so they cannot mask the server error), then
 * DatabaseError with the trimmed server message.
 *
 * Anything else: rollback-if-open (failures propagate), then adapter errors
 * are rethrown as-is and everything else is wrapped in RuntimeError.
 */
class ExceptionTranslator {
public:
    using RollbackFunc = std::function<void()>;

    explicit ExceptionTranslator(RollbackFunc rollback_if_open)
        : rollback_if_open_(std::move(rollback_if_open)) {}

    template<typename Fn>
    decltype(auto) run(const std::string& sql, Fn&& fn) {
        try {
            return std::forward<Fn>(fn)();
        } catch (const DriverDatabaseError& e) {
            utils::log::debug(std::format("{} error: {}", kDatabaseLabel, e.what()));
            try {
                rollback_if_open_();
            } catch (const DriverError& rollback_error) {
                utils::log::debug(std::format("Failed to release connection! ({})",
                    utils::trim(rollback_error.what())));
            }
            throw DatabaseError(utils::trim(e.what()));
        } catch (const std::exception& e) {
            utils::log::debug(std::format("Error running SQL: {}", sql));
            utils::log::debug("Rolling back transaction.");
            rollback_if_open_();
            if (dynamic_cast<const AdapterError*>(&e) != nullptr) {
                throw;
            }
            throw RuntimeError(e.what());
        }
    }

private:
    static constexpr const char* kDatabaseLabel = "Yugabytedb";

    RollbackFunc rollback_if_open_;
};

} // namespace ybadapter
