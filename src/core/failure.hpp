#pragma once

#include "core/result.hpp"

#include <QString>

#include <exception>
#include <optional>
#include <string>
#include <variant>

namespace folio {

/**
 * Failure - the value a pipeline run fails with.
 *
 * Either a structured Error (data loading, contract violations) or the exact
 * value a user handler raised, captured as an exception_ptr. Raised values
 * are never wrapped or converted: a handler that throws std::string("D'oh")
 * yields a Failure whose raised_as<std::string>() is "D'oh", and rethrow()
 * throws that same object again.
 */
class Failure {
public:
    enum class Origin {
        DataLoad,   // a data source could not be loaded
        Handler,    // a user handler raised or reported a failure
        Contract    // a handler broke the pipeline's calling contract
    };

    Failure() = default;

    [[nodiscard]] static Failure from_error(Origin origin, Error error);
    [[nodiscard]] static Failure contract(std::string message);
    [[nodiscard]] static Failure raised(std::exception_ptr value);

    [[nodiscard]] Origin origin() const noexcept { return origin_; }

    [[nodiscard]] bool is_error() const noexcept { return std::holds_alternative<Error>(value_); }
    [[nodiscard]] bool is_raised() const noexcept { return !is_error(); }

    // Only valid when is_error().
    [[nodiscard]] const Error& error() const;

    // The captured value, or nullptr when is_error().
    [[nodiscard]] std::exception_ptr exception() const noexcept;

    /**
     * Copy of the raised value if it was thrown as (or derives from) T.
     */
    template<typename T>
    [[nodiscard]] std::optional<T> raised_as() const {
        const auto ptr = exception();
        if (!ptr) return std::nullopt;
        try {
            std::rethrow_exception(ptr);
        } catch (const T& value) {
            return value;
        } catch (...) {
            return std::nullopt;
        }
    }

    /**
     * Throws the raised value unchanged, or std::runtime_error carrying the
     * structured error's message.
     */
    [[noreturn]] void rethrow() const;

    // One line for logs and the command line.
    [[nodiscard]] QString describe() const;

private:
    Origin origin_{Origin::Contract};
    std::variant<Error, std::exception_ptr> value_;
};

[[nodiscard]] QString origin_name(Failure::Origin origin);

} // namespace folio
