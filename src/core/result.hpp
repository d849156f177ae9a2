#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace folio {

/**
 * Error - a known failure from a collaborator (loader, config parser,
 * page discovery), carrying a human readable message and an optional code.
 */
struct Error {
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}

    bool operator==(const Error&) const = default;
};

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 * Used wherever an operation can fail in an expected way; exceptions are
 * reserved for user-supplied handler code.
 *
 *   Result<QVariant> load(...);
 *   auto page_count = discover_pages(root).map([](const PageList& p) { return p.size(); });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Access the value. Throws std::runtime_error when called on an error;
     * check is_ok() first or use map/and_then.
     */
    [[nodiscard]] T& unwrap() & {
        require_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        require_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        require_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        require_err();
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        require_err();
        return std::get<1>(data_);
    }

    [[nodiscard]] E unwrap_err() && {
        require_err();
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using Out = Result<std::invoke_result_t<F, const T&>, E>;
        if (is_ok()) {
            return Out::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Out::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using Out = Result<std::invoke_result_t<F, T>, E>;
        if (is_ok()) {
            return Out::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Out::err(std::get<1>(std::move(data_)));
    }

    /**
     * map_err : Result<T, E> -> (E -> E2) -> Result<T, E2>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) && -> Result<T, std::invoke_result_t<F, E>> {
        using Out = Result<T, std::invoke_result_t<F, E>>;
        if (is_err()) {
            return Out::err(std::invoke(std::forward<F>(f), std::get<1>(std::move(data_))));
        }
        return Out::ok(std::get<0>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using Out = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return Out::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using Out = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return Out::err(std::get<1>(std::move(data_)));
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void require_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() on error: " + std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() on error");
        }
    }

    void require_err() const {
        if (is_err()) return;
        throw std::runtime_error("Result::unwrap_err() on success");
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] static Result err(E error) {
        Result r;
        r.ok_ = false;
        r.error_ = std::move(error);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !ok_; }

    void unwrap() const {
        if (ok_) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() on error: " + error_.message);
        } else {
            throw std::runtime_error("Result::unwrap() on error");
        }
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (ok_) {
            throw std::runtime_error("Result::unwrap_err() on success");
        }
        return error_;
    }

    [[nodiscard]] E unwrap_err() && {
        if (ok_) {
            throw std::runtime_error("Result::unwrap_err() on success");
        }
        return std::move(error_);
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        if (ok_) {
            return std::invoke(std::forward<F>(f));
        }
        return std::invoke_result_t<F>::err(error_);
    }

private:
    Result() = default;

    bool ok_{true};
    E error_{};
};

} // namespace folio
