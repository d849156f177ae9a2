#include "core/failure.hpp"

#include <stdexcept>

namespace folio {

namespace {

QString describe_raised(const std::exception_ptr& ptr) {
    try {
        std::rethrow_exception(ptr);
    } catch (const std::exception& e) {
        return QString::fromUtf8(e.what());
    } catch (const std::string& s) {
        return QString::fromStdString(s);
    } catch (const char* s) {
        return QString::fromUtf8(s);
    } catch (const QString& s) {
        return s;
    } catch (const Error& e) {
        return QString::fromStdString(e.message);
    } catch (...) {
        return QStringLiteral("non-standard value");
    }
}

} // namespace

Failure Failure::from_error(Origin origin, Error error) {
    Failure f;
    f.origin_ = origin;
    f.value_ = std::move(error);
    return f;
}

Failure Failure::contract(std::string message) {
    return from_error(Origin::Contract, Error{std::move(message)});
}

Failure Failure::raised(std::exception_ptr value) {
    if (!value) {
        return contract("failure reported without a value");
    }
    Failure f;
    f.origin_ = Origin::Handler;
    f.value_ = std::move(value);
    return f;
}

const Error& Failure::error() const {
    if (!is_error()) {
        throw std::logic_error("Failure::error() on a raised value");
    }
    return std::get<Error>(value_);
}

std::exception_ptr Failure::exception() const noexcept {
    if (const auto* ptr = std::get_if<std::exception_ptr>(&value_)) {
        return *ptr;
    }
    return nullptr;
}

void Failure::rethrow() const {
    if (const auto ptr = exception()) {
        std::rethrow_exception(ptr);
    }
    throw std::runtime_error(error().message);
}

QString Failure::describe() const {
    const auto what = is_error() ? QString::fromStdString(error().message)
                                 : describe_raised(exception());
    return origin_name(origin_) + QStringLiteral(": ") + what;
}

QString origin_name(Failure::Origin origin) {
    switch (origin) {
        case Failure::Origin::DataLoad: return QStringLiteral("data load failed");
        case Failure::Origin::Handler: return QStringLiteral("handler failed");
        case Failure::Origin::Contract: return QStringLiteral("contract violation");
    }
    return QStringLiteral("failed");
}

} // namespace folio
