#pragma once

#include "core/failure.hpp"
#include "core/logging.hpp"
#include "core/result.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QMetaObject>
#include <QMutex>
#include <QString>
#include <QWaitCondition>

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace folio {

template<typename T>
class Done;

template<typename T>
class Pending;

namespace detail {

template<typename T>
struct CompletionState {
    QMutex mutex;
    QWaitCondition settled;
    std::optional<Result<T, Failure>> outcome;
    QEventLoop* waiter{nullptr};

    void settle(Result<T, Failure> value) {
        QMutexLocker lock(&mutex);
        if (outcome) {
            return;
        }
        outcome.emplace(std::move(value));
        settled.wakeAll();
        if (waiter) {
            // Safe from any thread; the loop quits on its own thread.
            QMetaObject::invokeMethod(waiter, &QEventLoop::quit, Qt::QueuedConnection);
        }
    }
};

/**
 * Shared by every copy of a Done<T>. Destroying the last copy without an
 * invocation settles the completion with a contract failure, so a handler
 * that forgets its callback cannot stall the pipeline.
 */
template<typename T>
class Signal {
public:
    Signal(std::shared_ptr<CompletionState<T>> state, QString label)
        : state_(std::move(state)), label_(std::move(label)) {}

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    ~Signal() {
        if (!invoked_.load()) {
            qCCritical(folioPipelineLog) << "completion for" << label_
                                         << "was dropped without being invoked";
            state_->settle(Result<T, Failure>::err(Failure::contract(
                "completion for " + label_.toStdString() + " was dropped without being invoked")));
        }
    }

    void fire(Result<T, Failure> value) {
        if (invoked_.exchange(true)) {
            qCCritical(folioPipelineLog) << "completion for" << label_
                                         << "invoked more than once; keeping the first outcome";
            return;
        }
        state_->settle(std::move(value));
    }

private:
    std::shared_ptr<CompletionState<T>> state_;
    QString label_;
    std::atomic<bool> invoked_{false};
};

} // namespace detail

/**
 * Done<T> - single-shot completion handed to asynchronous handlers.
 *
 * Call it once with the result, or call fail() once with any value; the
 * failure value reaches the caller of transform_pages unchanged. Copies
 * share one signal and may be invoked from any thread.
 */
template<typename T>
class Done {
public:
    void operator()(T value) const {
        signal_->fire(Result<T, Failure>::ok(std::move(value)));
    }

    void fail(std::exception_ptr error) const {
        signal_->fire(Result<T, Failure>::err(Failure::raised(std::move(error))));
    }

    template<typename E>
        requires(!std::is_same_v<std::decay_t<E>, std::exception_ptr>)
    void fail(E&& error) const {
        fail(std::make_exception_ptr(std::forward<E>(error)));
    }

private:
    explicit Done(std::shared_ptr<detail::Signal<T>> signal) : signal_(std::move(signal)) {}

    template<typename U>
    friend struct Completion;

    std::shared_ptr<detail::Signal<T>> signal_;
};

/**
 * Pending<T> - the waiting side of a completion.
 */
template<typename T>
class Pending {
public:
    [[nodiscard]] bool ready() const {
        QMutexLocker lock(&state_->mutex);
        return state_->outcome.has_value();
    }

    // Settled with a failure already; wait() will return it immediately.
    [[nodiscard]] bool failed() const {
        QMutexLocker lock(&state_->mutex);
        return state_->outcome.has_value() && state_->outcome->is_err();
    }

    /**
     * Block until the completion settles and take its outcome. With a
     * QCoreApplication present this runs a local event loop, so handlers
     * may defer work with QTimer on the calling thread; otherwise only
     * immediate or cross-thread completion can make progress.
     */
    [[nodiscard]] Result<T, Failure> wait() {
        QMutexLocker lock(&state_->mutex);
        while (!state_->outcome) {
            if (QCoreApplication::instance()) {
                QEventLoop loop;
                state_->waiter = &loop;
                lock.unlock();
                loop.exec();
                lock.relock();
                state_->waiter = nullptr;
            } else {
                state_->settled.wait(&state_->mutex);
            }
        }
        // The optional stays engaged so late invocations are still rejected.
        return std::move(*state_->outcome);
    }

private:
    explicit Pending(std::shared_ptr<detail::CompletionState<T>> state) : state_(std::move(state)) {}

    template<typename U>
    friend struct Completion;

    std::shared_ptr<detail::CompletionState<T>> state_;
};

/**
 * Completion<T> - a connected Done/Pending pair.
 */
template<typename T>
struct Completion {
    Done<T> done;
    Pending<T> pending;

    [[nodiscard]] static Completion make(QString label) {
        auto state = std::make_shared<detail::CompletionState<T>>();
        auto signal = std::make_shared<detail::Signal<T>>(state, std::move(label));
        return Completion{Done<T>(std::move(signal)), Pending<T>(std::move(state))};
    }
};

/**
 * Invoke an asynchronous handler with a fresh Done<T> and return the
 * waiting side. Anything the handler throws before completing becomes the
 * failure. The local Done copy is released before returning, so a handler
 * that kept no copy and never invoked it settles immediately.
 */
template<typename T, typename Invoke>
[[nodiscard]] Pending<T> invoke_async(QString label, Invoke&& invoke) {
    auto completion = Completion<T>::make(std::move(label));
    auto pending = std::move(completion.pending);
    {
        auto done = std::move(completion.done);
        try {
            std::invoke(std::forward<Invoke>(invoke), done);
        } catch (...) {
            done.fail(std::current_exception());
        }
    }
    return pending;
}

} // namespace folio
