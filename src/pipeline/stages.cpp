#include "pipeline/stages.hpp"

#include "core/completion.hpp"
#include "core/logging.hpp"
#include "data/data_loader.hpp"

#include <exception>
#include <iterator>
#include <type_traits>
#include <utility>
#include <variant>

namespace folio::pipeline {

namespace {

template<typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

StageResult fail(Failure failure) {
    return StageResult::err(std::move(failure));
}

StageResult contract_violation(const QString& message) {
    qCCritical(folioPipelineLog) << message;
    return fail(Failure::contract(message.toStdString()));
}

StageResult check_unique(const PageList& pages, const QString& stage) {
    if (const auto duplicate = find_duplicate_src(pages)) {
        return contract_violation(stage + QStringLiteral(" produced duplicate page src: ") + *duplicate);
    }
    return StageResult::ok();
}

StageResult check_same_src(const QString& expected, const Page& returned, const QString& label) {
    if (returned.src() != expected) {
        return contract_violation(label + QStringLiteral(" returned page '") + returned.src() +
                                  QStringLiteral("' in place of '") + expected + QLatin1Char('\''));
    }
    return StageResult::ok();
}

using DataOutcome = std::variant<Result<QVariant, Failure>, Pending<QVariant>>;

DataOutcome start_data(const DataOp& op,
                       size_t index,
                       const data::DataLoader& loader,
                       const QString& source_dir) {
    return std::visit(
        Overloaded{
            [&](const DataFile& file) -> DataOutcome {
                return loader.load(source_dir, file.file_name, op.name).map_err([](Error e) {
                    return Failure::from_error(Failure::Origin::DataLoad, std::move(e));
                });
            },
            [&](const DataFn& fn) -> DataOutcome {
                const auto label = QStringLiteral("data #%1 '%2'").arg(index).arg(op.name);
                return invoke_async<QVariant>(label, [&fn](const Done<QVariant>& done) { fn(done); });
            },
        },
        op.source);
}

// True once the outcome is known to be a failure, without waiting.
bool already_failed(const DataOutcome& outcome) {
    if (const auto* pending = std::get_if<Pending<QVariant>>(&outcome)) {
        return pending->failed();
    }
    return std::get<Result<QVariant, Failure>>(outcome).is_err();
}

Result<QVariant, Failure> finish_data(DataOutcome outcome) {
    if (auto* pending = std::get_if<Pending<QVariant>>(&outcome)) {
        return pending->wait();
    }
    return std::get<Result<QVariant, Failure>>(std::move(outcome));
}

template<typename Fn, typename Arg>
Result<std::invoke_result_t<const Fn&, Arg>, Failure> call_sync(const Fn& fn, Arg&& arg) {
    using Out = Result<std::invoke_result_t<const Fn&, Arg>, Failure>;
    try {
        return Out::ok(fn(std::forward<Arg>(arg)));
    } catch (...) {
        return Out::err(Failure::raised(std::current_exception()));
    }
}

StageResult run_sync_transform(const TransformOp& op, const TransformFn& fn, size_t index, PageList& pages) {
    for (auto& page : pages) {
        if (!op.pattern.matches(page.src())) continue;

        const QString src = page.src();
        auto out = call_sync(fn, std::move(page));
        if (out.is_err()) {
            return fail(std::move(out).unwrap_err());
        }
        auto check = check_same_src(src, out.unwrap(), QStringLiteral("transform #%1").arg(index));
        if (check.is_err()) {
            return check;
        }
        page = std::move(out).unwrap();
    }
    return StageResult::ok();
}

StageResult run_async_transform(const TransformOp& op, const TransformAsyncFn& fn, size_t index, PageList& pages) {
    struct InFlight {
        size_t position;
        QString label;
        Pending<Page> pending;
    };

    // Start every matching page before waiting on any of them.
    std::vector<InFlight> in_flight;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (!op.pattern.matches(pages[i].src())) continue;

        auto label = QStringLiteral("transform_async #%1 on %2").arg(index).arg(pages[i].src());
        auto pending = invoke_async<Page>(label, [&fn, &page = pages[i]](const Done<Page>& done) {
            fn(page, done);
        });
        if (pending.failed()) {
            // Pages not yet started are never handed to the handler.
            return fail(pending.wait().unwrap_err());
        }
        in_flight.push_back(InFlight{i, std::move(label), std::move(pending)});
    }

    for (auto& job : in_flight) {
        auto out = job.pending.wait();
        if (out.is_err()) {
            return fail(std::move(out).unwrap_err());
        }
        auto check = check_same_src(pages[job.position].src(), out.unwrap(), job.label);
        if (check.is_err()) {
            return check;
        }
        pages[job.position] = std::move(out).unwrap();
    }
    return StageResult::ok();
}

} // namespace

StageResult run_data_stage(const std::vector<const DataOp*>& ops,
                           PageList& pages,
                           const data::DataLoader& loader,
                           const QString& source_dir) {
    qCDebug(folioPipelineLog) << "data stage:" << ops.size() << "operation(s)";

    std::vector<DataOutcome> outcomes;
    outcomes.reserve(ops.size());
    for (size_t i = 0; i < ops.size(); ++i) {
        auto outcome = start_data(*ops[i], i, loader, source_dir);
        if (already_failed(outcome)) {
            return fail(finish_data(std::move(outcome)).unwrap_err());
        }
        outcomes.push_back(std::move(outcome));
    }

    QVariantMap values;
    for (size_t i = 0; i < ops.size(); ++i) {
        auto value = finish_data(std::move(outcomes[i]));
        if (value.is_err()) {
            return fail(std::move(value).unwrap_err());
        }
        values.insert(ops[i]->name, std::move(value).unwrap());
    }

    for (auto& page : pages) {
        for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
            page.data.insert(it.key(), it.value());
        }
    }
    return StageResult::ok();
}

void apply_ignore(const std::vector<const IgnoreOp*>& ops, PageList& pages) {
    for (const auto* op : ops) {
        for (auto& page : pages) {
            if (op->pattern.matches(page.src())) {
                page.ignore = true;
            }
        }
    }
}

void apply_metadata(const std::vector<const MetadataOp*>& ops, PageList& pages) {
    for (const auto* op : ops) {
        for (auto& page : pages) {
            if (!op->pattern.matches(page.src())) continue;
            for (auto it = op->values.constBegin(); it != op->values.constEnd(); ++it) {
                // Keys the page already owns are kept.
                if (!page.metadata.contains(it.key())) {
                    page.metadata.insert(it.key(), it.value());
                }
            }
        }
    }
}

void apply_layout(const std::vector<const LayoutOp*>& ops, PageList& pages) {
    for (const auto* op : ops) {
        for (auto& page : pages) {
            if (op->pattern.matches(page.src())) {
                page.layout = op->layout;
            }
        }
    }
}

StageResult run_query_stage(const std::vector<const QueryOp*>& ops, PageList& pages) {
    qCDebug(folioPipelineLog) << "query stage:" << ops.size() << "query(ies)";

    PageList next = pages;
    for (const auto* op : ops) {
        QueryResult snapshot;
        if (op->selector) {
            auto selected = call_sync(op->selector, std::as_const(next));
            if (selected.is_err()) {
                return fail(std::move(selected).unwrap_err());
            }
            snapshot = std::make_shared<const PageList>(std::move(selected).unwrap());
        } else {
            snapshot = std::make_shared<const PageList>(next);
        }
        for (auto& page : next) {
            page.queries.insert(op->name, snapshot);
        }
    }
    pages = std::move(next);
    return StageResult::ok();
}

StageResult run_transform_stage(const std::vector<const TransformOp*>& ops, PageList& pages) {
    qCDebug(folioPipelineLog) << "transform stage:" << ops.size() << "operation(s)";

    PageList next = pages;
    for (size_t i = 0; i < ops.size(); ++i) {
        const auto& op = *ops[i];
        auto result = std::visit(
            Overloaded{
                [&](const TransformFn& fn) { return run_sync_transform(op, fn, i, next); },
                [&](const TransformAsyncFn& fn) { return run_async_transform(op, fn, i, next); },
            },
            op.handler);
        if (result.is_err()) {
            return result;
        }
    }
    pages = std::move(next);
    return StageResult::ok();
}

StageResult run_transform_all_stage(const std::vector<const TransformAllOp*>& ops, PageList& pages) {
    qCDebug(folioPipelineLog) << "transform_all stage:" << ops.size() << "operation(s)";

    PageList next = pages;
    for (size_t i = 0; i < ops.size(); ++i) {
        auto out = std::visit(
            Overloaded{
                [&](const TransformAllFn& fn) { return call_sync(fn, std::move(next)); },
                [&](const TransformAllAsyncFn& fn) {
                    const auto label = QStringLiteral("transform_all_async #%1").arg(i);
                    return invoke_async<PageList>(label, [&fn, &next](const Done<PageList>& done) {
                        fn(next, done);
                    }).wait();
                },
            },
            ops[i]->handler);
        if (out.is_err()) {
            return fail(std::move(out).unwrap_err());
        }
        next = std::move(out).unwrap();

        auto check = check_unique(next, QStringLiteral("transform_all #%1").arg(i));
        if (check.is_err()) {
            return check;
        }
    }
    pages = std::move(next);
    return StageResult::ok();
}

StageResult run_generate_stage(const std::vector<const GenerateOp*>& ops, PageList& pages) {
    qCDebug(folioPipelineLog) << "generate stage:" << ops.size() << "generator(s)";

    const PageFactory factory;
    PageList next = pages;
    for (size_t i = 0; i < ops.size(); ++i) {
        const auto& generate = ops[i]->generator;
        const auto label = QStringLiteral("generate #%1").arg(i);

        // Generators see pages appended by earlier generators.
        auto out = invoke_async<PageList>(label, [&](const Done<PageList>& done) {
            generate(next, factory, done);
        }).wait();
        if (out.is_err()) {
            return fail(std::move(out).unwrap_err());
        }

        auto generated = std::move(out).unwrap();
        qCDebug(folioPipelineLog) << label << "produced" << generated.size() << "page(s)";
        next.insert(next.end(),
                    std::make_move_iterator(generated.begin()),
                    std::make_move_iterator(generated.end()));

        auto check = check_unique(next, label);
        if (check.is_err()) {
            return check;
        }
    }
    pages = std::move(next);
    return StageResult::ok();
}

} // namespace folio::pipeline
