#pragma once

#include "core/completion.hpp"
#include "core/glob.hpp"
#include "core/page.hpp"

#include <QString>
#include <QVariant>
#include <QVariantMap>

#include <functional>
#include <variant>
#include <vector>

namespace folio::pipeline {

// Handler shapes. Synchronous handlers report failure by throwing any
// value; asynchronous handlers by Done::fail().
using TransformFn = std::function<Page(Page)>;
using TransformAsyncFn = std::function<void(Page, Done<Page>)>;
using TransformAllFn = std::function<PageList(PageList)>;
using TransformAllAsyncFn = std::function<void(PageList, Done<PageList>)>;
using DataFn = std::function<void(Done<QVariant>)>;
using QuerySelector = std::function<PageList(const PageList&)>;
using GenerateFn = std::function<void(const PageList&, const PageFactory&, Done<PageList>)>;

struct DataFile {
    QString file_name;
};

struct DataOp {
    QString name;
    std::variant<DataFile, DataFn> source;
};

struct IgnoreOp {
    Glob pattern;
};

struct MetadataOp {
    Glob pattern;
    QVariantMap values;
};

struct LayoutOp {
    Glob pattern;
    QString layout;
};

struct QueryOp {
    QString name;
    QuerySelector selector;  // empty: every page in collection order
};

struct TransformOp {
    Glob pattern;
    std::variant<TransformFn, TransformAsyncFn> handler;
};

struct TransformAllOp {
    std::variant<TransformAllFn, TransformAllAsyncFn> handler;
};

struct GenerateOp {
    GenerateFn generator;
};

using Operation = std::variant<DataOp, IgnoreOp, MetadataOp, LayoutOp, QueryOp,
                               TransformOp, TransformAllOp, GenerateOp>;

/**
 * Registry - every registered operation in call order.
 *
 * Entries are stored as given; patterns are only matched against pages
 * when a stage runs. Each stage reads the operations of its own kind,
 * which keeps relative registration order (sync and async transforms
 * stay interleaved as registered).
 */
class Registry {
public:
    void add(Operation op) { operations_.push_back(std::move(op)); }

    template<typename Op>
    [[nodiscard]] std::vector<const Op*> of_kind() const {
        std::vector<const Op*> out;
        for (const auto& op : operations_) {
            if (const auto* typed = std::get_if<Op>(&op)) {
                out.push_back(typed);
            }
        }
        return out;
    }

    [[nodiscard]] size_t size() const noexcept { return operations_.size(); }

private:
    std::vector<Operation> operations_;
};

} // namespace folio::pipeline
