#include "cli/page_output.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace folio::cli {

namespace {

[[nodiscard]] QString render_page_line(const Page& page) {
    QString line = page.src();
    if (page.layout) {
        line += QStringLiteral("  [layout: ") + *page.layout + QLatin1Char(']');
    }
    if (page.ignore) {
        line += QStringLiteral("  (ignored)");
    }
    return line;
}

[[nodiscard]] QJsonArray query_to_json(const PageList& pages) {
    QJsonArray out;
    for (const auto& page : pages) {
        out.append(page.src());
    }
    return out;
}

[[nodiscard]] QJsonObject page_to_json(const Page& page, bool include_content) {
    QJsonObject obj;
    obj.insert(QStringLiteral("src"), page.src());
    obj.insert(QStringLiteral("ignore"), page.ignore);
    if (page.layout) {
        obj.insert(QStringLiteral("layout"), *page.layout);
    }
    obj.insert(QStringLiteral("metadata"), QJsonObject::fromVariantMap(page.metadata));
    obj.insert(QStringLiteral("data"), QJsonObject::fromVariantMap(page.data));

    QJsonObject queries;
    for (auto it = page.queries.constBegin(); it != page.queries.constEnd(); ++it) {
        queries.insert(it.key(), it.value() ? query_to_json(*it.value()) : QJsonArray{});
    }
    obj.insert(QStringLiteral("queries"), queries);

    if (include_content) {
        obj.insert(QStringLiteral("content"), page.content);
    }
    return obj;
}

} // namespace

QString format_pages(const PageList& pages, const OutputOptions& options) {
    QStringList out;
    for (const auto& page : pages) {
        if (page.ignore && !options.include_ignored) continue;
        out.append(render_page_line(page));
    }
    if (out.isEmpty()) {
        return {};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_pages_json(const PageList& pages, const OutputOptions& options) {
    QJsonArray out;
    for (const auto& page : pages) {
        if (page.ignore && !options.include_ignored) continue;
        out.append(page_to_json(page, options.include_content));
    }
    return QString::fromUtf8(QJsonDocument(out).toJson(QJsonDocument::Indented));
}

} // namespace folio::cli
