#include "cli/page_discovery.hpp"

#include "core/logging.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

namespace folio::cli {

Result<PageList> discover_pages(const QString& root) {
    const QFileInfo info(root);
    if (!info.exists() || !info.isDir()) {
        return Result<PageList>::err(Error{("Pages directory not found: " + root).toStdString()});
    }

    const QDir base(info.absoluteFilePath());
    QStringList sources;
    QDirIterator it(base.absolutePath(), QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        sources.append(base.relativeFilePath(it.next()));
    }
    sources.sort();

    PageList pages;
    pages.reserve(static_cast<size_t>(sources.size()));
    for (const auto& src : sources) {
        QFile file(base.filePath(src));
        if (!file.open(QIODevice::ReadOnly)) {
            return Result<PageList>::err(Error{
                ("Cannot read page " + src + ": " + file.errorString()).toStdString()});
        }
        pages.push_back(create_page(src, QString::fromUtf8(file.readAll())));
    }

    qCDebug(folioCliLog) << "discovered" << pages.size() << "page(s) under" << base.absolutePath();
    return Result<PageList>::ok(std::move(pages));
}

} // namespace folio::cli
