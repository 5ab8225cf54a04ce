// ============================================================================
// Document - Implementation
// ============================================================================

#include "Document.h"

#include <QDebug>

#include <utility>

// ============================================================================
// Loading & Processing
// ============================================================================

OperationResult Document::load(const QVector<QImage>& originals,
                               const EnhancementParameters& params,
                               const ProgressCallback& progress,
                               const std::atomic<bool>* cancelled)
{
    // Stage into a local vector so a cancelled load leaves us untouched
    std::vector<Page> staged;
    staged.reserve(originals.size());

    const int total = originals.size();
    for (int i = 0; i < total; ++i) {
        if (isCancelled(cancelled)) {
            qDebug() << "[Document] Load cancelled after" << i << "of" << total << "pages";
            return OperationResult::failure(ErrorKind::Cancelled,
                                            QStringLiteral("Load cancelled"));
        }

        Page page(originals.at(i));
        page.reprocess(params);
        staged.push_back(std::move(page));

        if (progress) {
            progress(static_cast<qreal>(i + 1) / total);
        }
    }

    m_pages = std::move(staged);
    qDebug() << "[Document] Loaded" << total << "pages with" << params.toString();
    return OperationResult::ok();
}

OperationResult Document::reprocessCurrent(int index, const EnhancementParameters& params)
{
    if (!isValidIndex(index)) {
        return OperationResult::failure(ErrorKind::InputError,
            QStringLiteral("Page index %1 out of range").arg(index + 1));
    }
    m_pages[index].reprocess(params);
    return OperationResult::ok();
}

OperationResult Document::reprocessAll(const EnhancementParameters& params,
                                       const ProgressCallback& progress,
                                       const std::atomic<bool>* cancelled)
{
    const int total = pageCount();
    for (int i = 0; i < total; ++i) {
        if (isCancelled(cancelled)) {
            qDebug() << "[Document] Reprocess cancelled after" << i << "of" << total << "pages";
            return OperationResult::failure(ErrorKind::Cancelled,
                                            QStringLiteral("Reprocess cancelled"));
        }
        m_pages[i].reprocess(params);
        if (progress) {
            progress(static_cast<qreal>(i + 1) / total);
        }
    }
    return OperationResult::ok();
}

OperationResult Document::revertCurrent(int index)
{
    if (!isValidIndex(index)) {
        return OperationResult::failure(ErrorKind::InputError,
            QStringLiteral("Page index %1 out of range").arg(index + 1));
    }
    m_pages[index].revert();
    return OperationResult::ok();
}

void Document::revertAll()
{
    for (Page& page : m_pages) {
        page.revert();
    }
}

// ============================================================================
// Page Management
// ============================================================================

QSize Document::referenceSize() const
{
    return m_pages.empty() ? QSize() : m_pages.front().size();
}

OperationResult Document::insertPage(int index, Page&& page)
{
    m_pages.insert(m_pages.begin() + index, std::move(page));
    qDebug() << "[Document] Inserted page at" << index << "- now" << pageCount() << "pages";
    return OperationResult::ok();
}

OperationResult Document::insertBlank(int index)
{
    if (m_pages.empty()) {
        return OperationResult::failure(ErrorKind::InputError,
            QStringLiteral("No reference page size: document is empty"));
    }
    if (index < 0 || index > pageCount()) {
        return OperationResult::failure(ErrorKind::InputError,
            QStringLiteral("Insert position %1 out of range").arg(index + 1));
    }
    return insertPage(index, Page::createBlank(referenceSize()));
}

OperationResult Document::insertText(int index, const QString& text)
{
    if (m_pages.empty()) {
        return OperationResult::failure(ErrorKind::InputError,
            QStringLiteral("No reference page size: document is empty"));
    }
    if (index < 0 || index > pageCount()) {
        return OperationResult::failure(ErrorKind::InputError,
            QStringLiteral("Insert position %1 out of range").arg(index + 1));
    }
    return insertPage(index, Page::createText(referenceSize(), text));
}

bool Document::move(int index, int direction)
{
    const int target = index + direction;
    if (!isValidIndex(index) || !isValidIndex(target) || index == target) {
        return false;
    }
    std::swap(m_pages[index], m_pages[target]);
    return true;
}

bool Document::removePage(int index)
{
    if (!isValidIndex(index)) {
        return false;
    }
    m_pages.erase(m_pages.begin() + index);
    return true;
}

// ============================================================================
// Selection
// ============================================================================

void Document::setSelected(int index, bool selected)
{
    if (isValidIndex(index)) {
        m_pages[index].selected = selected;
    }
}

void Document::toggleSelected(int index)
{
    if (isValidIndex(index)) {
        m_pages[index].selected = !m_pages[index].selected;
    }
}

bool Document::isSelected(int index) const
{
    return isValidIndex(index) && m_pages[index].selected;
}

QVector<int> Document::selectedIndices() const
{
    QVector<int> result;
    for (int i = 0; i < pageCount(); ++i) {
        if (m_pages[i].selected) {
            result.append(i);
        }
    }
    return result;
}

// ============================================================================
// Access
// ============================================================================

const Page* Document::page(int index) const
{
    return isValidIndex(index) ? &m_pages[index] : nullptr;
}

QImage Document::original(int index) const
{
    return isValidIndex(index) ? m_pages[index].original : QImage();
}

QImage Document::processed(int index) const
{
    return isValidIndex(index) ? m_pages[index].processed : QImage();
}

QVector<QImage> Document::processedPages(const QVector<int>& indices, bool selectedOnly) const
{
    QVector<int> order = indices;
    if (order.isEmpty()) {
        for (int i = 0; i < pageCount(); ++i) {
            order.append(i);
        }
    }

    QVector<QImage> result;
    result.reserve(order.size());
    for (int index : order) {
        if (!isValidIndex(index)) {
            continue;
        }
        if (selectedOnly && !m_pages[index].selected) {
            continue;
        }
        result.append(m_pages[index].processed);
    }
    return result;
}
