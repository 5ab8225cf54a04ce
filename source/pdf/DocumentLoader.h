#pragma once

// ============================================================================
// DocumentLoader - Rasterize a PDF into a Document
// ============================================================================

#include "../core/Document.h"
#include "../core/OperationResult.h"

#include <QString>

#include <atomic>

namespace DocumentLoader {

/**
 * @brief Rasterize every page of a PDF and load it into @p document.
 * @param path PDF file to open.
 * @param params Enhancement applied to each page after rasterization.
 * @param document Target. Left unchanged unless the whole load succeeds.
 * @param progress Optional. Rasterization reports [0, 0.5], enhancement (0.5, 1].
 * @param cancelled Optional flag, checked between pages.
 * @param dpi Rasterization resolution.
 * @return ResourceError if the file cannot be opened or a page fails to render.
 */
OperationResult loadPdf(const QString& path,
                        const EnhancementParameters& params,
                        Document& document,
                        const ProgressCallback& progress = nullptr,
                        const std::atomic<bool>* cancelled = nullptr,
                        int dpi = 200);

} // namespace DocumentLoader
