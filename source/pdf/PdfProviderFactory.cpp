// ============================================================================
// PdfProviderFactory - Platform-specific PDF provider creation
// ============================================================================
// Selects the rasterizer backend for this build:
//   - Alpine Linux (musl): MuPDF (avoids symbol collision with Poppler/OpenJPEG)
//   - PAGEFORGE_USE_MUPDF_RASTERIZER: MuPDF (build option)
//   - Desktop (glibc): Poppler (feature-rich, system library)
// ============================================================================

#include "PdfProvider.h"

#include <QDebug>

#include <memory>

// ============================================================================
// Platform Detection
// ============================================================================
// On musl, both MuPDF and Poppler use OpenJPEG for JPEG2000. When both are
// loaded as shared libraries, MuPDF's custom allocators get called by
// Poppler's OpenJPEG, causing crashes. musl doesn't define __GLIBC__.
// ============================================================================

#if defined(PAGEFORGE_USE_MUPDF_RASTERIZER)
    #define PAGEFORGE_USE_MUPDF 1

#elif defined(__linux__) && !defined(__GLIBC__)
    #define PAGEFORGE_USE_MUPDF 1

#else
    #define PAGEFORGE_USE_POPPLER 1

#endif

#ifdef PAGEFORGE_USE_MUPDF
#include "MuPdfProvider.h"
using PdfProviderImpl = MuPdfProvider;
#else
#include "PopplerPdfProvider.h"
using PdfProviderImpl = PopplerPdfProvider;
#endif

// ============================================================================
// Factory Methods
// ============================================================================

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath)
{
    auto provider = std::make_unique<PdfProviderImpl>(pdfPath);
    if (provider->isValid()) {
        return provider;
    }
    qWarning() << "[PdfProvider] Cannot open" << pdfPath << "with" << provider->backendName();
    return nullptr;
}
