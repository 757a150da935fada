#pragma once

// Wrapper for MuPDF Model

#include "PanelTypes.hpp"

#include <QImage>
#include <QSize>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <array>
#include <mutex>
#include <optional>

extern "C"
{
#include <mupdf/fitz.h>
}

#define CSTR(x) x.toStdString().c_str()

class Model
{
public:
    Model() noexcept;
    ~Model() noexcept;

    Model(const Model &)            = delete;
    Model &operator=(const Model &) = delete;

    // structure to carry the "Life Support" for the image memory
    struct RenderPayload
    {
        fz_context *ctx;
        fz_pixmap *pix;
    };

    inline fz_context *cloneContext() const noexcept
    {
        return fz_clone_context(m_ctx);
    }

    inline QString filePath() const noexcept
    {
        return m_filepath;
    }

    inline int numPages() const noexcept
    {
        return m_page_count;
    }

    inline bool success() const noexcept
    {
        return m_doc != nullptr;
    }

    inline void setZoom(float zoom) noexcept
    {
        m_zoom = zoom;
    }

    inline float zoom() const noexcept
    {
        return m_zoom;
    }

    bool openFile(const QString &filepath) noexcept;
    void cleanup() noexcept;

    // Size of the page in points, unscaled.
    std::optional<QSizeF> pageBounds(int pageno) const noexcept;

    // Size of the page in pixels at the model zoom.
    std::optional<QSize> pageSize(int pageno) const noexcept;

    // Whole page scaled to fit `target` (aspect kept).
    QImage renderPage(int pageno, const QSize &target) const noexcept;

    // The `rect` part of the page scaled to exactly `frame` pixels.
    QImage renderPageRegion(int pageno, const QSize &frame,
                            const PixelRect &rect) const noexcept;

    // Archive entry of the page for comic book archives, else the document
    // file name.
    QString pageFilename(int pageno) const noexcept;

private:
    void initMuPDF() noexcept;
    void readArchiveEntries() noexcept;
    QImage renderScaled(int pageno, float sx, float sy,
                        const fz_irect &bbox) const noexcept;

    fz_context *m_ctx{nullptr};
    fz_document *m_doc{nullptr};
    fz_locks_context m_fz_locks{};
    QString m_filepath;
    QStringList m_archive_entries;
    int m_page_count{0};
    float m_zoom{1.0f};
};
