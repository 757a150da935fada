#include "Model.hpp"

#include <QCollator>
#include <QDebug>
#include <QFileInfo>
#include <algorithm>
#include <cmath>

static std::array<std::mutex, FZ_LOCK_MAX> mupdf_mutexes;

// This is called by Qt when the last copy of the QImage is destroyed
static void
imageCleanupHandler(void *info) noexcept
{
    Model::RenderPayload *payload = static_cast<Model::RenderPayload *>(info);
    if (payload)
    {
        // Drop the pixmap first, then the context
        fz_drop_pixmap(payload->ctx, payload->pix);
        fz_drop_context(payload->ctx);
        delete payload;
    }
}

static void
mupdf_lock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].lock();
}

static void
mupdf_unlock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].unlock();
}

static bool
isImageEntry(const QString &name) noexcept
{
    static const QStringList exts
        = {"jpg", "jpeg", "png", "gif", "bmp", "tif", "tiff", "webp", "jxr"};
    return exts.contains(QFileInfo(name).suffix().toLower());
}

Model::Model() noexcept
{
    initMuPDF();
}

Model::~Model() noexcept
{
    cleanup();
    fz_drop_context(m_ctx);
}

void
Model::initMuPDF() noexcept
{
    // initialize each mutex
    m_fz_locks.user   = mupdf_mutexes.data();
    m_fz_locks.lock   = mupdf_lock_mutex;
    m_fz_locks.unlock = mupdf_unlock_mutex;
    m_ctx             = fz_new_context(nullptr, &m_fz_locks, FZ_STORE_DEFAULT);
    if (!m_ctx)
    {
        qCritical() << "Model::initMuPDF(): Cannot create MuPDF context";
        return;
    }
    fz_register_document_handlers(m_ctx);
}

void
Model::cleanup() noexcept
{
    if (m_ctx)
        fz_drop_document(m_ctx, m_doc);
    m_doc        = nullptr;
    m_page_count = 0;
    m_filepath.clear();
    m_archive_entries.clear();
}

bool
Model::openFile(const QString &filepath) noexcept
{
    if (!m_ctx)
        initMuPDF();
    if (!m_ctx)
        return false;

    cleanup();

    bool ok = false;
    fz_try(m_ctx)
    {
        m_doc = fz_open_document(m_ctx, CSTR(filepath));
        if (!m_doc)
            fz_throw(m_ctx, FZ_ERROR_GENERIC, "Failed to open document");

        m_page_count = fz_count_pages(m_ctx, m_doc);
        ok           = true;
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Model::openFile(): Cannot open" << filepath << ":"
                   << fz_caught_message(m_ctx);
        ok = false;
    }

    if (!ok)
    {
        cleanup();
        return false;
    }

    m_filepath = QFileInfo(filepath).absoluteFilePath();
    readArchiveEntries();

#ifndef NDEBUG
    qDebug() << "Model::openFile(): Opened" << m_filepath << "with"
             << m_page_count << "pages";
#endif
    return true;
}

// Comic book archives render their image entries in natural order, which is
// what page N refers to.
void
Model::readArchiveEntries() noexcept
{
    m_archive_entries.clear();

    const QString ext = QFileInfo(m_filepath).suffix().toLower();
    if (ext != "cbz" && ext != "zip" && ext != "cbt" && ext != "tar")
        return;

    fz_archive *archive{nullptr};
    QStringList entries;

    fz_try(m_ctx)
    {
        archive         = fz_open_archive(m_ctx, CSTR(m_filepath));
        const int count = fz_count_archive_entries(m_ctx, archive);
        for (int i = 0; i < count; ++i)
        {
            const char *name = fz_list_archive_entry(m_ctx, archive, i);
            if (!name)
                continue;
            const QString entry = QString::fromUtf8(name);
            if (isImageEntry(entry))
                entries.push_back(entry);
        }
    }
    fz_always(m_ctx)
    {
        fz_drop_archive(m_ctx, archive);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Model::readArchiveEntries(): Cannot list archive:"
                   << fz_caught_message(m_ctx);
        return;
    }

    QCollator collator;
    collator.setNumericMode(true);
    std::sort(entries.begin(), entries.end(),
              [&collator](const QString &a, const QString &b)
    { return collator.compare(a, b) < 0; });

    if (entries.size() == m_page_count)
        m_archive_entries = entries;
}

QString
Model::pageFilename(int pageno) const noexcept
{
    if (pageno >= 0 && pageno < m_archive_entries.size())
        return QFileInfo(m_archive_entries.at(pageno)).fileName();
    return QFileInfo(m_filepath).fileName();
}

std::optional<QSizeF>
Model::pageBounds(int pageno) const noexcept
{
    if (!m_doc || pageno < 0 || pageno >= m_page_count)
        return std::nullopt;

    fz_page *page{nullptr};
    fz_rect bounds{};

    fz_try(m_ctx)
    {
        page   = fz_load_page(m_ctx, m_doc, pageno);
        bounds = fz_bound_page(m_ctx, page);
    }
    fz_always(m_ctx)
    {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Model::pageBounds(): Cannot load page" << pageno << ":"
                   << fz_caught_message(m_ctx);
        return std::nullopt;
    }

    const QSizeF size(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
    if (size.width() <= 0 || size.height() <= 0)
        return std::nullopt;
    return size;
}

std::optional<QSize>
Model::pageSize(int pageno) const noexcept
{
    const std::optional<QSizeF> bounds = pageBounds(pageno);
    if (!bounds)
        return std::nullopt;

    return QSize(static_cast<int>(std::lround(bounds->width() * m_zoom)),
                 static_cast<int>(std::lround(bounds->height() * m_zoom)));
}

QImage
Model::renderPage(int pageno, const QSize &target) const noexcept
{
    const std::optional<QSizeF> bounds = pageBounds(pageno);
    if (!bounds || target.isEmpty())
        return QImage();

    const float scale = static_cast<float>(
        std::min(target.width() / bounds->width(),
                 target.height() / bounds->height()));

    const fz_irect bbox = {0, 0,
                           static_cast<int>(std::lround(bounds->width() * scale)),
                           static_cast<int>(
                               std::lround(bounds->height() * scale))};
    return renderScaled(pageno, scale, scale, bbox);
}

QImage
Model::renderPageRegion(int pageno, const QSize &frame,
                        const PixelRect &rect) const noexcept
{
    const std::optional<QSizeF> bounds = pageBounds(pageno);
    if (!bounds || frame.isEmpty() || rect.isEmpty())
        return QImage();

    const float sx = static_cast<float>(frame.width() / bounds->width());
    const float sy = static_cast<float>(frame.height() / bounds->height());

    const fz_irect bbox
        = {rect.x(), rect.y(), rect.x() + rect.width(), rect.y() + rect.height()};
    return renderScaled(pageno, sx, sy, bbox);
}

QImage
Model::renderScaled(int pageno, float sx, float sy,
                    const fz_irect &bbox) const noexcept
{
    if (!m_doc)
        return QImage();

    fz_context *ctx = cloneContext();
    if (!ctx)
    {
        qWarning() << "Model::renderScaled(): Failed to clone context";
        return QImage();
    }

    fz_page *page{nullptr};
    fz_pixmap *pix{nullptr};
    fz_device *dev{nullptr};
    QImage image;

    fz_try(ctx)
    {
        page                   = fz_load_page(ctx, m_doc, pageno);
        const fz_rect bounds   = fz_bound_page(ctx, page);
        const fz_matrix to_dev = fz_concat(fz_translate(-bounds.x0, -bounds.y0),
                                           fz_scale(sx, sy));

        pix = fz_new_pixmap_with_bbox(ctx, fz_device_rgb(ctx), bbox, nullptr, 0);
        fz_clear_pixmap_with_value(ctx, pix, 255);

        dev = fz_new_draw_device(ctx, fz_identity, pix);
        fz_run_page(ctx, page, dev, to_dev, nullptr);
        fz_close_device(ctx, dev);

        const int width  = fz_pixmap_width(ctx, pix);
        const int height = fz_pixmap_height(ctx, pix);
        const int stride = fz_pixmap_stride(ctx, pix);
        unsigned char *samples = fz_pixmap_samples(ctx, pix);

        if (!samples || fz_pixmap_components(ctx, pix) != 3)
            fz_throw(ctx, FZ_ERROR_GENERIC, "Unexpected pixmap layout");

        RenderPayload *payload = new RenderPayload{ctx, pix};
        image = QImage(samples, width, height, stride, QImage::Format_RGB888,
                       imageCleanupHandler, payload);
    }
    fz_always(ctx)
    {
        fz_drop_device(ctx, dev);
        fz_drop_page(ctx, page);
    }
    fz_catch(ctx)
    {
        qWarning() << "Model::renderScaled(): MuPDF error on page" << pageno
                   << ":" << fz_caught_message(ctx);
        fz_drop_pixmap(ctx, pix);
        fz_drop_context(ctx);
        return QImage();
    }

    return image;
}
