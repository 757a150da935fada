#pragma once

#include "PanelTypes.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

// Panel rectangles of one open document, read from the sidecar JSON file
// that sits next to it (same base name, ".json" extension).
//
// The sidecar is parsed once and cached; `resolve()` then only walks the
// cached JSON. Which page is current and when the cache is stale is decided
// by the caller.
class PanelCatalog
{
public:
    enum class Source
    {
        None = 0,
        PagesArray, // "pages": [{"page": N, "panels": [...]}, ...]
        PagesKeyed, // "pages": {"page001.jpg": [...], "1": [...]}
        FlatPanels  // "panels": [...] for every page
    };

    struct Lookup
    {
        PanelList panels;
        ReadingDirection direction{ReadingDirection::LTR};
        Source source{Source::None};
    };

    PanelCatalog() = default;

    static QString sidecarPathFor(const QString &documentPath) noexcept;

    bool load(const QString &path) noexcept;
    bool loadFromData(const QByteArray &data) noexcept;
    void clear() noexcept;

    Lookup resolve(int pageno, const QString &filename) const noexcept;

    inline bool isLoaded() const noexcept
    {
        return m_loaded;
    }

    inline ReadingDirection readingDirection() const noexcept
    {
        return m_direction;
    }

    inline const QString &sourcePath() const noexcept
    {
        return m_source_path;
    }

    inline const QString &lastError() const noexcept
    {
        return m_last_error;
    }

private:
    PanelList lookupPagesArray(int pageno) const noexcept;
    PanelList lookupPagesKeyed(int pageno,
                               const QString &filename) const noexcept;
    PanelList lookupFlatPanels() const noexcept;

    static PanelList parsePanels(const QJsonValue &value) noexcept;
    static PanelData parsePanel(const QJsonObject &obj) noexcept;

    QJsonObject m_root;
    QString m_source_path;
    QString m_last_error;
    ReadingDirection m_direction{ReadingDirection::LTR};
    bool m_loaded{false};
};
