#include "PanelCatalog.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

namespace
{
// Reads a numeric panel field, falling back when it is missing or not a
// number.
double
numberOr(const QJsonObject &obj, const char *key, double fallback) noexcept
{
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isDouble() ? v.toDouble() : fallback;
}

// True if `key` names the page number numerically ("1", "01", "1.0").
bool
keyMatchesPage(const QString &key, int pageno) noexcept
{
    bool ok        = false;
    const double n = key.trimmed().toDouble(&ok);
    return ok && std::isfinite(n) && n == static_cast<double>(pageno);
}
} // namespace

QString
PanelCatalog::sidecarPathFor(const QString &documentPath) noexcept
{
    if (documentPath.isEmpty())
        return QString();

    const QFileInfo info(documentPath);
    QString base = info.completeBaseName();
    if (base.isEmpty())
        base = info.fileName();

    return QDir(info.absolutePath()).filePath(base + ".json");
}

bool
PanelCatalog::load(const QString &path) noexcept
{
    clear();
    m_source_path = path;

    if (path.isEmpty())
    {
        m_last_error = "No document path";
        return false;
    }

    QFile file(path);
    if (!file.exists())
    {
        m_last_error = QString("Panel data not found at %1").arg(path);
        qWarning() << "PanelCatalog::load():" << m_last_error;
        return false;
    }

    if (!file.open(QIODevice::ReadOnly))
    {
        m_last_error
            = QString("Cannot read %1: %2").arg(path, file.errorString());
        qWarning() << "PanelCatalog::load():" << m_last_error;
        return false;
    }

    const QByteArray data = file.readAll();
    const QString source  = m_source_path;
    const bool ok         = loadFromData(data);
    m_source_path         = source;
    return ok;
}

bool
PanelCatalog::loadFromData(const QByteArray &data) noexcept
{
    m_root      = QJsonObject();
    m_direction = ReadingDirection::LTR;
    m_loaded    = false;
    m_last_error.clear();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError)
    {
        m_last_error = QString("Malformed panel data: %1 (offset %2)")
                           .arg(error.errorString())
                           .arg(error.offset);
        qWarning() << "PanelCatalog::loadFromData():" << m_last_error;
        return false;
    }

    if (!doc.isObject())
    {
        m_last_error = "Panel data root is not an object";
        qWarning() << "PanelCatalog::loadFromData():" << m_last_error;
        return false;
    }

    m_root   = doc.object();
    m_loaded = true;

    const QJsonValue dir = m_root.value("reading_direction");
    if (dir.isString())
        m_direction = readingDirectionFromString(dir.toString());

    qInfo() << "PanelCatalog::loadFromData(): Loaded panel data, reading "
               "direction"
            << readingDirectionToString(m_direction);
    return true;
}

void
PanelCatalog::clear() noexcept
{
    m_root = QJsonObject();
    m_source_path.clear();
    m_last_error.clear();
    m_direction = ReadingDirection::LTR;
    m_loaded    = false;
}

PanelCatalog::Lookup
PanelCatalog::resolve(int pageno, const QString &filename) const noexcept
{
    Lookup result;
    result.direction = m_direction;

    if (!m_loaded)
        return result;

    result.panels = lookupPagesArray(pageno);
    if (!result.panels.empty())
    {
        result.source = Source::PagesArray;
        return result;
    }

    result.panels = lookupPagesKeyed(pageno, filename);
    if (!result.panels.empty())
    {
        result.source = Source::PagesKeyed;
        return result;
    }

    result.panels = lookupFlatPanels();
    if (!result.panels.empty())
    {
        result.source = Source::FlatPanels;
        return result;
    }

#ifndef NDEBUG
    qDebug() << "PanelCatalog::resolve(): No panels match page" << pageno
             << "or filename" << filename;
#endif
    return result;
}

PanelList
PanelCatalog::lookupPagesArray(int pageno) const noexcept
{
    const QJsonValue pages = m_root.value("pages");
    if (!pages.isArray())
        return {};

    for (const QJsonValue &entry : pages.toArray())
    {
        if (!entry.isObject())
            continue;

        const QJsonObject obj = entry.toObject();
        const QJsonValue page = obj.value("page");
        if (!page.isDouble() || page.toDouble() != static_cast<double>(pageno))
            continue;

        return parsePanels(obj.value("panels"));
    }

    return {};
}

PanelList
PanelCatalog::lookupPagesKeyed(int pageno,
                               const QString &filename) const noexcept
{
    const QJsonValue pages = m_root.value("pages");

    if (pages.isObject())
    {
        const QJsonObject map = pages.toObject();

        if (!filename.isEmpty())
        {
            PanelList panels = parsePanels(map.value(filename));
            if (!panels.empty())
                return panels;
        }

        PanelList panels = parsePanels(map.value(QString::number(pageno)));
        if (!panels.empty())
            return panels;

        for (auto it = map.constBegin(); it != map.constEnd(); ++it)
        {
            if (!keyMatchesPage(it.key(), pageno))
                continue;
            panels = parsePanels(it.value());
            if (!panels.empty())
                return panels;
        }
        return {};
    }

    // Positional form: "pages": [[...page 1 panels...], [...page 2...]]
    if (pages.isArray())
    {
        const QJsonArray array = pages.toArray();
        if (pageno >= 1 && pageno <= array.size())
        {
            const QJsonValue v = array.at(pageno - 1);
            if (v.isArray())
                return parsePanels(v);
        }
    }

    return {};
}

PanelList
PanelCatalog::lookupFlatPanels() const noexcept
{
    return parsePanels(m_root.value("panels"));
}

PanelList
PanelCatalog::parsePanels(const QJsonValue &value) noexcept
{
    PanelList panels;
    if (!value.isArray())
        return panels;

    const QJsonArray array = value.toArray();
    panels.reserve(array.size());
    for (const QJsonValue &v : array)
    {
        if (!v.isObject())
            continue;
        panels.push_back(parsePanel(v.toObject()));
    }

    return panels;
}

PanelData
PanelCatalog::parsePanel(const QJsonObject &obj) noexcept
{
    PanelData panel;
    panel.x = numberOr(obj, "x", 0.0);
    panel.y = numberOr(obj, "y", 0.0);
    panel.w = numberOr(obj, "w", 1.0);
    panel.h = numberOr(obj, "h", 1.0);
    return panel;
}
