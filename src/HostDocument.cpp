#include "HostDocument.hpp"

#include <QDebug>

int
resolveCurrentPage(const std::vector<HostDocument::PageProbe> &probes,
                   int fallback) noexcept
{
    for (const HostDocument::PageProbe &p : probes)
    {
        if (!p.probe)
            continue;

        if (const std::optional<int> page = p.probe())
        {
#ifndef NDEBUG
            qDebug() << "resolveCurrentPage():" << p.name << "->" << *page;
#endif
            return *page;
        }
    }

#ifndef NDEBUG
    qDebug() << "resolveCurrentPage(): Using fallback page number" << fallback;
#endif
    return fallback;
}
