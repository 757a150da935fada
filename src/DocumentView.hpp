#pragma once

#include "HostDocument.hpp"
#include "Model.hpp"

#include <QImage>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPaintEvent>
#include <QResizeEvent>
#include <QString>
#include <QTimer>
#include <QWidget>

struct Config;

// Single page view: the current page fitted into the widget. Clicking the
// right half turns forward, the left half backward, unless a panel-zoom
// handler is installed and takes the click.
class DocumentView : public QWidget, public HostDocument
{
    Q_OBJECT
public:
    DocumentView(const Config &config, QWidget *parent = nullptr) noexcept;
    ~DocumentView() noexcept;

    inline const Config &config() const noexcept
    {
        return m_config;
    }

    inline Model &model() noexcept
    {
        return m_model;
    }

    inline bool isOpen() const noexcept
    {
        return m_model.success();
    }

    // 1-based
    inline int pageNo() const noexcept
    {
        return m_pageno + 1;
    }

    inline int numPages() const noexcept
    {
        return m_model.numPages();
    }

    // Widget pixels the page image occupies
    inline QRect pageRect() const noexcept
    {
        return m_page_rect;
    }

    bool openFile(const QString &filePath, int startPage = 1) noexcept;
    void closeFile() noexcept;
    bool gotoPage(int pageno) noexcept;
    void nextPage() noexcept;
    void prevPage() noexcept;
    void firstPage() noexcept;
    void lastPage() noexcept;

    // HostDocument
    std::vector<PageProbe> pageNumberProbes() const noexcept override;
    std::optional<QRect> viewArea() const noexcept override;
    std::optional<QSize> nativePageSize(int pageno) const noexcept override;
    QImage cropPageRegion(int pageno, const DisplayRect &frame,
                          const PixelRect &rect) noexcept override;
    void turnPage(int direction) noexcept override;
    QString documentPath() const noexcept override;
    QString pageFilename(int pageno) const noexcept override;
    QSize screenSize() const noexcept override;
    bool ditheringEnabled() const noexcept override;
    PanelZoomHandler *panelZoomHandler() const noexcept override;
    void setPanelZoomHandler(PanelZoomHandler *handler) noexcept override;

signals:
    void pageChanged(int pageno, int numPages);
    void fileOpened(const QString &filePath);
    void fileClosed();
    void openFileFailed(const QString &filePath);

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    void requestRender() noexcept;
    void renderCurrentPage() noexcept;
    QRect fittedPageRect() const noexcept;

    const Config &m_config;
    Model m_model;
    QImage m_page_image;
    QRect m_page_rect;
    QTimer *m_render_timer{nullptr};
    PanelZoomHandler *m_panel_zoom_handler{nullptr};
    QPoint m_press_pos;
    int m_pageno{0};          // 0-based
    int m_rendered_page{-1};  // 0-based page of m_page_image
    int m_start_page{1};
};
