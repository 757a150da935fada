#include "Koma.hpp"

#include "TapRouter.hpp"
#include "utils.hpp"

#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QStandardPaths>
#include <algorithm>
#include <toml++/toml.hpp>

namespace
{

static inline void
set_title_format_if_present(toml::node_view<toml::node> n,
                            QString &title_format)
{
    if (auto v = n.value<std::string>())
    {
        QString window_title = QString::fromStdString(*v);
        window_title.replace("{}", "%1");
        title_format = window_title;
    }
}

template <typename T>
static inline void
set(toml::node_view<toml::node> node, T &target)
{
    if (auto v = node.value<T>())
        target = *v;
}

static inline void
set_color(toml::node_view<toml::node> n, uint32_t &dst)
{
    if (auto s = n.value<std::string>())
    {
        uint32_t tmp = dst;
        if (parseHexColor(*s, tmp))
            dst = tmp;
        else
            qWarning() << "Koma::initConfig(): Invalid color"
                       << QString::fromStdString(*s);
    }
}

} // namespace

Koma::Koma() noexcept
{
    setAttribute(Qt::WA_NativeWindow,
                 true); // This is necessary for DPI updates
}

// On-demand construction of `Koma` (for use with argparse)
void
Koma::construct() noexcept
{
    initCommands();
    initConfig();
    initGui();
    if (m_load_default_keybinding)
        initDefaultKeybinds();
    initConnections();
    updateWindowTitle();
    setMinimumSize(200, 150);

    const auto [width, height] = m_config.window.initial_size;
    if (width > 0 && height > 0)
        resize(width, height);

    if (m_config.window.fullscreen)
        showFullScreen();
    else
        show();
}

void
Koma::initCommands() noexcept
{
    m_command_manager.reg("file_open", "Open a document",
                          [this](const QStringList &) { OpenFile(); });
    m_command_manager.reg("file_close", "Close the document",
                          [this](const QStringList &) { CloseFile(); });
    m_command_manager.reg("page_next", "Go to the next page",
                          [this](const QStringList &) { NextPage(); });
    m_command_manager.reg("page_prev", "Go to the previous page",
                          [this](const QStringList &) { PrevPage(); });
    m_command_manager.reg("page_first", "Go to the first page",
                          [this](const QStringList &) { FirstPage(); });
    m_command_manager.reg("page_last", "Go to the last page",
                          [this](const QStringList &) { LastPage(); });
    m_command_manager.reg("panel_zoom", "Toggle panel zoom integration",
                          [this](const QStringList &) { TogglePanelZoom(); });
    m_command_manager.reg("fullscreen", "Toggle fullscreen",
                          [this](const QStringList &) { ToggleFullscreen(); });
    m_command_manager.reg("menubar", "Toggle the menubar",
                          [this](const QStringList &) { ToggleMenubar(); });
    m_command_manager.reg("quit", "Quit koma",
                          [this](const QStringList &) { close(); });
}

// Initialize the config related stuff
void
Koma::initConfig() noexcept
{
    m_config_dir = QDir(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));

    // If config file path is not set, use the default one
    if (m_config_file_path.isEmpty())
        m_config_file_path = m_config_dir.filePath("config.toml");

    if (!QFile::exists(m_config_file_path))
        return;

    toml::table toml;

    try
    {
        toml = toml::parse_file(m_config_file_path.toStdString());
    }
    catch (std::exception &e)
    {
        qWarning() << "Koma::initConfig(): Error in" << m_config_file_path
                   << ":" << e.what();
        QMessageBox::critical(
            this, "Error in configuration file",
            QString("There are one or more error(s) in your config "
                    "file:\n%1\n\nLoading default config.")
                .arg(e.what()));
        return;
    }

    if (auto window = toml["window"])
    {
        set(window["menubar"], m_config.window.menubar);
        set(window["fullscreen"], m_config.window.fullscreen);
        set_title_format_if_present(window["title_format"],
                                    m_config.window.title_format);

        if (window["initial_size"].is_table())
        {
            int width{-1}, height{-1};

            const auto &size_table = *window["initial_size"].as_table();

            if (auto toml_width = size_table["width"].value<int>())
                width = *toml_width;
            if (auto toml_height = size_table["height"].value<int>())
                height = *toml_height;

            if (width > 0 && height > 0)
                m_config.window.initial_size = {width, height};
        }
    }

    if (auto colors = toml["colors"])
    {
        set_color(colors["background"], m_config.colors.background);
        set_color(colors["page_background"], m_config.colors.page_background);
    }

    if (auto rendering = toml["rendering"])
    {
        set(rendering["zoom"], m_config.rendering.zoom);
        if (m_config.rendering.zoom <= 0.0f)
        {
            qWarning() << "Koma::initConfig(): rendering.zoom must be positive";
            m_config.rendering.zoom = 1.0f;
        }
    }

    if (auto panel_zoom = toml["panel_zoom"])
    {
        set(panel_zoom["enabled_on_start"],
            m_config.panel_zoom.enabled_on_start);
        set(panel_zoom["tap_zone_left"], m_config.panel_zoom.tap_zone_left);
        set(panel_zoom["tap_zone_right"], m_config.panel_zoom.tap_zone_right);
        set(panel_zoom["settle_delay_ms"], m_config.panel_zoom.settle_delay_ms);
        set(panel_zoom["dithering"], m_config.panel_zoom.dithering);
        set(panel_zoom["use_view_area"], m_config.panel_zoom.use_view_area);

        const TapRouter::Zones zones{.left  = m_config.panel_zoom.tap_zone_left,
                                     .right = m_config.panel_zoom.tap_zone_right};
        if (!TapRouter::validZones(zones))
        {
            qWarning() << "Koma::initConfig(): Invalid tap zones"
                       << zones.left << zones.right << ", using defaults";
            m_config.panel_zoom.tap_zone_left  = TapRouter::Zones{}.left;
            m_config.panel_zoom.tap_zone_right = TapRouter::Zones{}.right;
        }

        m_config.panel_zoom.settle_delay_ms
            = std::max(0, m_config.panel_zoom.settle_delay_ms);
    }

    if (auto border = toml["panel_border"])
    {
        auto &b = m_config.panel_border;
        set(border["side_thickness"], b.side_thickness);
        set(border["border_thickness"], b.border_thickness);
        set(border["square_extension"], b.square_extension);
        set(border["square_min_aspect"], b.square_min_aspect);
        set(border["square_max_aspect"], b.square_max_aspect);
        set_color(border["color"], b.color);
        set_color(border["letterbox"], b.letterbox);

        b.side_thickness   = std::max(0, b.side_thickness);
        b.border_thickness = std::max(0, b.border_thickness);
        b.square_extension = std::max(0, b.square_extension);
    }

    if (auto keys = toml["keybindings"].as_table())
    {
        m_load_default_keybinding = false;

        for (auto &[action, value] : *keys)
        {
            if (value.is_value())
                setupKeybinding(
                    QString::fromStdString(std::string(action.str())),
                    QString::fromStdString(value.value_or<std::string>("")));
        }
    }

#ifndef NDEBUG
    qDebug() << "Finished reading config file:" << m_config_file_path;
#endif
}

// Initialize the GUI related Stuff
void
Koma::initGui() noexcept
{
    QWidget *widget = new QWidget(this);
    this->setCentralWidget(widget);
    m_layout = new QVBoxLayout(widget);
    m_layout->setContentsMargins(0, 0, 0, 0);
    m_layout->setSpacing(0);
    widget->setLayout(m_layout);

    m_menuBar  = this->menuBar();
    m_doc_view = new DocumentView(m_config, widget);
    m_doc_view->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    m_message_bar = new MessageBar(widget);

    m_layout->addWidget(m_doc_view, 1);
    m_layout->addWidget(m_message_bar);

    m_panel_zoom = new PanelZoomController(m_doc_view, this,
                                           panelZoomOptions(), this);

    initMenubar();
    m_menuBar->setVisible(m_config.window.menubar);
    m_actionMenubar->setChecked(m_config.window.menubar);
    m_doc_view->setFocus();
}

// Initialize the menubar related stuff
void
Koma::initMenubar() noexcept
{
    // --- File Menu ---
    QMenu *fileMenu = m_menuBar->addMenu("&File");

    fileMenu->addAction(
        QString("Open File\t%1").arg(m_config.shortcuts["file_open"]), this,
        [&]() { OpenFile(); });

    m_actionCloseFile = fileMenu->addAction(
        QString("Close File\t%1").arg(m_config.shortcuts["file_close"]), this,
        [&]() { CloseFile(); });
    m_actionCloseFile->setEnabled(false);

    fileMenu->addSeparator();
    fileMenu->addAction(QString("Quit\t%1").arg(m_config.shortcuts["quit"]),
                        this, [&]() { close(); });

    // --- View Menu ---
    QMenu *viewMenu = m_menuBar->addMenu("&View");

    m_actionPanelZoom = viewMenu->addAction(
        QString("Panel Zoom Integration\t%1")
            .arg(m_config.shortcuts["panel_zoom"]),
        this, [&]() { TogglePanelZoom(); });
    m_actionPanelZoom->setCheckable(true);
    m_actionPanelZoom->setChecked(false);

    viewMenu->addSeparator();

    m_actionFullscreen = viewMenu->addAction(
        QString("Fullscreen\t%1").arg(m_config.shortcuts["fullscreen"]), this,
        [&]() { ToggleFullscreen(); });
    m_actionFullscreen->setCheckable(true);
    m_actionFullscreen->setChecked(m_config.window.fullscreen);

    m_actionMenubar = viewMenu->addAction(
        QString("Menubar\t%1").arg(m_config.shortcuts["menubar"]), this,
        [&]() { ToggleMenubar(); });
    m_actionMenubar->setCheckable(true);

    // --- Navigation Menu ---
    QMenu *navMenu = m_menuBar->addMenu("&Navigation");

    navMenu->addAction(
        QString("Next Page\t%1").arg(m_config.shortcuts["page_next"]), this,
        [&]() { NextPage(); });
    navMenu->addAction(
        QString("Previous Page\t%1").arg(m_config.shortcuts["page_prev"]),
        this, [&]() { PrevPage(); });
    navMenu->addAction(
        QString("First Page\t%1").arg(m_config.shortcuts["page_first"]), this,
        [&]() { FirstPage(); });
    navMenu->addAction(
        QString("Last Page\t%1").arg(m_config.shortcuts["page_last"]), this,
        [&]() { LastPage(); });
}

// Arrow keys, Space and Backspace are handled by the page view and the panel
// viewer themselves, so they are not bound here.
void
Koma::initDefaultKeybinds() noexcept
{
    struct DefaultBinding
    {
        const char *action;
        const char *key;
    };

    constexpr DefaultBinding defaults[] = {
        {"file_open", "o"},         {"file_close", "Ctrl+w"},
        {"page_next", "Shift+j"},   {"page_prev", "Shift+k"},
        {"page_first", "g,g"},      {"page_last", "Shift+g"},
        {"panel_zoom", "z"},        {"fullscreen", "F11"},
        {"menubar", "Ctrl+Shift+m"}, {"quit", "Ctrl+q"},
    };

    for (const auto &binding : defaults)
    {
        setupKeybinding(QString::fromLatin1(binding.action),
                        QString::fromLatin1(binding.key));
    }
}

void
Koma::setupKeybinding(const QString &action, const QString &key) noexcept
{
    if (!m_command_manager.find(action))
    {
        qWarning() << "Koma::setupKeybinding(): Unknown action" << action;
        return;
    }

#ifndef NDEBUG
    qDebug() << "Keybinding set:" << action << "->" << key;
#endif
    QShortcut *shortcut = new QShortcut(QKeySequence(key), this);
    connect(shortcut, &QShortcut::activated, this,
            [this, action]() { m_command_manager.run(action); });
    m_config.shortcuts[action] = key;
}

void
Koma::initConnections() noexcept
{
    connect(m_panel_zoom, &PanelZoomController::notice, m_message_bar,
            &MessageBar::showMessage);

    connect(m_panel_zoom, &PanelZoomController::enabledChanged, this,
            [this](bool enabled) { m_actionPanelZoom->setChecked(enabled); });

    // The viewer took the focus, give it back to the page
    connect(m_panel_zoom, &PanelZoomController::viewerClosed, this,
            [this]() { m_doc_view->setFocus(); });

    connect(m_doc_view, &DocumentView::fileOpened, this,
            [this](const QString &)
    {
        // Notices about the previous document no longer apply
        m_message_bar->clear();
        m_panel_zoom->documentChanged();
        m_actionCloseFile->setEnabled(true);
        updateWindowTitle();
    });

    connect(m_doc_view, &DocumentView::fileClosed, this, [this]()
    {
        m_panel_zoom->documentChanged();
        m_actionCloseFile->setEnabled(false);
        updateWindowTitle();
    });

    connect(m_doc_view, &DocumentView::openFileFailed, this,
            [this](const QString &path)
    {
        m_message_bar->showMessage(
            QString("Could not open %1").arg(QFileInfo(path).fileName()), 3);
    });
}

PanelZoomController::Options
Koma::panelZoomOptions() const noexcept
{
    const auto &pz = m_config.panel_zoom;
    const auto &pb = m_config.panel_border;

    return PanelZoomController::Options{
        .zones = {.left = pz.tap_zone_left, .right = pz.tap_zone_right},
        .style = {.background        = rgbaToQColor(pb.letterbox),
                  .border            = rgbaToQColor(pb.color),
                  .side_thickness    = pb.side_thickness,
                  .border_thickness  = pb.border_thickness,
                  .square_extension  = pb.square_extension,
                  .square_min_aspect = pb.square_min_aspect,
                  .square_max_aspect = pb.square_max_aspect},
        .settle_delay_ms = pz.settle_delay_ms,
        .use_view_area   = pz.use_view_area,
        .sidecar_path    = m_panels_path,
    };
}

void
Koma::Read_args_parser(argparse::ArgumentParser &argparser) noexcept
{
    if (argparser.is_used("config"))
    {
        m_config_file_path
            = QString::fromStdString(argparser.get<std::string>("--config"));
    }

    this->construct();

    if (argparser.is_used("panels"))
    {
        m_panels_path = QFileInfo(QString::fromStdString(
                                      argparser.get<std::string>("--panels")))
                            .absoluteFilePath();
        m_panel_zoom->setOptions(panelZoomOptions());
    }

    int startPage = 1;
    if (argparser.is_used("page"))
        startPage = std::max(1, argparser.get<int>("--page"));

    if (argparser.is_used("files"))
    {
        const auto files = argparser.get<std::vector<std::string>>("files");
        if (files.size() > 1)
            qWarning() << "Koma::Read_args_parser(): Only one document can be "
                          "open at a time, ignoring the rest";
        if (!files.empty())
            OpenFile(QString::fromStdString(files.front()), startPage);
    }

    if (argparser.get<bool>("--panel-zoom")
        || m_config.panel_zoom.enabled_on_start)
        m_panel_zoom->setEnabled(true);
}

bool
Koma::OpenFile(const QString &filename, int startPage) noexcept
{
    QString path = filename;
    if (path.isEmpty())
    {
        path = QFileDialog::getOpenFileName(
            this, "Open File", QString(),
            "Documents (*.pdf *.cbz *.zip *.cbt *.tar *.epub *.xps);;All "
            "files (*)");
        if (path.isEmpty())
            return false;
    }

    if (!QFile::exists(path))
    {
        qWarning() << "Koma::OpenFile(): No such file" << path;
        m_message_bar->showMessage(QString("No such file: %1").arg(path), 3);
        return false;
    }

    return m_doc_view->openFile(path, startPage);
}

void
Koma::CloseFile() noexcept
{
    if (m_doc_view->isOpen())
        m_doc_view->closeFile();
}

void
Koma::NextPage() noexcept
{
    m_doc_view->nextPage();
}

void
Koma::PrevPage() noexcept
{
    m_doc_view->prevPage();
}

void
Koma::FirstPage() noexcept
{
    m_doc_view->firstPage();
}

void
Koma::LastPage() noexcept
{
    m_doc_view->lastPage();
}

// Toggles the fullscreen mode
void
Koma::ToggleFullscreen() noexcept
{
    bool isFullscreen = this->isFullScreen();
    if (isFullscreen)
        this->showNormal();
    else
        this->showFullScreen();
    m_actionFullscreen->setChecked(!isFullscreen);
}

// Toggles the menubar
void
Koma::ToggleMenubar() noexcept
{
    bool shown = !m_menuBar->isHidden();
    m_menuBar->setHidden(shown);
    m_actionMenubar->setChecked(!shown);
}

void
Koma::TogglePanelZoom() noexcept
{
    m_panel_zoom->toggleIntegration();
}

void
Koma::updateWindowTitle() noexcept
{
    QString title = m_config.window.title_format;
    title.replace("{}", "%1");

    if (m_doc_view && m_doc_view->isOpen())
        setWindowTitle(title.arg(QFileInfo(m_doc_view->documentPath()).fileName()));
    else
        setWindowTitle("koma");
}

void
Koma::closeEvent(QCloseEvent *event)
{
    // Close the panel viewer before the view it reads from goes away
    if (m_panel_zoom)
        m_panel_zoom->setEnabled(false);
    event->accept();
}
