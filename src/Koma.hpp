#pragma once

#include "CommandManager.hpp"
#include "Config.hpp"
#include "DocumentView.hpp"
#include "MessageBar.hpp"
#include "PanelZoomController.hpp"

#include <QAction>
#include <QDir>
#include <QMainWindow>
#include <QMenuBar>
#include <QShortcut>
#include <QVBoxLayout>
#include <argparse/argparse.hpp>

class Koma : public QMainWindow
{
    Q_OBJECT

public:
    Koma() noexcept;

    void Read_args_parser(argparse::ArgumentParser &argparser) noexcept;

    bool OpenFile(const QString &filename = QString(),
                  int startPage           = 1) noexcept;
    void CloseFile() noexcept;
    void NextPage() noexcept;
    void PrevPage() noexcept;
    void FirstPage() noexcept;
    void LastPage() noexcept;
    void ToggleFullscreen() noexcept;
    void ToggleMenubar() noexcept;
    void TogglePanelZoom() noexcept;

    inline const Config &config() const noexcept
    {
        return m_config;
    }

    inline DocumentView *view() const noexcept
    {
        return m_doc_view;
    }

    inline PanelZoomController *panelZoom() const noexcept
    {
        return m_panel_zoom;
    }

protected:
    void closeEvent(QCloseEvent *event) override;

private:
    void construct() noexcept;
    void initCommands() noexcept;
    void initConfig() noexcept;
    void initGui() noexcept;
    void initMenubar() noexcept;
    void initDefaultKeybinds() noexcept;
    void initConnections() noexcept;
    void setupKeybinding(const QString &action, const QString &key) noexcept;
    void updateWindowTitle() noexcept;
    PanelZoomController::Options panelZoomOptions() const noexcept;

    Config m_config;
    QDir m_config_dir;
    QString m_config_file_path;
    QString m_panels_path;
    bool m_load_default_keybinding{true};
    bool m_panel_zoom_on_start{false};

    CommandManager m_command_manager;
    QVBoxLayout *m_layout{nullptr};
    QMenuBar *m_menuBar{nullptr};
    DocumentView *m_doc_view{nullptr};
    MessageBar *m_message_bar{nullptr};
    PanelZoomController *m_panel_zoom{nullptr};

    QAction *m_actionPanelZoom{nullptr};
    QAction *m_actionFullscreen{nullptr};
    QAction *m_actionMenubar{nullptr};
    QAction *m_actionCloseFile{nullptr};
};
