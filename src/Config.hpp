#pragma once

#include <QHash>
#include <QString>
#include <cstdint>
#include <tuple>

struct Config
{
    QHash<QString, QString> shortcuts{};

    struct colors
    {
        uint32_t background{0x202020FF};
        uint32_t page_background{0xFFFFFFFF};
    } colors{};

    struct window
    {
        bool fullscreen{false};
        bool menubar{true};
        QString title_format{"{} - koma"};
        std::tuple<int, int> initial_size{-1,
                                          -1}; // width, height; -1 for default
    } window{};

    struct rendering
    {
        float zoom{1.0f};
    } rendering{};

    struct panel_zoom
    {
        bool enabled_on_start{false};
        double tap_zone_left{0.3};
        double tap_zone_right{0.7};
        int settle_delay_ms{300}; // wait for the page turn to render
        bool dithering{false};    // e-ink screens
        bool use_view_area{true}; // else the native page size is the frame
    } panel_zoom{};

    struct panel_border
    {
        int side_thickness{50};
        int border_thickness{50};
        int square_extension{4};
        double square_min_aspect{0.1};
        double square_max_aspect{1.5};
        uint32_t color{0xFFFFFFFF};
        uint32_t letterbox{0xFFFFFFFF};
    } panel_border{};
};
