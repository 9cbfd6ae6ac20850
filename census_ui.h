// census_ui.h - Terminal UI for the directory census browser
#ifndef CENSUS_UI_H
#define CENSUS_UI_H

#include "census_core.h"
#include "census_engine.h"
#include <ncurses.h>

// Color pair slots
enum ColorPair {
    PAIR_HEADER = 1,
    PAIR_DIR,
    PAIR_FILE,
    PAIR_PARENT,
    PAIR_SELECTED,
    PAIR_KEYS
};

// Screen geometry of the last draw, needed to map pointer clicks to rows
struct TableArea {
    int top = 0;
    int left = 0;
    int height = 0;
    int width = 0;
};

class InteractiveUI {
private:
    NavigationEngine& engine;
    Config& config;

    WINDOW* header_win = nullptr;
    WINDOW* table_win = nullptr;
    WINDOW* footer_win = nullptr;
    int header_height = 0;
    int layout_lines = 0;
    int layout_cols = 0;

    TableArea table_area;
    size_t view_offset = 0;
    size_t spinner_index = 0;
    bool colors_enabled = false;
    bool needs_redraw = true;

    // Window management
    void update_window_layout(int wanted_header_height);
    void destroy_windows();
    void handle_resize();

    // Drawing
    void draw_full();
    void draw_header(const std::string& text);
    void draw_table();
    void draw_row(size_t index, int y, int width);
    void draw_footer();
    void adjust_view_offset(int visible_rows);
    int color(ColorPair pair) const;
    const std::string& spinner_frame() const;
    bool has_pending_counts() const;

    // Input handling
    bool handle_key(int ch);
    void handle_mouse();

public:
    InteractiveUI(NavigationEngine& navigation_engine, Config& cfg);
    ~InteractiveUI();

    InteractiveUI(const InteractiveUI&) = delete;
    InteractiveUI& operator=(const InteractiveUI&) = delete;

    void run();
};

#endif // CENSUS_UI_H
