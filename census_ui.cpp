// census_ui.cpp - Terminal UI implementation
#include "census_ui.h"

#include <algorithm>
#include <array>

namespace {

const std::array<std::string, 4> SPINNER_FRAMES = {"   ", ".  ", ".. ", "..."};

constexpr int FOOTER_HEIGHT = 3;
constexpr int MIN_TABLE_HEIGHT = 3;
constexpr int MARKER_WIDTH = 3;
constexpr int TYPE_WIDTH = 6;
constexpr int COUNT_WIDTH = 8;

} // namespace

InteractiveUI::InteractiveUI(NavigationEngine& navigation_engine, Config& cfg)
    : engine(navigation_engine), config(cfg) {}

InteractiveUI::~InteractiveUI() {
    destroy_windows();
    release_console_log();
}

void InteractiveUI::run() {
    hold_console_log();
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(config.poll_interval_ms);  // bounded wait for input

    if (!config.no_mouse) {
        if (mousemask(BUTTON1_PRESSED | BUTTON1_CLICKED, nullptr) == 0) {
            log_warning("Mouse events are not available on this terminal");
        }
        mouseinterval(0);
    }

    colors_enabled = !config.no_colors && has_colors();
    if (colors_enabled) {
        start_color();
        init_pair(PAIR_HEADER, COLOR_YELLOW, COLOR_BLACK);
        init_pair(PAIR_DIR, COLOR_BLUE, COLOR_BLACK);
        init_pair(PAIR_FILE, COLOR_WHITE, COLOR_BLACK);
        init_pair(PAIR_PARENT, COLOR_GREEN, COLOR_BLACK);
        init_pair(PAIR_SELECTED, COLOR_BLACK, COLOR_GREEN);
        init_pair(PAIR_KEYS, COLOR_YELLOW, COLOR_BLACK);
    }

    bool running = true;
    while (running) {
        spinner_index = (spinner_index + 1) % SPINNER_FRAMES.size();

        if (engine.drain_results() || has_pending_counts()) {
            needs_redraw = true;
        }

        if (needs_redraw) {
            draw_full();
            needs_redraw = false;
        }

        // Pending actions run after the selection has been drawn
        if (engine.process_pending_action()) {
            view_offset = 0;
            needs_redraw = true;
            continue;
        }

        int ch = getch();
        if (ch == ERR) {
            continue;
        }
        if (!handle_key(ch)) {
            running = false;
        }
    }

    destroy_windows();
    endwin();
    release_console_log();
}

// Window management
void InteractiveUI::update_window_layout(int wanted_header_height) {
    if (header_win && wanted_header_height == header_height &&
        layout_lines == LINES && layout_cols == COLS) {
        return;
    }

    destroy_windows();

    clear();
    refresh();

    header_height = wanted_header_height;
    layout_lines = LINES;
    layout_cols = COLS;

    int table_height = std::max(MIN_TABLE_HEIGHT, LINES - header_height - FOOTER_HEIGHT);

    header_win = newwin(header_height, COLS, 0, 0);
    table_win = newwin(table_height, COLS, header_height, 0);
    footer_win = newwin(FOOTER_HEIGHT, COLS, header_height + table_height, 0);

    table_area.top = header_height;
    table_area.left = 0;
    table_area.height = table_height;
    table_area.width = COLS;
}

void InteractiveUI::destroy_windows() {
    if (header_win) {
        delwin(header_win);
        header_win = nullptr;
    }
    if (table_win) {
        delwin(table_win);
        table_win = nullptr;
    }
    if (footer_win) {
        delwin(footer_win);
        footer_win = nullptr;
    }
}

void InteractiveUI::handle_resize() {
    destroy_windows();
    needs_redraw = true;
}

// Drawing
int InteractiveUI::color(ColorPair pair) const {
    return colors_enabled ? COLOR_PAIR(pair) : 0;
}

const std::string& InteractiveUI::spinner_frame() const {
    return SPINNER_FRAMES[spinner_index];
}

bool InteractiveUI::has_pending_counts() const {
    if (!engine.get_current_dir_count()) {
        return true;
    }
    const auto& items = engine.get_items();
    return std::any_of(items.begin(), items.end(),
                       [](const DirectoryEntry& entry) { return entry.is_dir && !entry.file_count; });
}

void InteractiveUI::draw_full() {
    std::string text = engine.header_text(spinner_frame());

    int wanted = wrapped_height(text, COLS - 2) + 2;
    wanted = std::min(wanted, std::max(3, LINES - FOOTER_HEIGHT - MIN_TABLE_HEIGHT));
    update_window_layout(wanted);

    draw_header(text);
    draw_table();
    draw_footer();
    doupdate();
}

void InteractiveUI::draw_header(const std::string& text) {
    if (!header_win) return;

    int height = getmaxy(header_win);
    int width = getmaxx(header_win);

    werase(header_win);
    box(header_win, 0, 0);
    wattron(header_win, A_BOLD);
    mvwaddstr(header_win, 0, 2, " Current Directory ");
    wattroff(header_win, A_BOLD);

    // The inner window wraps the path at the border.
    if (height > 2 && width > 2) {
        WINDOW* inner = derwin(header_win, height - 2, width - 2, 1, 1);
        if (inner) {
            waddstr(inner, text.c_str());
            delwin(inner);
        }
    }

    wnoutrefresh(header_win);
}

void InteractiveUI::draw_table() {
    if (!table_win) return;

    int height = getmaxy(table_win);
    int width = getmaxx(table_win);
    int inner_width = width - 2;

    werase(table_win);
    box(table_win, 0, 0);
    wattron(table_win, A_BOLD);
    mvwaddstr(table_win, 0, 2, " File Counter ");
    wattroff(table_win, A_BOLD);

    // Column header
    wattron(table_win, color(PAIR_HEADER) | A_BOLD);
    mvwhline(table_win, 1, 1, ' ', inner_width);
    mvwaddstr(table_win, 1, 1 + MARKER_WIDTH, "Type");
    mvwaddstr(table_win, 1, 1 + MARKER_WIDTH + TYPE_WIDTH, "Name");
    mvwaddstr(table_win, 1, width - 1 - COUNT_WIDTH, "Count");
    wattroff(table_win, color(PAIR_HEADER) | A_BOLD);

    int visible_rows = height - 3;
    adjust_view_offset(visible_rows);

    const auto& items = engine.get_items();
    int y = 2;
    for (size_t i = view_offset; i < items.size() && y < height - 1; i++) {
        draw_row(i, y, width);
        y++;
    }

    wnoutrefresh(table_win);
}

void InteractiveUI::draw_row(size_t index, int y, int width) {
    const DirectoryEntry& entry = engine.get_items()[index];
    bool is_selected = (index == engine.get_selected_index());
    bool is_parent = engine.has_parent_entry() && index == 0;
    int inner_width = width - 2;

    int selected_attr = (colors_enabled ? COLOR_PAIR(PAIR_SELECTED) : A_REVERSE) | A_BOLD;
    if (is_selected) {
        wattron(table_win, selected_attr);
        mvwhline(table_win, y, 1, ' ', inner_width);
        mvwaddstr(table_win, y, 1, ">> ");
    }

    int col_x = 1 + MARKER_WIDTH;

    // Type
    int type_attr = entry.is_dir ? color(PAIR_DIR) : color(PAIR_FILE);
    if (!is_selected) wattron(table_win, type_attr);
    mvwaddstr(table_win, y, col_x, entry.is_dir ? "Dir" : "File");
    if (!is_selected) wattroff(table_win, type_attr);
    col_x += TYPE_WIDTH;

    // Name
    int name_width = std::max(1, inner_width - MARKER_WIDTH - TYPE_WIDTH - COUNT_WIDTH);
    std::string name = fit_to_width(entry.name, static_cast<size_t>(name_width - 1));
    if (is_parent && !is_selected) wattron(table_win, color(PAIR_PARENT));
    mvwaddstr(table_win, y, col_x, name.c_str());
    if (is_parent && !is_selected) wattroff(table_win, color(PAIR_PARENT));

    // Count
    std::string count_text;
    if (entry.is_dir) {
        count_text = entry.file_count ? std::to_string(*entry.file_count) : spinner_frame();
    } else {
        count_text = "-";
    }
    mvwprintw(table_win, y, width - 1 - COUNT_WIDTH, "%*s", COUNT_WIDTH - 1, count_text.c_str());

    if (is_selected) {
        wattroff(table_win, selected_attr);
    }
}

void InteractiveUI::draw_footer() {
    if (!footer_win) return;

    werase(footer_win);
    box(footer_win, 0, 0);

    static const std::array<const char*, 4> bindings = {
        "q - Quit", "Up/Down/k/j - Move", "Enter - Open", "h - Home"
    };

    wmove(footer_win, 1, 1);
    for (size_t i = 0; i < bindings.size(); i++) {
        if (i > 0) {
            waddstr(footer_win, " | ");
        }
        wattron(footer_win, color(PAIR_KEYS) | A_BOLD);
        waddstr(footer_win, bindings[i]);
        wattroff(footer_win, color(PAIR_KEYS) | A_BOLD);
    }
    // Re-draw the right border in case the bindings ran over it
    box(footer_win, 0, 0);

    wnoutrefresh(footer_win);
}

void InteractiveUI::adjust_view_offset(int visible_rows) {
    const size_t selected = engine.get_selected_index();
    const size_t total = engine.get_items().size();

    if (visible_rows <= 0) {
        view_offset = selected;
        return;
    }
    const size_t visible = static_cast<size_t>(visible_rows);

    if (selected < view_offset) {
        view_offset = selected;
    } else if (selected >= view_offset + visible) {
        view_offset = selected - visible + 1;
    }

    if (view_offset > 0 && total < view_offset + visible) {
        view_offset = total > visible ? total - visible : 0;
    }
}

// Input handling
bool InteractiveUI::handle_key(int ch) {
    switch (ch) {
        case 'q':
        case 'Q':
            return false;  // Exit

        case KEY_UP:
        case 'k':
            engine.retreat_selection();
            needs_redraw = true;
            break;

        case KEY_DOWN:
        case 'j':
            engine.advance_selection();
            needs_redraw = true;
            break;

        case KEY_ENTER:
        case '\n':
        case '\r':
            if (!engine.get_items().empty()) {
                engine.queue_enter(engine.get_selected_index());
            }
            break;

        case 'h':
            engine.go_home();
            view_offset = 0;
            needs_redraw = true;
            break;

        case KEY_MOUSE:
            handle_mouse();
            break;

        case KEY_RESIZE:
            handle_resize();
            break;

        default:
            break;
    }

    return true;  // Continue running
}

void InteractiveUI::handle_mouse() {
    MEVENT event;
    if (getmouse(&event) != OK) {
        log_warning("Cannot read mouse event");
        return;
    }
    if (!(event.bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED))) {
        return;
    }

    // +2 for the top border and the column header, -1 for the bottom border
    const TableArea& area = table_area;
    if (event.y >= area.top + 2 && event.y < area.top + area.height - 1 &&
        event.x >= area.left + 1 && event.x < area.left + area.width - 1) {
        size_t row = static_cast<size_t>(event.y - area.top - 2) + view_offset;
        if (row < engine.get_items().size()) {
            engine.select(row);
            engine.queue_enter(row);
            needs_redraw = true;
        }
    }
}
