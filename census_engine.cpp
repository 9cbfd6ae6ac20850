// census_engine.cpp - Navigation engine implementation
#include "census_engine.h"

#include <algorithm>
#include <cctype>
#include <cwctype>

const std::string PARENT_ENTRY_LABEL = ".. (Back to parent directory)";

// Lowercases every decodable code point with the locale's towlower; stray
// bytes that are not UTF-8 only get ASCII folding.
std::string fold_case(const std::string& text) {
    std::string folded;
    folded.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        char32_t code_point = 0;
        if (decode_utf8(text, pos, code_point)) {
            auto lower = std::towlower(static_cast<std::wint_t>(code_point));
            append_utf8(folded, static_cast<char32_t>(lower));
        } else {
            folded += static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos])));
            pos++;
        }
    }
    return folded;
}

static int compare_names(const DirectoryEntry& a, const DirectoryEntry& b) {
    int folded = fold_case(a.name).compare(fold_case(b.name));
    if (folded != 0) return folded;
    // Names that fold to the same text keep a fixed order.
    return a.name.compare(b.name);
}

bool entry_precedes(const DirectoryEntry& a, const DirectoryEntry& b) {
    if (a.is_dir != b.is_dir) {
        return a.is_dir;
    }

    if (a.is_dir) {
        if (a.file_count && b.file_count) {
            if (*a.file_count != *b.file_count) {
                return *a.file_count > *b.file_count;
            }
        } else if (a.file_count) {
            return true;
        } else if (b.file_count) {
            return false;
        }
    }

    return compare_names(a, b) < 0;
}

void sort_entries(std::vector<DirectoryEntry>& entries, size_t pinned) {
    if (pinned >= entries.size()) return;
    std::stable_sort(entries.begin() + static_cast<std::ptrdiff_t>(pinned), entries.end(), entry_precedes);
}

// NavigationEngine implementation
NavigationEngine::NavigationEngine(const fs::path& start_dir, size_t threads)
    : current_dir(normalize_start_dir(start_dir)),
      home_dir(current_dir),
      cache(std::make_shared<CensusCache>()),
      channel(std::make_shared<ResultChannel>()),
      dispatcher(std::make_unique<CensusDispatcher>(cache, channel, threads)) {
    refresh_items();
}

NavigationEngine::~NavigationEngine() {
    channel->close();
}

bool NavigationEngine::is_within_home(const fs::path& path) const {
    fs::path relative = path.lexically_relative(home_dir);
    return !relative.empty() && *relative.begin() != "..";
}

void NavigationEngine::refresh_items() {
    items.clear();
    pinned_entries = 0;

    const bool include_back = current_dir != home_dir;

    current_dir_count = dispatcher->request(current_dir);

    if (include_back && current_dir.has_parent_path()) {
        fs::path parent = current_dir.parent_path();
        DirectoryEntry back;
        back.name = PARENT_ENTRY_LABEL;
        back.path = parent;
        back.is_dir = true;
        back.file_count = dispatcher->request(parent);
        items.push_back(std::move(back));
        pinned_entries = 1;
    }

    // An unreadable directory lists as empty; unreadable entries are skipped.
    std::error_code ec;
    const fs::directory_iterator end;
    for (fs::directory_iterator it(current_dir, ec); !ec && it != end; it.increment(ec)) {
        DirectoryEntry entry;
        entry.path = it->path();
        entry.name = display_name(entry.path);

        std::error_code type_ec;
        entry.is_dir = it->is_directory(type_ec);
        if (entry.is_dir) {
            entry.file_count = dispatcher->request(entry.path);
        }
        items.push_back(std::move(entry));
    }

    sort_entries(items, pinned_entries);

    if (items.empty()) {
        selected_index = 0;
    } else if (selected_index >= items.size()) {
        selected_index = items.size() - 1;
    }
}

void NavigationEngine::advance_selection() {
    if (items.empty()) return;
    selected_index = (selected_index + 1 >= items.size()) ? 0 : selected_index + 1;
}

void NavigationEngine::retreat_selection() {
    if (items.empty()) return;
    selected_index = (selected_index == 0 || selected_index >= items.size())
                         ? items.size() - 1
                         : selected_index - 1;
}

void NavigationEngine::select(size_t index) {
    if (index < items.size()) {
        selected_index = index;
    }
}

bool NavigationEngine::merge_count_update(const fs::path& path, size_t count) {
    bool changed = false;

    if (path == current_dir) {
        current_dir_count = count;
        changed = true;
    }

    auto it = std::find_if(items.begin(), items.end(),
                           [&path](const DirectoryEntry& item) { return item.path == path; });
    if (it != items.end()) {
        it->file_count = count;
        changed = true;
    }

    return changed;
}

bool NavigationEngine::drain_results() {
    bool counts_updated = false;
    while (auto result = channel->try_receive()) {
        if (merge_count_update(result->path, result->count)) {
            counts_updated = true;
        }
    }

    if (counts_updated) {
        resort_keeping_selection();
    }
    return counts_updated;
}

// The selected row follows its entry through the re-sort.
void NavigationEngine::resort_keeping_selection() {
    fs::path selected_path;
    bool had_selection = selected_index < items.size();
    if (had_selection) {
        selected_path = items[selected_index].path;
    }

    sort_entries(items, pinned_entries);

    if (!had_selection) return;
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].path == selected_path) {
            selected_index = i;
            return;
        }
    }
}

bool NavigationEngine::enter(size_t index) {
    if (index >= items.size()) return false;

    const DirectoryEntry& entry = items[index];
    if (!entry.is_dir || !is_within_home(entry.path)) return false;

    current_dir = entry.path;
    refresh_items();
    return true;
}

void NavigationEngine::go_home() {
    current_dir = home_dir;
    refresh_items();
}

void NavigationEngine::queue_enter(size_t index) {
    action_pending = PendingAction{ActionKind::EnterDirectory, index};
}

bool NavigationEngine::process_pending_action() {
    if (!action_pending) return false;

    PendingAction action = *action_pending;
    action_pending.reset();

    switch (action.kind) {
        case ActionKind::EnterDirectory:
            return enter(action.index);
    }
    return false;
}

std::string NavigationEngine::header_text(const std::string& spinner_frame) const {
    std::string text = current_dir.string();
    if (current_dir_count) {
        return text + " (Total files: " + std::to_string(*current_dir_count) + ")";
    }
    return text + " (Counting files" + spinner_frame + ")";
}
