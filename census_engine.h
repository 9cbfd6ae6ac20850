// census_engine.h - Directory listing, ordering and navigation over census results
#ifndef CENSUS_ENGINE_H
#define CENSUS_ENGINE_H

#include "census_core.h"

extern const std::string PARENT_ENTRY_LABEL;

// One row of a listing. Rebuilt on every refresh.
struct DirectoryEntry {
    std::string name;
    fs::path path;
    bool is_dir = false;
    std::optional<size_t> file_count;  // nullopt while the count is pending
};

enum class ActionKind {
    EnterDirectory
};

struct PendingAction {
    ActionKind kind = ActionKind::EnterDirectory;
    size_t index = 0;
};

// Listing order: directories first, then known counts descending, unknown
// counts after known ones, then case-insensitive name.
bool entry_precedes(const DirectoryEntry& a, const DirectoryEntry& b);

// Sorts entries[pinned..]; the first `pinned` entries keep their place.
void sort_entries(std::vector<DirectoryEntry>& entries, size_t pinned = 0);

std::string fold_case(const std::string& text);

class NavigationEngine {
private:
    fs::path current_dir;
    fs::path home_dir;
    std::optional<size_t> current_dir_count;
    std::vector<DirectoryEntry> items;
    size_t pinned_entries = 0;
    size_t selected_index = 0;
    std::optional<PendingAction> action_pending;

    std::shared_ptr<CensusCache> cache;
    std::shared_ptr<ResultChannel> channel;
    std::unique_ptr<CensusDispatcher> dispatcher;  // last: stopped first

    bool is_within_home(const fs::path& path) const;
    void resort_keeping_selection();

public:
    explicit NavigationEngine(const fs::path& start_dir, size_t threads = THREAD_POOL_SIZE);
    ~NavigationEngine();

    NavigationEngine(const NavigationEngine&) = delete;
    NavigationEngine& operator=(const NavigationEngine&) = delete;

    // Rebuilds the listing for current_dir and requests counts for misses.
    void refresh_items();

    // Cyclic selection movement; no-op on an empty listing.
    void advance_selection();
    void retreat_selection();
    void select(size_t index);

    // Applies one (path, count) message. Returns true if anything changed.
    bool merge_count_update(const fs::path& path, size_t count);

    // Drains every available message and re-sorts once if needed.
    bool drain_results();

    // Enters the directory at `index`. Files and bad indices are ignored.
    bool enter(size_t index);
    void go_home();

    void queue_enter(size_t index);
    bool process_pending_action();
    const std::optional<PendingAction>& pending_action() const { return action_pending; }

    std::string header_text(const std::string& spinner_frame) const;

    const fs::path& get_current_dir() const { return current_dir; }
    const fs::path& get_home_dir() const { return home_dir; }
    std::optional<size_t> get_current_dir_count() const { return current_dir_count; }
    const std::vector<DirectoryEntry>& get_items() const { return items; }
    size_t get_selected_index() const { return selected_index; }
    bool has_parent_entry() const { return pinned_entries > 0; }

    CensusDispatcher& census_dispatcher() { return *dispatcher; }
    const CensusCache& census_cache() const { return *cache; }
};

#endif // CENSUS_ENGINE_H
