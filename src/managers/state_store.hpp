#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "job_store.hpp"
#include "draft_store.hpp"

namespace fs = std::filesystem;

// Core state: job history, drafts and the last connection used (no secret).
struct PersistedState {
    std::vector<PrintJob> jobs;
    std::vector<DraftJob> drafts;
    std::optional<ConnectionConfig> last_connection;
};

// User preferences, kept apart from core state.
struct Preferences {
    std::string default_queue;
};

// YAML files under one directory (~/.socprint by default):
//   state.yaml, preferences.yaml, backups/<job_id>/<file>
class StateStore {
public:
    explicit StateStore(fs::path dir);

    // Missing file -> empty state. Unreadable file -> Storage error.
    Result<PersistedState> load() const;
    Result<void> save(const PersistedState& state) const;

    Result<Preferences> load_preferences() const;
    Result<void> save_preferences(const Preferences& prefs) const;

    // Copies the source file into backups/<job_id>/.
    Result<fs::path> backup_source(const std::string& job_id, const fs::path& source) const;
    void remove_backup(const std::string& job_id) const;
    fs::path backup_dir(const std::string& job_id) const;

    const fs::path& state_path() const { return state_path_; }

private:
    fs::path dir_;
    fs::path state_path_;
    fs::path prefs_path_;
};

// Write via temp file + rename so a crash never leaves half a file.
Result<void> write_file_atomic(const fs::path& path, const std::string& content);
