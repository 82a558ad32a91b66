#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/print_settings.hpp>

// Settings being prepared for a file that has not been submitted yet.
struct DraftJob {
    std::string source_path;
    std::string queue;          // empty: use the default queue
    PrintSettings settings;
    std::string updated_at;
};

// Drafts keyed by normalized source path. Saving the same path again
// replaces the earlier draft.
class DraftStore {
public:
    DraftJob save(DraftJob draft);
    std::optional<DraftJob> get(const std::string& source_path) const;
    std::vector<DraftJob> list() const;     // most recently saved first
    bool remove(const std::string& source_path);
    void restore(std::vector<DraftJob> drafts);

    static std::string key(const std::string& source_path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, DraftJob> drafts_;
};
