#include "draft_store.hpp"
#include <core/utils.hpp>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

std::string DraftStore::key(const std::string& source_path) {
    std::error_code ec;
    fs::path abs = fs::absolute(source_path, ec);
    if (ec) return source_path;
    return abs.lexically_normal().string();
}

DraftJob DraftStore::save(DraftJob draft) {
    draft.source_path = key(draft.source_path);
    draft.updated_at = now_iso();
    std::lock_guard<std::mutex> lock(mutex_);
    drafts_[draft.source_path] = draft;
    return draft;
}

std::optional<DraftJob> DraftStore::get(const std::string& source_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drafts_.find(key(source_path));
    if (it == drafts_.end()) return std::nullopt;
    return it->second;
}

std::vector<DraftJob> DraftStore::list() const {
    std::vector<DraftJob> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [path, d] : drafts_) out.push_back(d);
    }
    std::stable_sort(out.begin(), out.end(), [](const DraftJob& a, const DraftJob& b) {
        return a.updated_at > b.updated_at;
    });
    return out;
}

bool DraftStore::remove(const std::string& source_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return drafts_.erase(key(source_path)) > 0;
}

void DraftStore::restore(std::vector<DraftJob> drafts) {
    std::lock_guard<std::mutex> lock(mutex_);
    drafts_.clear();
    for (auto& d : drafts) {
        d.source_path = key(d.source_path);
        drafts_[d.source_path] = std::move(d);
    }
}
