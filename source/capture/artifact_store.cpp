#include "capture/artifact_store.hpp"

#include <utility>

namespace capture {

void ArtifactStore::put(const std::string &name, const ScreenshotArtifact &artifact) {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        artifacts_[name] = artifact;
        callback = list_changed_callback_;
    }
    if (callback) {
        callback();
    }
}

std::optional<ScreenshotArtifact> ArtifactStore::get(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iterator = artifacts_.find(name);
    if (iterator == artifacts_.end()) {
        return std::nullopt;
    }
    return iterator->second;
}

std::vector<std::string> ArtifactStore::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(artifacts_.size());
    for (const auto &entry : artifacts_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t ArtifactStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return artifacts_.size();
}

void ArtifactStore::set_list_changed_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    list_changed_callback_ = std::move(callback);
}

} // namespace capture
