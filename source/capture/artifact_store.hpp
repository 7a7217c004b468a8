#ifndef WEBMCPS_ARTIFACT_STORE_HPP
#define WEBMCPS_ARTIFACT_STORE_HPP

// Named screenshot artifacts. Survives session close; lives until process exit.

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace capture {

struct ScreenshotArtifact {
    std::string mime_type;
    std::string image_base64;
};

class ArtifactStore {
public:
    // Store under name, replacing any artifact with the same name.
    void put(const std::string &name, const ScreenshotArtifact &artifact);

    std::optional<ScreenshotArtifact> get(const std::string &name) const;

    // Artifact names in lexical order.
    std::vector<std::string> names() const;

    size_t size() const;

    // Called after every put (outside the store lock).
    void set_list_changed_callback(std::function<void()> callback);

private:
    mutable std::mutex mutex_;
    std::map<std::string, ScreenshotArtifact> artifacts_;
    std::function<void()> list_changed_callback_;
};

} // namespace capture

#endif // WEBMCPS_ARTIFACT_STORE_HPP
