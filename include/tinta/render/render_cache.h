#pragma once
#include <tinta/render/pixmap.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <tuple>

namespace tinta::render {

// Pattern tiles rendered during one render call, keyed by pattern index
// and tile size in pixels. Shared by the worker threads of that call.
class RenderCache {
public:
    using Key = std::tuple<size_t, uint32_t, uint32_t>;

    std::shared_ptr<const Pixmap> find(const Key& key) const;

    // Stores `tile` unless a tile for `key` exists already; returns the
    // stored one either way.
    std::shared_ptr<const Pixmap> insert(const Key& key, std::shared_ptr<const Pixmap> tile);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<const Pixmap>> tiles_;
};

} // namespace tinta::render
