#include <tinta/render/render_cache.h>

namespace tinta::render {

std::shared_ptr<const Pixmap> RenderCache::find(const Key& key) const {
    std::lock_guard lock(mutex_);
    auto it = tiles_.find(key);
    return it != tiles_.end() ? it->second : nullptr;
}

std::shared_ptr<const Pixmap> RenderCache::insert(const Key& key,
                                                  std::shared_ptr<const Pixmap> tile) {
    std::lock_guard lock(mutex_);
    return tiles_.emplace(key, std::move(tile)).first->second;
}

size_t RenderCache::size() const {
    std::lock_guard lock(mutex_);
    return tiles_.size();
}

} // namespace tinta::render
