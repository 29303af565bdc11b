#include <chdview/chd/hunk_cache.hpp>

#include <chdview/chd/chd_devlog.hpp>

#include <algorithm>

namespace chdview::chd {

HunkCache::HunkCache(uint32 capacity)
    : m_capacity(std::max(capacity, 1u)) {}

const std::vector<uint8> *HunkCache::Find(uint32 index) {
    auto it = m_index.find(index);
    if (it == m_index.end()) {
        m_misses++;
        return nullptr;
    }
    m_hits++;
    m_entries.splice(m_entries.begin(), m_entries, it->second);
    return &it->second->data;
}

void HunkCache::Insert(uint32 index, std::vector<uint8> data) {
    if (auto it = m_index.find(index); it != m_index.end()) {
        it->second->data = std::move(data);
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return;
    }
    m_entries.push_front({index, std::move(data)});
    m_index[index] = m_entries.begin();
    EvictToCapacity();
}

void HunkCache::Erase(uint32 index) {
    if (auto it = m_index.find(index); it != m_index.end()) {
        m_entries.erase(it->second);
        m_index.erase(it);
    }
}

void HunkCache::Clear() {
    m_entries.clear();
    m_index.clear();
}

void HunkCache::SetCapacity(uint32 capacity) {
    m_capacity = std::max(capacity, 1u);
    EvictToCapacity();
}

void HunkCache::EvictToCapacity() {
    while (m_entries.size() > m_capacity) {
        const Entry &victim = m_entries.back();
        devlog::trace<grp::cache>("Evicting hunk {}", victim.index);
        m_index.erase(victim.index);
        m_entries.pop_back();
    }
}

} // namespace chdview::chd
