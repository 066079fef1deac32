#include <sprig/batcher.h>
#include <utility>

namespace sprig {

void Batcher::add(const BatchKey& key) {
    if (m_open && m_current.key() == key) {
        m_current.count++;
    } else {
        if (m_open) {
            m_batches.push_back(m_current);
        }
        m_current = Batch{key.texture, key.transform, m_next, 1};
        m_open = true;
    }
    m_next++;
}

std::vector<Batch> Batcher::finish() {
    if (m_open) {
        m_batches.push_back(m_current);
    }
    std::vector<Batch> result = std::move(m_batches);
    reset();
    return result;
}

void Batcher::reset() {
    m_batches.clear();
    m_current = Batch{};
    m_open = false;
    m_next = 0;
}

std::vector<Batch> buildBatches(const std::vector<BatchKey>& keys) {
    Batcher batcher;
    for (const auto& key : keys) {
        batcher.add(key);
    }
    return batcher.finish();
}

size_t countRuns(const std::vector<BatchKey>& keys) {
    size_t runs = 0;
    for (size_t i = 0; i < keys.size(); i++) {
        if (i == 0 || keys[i] != keys[i - 1]) {
            runs++;
        }
    }
    return runs;
}

} // namespace sprig
