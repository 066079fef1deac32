#include <sprig/texture_registry.h>
#include <sprig/errors.h>
#include <stdexcept>

namespace sprig {

TextureRegistry::TextureRegistry(GpuBackend& backend)
    : m_backend(backend) {}

TextureRegistry::~TextureRegistry() {
    clear();
}

void TextureRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [id, entry] : m_entries) {
        releaseEntry(entry);
    }
    m_entries.clear();
}

TextureHandle TextureRegistry::registerTexture(TextureId id, glm::uvec2 size,
                                               TextureKind kind, RawTexture texture) {
    if (!texture) {
        throw std::invalid_argument("registerTexture: null texture for id " + std::to_string(id));
    }
    if (size.x == 0 || size.y == 0) {
        throw std::invalid_argument("registerTexture: zero-sized texture for id " + std::to_string(id));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(id)) {
        throw InvalidStateError("Texture id " + std::to_string(id) + " is already registered");
    }

    Entry entry;
    entry.info.id = id;
    entry.info.size = size;
    entry.info.kind = kind;
    entry.info.texture = texture;
    entry.generation = m_nextGeneration++;

    entry.uniforms = m_backend.createBuffer(BufferUsage::Uniform, sizeof(TextureUniforms));
    try {
        writeUniforms(entry);
        entry.info.bindGroup = m_backend.createTextureBindGroup(texture, entry.uniforms);
    } catch (...) {
        releaseEntry(entry);
        throw;
    }
    m_bindGroupBuilds++;

    TextureHandle handle{id, entry.generation};
    m_entries.emplace(id, entry);
    return handle;
}

void TextureRegistry::unregisterTexture(TextureHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(handle.id);
    if (it == m_entries.end() || it->second.generation != handle.generation) {
        throw UnknownTextureError(handle.id);
    }
    releaseEntry(it->second);
    m_entries.erase(it);
}

TextureInfo TextureRegistry::lookup(TextureId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        throw UnknownTextureError(id);
    }
    return it->second.info;
}

bool TextureRegistry::contains(TextureId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(id) != 0;
}

void TextureRegistry::updateTexture(TextureId id, glm::uvec2 size, RawTexture texture) {
    if (!texture) {
        throw std::invalid_argument("updateTexture: null texture for id " + std::to_string(id));
    }
    if (size.x == 0 || size.y == 0) {
        throw std::invalid_argument("updateTexture: zero-sized texture for id " + std::to_string(id));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        throw UnknownTextureError(id);
    }
    Entry& entry = it->second;

    // Build the new bind group before touching the entry so a failure leaves
    // the old texture, size and uniforms in place
    BindGroupId rebuilt = INVALID_BIND_GROUP;
    if (entry.info.texture != texture) {
        rebuilt = m_backend.createTextureBindGroup(texture, entry.uniforms);
    }

    if (entry.info.size != size) {
        glm::uvec2 previous = entry.info.size;
        entry.info.size = size;
        try {
            writeUniforms(entry);
        } catch (...) {
            entry.info.size = previous;
            if (rebuilt != INVALID_BIND_GROUP) {
                m_backend.releaseBindGroup(rebuilt);
            }
            throw;
        }
    }

    if (rebuilt != INVALID_BIND_GROUP) {
        m_backend.releaseBindGroup(entry.info.bindGroup);
        entry.info.bindGroup = rebuilt;
        entry.info.texture = texture;
        m_bindGroupBuilds++;
    }
}

size_t TextureRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

uint64_t TextureRegistry::bindGroupBuilds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bindGroupBuilds;
}

void TextureRegistry::writeUniforms(const Entry& entry) {
    TextureUniforms uniforms = {};
    uniforms.size = glm::vec2(entry.info.size);
    uniforms.isMask = entry.info.isMask() ? 1u : 0u;
    m_backend.writeBuffer(entry.uniforms, 0, &uniforms, sizeof(uniforms));
}

void TextureRegistry::releaseEntry(Entry& entry) {
    if (entry.info.bindGroup != INVALID_BIND_GROUP) {
        m_backend.releaseBindGroup(entry.info.bindGroup);
        entry.info.bindGroup = INVALID_BIND_GROUP;
    }
    if (entry.uniforms != INVALID_BUFFER) {
        m_backend.releaseBuffer(entry.uniforms);
        entry.uniforms = INVALID_BUFFER;
    }
}

} // namespace sprig
