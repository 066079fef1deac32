#include <sprig/webgpu/webgpu_backend.h>
#include <sprig/errors.h>
#include <sprig/sprite_renderer.h>
#include <sprig/types.h>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace sprig::webgpu {

namespace {

WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

WGPUBufferUsage toWgpuUsage(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Vertex: return WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
        case BufferUsage::Index: return WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst;
        case BufferUsage::Uniform: return WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    }
    return WGPUBufferUsage_CopyDst;
}

const char* usageLabel(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Vertex: return "Sprite Vertices";
        case BufferUsage::Index: return "Sprite Indices";
        case BufferUsage::Uniform: return "Sprite Uniforms";
    }
    return "Sprite Buffer";
}

} // namespace

const char* const SPRITE_SHADER = R"(
struct TextureUniforms {
    size: vec2f,
    is_mask: u32,
    _pad: u32,
};

struct GroupUniforms {
    target_size: vec2f,
    _pad: vec2f,
    transform: mat4x4f,
};

@group(0) @binding(0) var tex: texture_2d<f32>;
@group(0) @binding(1) var samp: sampler;
@group(0) @binding(2) var<uniform> textureUniforms: TextureUniforms;

@group(1) @binding(0) var<uniform> groupUniforms: GroupUniforms;

struct VertexInput {
    @location(0) position: vec3f,
    @location(1) texCoords: vec2f,
    @location(2) tint: vec4f,
};

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
    @location(1) tint: vec4f,
};

@vertex
fn vs_main(input: VertexInput) -> VertexOutput {
    var output: VertexOutput;
    // Target pixels (origin top-left, y down) to clip space
    let p = groupUniforms.transform * vec4f(input.position.xy, 0.0, 1.0);
    let ndc = vec2f(p.x / groupUniforms.target_size.x * 2.0 - 1.0,
                    1.0 - p.y / groupUniforms.target_size.y * 2.0);
    // No depth attachment: input.position.z (the layer) is not used here
    output.position = vec4f(ndc, 0.0, 1.0);
    output.uv = input.texCoords / textureUniforms.size;
    output.tint = input.tint;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let c = textureSample(tex, samp, input.uv);
    if (textureUniforms.is_mask != 0u) {
        return vec4f(input.tint.rgb, input.tint.a * c.r);
    }
    return c * input.tint;
}
)";

WebGpuBackend::WebGpuBackend(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat targetFormat,
                             SamplerFilter filter)
    : m_device(device), m_queue(queue) {
    if (!m_device || !m_queue) {
        throw std::invalid_argument("WebGpuBackend: device and queue are required");
    }
    createPipeline(targetFormat);
    createSampler(filter);
}

WebGpuBackend::~WebGpuBackend() {
    if (!m_buffers.empty() || !m_bindGroups.empty()) {
        std::cerr << "[WebGpuBackend] Releasing " << m_buffers.size() << " buffers and "
                  << m_bindGroups.size() << " bind groups still alive at shutdown\n";
    }
    m_bindGroups.clear();
    m_buffers.clear();
}

void WebGpuBackend::createPipeline(WGPUTextureFormat targetFormat) {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(SPRITE_SHADER);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView("Sprite Shader");
    GpuHandle<WGPUShaderModule> shaderModule(wgpuDeviceCreateShaderModule(m_device, &shaderDesc));
    if (!shaderModule) {
        throw std::runtime_error("WebGpuBackend: failed to create sprite shader module");
    }

    // Group 0: texture, sampler, TextureUniforms
    WGPUBindGroupLayoutEntry textureEntries[3] = {};
    textureEntries[0].binding = 0;
    textureEntries[0].visibility = WGPUShaderStage_Fragment;
    textureEntries[0].texture.sampleType = WGPUTextureSampleType_Float;
    textureEntries[0].texture.viewDimension = WGPUTextureViewDimension_2D;

    textureEntries[1].binding = 1;
    textureEntries[1].visibility = WGPUShaderStage_Fragment;
    textureEntries[1].sampler.type = WGPUSamplerBindingType_Filtering;

    textureEntries[2].binding = 2;
    textureEntries[2].visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    textureEntries[2].buffer.type = WGPUBufferBindingType_Uniform;
    textureEntries[2].buffer.minBindingSize = sizeof(TextureUniforms);

    WGPUBindGroupLayoutDescriptor textureLayoutDesc = {};
    textureLayoutDesc.label = toStringView("Sprite Texture Layout");
    textureLayoutDesc.entryCount = 3;
    textureLayoutDesc.entries = textureEntries;
    m_textureLayout.reset(wgpuDeviceCreateBindGroupLayout(m_device, &textureLayoutDesc));

    // Group 1: GroupUniforms, one slot selected per batch by dynamic offset
    WGPUBindGroupLayoutEntry groupEntry = {};
    groupEntry.binding = 0;
    groupEntry.visibility = WGPUShaderStage_Vertex;
    groupEntry.buffer.type = WGPUBufferBindingType_Uniform;
    groupEntry.buffer.hasDynamicOffset = true;
    groupEntry.buffer.minBindingSize = sizeof(GroupUniforms);

    WGPUBindGroupLayoutDescriptor groupLayoutDesc = {};
    groupLayoutDesc.label = toStringView("Sprite Group Layout");
    groupLayoutDesc.entryCount = 1;
    groupLayoutDesc.entries = &groupEntry;
    m_groupLayout.reset(wgpuDeviceCreateBindGroupLayout(m_device, &groupLayoutDesc));

    WGPUBindGroupLayout layouts[2] = {m_textureLayout.get(), m_groupLayout.get()};
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 2;
    pipelineLayoutDesc.bindGroupLayouts = layouts;
    GpuHandle<WGPUPipelineLayout> pipelineLayout(wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc));

    WGPUVertexAttribute attrs[3] = {};
    attrs[0].format = WGPUVertexFormat_Float32x3;  // position
    attrs[0].offset = offsetof(SpriteVertex, position);
    attrs[0].shaderLocation = 0;
    attrs[1].format = WGPUVertexFormat_Float32x2;  // texCoords
    attrs[1].offset = offsetof(SpriteVertex, texCoords);
    attrs[1].shaderLocation = 1;
    attrs[2].format = WGPUVertexFormat_Float32x4;  // tint
    attrs[2].offset = offsetof(SpriteVertex, tint);
    attrs[2].shaderLocation = 2;

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = sizeof(SpriteVertex);
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = 3;
    vertexLayout.attributes = attrs;

    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = targetFormat;
    colorTarget.blend = &blendState;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = shaderModule;
    fragmentState.entryPoint = toStringView("fs_main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView("Sprite Pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 1;
    pipelineDesc.vertex.buffers = &vertexLayout;
    pipelineDesc.fragment = &fragmentState;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;

    m_pipeline.reset(wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc));
    if (!m_pipeline) {
        throw std::runtime_error("WebGpuBackend: failed to create sprite pipeline");
    }
}

void WebGpuBackend::createSampler(SamplerFilter filter) {
    WGPUFilterMode mode = filter == SamplerFilter::Linear ? WGPUFilterMode_Linear : WGPUFilterMode_Nearest;

    WGPUSamplerDescriptor desc = {};
    desc.addressModeU = WGPUAddressMode_ClampToEdge;
    desc.addressModeV = WGPUAddressMode_ClampToEdge;
    desc.addressModeW = WGPUAddressMode_ClampToEdge;
    desc.magFilter = mode;
    desc.minFilter = mode;
    desc.mipmapFilter = filter == SamplerFilter::Linear ? WGPUMipmapFilterMode_Linear
                                                        : WGPUMipmapFilterMode_Nearest;
    desc.maxAnisotropy = 1;
    m_sampler.reset(wgpuDeviceCreateSampler(m_device, &desc));
}

BufferId WebGpuBackend::createBuffer(BufferUsage usage, uint64_t size) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(usageLabel(usage));
    desc.size = size;
    desc.usage = toWgpuUsage(usage);

    Buffer entry;
    entry.handle.reset(wgpuDeviceCreateBuffer(m_device, &desc));
    entry.size = size;
    if (!entry.handle) {
        throw std::runtime_error("WebGpuBackend: failed to create " + std::to_string(size) +
                                 "-byte " + usageLabel(usage) + " buffer");
    }

    BufferId id = m_nextId++;
    m_buffers.emplace(id, std::move(entry));
    return id;
}

void WebGpuBackend::releaseBuffer(BufferId buffer) {
    if (m_buffers.erase(buffer) == 0) {
        throw InvalidStateError("releaseBuffer: unknown buffer " + std::to_string(buffer));
    }
}

BindGroupId WebGpuBackend::createTextureBindGroup(RawTexture texture, BufferId uniforms) {
    Buffer& uniformBuffer = buffer(uniforms);

    BindGroup entry;
    entry.view.reset(wgpuTextureCreateView(static_cast<WGPUTexture>(texture), nullptr));
    if (!entry.view) {
        throw std::runtime_error("WebGpuBackend: failed to create texture view");
    }

    WGPUBindGroupEntry bgEntries[3] = {};
    bgEntries[0].binding = 0;
    bgEntries[0].textureView = entry.view;
    bgEntries[1].binding = 1;
    bgEntries[1].sampler = m_sampler;
    bgEntries[2].binding = 2;
    bgEntries[2].buffer = uniformBuffer.handle;
    bgEntries[2].size = sizeof(TextureUniforms);

    WGPUBindGroupDescriptor desc = {};
    desc.layout = m_textureLayout;
    desc.entryCount = 3;
    desc.entries = bgEntries;
    entry.handle.reset(wgpuDeviceCreateBindGroup(m_device, &desc));
    if (!entry.handle) {
        throw std::runtime_error("WebGpuBackend: failed to create texture bind group");
    }

    BindGroupId id = m_nextId++;
    m_bindGroups.emplace(id, std::move(entry));
    return id;
}

BindGroupId WebGpuBackend::createGroupBindGroup(BufferId uniforms) {
    Buffer& uniformBuffer = buffer(uniforms);

    WGPUBindGroupEntry bgEntry = {};
    bgEntry.binding = 0;
    bgEntry.buffer = uniformBuffer.handle;
    bgEntry.offset = 0;
    bgEntry.size = sizeof(GroupUniforms);

    WGPUBindGroupDescriptor desc = {};
    desc.layout = m_groupLayout;
    desc.entryCount = 1;
    desc.entries = &bgEntry;

    BindGroup entry;
    entry.handle.reset(wgpuDeviceCreateBindGroup(m_device, &desc));
    if (!entry.handle) {
        throw std::runtime_error("WebGpuBackend: failed to create group bind group");
    }

    BindGroupId id = m_nextId++;
    m_bindGroups.emplace(id, std::move(entry));
    return id;
}

void WebGpuBackend::releaseBindGroup(BindGroupId group) {
    if (m_bindGroups.erase(group) == 0) {
        throw InvalidStateError("releaseBindGroup: unknown bind group " + std::to_string(group));
    }
}

void WebGpuBackend::writeBuffer(BufferId id, uint64_t offset, const void* data, uint64_t size) {
    Buffer& target = buffer(id);
    if (offset + size > target.size) {
        throw std::out_of_range("writeBuffer: " + std::to_string(size) + " bytes at offset " +
                                std::to_string(offset) + " exceed buffer of " +
                                std::to_string(target.size));
    }
    if (size == 0) {
        return;
    }
    wgpuQueueWriteBuffer(m_queue, target.handle, offset, data, size);
}

void WebGpuBackend::beginPass(WGPURenderPassEncoder pass) {
    if (!pass) {
        throw std::invalid_argument("beginPass: null render pass");
    }
    if (m_pass) {
        throw InvalidStateError("beginPass: a render pass is already active");
    }
    m_pass = pass;
    wgpuRenderPassEncoderSetPipeline(m_pass, m_pipeline);
}

void WebGpuBackend::endPass() {
    m_pass = nullptr;
}

void WebGpuBackend::setGeometry(BufferId vertices, BufferId indices) {
    WGPURenderPassEncoder pass = requirePass("setGeometry");
    Buffer& vb = buffer(vertices);
    Buffer& ib = buffer(indices);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, vb.handle, 0, vb.size);
    wgpuRenderPassEncoderSetIndexBuffer(pass, ib.handle, WGPUIndexFormat_Uint32, 0, ib.size);
}

void WebGpuBackend::setTextureBindGroup(BindGroupId group) {
    WGPURenderPassEncoder pass = requirePass("setTextureBindGroup");
    wgpuRenderPassEncoderSetBindGroup(pass, 0, bindGroup(group), 0, nullptr);
}

void WebGpuBackend::setGroupBindGroup(BindGroupId group, uint32_t dynamicOffset) {
    WGPURenderPassEncoder pass = requirePass("setGroupBindGroup");
    wgpuRenderPassEncoderSetBindGroup(pass, 1, bindGroup(group), 1, &dynamicOffset);
}

void WebGpuBackend::drawIndexed(uint32_t indexCount, uint32_t firstIndex,
                                int32_t baseVertex, uint32_t instanceCount) {
    WGPURenderPassEncoder pass = requirePass("drawIndexed");
    wgpuRenderPassEncoderDrawIndexed(pass, indexCount, instanceCount, firstIndex, baseVertex, 0);
}

DrawStats WebGpuBackend::renderToView(SpriteRenderer& renderer, WGPUTextureView view,
                                      const glm::vec4& clearColor) {
    // Queue writes land before the command buffer below executes
    renderer.prepare();

    WGPUCommandEncoderDescriptor encDesc = {};
    GpuHandle<WGPUCommandEncoder> encoder(wgpuDeviceCreateCommandEncoder(m_device, &encDesc));

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = view;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {clearColor.r, clearColor.g, clearColor.b, clearColor.a};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.label = toStringView("Sprite Pass");
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    GpuHandle<WGPURenderPassEncoder> pass(wgpuCommandEncoderBeginRenderPass(encoder, &passDesc));

    DrawStats stats;
    beginPass(pass);
    try {
        stats = renderer.render();
    } catch (const std::exception& e) {
        std::cerr << "[WebGpuBackend] Render failed: " << e.what() << "\n";
        endPass();
        wgpuRenderPassEncoderEnd(pass);
        throw;
    }
    endPass();
    wgpuRenderPassEncoderEnd(pass);

    submit(encoder);
    return stats;
}

void WebGpuBackend::submit(WGPUCommandEncoder encoder) {
    if (!encoder) {
        throw std::invalid_argument("submit: null command encoder");
    }
    if (m_pass) {
        throw InvalidStateError("submit: render pass still active, call endPass() first");
    }
    WGPUCommandBufferDescriptor cmdDesc = {};
    GpuHandle<WGPUCommandBuffer> commands(wgpuCommandEncoderFinish(encoder, &cmdDesc));
    if (!commands) {
        throw std::runtime_error("submit: failed to finish command encoder");
    }
    WGPUCommandBuffer raw = commands.get();
    wgpuQueueSubmit(m_queue, 1, &raw);
    m_submissions++;
}

WebGpuBackend::Buffer& WebGpuBackend::buffer(BufferId id) {
    auto it = m_buffers.find(id);
    if (it == m_buffers.end()) {
        throw InvalidStateError("Unknown buffer " + std::to_string(id));
    }
    return it->second;
}

WGPUBindGroup WebGpuBackend::bindGroup(BindGroupId id) const {
    auto it = m_bindGroups.find(id);
    if (it == m_bindGroups.end()) {
        throw InvalidStateError("Unknown bind group " + std::to_string(id));
    }
    return it->second.handle;
}

WGPURenderPassEncoder WebGpuBackend::requirePass(const char* operation) const {
    if (!m_pass) {
        throw InvalidStateError(std::string(operation) + ": no active render pass, call beginPass() first");
    }
    return m_pass;
}

} // namespace sprig::webgpu
