// ResourceStore Test
// Eager/deferred insertion, realization order, retention window and release accounting

#include "TestHarness.hpp"
#include "MockRenderDevice.hpp"
#include "renderer/graph/ResourceStore.hpp"
#include "ecs/World.hpp"

using namespace ember;
using namespace ember::test;

namespace {

TextureDesc hdrTexture(const char* label, uint32_t size = 512) {
    TextureDesc desc;
    desc.label = label;
    desc.width = size;
    desc.height = size;
    desc.format = TextureFormat::RGBA16Float;
    desc.usage = TextureUsage::Sampled | TextureUsage::ColorAttachment;
    return desc;
}

ResourceInit<Texture> eagerTexture(MockRenderDevice& device, const TextureDesc& desc) {
    ResourceMeta<Texture> meta;
    meta.descriptor = desc;
    meta.resource = device.createTexture(desc);
    return ResourceInit<Texture>::eager(meta);
}

ResourceInit<Texture> deferredTexture(const TextureDesc& desc) {
    return ResourceInit<Texture>::deferred([desc](World&, RenderDevice& device) {
        return ResourceMeta<Texture>{desc, device.createTexture(desc), true};
    });
}

} // namespace

// Test 1: eager insert is visible at once
void testEagerInsert() {
    section(1, "Eager insert");

    MockRenderDevice device;
    ResourceStore<Texture> store;

    TextureDesc desc = hdrTexture("scene_color");
    store.insert(0, eagerTexture(device, desc));

    const auto* meta = store.get(0);
    EMBER_CHECK(meta != nullptr);
    EMBER_CHECK(meta && meta->descriptor && *meta->descriptor == desc);
    EMBER_CHECK(meta && meta->resource.width == 512);
    EMBER_CHECK(store.currentCount() == 1);
    EMBER_CHECK(store.queuedCount() == 0);

    store.clear(device);
}

// Test 2: deferred buffer at index 3 is absent until realized
void testDeferredInsert() {
    section(2, "Deferred insert");

    World world;
    MockRenderDevice device;
    ResourceStore<Buffer> store;

    BufferDesc desc;
    desc.label = "bloom_uniforms";
    desc.size = 256;
    desc.usage = BufferUsage::Uniform;

    store.insert(3, ResourceInit<Buffer>::deferred([desc](World&, RenderDevice& d) {
        return ResourceMeta<Buffer>{desc, d.createBuffer(desc), true};
    }));

    EMBER_CHECK(store.get(3) == nullptr);
    EMBER_CHECK(store.isQueued(3));
    EMBER_CHECK(store.contains(3));
    EMBER_CHECK(device.counters().buffersCreated == 0);

    store.realizeQueued(world, device);

    const auto* meta = store.get(3);
    EMBER_CHECK(meta != nullptr);
    EMBER_CHECK(meta && meta->descriptor && *meta->descriptor == desc);
    EMBER_CHECK(meta && meta->resource.size == 256);
    EMBER_CHECK(!store.isQueued(3));
    EMBER_CHECK(device.counters().buffersCreated == 1);

    store.clear(device);
    EMBER_CHECK(device.counters().buffersDestroyed == 1);
}

// Test 3: mixed eager/deferred inserts all resolve to what was inserted
void testMixedRealization() {
    section(3, "Mixed realization");

    World world;
    MockRenderDevice device;
    ResourceStore<Texture> store;

    eastl::vector<uint32_t> sizes = {64, 128, 256, 512, 1024};
    for (uint16_t i = 0; i < sizes.size(); ++i) {
        eastl::string label = "texture_" + eastl::to_string(i);
        TextureDesc desc = hdrTexture(label.c_str(), sizes[i]);
        if (i % 2 == 0) {
            store.insert(i, deferredTexture(desc));
        } else {
            store.insert(i, eagerTexture(device, desc));
        }
    }

    EMBER_CHECK(store.queuedCount() == 3);
    EMBER_CHECK(store.currentCount() == 2);
    EMBER_CHECK(store.get(0) == nullptr);
    EMBER_CHECK(store.get(1) != nullptr);

    store.realizeQueued(world, device);
    EMBER_CHECK(store.queuedCount() == 0);

    for (uint16_t i = 0; i < sizes.size(); ++i) {
        const auto* meta = store.get(i);
        EMBER_CHECK(meta != nullptr);
        EMBER_CHECK(meta && meta->resource.width == sizes[i]);
        EMBER_CHECK(meta && meta->descriptor && meta->descriptor->width == sizes[i]);
    }
    EMBER_CHECK(store.get(7) == nullptr);

    store.clear(device);
    EMBER_CHECK(device.aliveCount() == 0);
}

// Test 4: inserting the same index twice is an authorship error
void testDuplicateInsert() {
    section(4, "Duplicate insert");

    MockRenderDevice device;
    ResourceStore<Texture> store;

    store.insert(2, deferredTexture(hdrTexture("a")));
    EMBER_CHECK_GRAPH_ERROR(store.insert(2, deferredTexture(hdrTexture("b"))), GraphErrorKind::DuplicateInsert);
    EMBER_CHECK_GRAPH_ERROR(store.insert(2, eagerTexture(device, hdrTexture("c"))), GraphErrorKind::DuplicateInsert);

    // The rejected eager texture was created by the test, not the store
    EMBER_CHECK(store.queuedCount() == 1);
    store.clear(device);
}

// Test 5: deferred descriptor fills in when the initializer returns none
void testKnownDescriptorFallback() {
    section(5, "Known descriptor fallback");

    World world;
    MockRenderDevice device;
    ResourceStore<Texture> store;

    TextureDesc desc = hdrTexture("history");
    store.insert(0, ResourceInit<Texture>::deferred(
        [desc](World&, RenderDevice& d) {
            ResourceMeta<Texture> meta;
            meta.resource = d.createTexture(desc);
            return meta;
        },
        desc));

    const TextureDesc* queuedDesc = store.getDescriptor(0);
    EMBER_CHECK(queuedDesc != nullptr && *queuedDesc == desc);

    store.realizeQueued(world, device);
    const auto* meta = store.get(0);
    EMBER_CHECK(meta && meta->descriptor && *meta->descriptor == desc);

    store.clear(device);
}

// Test 6: retention round trip and the one-frame window
void testRetentionWindow() {
    section(6, "Retention window");

    World world;
    MockRenderDevice device;
    ResourceStore<Texture> store;

    // Frame N: mark index 0 as "taa_history"
    TextureDesc desc = hdrTexture("taa_history", 1024);
    store.insert(0, eagerTexture(device, desc));
    store.insert(1, eagerTexture(device, hdrTexture("scratch")));
    RawHandle retainedImage = store.get(0)->resource.image;

    store.markRetain(0, "taa_history");
    store.reset(device);

    EMBER_CHECK(store.currentCount() == 0);
    EMBER_CHECK(store.retainedCount() == 1);
    EMBER_CHECK(device.isAlive(retainedImage));
    EMBER_CHECK(device.counters().texturesDestroyed == 1);

    const auto* retained = store.getRetained("taa_history");
    EMBER_CHECK(retained != nullptr);
    EMBER_CHECK(retained && retained->resource.image == retainedImage);
    EMBER_CHECK(retained && retained->descriptor && *retained->descriptor == desc);
    EMBER_CHECK(store.getRetained("never_marked") == nullptr);

    // Frame N+1: label not re-marked, dropped at reset
    store.insert(0, eagerTexture(device, hdrTexture("other")));
    store.reset(device);

    EMBER_CHECK(store.getRetained("taa_history") == nullptr);
    EMBER_CHECK(!device.isAlive(retainedImage));
    EMBER_CHECK(device.aliveCount() == 0);
}

// Test 7: re-marking a label replaces the earlier mark
void testRemarkLabel() {
    section(7, "Re-marking a label");

    MockRenderDevice device;
    ResourceStore<Texture> store;

    store.insert(0, eagerTexture(device, hdrTexture("first")));
    store.insert(1, eagerTexture(device, hdrTexture("second")));
    RawHandle secondImage = store.get(1)->resource.image;

    store.markRetain(0, "history");
    store.markRetain(1, "history");
    EMBER_CHECK(store.markedCount() == 1);

    store.reset(device);
    const auto* retained = store.getRetained("history");
    EMBER_CHECK(retained && retained->resource.image == secondImage);
    EMBER_CHECK(device.counters().texturesDestroyed == 1);

    store.clear(device);
    EMBER_CHECK(device.aliveCount() == 0);
}

// Test 8: adopting a retained meta moves it into current, and abort returns it
void testAdoptRetained() {
    section(8, "Adopt retained");

    MockRenderDevice device;
    ResourceStore<Buffer> store;

    BufferDesc desc;
    desc.label = "exposure";
    desc.size = 16;
    ResourceMeta<Buffer> meta{desc, device.createBuffer(desc), true};
    RawHandle exposureBuffer = meta.resource.buffer;
    store.insert(0, ResourceInit<Buffer>::eager(meta));
    store.markRetain(0, "exposure");
    store.reset(device);

    EMBER_CHECK(!store.adoptRetained(0, "missing"));
    EMBER_CHECK(store.adoptRetained(5, "exposure"));
    EMBER_CHECK(store.retainedCount() == 0);
    EMBER_CHECK(store.get(5) && store.get(5)->resource.buffer == exposureBuffer);

    // Aborted frame: the buffer goes back to lastFrame untouched
    store.abort(device);
    EMBER_CHECK(store.retainedCount() == 1);
    EMBER_CHECK(device.isAlive(exposureBuffer));

    // Adopted but not re-marked: released at reset
    EMBER_CHECK(store.adoptRetained(0, "exposure"));
    store.reset(device);
    EMBER_CHECK(store.retainedCount() == 0);
    EMBER_CHECK(!device.isAlive(exposureBuffer));
    EMBER_CHECK(device.counters().buffersDestroyed == 1);
}

// Test 9: imported resources are never released
void testImportedNotReleased() {
    section(9, "Imported resources");

    MockRenderDevice device;
    ResourceStore<Texture> store;

    Texture swapchainImage = device.createTexture(hdrTexture("swapchain"));
    store.insert(0, ResourceInit<Texture>::eager(ResourceMeta<Texture>{eastl::nullopt, swapchainImage, false}));
    store.reset(device);

    EMBER_CHECK(device.isAlive(swapchainImage.image));
    EMBER_CHECK(device.counters().texturesDestroyed == 0);
    device.destroyTexture(swapchainImage);
}

// Test 10: abort keeps lastFrame and drops everything else
void testAbort() {
    section(10, "Abort");

    World world;
    MockRenderDevice device;
    ResourceStore<Texture> store;

    store.insert(0, eagerTexture(device, hdrTexture("kept")));
    store.markRetain(0, "kept");
    store.reset(device);

    store.insert(0, eagerTexture(device, hdrTexture("transient")));
    store.insert(1, deferredTexture(hdrTexture("queued")));
    store.markRetain(0, "transient");
    store.abort(device);

    EMBER_CHECK(store.currentCount() == 0);
    EMBER_CHECK(store.queuedCount() == 0);
    EMBER_CHECK(store.markedCount() == 0);
    EMBER_CHECK(store.getRetained("kept") != nullptr);
    EMBER_CHECK(store.getRetained("transient") == nullptr);
    EMBER_CHECK(device.counters().texturesCreated == 2);

    // After abort the same index can be inserted again
    store.insert(0, deferredTexture(hdrTexture("retry")));
    store.realizeQueued(world, device);
    EMBER_CHECK(store.get(0) != nullptr);

    store.clear(device);
    EMBER_CHECK(device.aliveCount() == 0);
}

// Test 11: a throwing initializer leaves earlier realizations in place
void testRealizeFailure() {
    section(11, "Realize failure");

    World world;
    MockRenderDevice device;
    ResourceStore<Texture> store;

    store.insert(0, deferredTexture(hdrTexture("ok")));
    store.insert(1, ResourceInit<Texture>::deferred([](World&, RenderDevice& d) {
        static_cast<MockRenderDevice&>(d).failNextTexture();
        TextureDesc desc;
        desc.label = "oom";
        return ResourceMeta<Texture>{desc, d.createTexture(desc), true};
    }));
    store.insert(2, deferredTexture(hdrTexture("later")));

    EMBER_CHECK_THROWS(store.realizeQueued(world, device), DeviceError);

    EMBER_CHECK(store.get(0) != nullptr);
    EMBER_CHECK(store.get(1) == nullptr);
    EMBER_CHECK(!store.isQueued(1));
    EMBER_CHECK(store.isQueued(2));

    store.abort(device);
    EMBER_CHECK(store.queuedCount() == 0);
    EMBER_CHECK(device.aliveCount() == 0);
}

int main() {
    fmt::print("========================================\n");
    fmt::print("ResourceStore Test Suite\n");
    fmt::print("========================================\n");

    testEagerInsert();
    testDeferredInsert();
    testMixedRealization();
    testDuplicateInsert();
    testKnownDescriptorFallback();
    testRetentionWindow();
    testRemarkLabel();
    testAdoptRetained();
    testImportedNotReleased();
    testAbort();
    testRealizeFailure();

    return finish("ResourceStore");
}
