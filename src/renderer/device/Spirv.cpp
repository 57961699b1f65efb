#include "Spirv.hpp"
#include "core/Log.hpp"

#include <spirv_reflect.h>

namespace ember {

namespace {
    // Owns one SPIRV-Reflect module for the duration of a query
    class ReflectedModule {
    public:
        explicit ReflectedModule(const eastl::vector<uint32_t>& words) {
            if (words.empty() || words[0] != kSpirvMagic) {
                return;
            }
            result = spvReflectCreateShaderModule(words.size() * sizeof(uint32_t), words.data(), &module);
            if (result != SPV_REFLECT_RESULT_SUCCESS) {
                Log::debug("Pipeline", "SPIR-V reflection failed with result {}", static_cast<int>(result));
            }
        }

        ~ReflectedModule() {
            if (valid()) {
                spvReflectDestroyShaderModule(&module);
            }
        }

        ReflectedModule(const ReflectedModule&) = delete;
        ReflectedModule& operator=(const ReflectedModule&) = delete;

        bool valid() const { return result == SPV_REFLECT_RESULT_SUCCESS; }
        const SpvReflectShaderModule& get() const { return module; }

    private:
        SpvReflectShaderModule module{};
        SpvReflectResult result = SPV_REFLECT_RESULT_ERROR_SPIRV_INVALID_MAGIC_NUMBER;
    };
}

bool isSpirv(const eastl::vector<uint32_t>& words) {
    return ReflectedModule(words).valid();
}

eastl::vector<eastl::string> spirvEntryPoints(const eastl::vector<uint32_t>& words) {
    eastl::vector<eastl::string> names;
    ReflectedModule reflected(words);
    if (!reflected.valid()) {
        return names;
    }

    const SpvReflectShaderModule& module = reflected.get();
    for (uint32_t i = 0; i < module.entry_point_count; ++i) {
        names.push_back(module.entry_points[i].name);
    }
    return names;
}

bool hasSpirvEntryPoint(const eastl::vector<uint32_t>& words, const eastl::string& name) {
    ReflectedModule reflected(words);
    return reflected.valid() && spvReflectGetEntryPoint(&reflected.get(), name.c_str()) != nullptr;
}

} // namespace ember
