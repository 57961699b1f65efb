#pragma once

#include <EASTL/string.h>
#include <EASTL/vector.h>
#include <cstdint>

namespace ember {

constexpr uint32_t kSpirvMagic = 0x07230203;

// True when SPIRV-Reflect can parse the module
bool isSpirv(const eastl::vector<uint32_t>& words);

// Entry point names as reflected, in module order. Empty for invalid modules.
eastl::vector<eastl::string> spirvEntryPoints(const eastl::vector<uint32_t>& words);

bool hasSpirvEntryPoint(const eastl::vector<uint32_t>& words, const eastl::string& name);

} // namespace ember
