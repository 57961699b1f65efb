#include "RenderDependencies.hpp"

namespace ember {

RenderDependencies RenderDependencies::of(std::initializer_list<RenderDependency> dependencies) {
    RenderDependencies result;
    result.addMany(dependencies);
    return result;
}

RenderDependencies& RenderDependencies::add(const RenderDependency& dependency) {
    switch (dependency.type) {
        case RenderDependency::Type::Read:
            readSet.insert(dependency.id);
            break;
        case RenderDependency::Type::ReadWrite:
            writeSet.insert(dependency.id);
            break;
        case RenderDependency::Type::BindGroup:
            bindGroupSet.insert(BindGroupId{dependency.id});
            break;
    }
    return *this;
}

RenderDependencies& RenderDependencies::addMany(std::initializer_list<RenderDependency> dependencies) {
    return addMany(dependencies.begin(), dependencies.end());
}

bool RenderDependencies::containsResourceId(ResourceId id) const {
    return readSet.find(id) != readSet.end() || writeSet.find(id) != writeSet.end();
}

bool RenderDependencies::containsBindGroup(BindGroupId bindGroup) const {
    return bindGroupSet.find(bindGroup) != bindGroupSet.end();
}

} // namespace ember
